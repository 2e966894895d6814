////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include "archive.hpp"
#include "error.hpp"
#include "fields.hpp"
#include "numeric_codec.hpp"
#include "record_reader.hpp"
#include "sequence_codec.hpp"
#include "serializer_traits.hpp"
#include "text_codec.hpp"
#include "traits.hpp"
#include <pfs/optional.hpp>
#include <utility>

BINFORM__NAMESPACE_BEGIN

/**
 * Appends the encoded @a root value to the end of the archive.
 */
template <typename T>
inline void encode_root (archive & ar, T const & root)
{
    encode(ar, root);
}

/**
 * Decodes one value of type @a T from the beginning of the archive.
 *
 * @details
 * Bytes following the decoded value are ignored. On failure the error is
 * thrown if @a perr is @c nullptr, otherwise it is stored into @a *perr and
 * @c pfs::nullopt is returned.
 */
template <typename T>
pfs::optional<T> decode_root (archive const & ar, error * perr = nullptr)
{
    std::size_t cursor = 0;
    T value {};

    if (!decode(ar, cursor, value, perr))
        return pfs::nullopt;

    return pfs::optional<T>(std::move(value));
}

BINFORM__NAMESPACE_END
