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
#include <pfs/endian.hpp>
#include <pfs/binary_istream.hpp>
#include <pfs/binary_ostream.hpp>

BINFORM__NAMESPACE_BEGIN

struct serializer_traits
{
    using archive_type = archive;
    using serializer_type = pfs::binary_ostream<pfs::endian::network, archive_type>;
    using deserializer_type = pfs::binary_istream<pfs::endian::network>;
};

using serializer_t = serializer_traits::serializer_type;
using deserializer_t = serializer_traits::deserializer_type;

namespace details {

/**
 * Start of the bytes remaining after @a cursor, @c nullptr if there are none.
 */
inline char const * begin_at (archive const & ar, std::size_t cursor) noexcept
{
    return ar.available(cursor) == 0 ? nullptr : ar.data() + cursor;
}

} // namespace details

BINFORM__NAMESPACE_END

PFS__NAMESPACE_BEGIN
template <>
inline void
binary_ostream<endian::network, BINFORM__NAMESPACE_NAME::archive>::write (
    BINFORM__NAMESPACE_NAME::archive & ar, char const * data, std::size_t n)
{
    ar.append(data, n);
}

template <>
inline void
append_bytes<BINFORM__NAMESPACE_NAME::archive> (BINFORM__NAMESPACE_NAME::archive & ar
    , char const * data, std::size_t n)
{
    ar.append(data, n);
}
PFS__NAMESPACE_END
