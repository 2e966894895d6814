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
#include "traits.hpp"
#include <pfs/optional.hpp>
#include <utility>

BINFORM__NAMESPACE_BEGIN

/**
 * Reads records appended back-to-back to one archive.
 *
 * @details
 * Each call to next() decodes one value starting where the previous record
 * ended. Once a record fails to decode the reader turns bad and yields no more
 * records.
 */
class record_reader
{
    archive const & _ar;
    std::size_t _cursor {0};

    // True after a decode failure
    bool _bad {false};

public:
    explicit record_reader (archive const & ar, std::size_t cursor = 0)
        : _ar(ar)
        , _cursor(cursor)
    {}

    record_reader (archive &&, std::size_t = 0) = delete;

public:
    bool bad () const noexcept
    {
        return _bad;
    }

    std::size_t position () const noexcept
    {
        return _cursor;
    }

    std::size_t remain_size () const noexcept
    {
        return _bad ? 0 : _ar.available(_cursor);
    }

    template <typename T>
    pfs::optional<T> next (error * perr = nullptr)
    {
        if (_bad)
            return pfs::nullopt;

        error err;
        std::size_t cursor = _cursor;
        T value {};

        if (!decode(_ar, cursor, value, & err)) {
            _bad = true;
            pfs::throw_or(perr, std::move(err));
            return pfs::nullopt;
        }

        _cursor = cursor;
        return pfs::optional<T>(std::move(value));
    }
};

BINFORM__NAMESPACE_END
