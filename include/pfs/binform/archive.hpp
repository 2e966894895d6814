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
#include "exports.hpp"
#include <cstdint>
#include <vector>

BINFORM__NAMESPACE_BEGIN

/**
 * Owned sequence of bytes acting as encode sink and decode source.
 *
 * @details
 * An archive is either created empty (encode target) or loaded from an
 * externally supplied byte sequence (decode source). Content is never
 * validated on load. Bytes are only ever appended at the end; nothing is
 * inserted, erased or rewritten.
 */
class BINFORM__EXPORT archive
{
public:
    using container_type = std::vector<char>;

private:
    container_type _c;

public:
    archive () = default;

    archive (char const * data, std::size_t n);

    archive (container_type && c) noexcept
        : _c(std::move(c))
    {}

    archive (archive && other) noexcept
        : _c(std::move(other._c))
    {}

    archive & operator = (archive && other) noexcept
    {
        if (this != & other)
            _c = std::move(other._c);

        return *this;
    }

    archive (archive const & other) = default;
    archive & operator = (archive const &) = delete;

public:
    /**
     * Moves the content out of the archive. The archive is empty after the call.
     */
    container_type container () &&
    {
        return std::move(_c);
    }

    /**
     * Returns a copy of the current content for handoff to a storage layer.
     */
    container_type bytes () const
    {
        return _c;
    }

    /**
     * @return @c nullptr on empty.
     */
    char const * data () const noexcept
    {
        return _c.empty() ? nullptr : _c.data();
    }

    bool empty () const noexcept
    {
        return _c.empty();
    }

    std::size_t size () const noexcept
    {
        return _c.size();
    }

    /**
     * Number of bytes between @a cursor and the end of the archive, zero if the
     * cursor is at or beyond the end.
     */
    std::size_t available (std::size_t cursor) const noexcept
    {
        return cursor < _c.size() ? _c.size() - cursor : 0;
    }

    void append (archive const & ar);
    void append (char const * data, std::size_t n);
    void append (char ch);

    friend bool operator == (archive const & a, archive const & b)
    {
        return a._c == b._c;
    }

    friend bool operator != (archive const & a, archive const & b)
    {
        return !(a == b);
    }
};

BINFORM__NAMESPACE_END
