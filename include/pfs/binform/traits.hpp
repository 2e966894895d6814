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
#include "trace.hpp"
#include <pfs/i18n.hpp>
#include <cstdint>

BINFORM__NAMESPACE_BEGIN

/**
 * Encodable capability.
 *
 * @details
 * Appends the canonical representation of @a value to the end of the archive.
 * Encoding is deterministic and never fails. The primary template forwards to
 * the member function `void encode (archive & ar) const`, so a composite type
 * may either provide that member or specialize this template.
 */
template <typename T, typename Enable = void>
struct encoder
{
    static void encode (archive & ar, T const & value)
    {
        value.encode(ar);
    }
};

/**
 * Decodable capability.
 *
 * @details
 * Reconstructs a value starting at @a cursor and advances the cursor by the
 * number of bytes consumed. On failure the error is thrown if @a perr is
 * @c nullptr or stored into @a *perr otherwise, and @c false is returned.
 * The cursor position after a failure is unspecified.
 *
 * The primary template forwards to the member function
 * `bool decode (archive const & ar, std::size_t & cursor, error * perr)`.
 */
template <typename T, typename Enable = void>
struct decoder
{
    static bool decode (archive const & ar, std::size_t & cursor, T & value, error * perr)
    {
        return value.decode(ar, cursor, perr);
    }
};

template <typename T>
inline void encode (archive & ar, T const & value)
{
    encoder<T>::encode(ar, value);
}

template <typename T>
inline bool decode (archive const & ar, std::size_t & cursor, T & value, error * perr = nullptr)
{
    return decoder<T>::decode(ar, cursor, value, perr);
}

namespace details {

/**
 * Reports errc::insufficient_data: @a required bytes were expected at offset
 * @a cursor, but only @a available remain. Always returns @c false.
 */
inline bool insufficient_data (std::size_t cursor, std::uint64_t required
    , std::size_t available, error * perr)
{
    BINFORM__TRACE(TAG, "insufficient data: cursor={}, required={}, available={}"
        , cursor, required, available);

    pfs::throw_or(perr, error {
          make_error_code(errc::insufficient_data)
        , tr::f_("required {} byte(s) at offset {}, but only {} available"
            , required, cursor, available)
    });

    return false;
}

} // namespace details

BINFORM__NAMESPACE_END
