////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
//      2026.10.20 Encode and decode through pfs binary streams.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include "serializer_traits.hpp"
#include "traits.hpp"
#include <cstdint>
#include <limits>
#include <type_traits>

#if defined(__SIZEOF_INT128__) && !defined(BINFORM__INT128_ENABLED)
#   define BINFORM__INT128_ENABLED 1
#endif

BINFORM__NAMESPACE_BEGIN

#if BINFORM__INT128_ENABLED
__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;
#endif

static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4
    , "IEEE-754 binary32 float required");
static_assert(std::numeric_limits<double>::is_iec559 && sizeof(double) == 8
    , "IEEE-754 binary64 double required");

namespace details {

template <std::size_t N, bool Signed>
struct int_of;

template <> struct int_of<1, true>  { using type = std::int8_t; };
template <> struct int_of<2, true>  { using type = std::int16_t; };
template <> struct int_of<4, true>  { using type = std::int32_t; };
template <> struct int_of<8, true>  { using type = std::int64_t; };
template <> struct int_of<1, false> { using type = std::uint8_t; };
template <> struct int_of<2, false> { using type = std::uint16_t; };
template <> struct int_of<4, false> { using type = std::uint32_t; };
template <> struct int_of<8, false> { using type = std::uint64_t; };

// Type actually written to the stream: floats as is, any integer type (`char`,
// `long long`, `std::size_t`, ...) as the fixed-width integer of the same size
// and signedness.
template <typename T, bool IsFloat = std::is_floating_point<T>::value>
struct wire_type
{
    using type = T;
};

template <typename T>
struct wire_type<T, false>
{
    using type = typename int_of<sizeof(T), std::is_signed<T>::value>::type;
};

template <typename T>
struct is_int128 : std::false_type {};

#if BINFORM__INT128_ENABLED
template <> struct is_int128<int128_t> : std::true_type {};
template <> struct is_int128<uint128_t> : std::true_type {};
#endif

} // namespace details

/**
 * Fixed-width integers of every standard width, the 128-bit integers where the
 * compiler has them, and IEEE-754 `float` / `double`. `bool` is excluded, it
 * has a codec of its own.
 */
template <typename T>
struct is_numeric : std::integral_constant<bool
    , (std::is_integral<T>::value && !std::is_same<T, bool>::value)
        || std::is_same<T, float>::value
        || std::is_same<T, double>::value
        || details::is_int128<T>::value>
{};

/**
 * Exactly `sizeof(T)` bytes in network (big-endian) order, no padding, no tag.
 */
template <typename T>
struct numeric_codec
{
    using wire_type = typename details::wire_type<T>::type;

    static void encode (archive & ar, T const & value)
    {
        serializer_t out {ar};
        out << static_cast<wire_type>(value);
    }

    static bool decode (archive const & ar, std::size_t & cursor, T & value, error * perr)
    {
        auto avail = ar.available(cursor);
        deserializer_t in {details::begin_at(ar, cursor), avail};
        wire_type w {};

        in >> w;

        if (!in.is_good())
            return details::insufficient_data(cursor, sizeof(T), avail, perr);

        value = static_cast<T>(w);
        cursor += avail - in.available();
        return true;
    }
};

#if BINFORM__INT128_ENABLED
// Two 64-bit halves, high half first, which is the big-endian layout of the
// whole 128-bit value.
template <typename T>
struct int128_codec
{
    static void encode (archive & ar, T const & value)
    {
        auto u = static_cast<uint128_t>(value);
        serializer_t out {ar};
        out << static_cast<std::uint64_t>(u >> 64) << static_cast<std::uint64_t>(u);
    }

    static bool decode (archive const & ar, std::size_t & cursor, T & value, error * perr)
    {
        auto avail = ar.available(cursor);
        deserializer_t in {details::begin_at(ar, cursor), avail};
        std::uint64_t hi = 0;
        std::uint64_t lo = 0;

        in >> hi >> lo;

        if (!in.is_good())
            return details::insufficient_data(cursor, sizeof(T), avail, perr);

        value = static_cast<T>((static_cast<uint128_t>(hi) << 64) | lo);
        cursor += avail - in.available();
        return true;
    }
};

template <> struct numeric_codec<int128_t> : int128_codec<int128_t> {};
template <> struct numeric_codec<uint128_t> : int128_codec<uint128_t> {};
#endif

template <typename T>
struct encoder<T, typename std::enable_if<is_numeric<T>::value>::type>
{
    static void encode (archive & ar, T const & value)
    {
        numeric_codec<T>::encode(ar, value);
    }
};

template <typename T>
struct decoder<T, typename std::enable_if<is_numeric<T>::value>::type>
{
    static bool decode (archive const & ar, std::size_t & cursor, T & value, error * perr)
    {
        return numeric_codec<T>::decode(ar, cursor, value, perr);
    }
};

// One byte: 0x00 or 0x01. Any non-zero byte reads back as `true`.
template <>
struct encoder<bool>
{
    static void encode (archive & ar, bool const & value)
    {
        numeric_codec<std::uint8_t>::encode(ar, value ? 1 : 0);
    }
};

template <>
struct decoder<bool>
{
    static bool decode (archive const & ar, std::size_t & cursor, bool & value, error * perr)
    {
        std::uint8_t b = 0;

        if (!numeric_codec<std::uint8_t>::decode(ar, cursor, b, perr))
            return false;

        value = (b != 0);
        return true;
    }
};

// Enumerations travel as their underlying integer type.
template <typename T>
struct encoder<T, typename std::enable_if<std::is_enum<T>::value>::type>
{
    using underlying_type = typename std::underlying_type<T>::type;

    static void encode (archive & ar, T const & value)
    {
        encoder<underlying_type>::encode(ar, static_cast<underlying_type>(value));
    }
};

template <typename T>
struct decoder<T, typename std::enable_if<std::is_enum<T>::value>::type>
{
    using underlying_type = typename std::underlying_type<T>::type;

    static bool decode (archive const & ar, std::size_t & cursor, T & value, error * perr)
    {
        underlying_type u {};

        if (!decoder<underlying_type>::decode(ar, cursor, u, perr))
            return false;

        value = static_cast<T>(u);
        return true;
    }
};

BINFORM__NAMESPACE_END
