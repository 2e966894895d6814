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
#include "numeric_codec.hpp"
#include "traits.hpp"
#include <algorithm>
#include <cstdint>
#include <deque>
#include <list>
#include <type_traits>
#include <utility>
#include <vector>

BINFORM__NAMESPACE_BEGIN

//
// Sequence format
//
// +--+--+--+--+--+--+--+--+-----------+-----------+-----+
// |       count (u64)     | element 0 | element 1 | ... |
// +--+--+--+--+--+--+--+--+-----------+-----------+-----+
//
// Elements follow back-to-back in iteration order, no separators.
//
template <typename T>
struct is_sequence : std::false_type {};

template <typename T, typename Alloc>
struct is_sequence<std::vector<T, Alloc>> : std::true_type {};

template <typename T, typename Alloc>
struct is_sequence<std::deque<T, Alloc>> : std::true_type {};

template <typename T, typename Alloc>
struct is_sequence<std::list<T, Alloc>> : std::true_type {};

namespace details {

// Declared count is a hint only: never reserve more elements than there are
// bytes left, every built-in element occupies at least one byte.
template <typename T, typename Alloc>
inline void reserve (std::vector<T, Alloc> & v, std::uint64_t count, std::size_t avail)
{
    v.reserve(static_cast<std::size_t>((std::min)(count, static_cast<std::uint64_t>(avail))));
}

template <typename Sequence>
inline void reserve (Sequence &, std::uint64_t, std::size_t)
{}

} // namespace details

template <typename Sequence>
struct encoder<Sequence, typename std::enable_if<is_sequence<Sequence>::value>::type>
{
    using value_type = typename Sequence::value_type;

    static void encode (archive & ar, Sequence const & seq)
    {
        encoder<std::uint64_t>::encode(ar, static_cast<std::uint64_t>(seq.size()));

        for (auto const & x: seq)
            encoder<value_type>::encode(ar, x);
    }
};

template <typename Sequence>
struct decoder<Sequence, typename std::enable_if<is_sequence<Sequence>::value>::type>
{
    using value_type = typename Sequence::value_type;

    static bool decode (archive const & ar, std::size_t & cursor, Sequence & seq, error * perr)
    {
        std::uint64_t count = 0;

        if (!decoder<std::uint64_t>::decode(ar, cursor, count, perr))
            return false;

        Sequence result;
        details::reserve(result, count, ar.available(cursor));

        for (std::uint64_t i = 0; i < count; i++) {
            value_type x {};

            if (!decoder<value_type>::decode(ar, cursor, x, perr))
                return false;

            result.push_back(std::move(x));
        }

        seq = std::move(result);
        return true;
    }
};

BINFORM__NAMESPACE_END
