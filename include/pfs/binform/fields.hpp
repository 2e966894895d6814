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
#include "traits.hpp"

BINFORM__NAMESPACE_BEGIN

//
// Helpers for composite types: fields are encoded and decoded in the order
// they are listed, decoding stops at the first failure.
//
// struct point
// {
//     std::int32_t x;
//     std::int32_t y;
//     std::string label;
//
//     void encode (binform::archive & ar) const
//     {
//         binform::encode_fields(ar, x, y, label);
//     }
//
//     bool decode (binform::archive const & ar, std::size_t & cursor, binform::error * perr)
//     {
//         return binform::decode_fields(ar, cursor, perr, x, y, label);
//     }
// };
//

inline void encode_fields (archive &)
{}

template <typename T, typename ...Ts>
inline void encode_fields (archive & ar, T const & first, Ts const & ... rest)
{
    encode(ar, first);
    encode_fields(ar, rest...);
}

inline bool decode_fields (archive const &, std::size_t &, error *)
{
    return true;
}

template <typename T, typename ...Ts>
inline bool decode_fields (archive const & ar, std::size_t & cursor, error * perr
    , T & first, Ts & ... rest)
{
    if (!decode(ar, cursor, first, perr))
        return false;

    return decode_fields(ar, cursor, perr, rest...);
}

BINFORM__NAMESPACE_END
