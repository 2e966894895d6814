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
#include "numeric_codec.hpp"
#include "serializer_traits.hpp"
#include "traits.hpp"
#include "utf8.hpp"
#include <cstdint>
#include <string>
#include <utility>

BINFORM__NAMESPACE_BEGIN

//
// Text format
//
// +--+--+--+--+--+--+--+--+-----------------+
// |     length (u64)      | UTF-8 bytes ... |
// +--+--+--+--+--+--+--+--+-----------------+
//
// Length is the number of bytes, not characters. Ill-formed UTF-8 is repaired
// on decode, only a length exceeding the remaining bytes is an error.
//
template <>
struct encoder<std::string>
{
    static void encode (archive & ar, std::string const & value)
    {
        serializer_t out {ar};
        out << static_cast<std::uint64_t>(value.size());
        out.write(value.data(), value.size());
    }
};

template <>
struct decoder<std::string>
{
    static bool decode (archive const & ar, std::size_t & cursor, std::string & value, error * perr)
    {
        auto avail = ar.available(cursor);
        deserializer_t in {details::begin_at(ar, cursor), avail};
        std::uint64_t len = 0;

        in >> len;

        if (!in.is_good())
            return details::insufficient_data(cursor, sizeof(len), avail, perr);

        // Checked before reading, the declared length is not trusted
        if (len > in.available()) {
            return details::insufficient_data(cursor + sizeof(len), len
                , in.available(), perr);
        }

        std::string text;
        in.read(text, static_cast<std::size_t>(len));

        if (!in.is_good())
            return details::insufficient_data(cursor + sizeof(len), len, in.available(), perr);

        if (utf8::is_valid(text.data(), text.size())) {
            value = std::move(text);
        } else {
            value = utf8::repair(text.data(), text.size());
            BINFORM__TRACE(TAG, "ill-formed UTF-8 text repaired at offset {}: {} byte(s) read, {} byte(s) produced"
                , cursor + sizeof(len), text.size(), value.size());
        }

        cursor += avail - in.available();
        return true;
    }
};

BINFORM__NAMESPACE_END
