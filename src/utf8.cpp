////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/binform/utf8.hpp"
#include <cstdint>

BINFORM__NAMESPACE_BEGIN

namespace utf8 {

static constexpr char const * REPLACEMENT_CHAR = "\xEF\xBF\xBD";

// Returns the length of the well-formed sequence at the beginning of [p, p + n)
// or zero. In the latter case `bad` receives the length of the maximal subpart
// to replace (at least one byte).
static std::size_t scan (unsigned char const * p, std::size_t n, std::size_t & bad)
{
    unsigned char b0 = p[0];

    if (b0 < 0x80)
        return 1;

    std::size_t len = 0;

    // Allowed range of the second byte
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 == 0xE0) {
        len = 3;
        lo = 0xA0;
    } else if (b0 >= 0xE1 && b0 <= 0xEC) {
        len = 3;
    } else if (b0 == 0xED) {
        len = 3;
        hi = 0x9F;
    } else if (b0 >= 0xEE && b0 <= 0xEF) {
        len = 3;
    } else if (b0 == 0xF0) {
        len = 4;
        lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        len = 4;
    } else if (b0 == 0xF4) {
        len = 4;
        hi = 0x8F;
    } else {
        bad = 1;
        return 0;
    }

    for (std::size_t i = 1; i < len; i++) {
        if (i >= n) {
            bad = i;
            return 0;
        }

        unsigned char b = p[i];

        if (i == 1) {
            if (b < lo || b > hi) {
                bad = 1;
                return 0;
            }
        } else if (b < 0x80 || b > 0xBF) {
            bad = i;
            return 0;
        }
    }

    return len;
}

bool is_valid (char const * s, std::size_t n)
{
    auto p = reinterpret_cast<unsigned char const *>(s);
    std::size_t pos = 0;

    while (pos < n) {
        std::size_t bad = 0;
        auto len = scan(p + pos, n - pos, bad);

        if (len == 0)
            return false;

        pos += len;
    }

    return true;
}

std::string repair (char const * s, std::size_t n)
{
    if (is_valid(s, n))
        return std::string(s, n);

    auto p = reinterpret_cast<unsigned char const *>(s);
    std::string result;
    result.reserve(n + 8);

    std::size_t pos = 0;

    while (pos < n) {
        std::size_t bad = 0;
        auto len = scan(p + pos, n - pos, bad);

        if (len > 0) {
            result.append(s + pos, len);
            pos += len;
        } else {
            result.append(REPLACEMENT_CHAR);
            pos += bad;
        }
    }

    return result;
}

} // namespace utf8

BINFORM__NAMESPACE_END
