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
#include <string>

BINFORM__NAMESPACE_BEGIN

namespace utf8 {

/**
 * Checks that [@a s, @a s + @a n) is well-formed UTF-8: no overlong forms, no
 * surrogates, nothing above U+10FFFF.
 */
BINFORM__EXPORT bool is_valid (char const * s, std::size_t n);

/**
 * Copies [@a s, @a s + @a n) replacing every ill-formed subsequence with
 * U+FFFD.
 *
 * @details
 * Follows the "maximal subpart" practice: a truncated or broken multibyte
 * sequence yields one replacement character for its longest valid prefix, a
 * byte that can not start a sequence yields one replacement character by
 * itself. Well-formed input is returned unchanged.
 */
BINFORM__EXPORT std::string repair (char const * s, std::size_t n);

} // namespace utf8

BINFORM__NAMESPACE_END
