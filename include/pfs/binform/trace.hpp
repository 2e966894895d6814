////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
//      2026.10.20 Trace line format with time stamp.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"

BINFORM__NAMESPACE_BEGIN
constexpr char const * TAG = "binform";
BINFORM__NAMESPACE_END

#if BINFORM__TRACE_ENABLED
#   include <pfs/fmt.hpp>
#   include <chrono>
#   include <cstdint>
#   include <cstdio>
#   include <string>

BINFORM__NAMESPACE_BEGIN

// Steady clock time as "H:MM:SS.mmm"
inline std::string stringify_trace_time ()
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::steady_clock;

    std::uint64_t msecs = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();

    int millis = static_cast<int>(msecs % 1000);
    std::uint64_t seconds = msecs / 1000;
    std::uint64_t hours   = seconds / 3600;
    seconds -= hours * 3600;
    std::uint64_t minutes = seconds / 60;
    seconds -= minutes * 60;

    return fmt::format("{}:{:02}:{:02}.{:03}", hours, minutes, seconds, millis);
}

BINFORM__NAMESPACE_END

#   define BINFORM__TRACE(t, f, ...) {                                         \
        fmt::print(stdout, "{} [T] {}: " f "\n"                                \
            , BINFORM__NAMESPACE_NAME::stringify_trace_time(), t , ##__VA_ARGS__); fflush(stdout);}
#else // BINFORM__TRACE_ENABLED
#   define BINFORM__TRACE(t, f, ...)
#endif // !BINFORM__TRACE_ENABLED
