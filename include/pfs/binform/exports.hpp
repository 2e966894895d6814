////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef BINFORM__STATIC
#   ifndef BINFORM__EXPORT
#       if _MSC_VER
#           if defined(BINFORM__EXPORTS)
#               define BINFORM__EXPORT __declspec(dllexport)
#           else
#               define BINFORM__EXPORT __declspec(dllimport)
#           endif
#       else
#           define BINFORM__EXPORT
#       endif
#   endif
#else
#   define BINFORM__EXPORT
#endif // !BINFORM__STATIC
