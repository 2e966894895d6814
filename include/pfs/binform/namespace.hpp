////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef BINFORM__NAMESPACE_NAME
#   define BINFORM__NAMESPACE_NAME binform
#   define BINFORM__NAMESPACE_BEGIN namespace BINFORM__NAMESPACE_NAME {
#   define BINFORM__NAMESPACE_END }
#endif
