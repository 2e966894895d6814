////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/binform/archive.hpp"

BINFORM__NAMESPACE_BEGIN

archive::archive (char const * data, std::size_t n)
{
    append(data, n);
}

void archive::append (archive const & ar)
{
    append(ar.data(), ar.size());
}

void archive::append (char const * data, std::size_t n)
{
    if (n == 0)
        return;

    _c.insert(_c.end(), data, data + n);
}

void archive::append (char ch)
{
    _c.push_back(ch);
}

BINFORM__NAMESPACE_END
