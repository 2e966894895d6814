////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/binform/error.hpp"
#include <pfs/i18n.hpp>

BINFORM__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "binform::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::insufficient_data:
            return tr::_("insufficient data");

        default: return tr::_("unknown binform error");
    }
}

std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

BINFORM__NAMESPACE_END
