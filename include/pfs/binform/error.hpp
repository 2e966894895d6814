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
#include <pfs/error.hpp>
#include <string>
#include <system_error>

BINFORM__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , insufficient_data // Decode step requires more bytes than remain in the archive
};

class BINFORM__EXPORT error_category : public std::error_category
{
public:
    virtual char const * name () const noexcept override;
    virtual std::string message (int ev) const override;
};

BINFORM__EXPORT std::error_category const & get_error_category ();

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

BINFORM__NAMESPACE_END
