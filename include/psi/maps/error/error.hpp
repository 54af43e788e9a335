////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
///
/// Error types raised by psi::maps containers.
///
///   usage_error : caller programming error (the operation is aborted before
///                 any state is touched); never raised for missing keys
///   decode_error: structurally invalid binary/text payload
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

class usage_error : public std::logic_error
{
public:
    using std::logic_error::logic_error;
}; // class usage_error

class decode_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
}; // class decode_error

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_usage_error ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_decode_error( char const * msg );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
