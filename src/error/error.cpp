////////////////////////////////////////////////////////////////////////////////
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
#include <psi/maps/error/error.hpp>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_usage_error ( char const * const msg ) { throw usage_error ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_decode_error( char const * const msg ) { throw decode_error( msg ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
