////////////////////////////////////////////////////////////////////////////////
/// Value equality used by the equal() member of every psi::maps container.
///
/// A value type may provide its own equality with a single-argument
///     bool equal( T const & other ) const;
/// member (the "equaler" capability); it is preferred over operator==.
/// Value types offering neither are rejected at compile time when equal()
/// is instantiated: give such types an equal() member to compare maps of them.
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

#include <concepts>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

template <typename T>
concept equaler = requires( T const & a, T const & b ) {
    { a.equal( b ) } -> std::convertible_to<bool>;
};

template <typename T>
concept value_comparable = equaler<T> || std::equality_comparable<T>;

template <typename T>
[[ nodiscard ]] constexpr bool equal_values( T const & a, T const & b )
{
    static_assert
    (
        value_comparable<T>,
        "Value type is neither equality comparable nor provides an equal( T const & ) member"
    );
    if constexpr ( equaler<T> )
        return static_cast<bool>( a.equal( b ) );
    else
        return static_cast<bool>( a == b );
}

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
