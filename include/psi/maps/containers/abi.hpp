////////////////////////////////////////////////////////////////////////////////
/// Parameter-passing and type-category helpers shared by psi::maps containers.
///
/// Contents:
///   - can_be_passed_in_reg<T>             : trait: pass T by value?
///   - string_viewable                     : concept: basic_string-like types
///   - make_trivially_copyable_predicate() : cheap-to-copy predicate adaptor
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

#include <boost/config.hpp>

#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
}; // can_be_passed_in_reg

/// Detects types that behave as strings (basic_string, basic_string_view and
/// derived types). Requires traits_type to distinguish from generic char
/// containers (e.g. vector<char>).
template <typename T>
concept string_viewable = requires {
    typename T::value_type;
    typename T::traits_type;
} && requires( T const & t ) {
    std::basic_string_view<typename T::value_type, typename T::traits_type>{ t };
};

/// Key/value argument type: by value for small trivial types, const & otherwise.
template <typename T>
using const_arg_t = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;


// utility for passing non trivial predicates (e.g. std::function) to
// algorithms which pass them around by-val
template <typename Pred>
constexpr decltype( auto ) make_trivially_copyable_predicate( Pred && pred ) noexcept {
    if constexpr ( can_be_passed_in_reg<std::remove_cvref_t<Pred>> ) {
        return std::forward<Pred>( pred );
    } else {
        return [&pred]( auto const & ... args ) noexcept( noexcept( pred( args... ) ) ) {
            return pred( args... );
        };
    }
} // make_trivially_copyable_predicate

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
