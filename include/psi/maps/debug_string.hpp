////////////////////////////////////////////////////////////////////////////////
/// Developer-facing textual rendering of psi::maps containers.
///
/// Renders maps as {k:v,k2:v2} and sets as {k,k2}, in the container's current
/// order, with debug-style literals: strings and chars are quoted and escaped
/// (fmt's '?' presentation), nested psi::maps containers recurse through their
/// own to_string(), anything else goes through its fmt formatter.
///
/// Intended for logs and test failure messages only: not a stable machine
/// format. PSI_MAPS_DEBUG_STRING_MAX_ELEMENTS (0 = unlimited) caps the number
/// of rendered elements, a trailing ... marks the elision.
///
/// Also provides fmt::formatter and std::ostream support for every container.
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

#include "containers/abi.hpp"
#include "interface.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <concepts>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
#ifndef PSI_MAPS_DEBUG_STRING_MAX_ELEMENTS
#define PSI_MAPS_DEBUG_STRING_MAX_ELEMENTS 0
#endif
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

template <typename T>
concept container = map_interface<T> || set_interface<T>;

namespace detail
{
    // a conjunction of concepts stops at the first unsatisfied one, so
    // value_type is never looked up for non-class types
    template <typename T>
    concept char_string = string_viewable<T> && std::same_as<typename T::value_type, char>;

    inline constexpr std::size_t debug_string_max_elements{ PSI_MAPS_DEBUG_STRING_MAX_ELEMENTS };

    template <typename T>
    void append_debug_literal( std::string & out, T const & value )
    {
        auto sink{ std::back_inserter( out ) };
        if constexpr ( char_string<T> )
            fmt::format_to( sink, "{:?}", std::string_view{ value } );
        else
        if constexpr ( std::is_same_v<std::decay_t<T>, char const *> || std::is_same_v<std::decay_t<T>, char *> )
            fmt::format_to( sink, "{:?}", std::string_view{ value } );
        else
        if constexpr ( std::is_same_v<T, char> )
            fmt::format_to( sink, "{:?}", value );
        else
        if constexpr ( requires{ { value.to_string() } -> std::convertible_to<std::string_view>; } )
            out += value.to_string();
        else
        {
            static_assert( fmt::is_formattable<T>::value, "No textual representation for this type (provide a to_string() member or an fmt::formatter)" );
            fmt::format_to( sink, "{}", value );
        }
    }

    /// Appends "," separators and the elision marker; returns false once the
    /// element budget is exhausted.
    inline bool begin_debug_element( std::string & out, std::size_t const index )
    {
        if ( debug_string_max_elements && ( index >= debug_string_max_elements ) )
        {
            out += index ? ",..." : "...";
            return false;
        }
        if ( index )
            out += ',';
        return true;
    }

    template <typename Map>
    [[ nodiscard ]] std::string render_map( Map const & map )
    {
        std::string out{ "{" };
        std::size_t index{ 0 };
        map.range( [ & ]( auto const & key, auto const & val ) {
            if ( !begin_debug_element( out, index++ ) )
                return false;
            append_debug_literal( out, key );
            out += ':';
            append_debug_literal( out, val );
            return true;
        } );
        out += '}';
        return out;
    }

    template <typename Set>
    [[ nodiscard ]] std::string render_set( Set const & set )
    {
        std::string out{ "{" };
        std::size_t index{ 0 };
        set.range( [ & ]( auto const & key ) {
            if ( !begin_debug_element( out, index++ ) )
                return false;
            append_debug_literal( out, key );
            return true;
        } );
        out += '}';
        return out;
    }
} // namespace detail

template <container C>
std::ostream & operator<<( std::ostream & os, C const & c ) { return os << c.to_string(); }

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------

// psi::maps containers are rendered through to_string(), not as fmt ranges
template <psi::maps::container C>
struct fmt::is_range<C, char> : std::false_type {};

template <psi::maps::container C>
struct fmt::formatter<C, char> : fmt::formatter<std::string_view, char>
{
    template <typename FormatContext>
    auto format( C const & c, FormatContext & ctx ) const
    {
        return fmt::formatter<std::string_view, char>::format( c.to_string(), ctx );
    }
};
//------------------------------------------------------------------------------
