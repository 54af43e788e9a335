////////////////////////////////////////////////////////////////////////////////
/// The capability contracts shared by all psi::maps containers.
///
/// map_interface<M>: satisfied by map, ordered_map and safe<> of either
/// set_interface<S>: satisfied by set, sorted_set, ordered_set and safe<> of
///                    any of them
///
/// Code written against these concepts can swap the plain, order-preserving,
/// sorted and concurrency-safe variants without touching call sites. The
/// variants are distinct types: there is no common base class, wrappers hold
/// the container they wrap.
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
#include <cstddef>
#include <ranges>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

/// Placeholder value of the map-backed set adapters.
struct unit
{
    friend constexpr bool operator==( unit, unit ) noexcept { return true; }

    template <typename Archive>
    void serialize( Archive &, unsigned int /*version*/ ) noexcept {}
}; // struct unit


namespace detail
{
    // Archetype callbacks used to spell the range() and erase_if() requirements.
    template <typename Key, typename T>
    struct entry_visitor { bool operator()( Key const &, T const & ) const noexcept { return true; } };

    template <typename Key>
    struct key_visitor { bool operator()( Key const & ) const noexcept { return true; } };
} // namespace detail


/// M2 is a source of ( key, value ) entries of M's types (the argument of
/// copy() and equal()).
template <typename M2, typename M>
concept compatible_map = requires( M2 const & other )
{
    typename M2::key_type;
    typename M2::mapped_type;
    { other.size() } -> std::convertible_to<std::size_t>;
    other.range( detail::entry_visitor<typename M::key_type, typename M::mapped_type>{} );
} &&
    std::same_as<typename M2::key_type   , typename M::key_type   > &&
    std::same_as<typename M2::mapped_type, typename M::mapped_type>;

/// S2 is a source of keys of S's type, and not a map.
template <typename S2, typename S>
concept compatible_set = requires( S2 const & other )
{
    typename S2::key_type;
    { other.size() } -> std::convertible_to<std::size_t>;
    other.range( detail::key_visitor<typename S::key_type>{} );
} &&
    !requires { typename S2::mapped_type; } &&
    std::same_as<typename S2::key_type, typename S::key_type>;


template <typename M>
concept map_interface = requires
(
    M                                                                          & m,
    M                                                                    const & cm,
    typename M::key_type                                                 const & key,
    typename M::mapped_type                                              const & val,
    std::vector<std::pair<typename M::key_type, typename M::mapped_type>> const & entries
)
{
    typename M::key_type;
    typename M::mapped_type;

    m.set( key, val );
    { m.erase( key ) } -> std::same_as<typename M::mapped_type>;
    m.erase_if( detail::entry_visitor<typename M::key_type, typename M::mapped_type>{} );
    m.clear();
    m.copy  ( cm );
    m.insert( entries );

    { cm.get ( key ) } -> std::same_as<typename M::mapped_type>;
    { cm.load( key ) } -> std::same_as<std::pair<typename M::mapped_type, bool>>;
    { cm.has ( key ) } -> std::same_as<bool>;

    { cm.keys  () } -> std::same_as<std::vector<typename M::key_type   >>;
    { cm.values() } -> std::same_as<std::vector<typename M::mapped_type>>;
    { cm.size  () } -> std::convertible_to<std::size_t>;
    { cm.empty () } -> std::same_as<bool>;

    cm.range( detail::entry_visitor<typename M::key_type, typename M::mapped_type>{} );
    { cm.all        () } -> std::ranges::input_range;
    { cm.keys_view  () } -> std::ranges::input_range;
    { cm.values_view() } -> std::ranges::input_range;

    { cm.equal    ( cm ) } -> std::same_as<bool>;
    { cm.clone    ()     } -> std::same_as<M>;
    { cm.to_string()     } -> std::same_as<std::string>;
};

template <typename S>
concept set_interface = requires
(
    S                                       & s,
    S                                 const & cs,
    typename S::key_type              const & key,
    std::vector<typename S::key_type> const & keys
)
{
    typename S::key_type;

    { s.add  ( key ) } -> std::same_as<S &>;
    s.erase( key );
    s.erase_if( detail::key_visitor<typename S::key_type>{} );
    s.clear();
    s.copy  ( cs );
    s.insert( keys );

    { cs.has   ( key ) } -> std::same_as<bool>;
    { cs.values()     } -> std::same_as<std::vector<typename S::key_type>>;
    { cs.size  ()     } -> std::convertible_to<std::size_t>;
    { cs.empty ()     } -> std::same_as<bool>;

    cs.range( detail::key_visitor<typename S::key_type>{} );
    { cs.all() } -> std::ranges::input_range;

    { cs.equal    ( cs ) } -> std::same_as<bool>;
    { cs.clone    ()     } -> std::same_as<S>;
    { cs.to_string()     } -> std::same_as<std::string>;
};

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
