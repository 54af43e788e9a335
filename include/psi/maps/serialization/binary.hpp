////////////////////////////////////////////////////////////////////////////////
/// Binary serialization of psi::maps containers (Boost.Serialization)
///
/// Layouts (all object_serializable, i.e. no per object class preamble):
///  map         : the table
///  ordered_map : the table, then the key order
///  set variants: the elements, in the container's iteration order
///  safe<C>     : as C
///
/// The comparator of an ordered_map/ordered_set is never written: decoding
/// into an ordered_map drops it and the caller has to reinstall it. Decoding
/// into a set adds to the current elements. Any archive can be used directly
/// (ar << c, ar >> c); to_binary()/from_binary() wrap the portable-enough
/// binary archives.
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

#include "codec_access.hpp"

#include <psi/maps/containers/map.hpp>
#include <psi/maps/containers/ordered_map.hpp>
#include <psi/maps/containers/ordered_set.hpp>
#include <psi/maps/containers/safe.hpp>
#include <psi/maps/containers/set.hpp>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/level.hpp>
#include <boost/serialization/split_free.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/tracking.hpp>
#include <boost/serialization/unordered_map.hpp>
#include <boost/serialization/vector.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename Archive, typename Set>
    void save_set( Archive & ar, Set const & s )
    {
        auto const values{ s.values() };
        ar << values;
    }

    template <typename Archive, typename Set>
    void load_set( Archive & ar, Set & s )
    {
        std::vector<typename Set::key_type> values;
        ar >> values;
        s.insert( values );
    }
} // namespace detail

template <typename C>
[[ nodiscard ]] std::string to_binary( C const & c )
{
    std::ostringstream stream;
    {
        boost::archive::binary_oarchive archive{ stream };
        archive << c;
    }
    return std::move( stream ).str();
}

/// Throws boost::archive::archive_exception on a malformed payload and
/// decode_error on a well formed but inconsistent one.
template <typename C>
void from_binary( C & c, std::string_view const bytes )
{
    std::istringstream stream{ std::string{ bytes } };
    boost::archive::binary_iarchive archive{ stream };
    archive >> c;
}

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------

namespace boost::serialization
{
//------------------------------------------------------------------------------

//==============================================================================
// map
//==============================================================================

template <typename Archive, typename K, typename T, typename H, typename E>
void save( Archive & ar, psi::maps::map<K, T, H, E> const & m, unsigned int /*version*/ )
{
    ar << psi::maps::detail::codec_access::table( m );
}

template <typename Archive, typename K, typename T, typename H, typename E>
void load( Archive & ar, psi::maps::map<K, T, H, E> & m, unsigned int /*version*/ )
{
    typename psi::maps::map<K, T, H, E>::table_type items;
    ar >> items;
    psi::maps::detail::codec_access::assign( m, std::move( items ) );
}

template <typename Archive, typename K, typename T, typename H, typename E>
void serialize( Archive & ar, psi::maps::map<K, T, H, E> & m, unsigned int const version ) { split_free( ar, m, version ); }

//==============================================================================
// ordered_map
//==============================================================================

template <typename Archive, typename K, typename T, typename H, typename E>
void save( Archive & ar, psi::maps::ordered_map<K, T, H, E> const & m, unsigned int /*version*/ )
{
    using access = psi::maps::detail::codec_access;
    ar << access::table( m );
    ar << access::order( m );
}

template <typename Archive, typename K, typename T, typename H, typename E>
void load( Archive & ar, psi::maps::ordered_map<K, T, H, E> & m, unsigned int /*version*/ )
{
    typename psi::maps::ordered_map<K, T, H, E>::table_type items;
    typename psi::maps::ordered_map<K, T, H, E>::order_type order;
    ar >> items;
    ar >> order;
    psi::maps::detail::codec_access::assign( m, std::move( items ), std::move( order ) );
}

template <typename Archive, typename K, typename T, typename H, typename E>
void serialize( Archive & ar, psi::maps::ordered_map<K, T, H, E> & m, unsigned int const version ) { split_free( ar, m, version ); }

//==============================================================================
// sets
//==============================================================================

template <typename Archive, typename K, typename H, typename E>
void save( Archive & ar, psi::maps::set<K, H, E> const & s, unsigned int ) { psi::maps::detail::save_set( ar, s ); }
template <typename Archive, typename K, typename H, typename E>
void load( Archive & ar, psi::maps::set<K, H, E>       & s, unsigned int ) { psi::maps::detail::load_set( ar, s ); }
template <typename Archive, typename K, typename H, typename E>
void serialize( Archive & ar, psi::maps::set<K, H, E> & s, unsigned int const version ) { split_free( ar, s, version ); }

template <typename Archive, typename K, typename Cmp, typename H, typename E>
void save( Archive & ar, psi::maps::sorted_set<K, Cmp, H, E> const & s, unsigned int ) { psi::maps::detail::save_set( ar, s ); }
template <typename Archive, typename K, typename Cmp, typename H, typename E>
void load( Archive & ar, psi::maps::sorted_set<K, Cmp, H, E>       & s, unsigned int ) { psi::maps::detail::load_set( ar, s ); }
template <typename Archive, typename K, typename Cmp, typename H, typename E>
void serialize( Archive & ar, psi::maps::sorted_set<K, Cmp, H, E> & s, unsigned int const version ) { split_free( ar, s, version ); }

template <typename Archive, typename K, typename H, typename E>
void save( Archive & ar, psi::maps::ordered_set<K, H, E> const & s, unsigned int ) { psi::maps::detail::save_set( ar, s ); }
template <typename Archive, typename K, typename H, typename E>
void load( Archive & ar, psi::maps::ordered_set<K, H, E>       & s, unsigned int ) { psi::maps::detail::load_set( ar, s ); }
template <typename Archive, typename K, typename H, typename E>
void serialize( Archive & ar, psi::maps::ordered_set<K, H, E> & s, unsigned int const version ) { split_free( ar, s, version ); }

//==============================================================================
// safe<C>
//==============================================================================

template <typename Archive, typename C>
void save( Archive & ar, psi::maps::safe<C> const & s, unsigned int /*version*/ )
{
    using access = psi::maps::detail::codec_access;
    auto const lock{ access::read_lock( s ) };
    ar << access::inner( s );
}

template <typename Archive, typename C>
void load( Archive & ar, psi::maps::safe<C> & s, unsigned int /*version*/ )
{
    C decoded;
    ar >> decoded;
    psi::maps::detail::codec_access::install( s, std::move( decoded ) );
}

template <typename Archive, typename C>
void serialize( Archive & ar, psi::maps::safe<C> & s, unsigned int const version ) { split_free( ar, s, version ); }

//==============================================================================
// Layout traits: plain values, no class preamble, never tracked
//==============================================================================

template <typename K, typename T, typename H, typename E> struct implementation_level_impl<psi::maps::map        <K, T, H, E> const> : mpl::int_<object_serializable> {};
template <typename K, typename T, typename H, typename E> struct implementation_level_impl<psi::maps::ordered_map<K, T, H, E> const> : mpl::int_<object_serializable> {};
template <typename K, typename H, typename E>             struct implementation_level_impl<psi::maps::set        <K, H, E> const>    : mpl::int_<object_serializable> {};
template <typename K, typename C, typename H, typename E> struct implementation_level_impl<psi::maps::sorted_set <K, C, H, E> const> : mpl::int_<object_serializable> {};
template <typename K, typename H, typename E>             struct implementation_level_impl<psi::maps::ordered_set<K, H, E> const>    : mpl::int_<object_serializable> {};
template <typename C>                                     struct implementation_level_impl<psi::maps::safe       <C> const>          : mpl::int_<object_serializable> {};

template <typename K, typename T, typename H, typename E> struct tracking_level<psi::maps::map        <K, T, H, E>> : mpl::int_<track_never> {};
template <typename K, typename T, typename H, typename E> struct tracking_level<psi::maps::ordered_map<K, T, H, E>> : mpl::int_<track_never> {};
template <typename K, typename H, typename E>             struct tracking_level<psi::maps::set        <K, H, E>>    : mpl::int_<track_never> {};
template <typename K, typename C, typename H, typename E> struct tracking_level<psi::maps::sorted_set <K, C, H, E>> : mpl::int_<track_never> {};
template <typename K, typename H, typename E>             struct tracking_level<psi::maps::ordered_set<K, H, E>>    : mpl::int_<track_never> {};
template <typename C>                                     struct tracking_level<psi::maps::safe       <C>>          : mpl::int_<track_never> {};

//------------------------------------------------------------------------------
} // namespace boost::serialization
//------------------------------------------------------------------------------
