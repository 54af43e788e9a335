////////////////////////////////////////////////////////////////////////////////
/// JSON (de)serialization of psi::maps containers (nlohmann::json ADL hooks)
///
/// Maps are written as JSON objects; keys that are not strings go through
/// boost::lexical_cast. JSON objects carry no order: decoding into an
/// ordered_map yields the object's iteration order and drops the comparator.
/// Sets are written as arrays in their iteration order; decoding adds to the
/// current elements.
///
/// safe<> wrappers can be neither copied nor moved: decode them with
/// json.get_to( wrapper ).
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

#include <psi/maps/containers/abi.hpp>
#include <psi/maps/containers/map.hpp>
#include <psi/maps/containers/ordered_map.hpp>
#include <psi/maps/containers/ordered_set.hpp>
#include <psi/maps/containers/safe.hpp>
#include <psi/maps/containers/set.hpp>
#include <psi/maps/error/error.hpp>

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename Key>
    [[ nodiscard ]] std::string to_json_key( Key const & key )
    {
        if constexpr ( std::is_convertible_v<Key const &, std::string> )
            return key;
        else
            return boost::lexical_cast<std::string>( key );
    }

    template <typename Key>
    [[ nodiscard ]] Key from_json_key( std::string const & key )
    {
        if constexpr ( std::is_constructible_v<Key, std::string const &> )
            return Key( key );
        else
        {
            Key result;
            if ( !boost::conversion::try_lexical_convert( key, result ) )
                throw_decode_error( "psi::maps: JSON object key not convertible to the key type" );
            return result;
        }
    }

    template <typename Json, typename Map>
    void map_to_json( Json & j, Map const & m )
    {
        j = Json::object();
        m.range( [ &j ]( auto const & key, auto const & val ) {
            j[ to_json_key( key ) ] = val;
            return true;
        } );
    }

    /// Decodes into a fresh container (the comparator of an ordered_map is
    /// not carried over) and swaps it in.
    template <typename Json, typename Map>
    void map_from_json( Json const & j, Map & m )
    {
        if ( !j.is_object() )
            throw_decode_error( "psi::maps: JSON object expected" );
        Map decoded;
        for ( auto const & item : j.items() )
            decoded.set( from_json_key<typename Map::key_type>( item.key() ), item.value().template get<typename Map::mapped_type>() );
        std::swap( m, decoded );
    }

    template <typename Json, typename Set>
    void set_to_json( Json & j, Set const & s )
    {
        j = Json::array();
        s.range( [ &j ]( auto const & key ) {
            j.push_back( key );
            return true;
        } );
    }

    template <typename Json, typename Set>
    void set_from_json( Json const & j, Set & s )
    {
        if ( !j.is_array() )
            throw_decode_error( "psi::maps: JSON array expected" );
        s.insert( j.template get<std::vector<typename Set::key_type>>() );
    }
} // namespace detail

template <typename Json, typename K, typename T, typename H, typename E>
void to_json  ( Json       & j, map<K, T, H, E> const & m ) { detail::map_to_json  ( j, m ); }
template <typename Json, typename K, typename T, typename H, typename E>
void from_json( Json const & j, map<K, T, H, E>       & m ) { detail::map_from_json( j, m ); }

template <typename Json, typename K, typename T, typename H, typename E>
void to_json  ( Json       & j, ordered_map<K, T, H, E> const & m ) { detail::map_to_json  ( j, m ); }
template <typename Json, typename K, typename T, typename H, typename E>
void from_json( Json const & j, ordered_map<K, T, H, E>       & m ) { detail::map_from_json( j, m ); }

template <typename Json, typename K, typename H, typename E>
void to_json  ( Json       & j, set<K, H, E> const & s ) { detail::set_to_json  ( j, s ); }
template <typename Json, typename K, typename H, typename E>
void from_json( Json const & j, set<K, H, E>       & s ) { detail::set_from_json( j, s ); }

template <typename Json, typename K, typename Cmp, typename H, typename E>
void to_json  ( Json       & j, sorted_set<K, Cmp, H, E> const & s ) { detail::set_to_json  ( j, s ); }
template <typename Json, typename K, typename Cmp, typename H, typename E>
void from_json( Json const & j, sorted_set<K, Cmp, H, E>       & s ) { detail::set_from_json( j, s ); }

template <typename Json, typename K, typename H, typename E>
void to_json  ( Json       & j, ordered_set<K, H, E> const & s ) { detail::set_to_json  ( j, s ); }
template <typename Json, typename K, typename H, typename E>
void from_json( Json const & j, ordered_set<K, H, E>       & s ) { detail::set_from_json( j, s ); }

template <typename Json, typename C>
void to_json( Json & j, safe<C> const & s )
{
    using access = detail::codec_access;
    auto const lock{ access::read_lock( s ) };
    to_json( j, access::inner( s ) );
}

template <typename Json, typename C>
void from_json( Json const & j, safe<C> & s )
{
    C decoded;
    from_json( j, decoded );
    detail::codec_access::install( s, std::move( decoded ) );
}

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
