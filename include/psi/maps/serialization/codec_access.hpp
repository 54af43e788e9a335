////////////////////////////////////////////////////////////////////////////////
/// Storage access for the binary and JSON codecs.
///
/// Decoding never installs partially validated state: the caller decodes into
/// temporaries and hands them over here, where the key order is checked
/// against the table before anything is swapped in.
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

#include <psi/maps/containers/map.hpp>
#include <psi/maps/containers/ordered_map.hpp>
#include <psi/maps/containers/safe.hpp>
#include <psi/maps/error/error.hpp>
#include <psi/maps/interface.hpp>

#include <mutex>
#include <shared_mutex>
#include <unordered_set>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps::detail
{
//------------------------------------------------------------------------------

struct codec_access
{
    template <typename K, typename T, typename H, typename E>
    static auto const & table( map<K, T, H, E> const & m ) noexcept { return m.items_; }

    template <typename K, typename T, typename H, typename E>
    static auto const & table( ordered_map<K, T, H, E> const & m ) noexcept { return m.items_; }

    template <typename K, typename T, typename H, typename E>
    static auto const & order( ordered_map<K, T, H, E> const & m ) noexcept { return m.order_; }

    template <typename K, typename T, typename H, typename E>
    static void assign( map<K, T, H, E> & m, typename map<K, T, H, E>::table_type && items ) noexcept
    {
        m.items_.swap( items );
    }

    /// Replaces the contents with a decoded (table, order) pair. Throws
    /// decode_error, leaving m untouched, unless order is a permutation of
    /// the table's keys. The comparator is dropped.
    template <typename K, typename T, typename H, typename E>
    static void assign
    (
        ordered_map<K, T, H, E>                                & m,
        typename ordered_map<K, T, H, E>::table_type          && items,
        typename ordered_map<K, T, H, E>::order_type          && order
    )
    {
        if ( items.size() != order.size() )
            throw_decode_error( "psi::maps::ordered_map: key order and table sizes differ" );

        std::unordered_set<K, H, E> seen( order.size(), items.hash_function(), items.key_eq() );
        for ( auto const & key : order )
        {
            if ( !items.contains( key ) )
                throw_decode_error( "psi::maps::ordered_map: key order names a key missing from the table" );
            if ( !seen.insert( key ).second )
                throw_decode_error( "psi::maps::ordered_map: duplicate key in the key order" );
        }

        m.items_.swap( items );
        m.order_.swap( order );
        m.less_ = nullptr;
    }

    template <typename C>
    static C const & inner( safe<C> const & s ) noexcept { return s.c_; }

    template <typename C>
    [[ nodiscard ]] static std::shared_lock<std::shared_mutex> read_lock( safe<C> const & s ) { return std::shared_lock{ s.mutex_ }; }

    /// Installs a fully decoded container: sets are merged into (decoding a
    /// set is additive), maps are replaced.
    template <typename C>
    static void install( safe<C> & s, C && decoded )
    {
        std::unique_lock const lock{ s.mutex_ };
        if constexpr ( set_interface<C> )
            s.c_.copy( decoded );
        else
            std::swap( s.c_, decoded );
    }
}; // struct codec_access

//------------------------------------------------------------------------------
} // namespace psi::maps::detail
//------------------------------------------------------------------------------
