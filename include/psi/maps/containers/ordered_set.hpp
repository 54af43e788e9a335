////////////////////////////////////////////////////////////////////////////////
/// psi::maps::ordered_set: set adapter over ordered_map<K, unit>
///
/// Elements iterate in insertion order or, once set_comparator() installed a
/// key ordering, continuously sorted by it (sorting happens on insert, reads
/// are already ordered).
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

#include "ordered_map.hpp"

#include <psi/maps/debug_string.hpp>
#include <psi/maps/interface.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ranges>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

namespace detail { struct codec_access; }

template
<
    typename Key,
    typename Hash     = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class ordered_set
{
public:
    using key_type        = Key;
    using value_type      = Key;
    using size_type       = std::size_t;
    using map_type        = ordered_map<Key, unit, Hash, KeyEqual>;
    using comparator_type = std::function<bool( Key const & key1, Key const & key2 )>;

private:
    using key_arg = const_arg_t<Key>;

public:
    ordered_set() = default;
    ordered_set( std::initializer_list<Key> const keys ) { insert( keys ); }

    template <std::ranges::input_range R>
    [[ nodiscard ]] static ordered_set collect( R && keys )
    {
        ordered_set result;
        result.insert( std::forward<R>( keys ) );
        return result;
    }

    /// Installs (or, with an empty function, removes) the ordering of the
    /// elements; installing sorts the current elements.
    void set_comparator( comparator_type less )
    {
        if ( !less )
        {
            map_.set_comparator( nullptr );
            return;
        }
        map_.set_comparator
        (
            [ less = std::move( less ) ]( Key const & key1, Key const & key2, unit, unit ) { return less( key1, key2 ); }
        );
    }

    [[ nodiscard ]] bool has_comparator() const noexcept { return map_.has_comparator(); }

    template <typename... Keys>
    ordered_set & add( Keys &&... keys ) { ( map_.set( Key( std::forward<Keys>( keys ) ), unit{} ), ... ); return *this; }

    void erase( key_arg key ) { map_.erase( key ); }

    template <typename Predicate>
    void erase_if( Predicate && pred ) { map_.erase_if( [ &pred ]( Key const & key, unit ) { return pred( key ); } ); }

    void clear() { map_.clear(); }

    [[ nodiscard ]] bool has( key_arg key ) const { return map_.has( key ); }

    /// The elements in current order.
    [[ nodiscard ]] std::vector<Key> values() const { return map_.keys(); }

    [[ nodiscard ]] size_type size () const noexcept { return map_.size();  }
    [[ nodiscard ]] bool      empty() const noexcept { return map_.empty(); }

    template <typename Visitor>
    void range( Visitor && visit ) const
    {
        map_.range( [ &visit ]( Key const & key, unit ) { return static_cast<bool>( visit( key ) ); } );
    }

    auto begin() const noexcept { return map_.keys_view().begin(); }
    auto end  () const noexcept { return map_.keys_view().end  (); }

    [[ nodiscard ]] auto all() const noexcept { return map_.keys_view(); }

    template <std::ranges::input_range R>
    void insert( R && keys )
    {
        for ( auto && key : keys )
            add( key );
    }

    template <compatible_set<ordered_set> Other>
    void copy( Other const & other )
    {
        other.range( [ this ]( Key const & key ) { add( key ); return true; } );
    }

    template <compatible_set<ordered_set> Other>
    [[ deprecated( "use copy()" ) ]] void merge( Other const & other ) { copy( other ); }

    /// Same elements, regardless of order.
    template <compatible_set<ordered_set> Other>
    [[ nodiscard ]] bool equal( Other const & other ) const
    {
        if ( size() != other.size() )
            return false;
        bool result{ true };
        other.range( [ & ]( Key const & key ) { return result = has( key ); } );
        return result;
    }

    [[ nodiscard ]] ordered_set clone() const { return *this; }

    [[ nodiscard ]] std::string to_string() const { return detail::render_set( *this ); }

private: friend struct detail::codec_access;
    map_type map_;
}; // class ordered_set

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
