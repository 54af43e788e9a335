////////////////////////////////////////////////////////////////////////////////
/// psi::maps::set and psi::maps::sorted_set: hash sets with the psi::maps
/// capability contract
///
/// set<K>        : map<K, unit> adapter, iteration in the table's order
/// sorted_set<K> : same storage, every read (values(), range(), all(),
///                 to_string()) yields the keys sorted by Compare
///
/// sorted_set trades O(n log n) reads for O(1) inserts; ordered_set keeps its
/// order continuously maintained instead.
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

#include "komparator.hpp"
#include "map.hpp"

#include <psi/maps/debug_string.hpp>
#include <psi/maps/interface.hpp>

#include <concepts>
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
class set
{
public:
    using key_type   = Key;
    using value_type = Key;
    using size_type  = std::size_t;
    using map_type   = map<Key, unit, Hash, KeyEqual>;

private:
    using key_arg = const_arg_t<Key>;

public:
    set() = default;
    set( std::initializer_list<Key> const keys ) { insert( keys ); }

    template <std::ranges::input_range R>
    [[ nodiscard ]] static set collect( R && keys )
    {
        set result;
        result.insert( std::forward<R>( keys ) );
        return result;
    }

    template <typename... Keys>
    set & add( Keys &&... keys ) { ( map_.set( Key( std::forward<Keys>( keys ) ), unit{} ), ... ); return *this; }

    void erase( key_arg key ) { map_.erase( key ); }

    template <typename Predicate>
    void erase_if( Predicate && pred ) { map_.erase_if( [ &pred ]( Key const & key, unit ) { return pred( key ); } ); }

    void clear() { map_.clear(); }

    [[ nodiscard ]] bool has( key_arg key ) const { return map_.has( key ); }

    [[ nodiscard ]] std::vector<Key> values() const { return map_.keys(); }

    [[ nodiscard ]] size_type size () const noexcept { return map_.size();  }
    [[ nodiscard ]] bool      empty() const noexcept { return map_.empty(); }

    /// Calls visit( key ) for every element until it returns false.
    template <typename Visitor>
    void range( Visitor && visit ) const
    {
        map_.range( [ &visit ]( Key const & key, unit ) { return static_cast<bool>( visit( key ) ); } );
    }

    [[ nodiscard ]] auto all() const noexcept { return map_.keys_view(); }

    template <std::ranges::input_range R>
    void insert( R && keys )
    {
        for ( auto && key : keys )
            add( key );
    }

    template <compatible_set<set> Other>
    void copy( Other const & other )
    {
        other.range( [ this ]( Key const & key ) { add( key ); return true; } );
    }

    template <compatible_set<set> Other>
    [[ deprecated( "use copy()" ) ]] void merge( Other const & other ) { copy( other ); }

    /// Same elements, regardless of order.
    template <compatible_set<set> Other>
    [[ nodiscard ]] bool equal( Other const & other ) const
    {
        if ( size() != other.size() )
            return false;
        bool result{ true };
        other.range( [ & ]( Key const & key ) { return result = has( key ); } );
        return result;
    }

    [[ nodiscard ]] set clone() const { return *this; }

    [[ nodiscard ]] std::string to_string() const { return detail::render_set( *this ); }

private: friend struct detail::codec_access;
    map_type map_;
}; // class set


/// Hash set that sorts its elements (by Compare) on every read.
template
<
    typename Key,
    typename Compare  = std::less<Key>,
    typename Hash     = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class sorted_set
{
public:
    using key_type     = Key;
    using value_type   = Key;
    using size_type    = std::size_t;
    using key_compare  = Compare;
    using storage_type = set<Key, Hash, KeyEqual>;

private:
    using key_arg = const_arg_t<Key>;

public:
    sorted_set() = default;
    sorted_set( std::initializer_list<Key> const keys ) : set_( keys ) {}

    template <std::ranges::input_range R>
    [[ nodiscard ]] static sorted_set collect( R && keys )
    {
        sorted_set result;
        result.insert( std::forward<R>( keys ) );
        return result;
    }

    template <typename... Keys>
    sorted_set & add( Keys &&... keys ) { set_.add( std::forward<Keys>( keys )... ); return *this; }

    void erase( key_arg key ) { set_.erase( key ); }

    template <typename Predicate>
    void erase_if( Predicate && pred ) { set_.erase_if( std::forward<Predicate>( pred ) ); }

    void clear() { set_.clear(); }

    [[ nodiscard ]] bool has( key_arg key ) const { return set_.has( key ); }

    /// The elements, sorted.
    [[ nodiscard ]] std::vector<Key> values() const
    {
        auto keys{ set_.values() };
        Komparator<Compare>{}.sort( keys.begin(), keys.end() );
        return keys;
    }

    [[ nodiscard ]] size_type size () const noexcept { return set_.size();  }
    [[ nodiscard ]] bool      empty() const noexcept { return set_.empty(); }

    /// Calls visit( key ) for every element, in sorted order, until it returns
    /// false.
    template <typename Visitor>
    void range( Visitor && visit ) const
    {
        for ( auto const & key : values() )
        {
            if ( !visit( key ) )
                break;
        }
    }

    /// Each call sorts a fresh snapshot.
    [[ nodiscard ]] auto all() const { return std::views::all( values() ); }

    template <std::ranges::input_range R>
    void insert( R && keys ) { set_.insert( std::forward<R>( keys ) ); }

    template <compatible_set<sorted_set> Other>
    void copy( Other const & other )
    {
        other.range( [ this ]( Key const & key ) { add( key ); return true; } );
    }

    template <compatible_set<sorted_set> Other>
    [[ deprecated( "use copy()" ) ]] void merge( Other const & other ) { copy( other ); }

    template <compatible_set<sorted_set> Other>
    [[ nodiscard ]] bool equal( Other const & other ) const
    {
        if ( size() != other.size() )
            return false;
        bool result{ true };
        other.range( [ & ]( Key const & key ) { return result = has( key ); } );
        return result;
    }

    [[ nodiscard ]] sorted_set clone() const { return *this; }

    [[ nodiscard ]] std::string to_string() const { return detail::render_set( *this ); }

private: friend struct detail::codec_access;
    storage_type set_;
}; // class sorted_set

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
