////////////////////////////////////////////////////////////////////////////////
/// psi::maps::map: plain hash map with the psi::maps capability contract
///
/// A thin delegate over std::unordered_map: iteration, keys() and values()
/// follow the table's (unspecified) order. Use ordered_map when a
/// deterministic order is required: both satisfy map_interface, so switching
/// is a change of type only.
///
/// The default-constructed map owns no heap storage; the table is populated
/// lazily by the first write and clear() releases it again.
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

#include "abi.hpp"
#include "equality.hpp"

#include <psi/maps/debug_string.hpp>
#include <psi/maps/interface.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ranges>
#include <string>
#include <unordered_map>
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
    typename T,
    typename Hash     = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class map
{
public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type       = Key;
    using mapped_type    = T;
    using value_type     = std::pair<Key const, T>;
    using size_type      = std::size_t;
    using hasher         = Hash;
    using key_equal      = KeyEqual;
    using table_type     = std::unordered_map<Key, T, Hash, KeyEqual>;
    using const_iterator = typename table_type::const_iterator;
    using iterator       = const_iterator;

private:
    using key_arg = const_arg_t<Key>;

public:
    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    map() = default;

    map( std::initializer_list<value_type> const il ) : items_( il ) {}

    /// Copies the contents of one or more plain tables (later sources win).
    template <typename... Sources>
    requires( sizeof...( Sources ) > 0 && ( std::convertible_to<Sources const &, table_type const &> && ... ) )
    explicit map( Sources const & ... sources )
    {
        ( insert( static_cast<table_type const &>( sources ) ), ... );
    }

    /// Collects (key, value) pairs from a range; duplicate keys keep the last value.
    template <std::ranges::input_range R>
    [[ nodiscard ]] static map collect( R && entries )
    {
        map result;
        result.insert( std::forward<R>( entries ) );
        return result;
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] T get( key_arg key ) const
    {
        auto const pos{ items_.find( key ) };
        return ( pos != items_.end() ) ? pos->second : T{};
    }

    [[ nodiscard ]] std::pair<T, bool> load( key_arg key ) const
    {
        auto const pos{ items_.find( key ) };
        if ( pos == items_.end() )
            return { T{}, false };
        return { pos->second, true };
    }

    [[ nodiscard ]] bool has( key_arg key ) const { return items_.contains( key ); }

    [[ nodiscard ]] std::vector<Key> keys() const
    {
        std::vector<Key> result;
        result.reserve( items_.size() );
        for ( auto const & entry : items_ )
            result.push_back( entry.first );
        return result;
    }

    [[ nodiscard ]] std::vector<T> values() const
    {
        std::vector<T> result;
        result.reserve( items_.size() );
        for ( auto const & entry : items_ )
            result.push_back( entry.second );
        return result;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return items_.size();  }
    [[ nodiscard ]] bool      empty() const noexcept { return items_.empty(); }

    //--------------------------------------------------------------------------
    // Iteration
    //--------------------------------------------------------------------------
    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end  () const noexcept { return items_.end  (); }

    /// Lazy views over the current contents; each call starts a new pass.
    /// The map must not be modified while a view is being consumed.
    [[ nodiscard ]] auto all        () const noexcept { return std::views::all( items_ ); }
    [[ nodiscard ]] auto keys_view  () const noexcept { return std::views::keys  ( items_ ); }
    [[ nodiscard ]] auto values_view() const noexcept { return std::views::values( items_ ); }

    /// Calls visit( key, value ) for every entry until it returns false.
    template <typename Visitor>
    void range( Visitor && visit ) const
    {
        for ( auto const & [ key, val ] : items_ )
        {
            if ( !visit( key, val ) )
                break;
        }
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------
    void set( Key key, T val ) { items_.insert_or_assign( std::move( key ), std::move( val ) ); }

    /// Removes key and returns its value (a value-initialized T if absent).
    T erase( key_arg key )
    {
        auto const pos{ items_.find( key ) };
        if ( pos == items_.end() )
            return T{};
        T val{ std::move( pos->second ) };
        items_.erase( pos );
        return val;
    }

    template <typename Predicate>
    void erase_if( Predicate && pred )
    {
        std::erase_if( items_, [ &pred ]( value_type const & entry ) { return static_cast<bool>( pred( entry.first, entry.second ) ); } );
    }

    void clear() { table_type{}.swap( items_ ); }

    /// Upserts every entry of other (visited in other's order).
    template <compatible_map<map> Other>
    void copy( Other const & other )
    {
        other.range( [ this ]( Key const & key, T const & val ) {
            set( key, val );
            return true;
        } );
    }

    template <compatible_map<map> Other>
    [[ deprecated( "use copy()" ) ]] void merge( Other const & other ) { copy( other ); }

    /// Upserts every (key, value) element of entries, in the range's order.
    template <std::ranges::input_range R>
    void insert( R && entries )
    {
        for ( auto && [ key, val ] : entries )
            set( key, val );
    }

    //--------------------------------------------------------------------------
    // Comparison & copying
    //--------------------------------------------------------------------------

    /// Same keys with equal values (see equal_values()), regardless of order.
    template <compatible_map<map> Other>
    [[ nodiscard ]] bool equal( Other const & other ) const
    {
        if ( size() != other.size() )
            return false;
        bool result{ true };
        other.range( [ & ]( Key const & key, T const & val ) {
            auto const pos{ items_.find( key ) };
            if ( ( pos == items_.end() ) || !equal_values( pos->second, val ) )
            {
                result = false;
                return false;
            }
            return true;
        } );
        return result;
    }

    /// Shallow copy: values are copy constructed, storage is not shared.
    [[ nodiscard ]] map clone() const { return *this; }

    [[ nodiscard ]] std::string to_string() const { return detail::render_map( *this ); }

private: friend struct detail::codec_access;
    table_type items_;
}; // class map

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
