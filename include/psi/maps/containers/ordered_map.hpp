////////////////////////////////////////////////////////////////////////////////
///
/// \file ordered_map.hpp
/// ---------------------
///
/// psi::maps::ordered_map: hash map with a deterministic, caller controlled
/// iteration order
///
/// Storage is a hash table (membership and lookup) plus a parallel vector of
/// keys (iteration and positional order). The two are kept in bijection:
/// every key of the order vector is in the table and vice versa, without
/// duplicates.
///
/// The order is either:
///  - insertion order (FIFO), optionally overridden per entry with set_at(), or
///  - continuously sorted by an installed entry comparator
///    (set_comparator()): new keys are spliced in at their binary searched
///    position.
/// Updating the value of an existing key never moves it, even while a
/// comparator is installed (erase + set re-sorts a single entry).
/// Positional insertion and an installed comparator are mutually exclusive:
/// set_at() throws usage_error while a comparator is installed.
///
/// A default constructed ordered_map allocates nothing and every read-only
/// operation on it returns the empty/zero result. clear() returns to that
/// state but keeps the comparator.
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
#include "komparator.hpp"

#include <psi/maps/debug_string.hpp>
#include <psi/maps/error/error.hpp>
#include <psi/maps/interface.hpp>

#include <boost/assert.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
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
class ordered_map
{
public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<Key const, T>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using table_type      = std::unordered_map<Key, T, Hash, KeyEqual>;
    using order_type      = std::vector<Key>;
    using comparator_type = entry_less<Key, T>;

    class const_iterator;
    using iterator = const_iterator;

private:
    using key_arg = const_arg_t<Key>;

public:
    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    ordered_map() = default;

    /// Entries are added in list order (duplicates keep their first position).
    ordered_map( std::initializer_list<value_type> const il ) { insert( il ); }

    /// Copies the contents of one or more plain tables, each in its own
    /// iteration order (later sources update values of earlier ones).
    template <typename... Sources>
    requires( sizeof...( Sources ) > 0 && ( std::convertible_to<Sources const &, table_type const &> && ... ) )
    explicit ordered_map( Sources const & ... sources )
    {
        ( insert( static_cast<table_type const &>( sources ) ), ... );
    }

    /// Collects (key, value) pairs from a range, in the range's order.
    template <std::ranges::input_range R>
    [[ nodiscard ]] static ordered_map collect( R && entries )
    {
        ordered_map result;
        result.insert( std::forward<R>( entries ) );
        return result;
    }

    //--------------------------------------------------------------------------
    // Ordering
    //--------------------------------------------------------------------------

    /// Installs less as the ordering of this map and stable sorts the current
    /// entries by it. An empty function (or nullptr) removes the comparator:
    /// the current order stays as is and subsequent new keys are appended.
    /// A throwing comparator leaves the map (and the previous comparator)
    /// unchanged.
    void set_comparator( comparator_type less )
    {
        if ( less )
            detail::stable_sort_entries<Key, T>( order_, items_, less );
        less_ = std::move( less );
        BOOST_ASSERT( !less_ || is_sorted() );
    }

    [[ nodiscard ]] bool has_comparator() const noexcept { return static_cast<bool>( less_ ); }

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

    /// Value at position (a value-initialized T when out of range).
    [[ nodiscard ]] T get_at( difference_type const position ) const
    {
        if ( !in_range( position ) )
            return T{};
        return entry( order_[ static_cast<size_type>( position ) ] ).second;
    }

    /// Key at position (a value-initialized Key when out of range).
    [[ nodiscard ]] Key get_key_at( difference_type const position ) const
    {
        if ( !in_range( position ) )
            return Key{};
        return order_[ static_cast<size_type>( position ) ];
    }

    /// Snapshot of the keys in current order.
    [[ nodiscard ]] std::vector<Key> keys() const { return order_; }

    /// Snapshot of the values in current order.
    [[ nodiscard ]] std::vector<T> values() const
    {
        std::vector<T> result;
        result.reserve( order_.size() );
        for ( auto const & key : order_ )
            result.push_back( entry( key ).second );
        return result;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return order_.size();  }
    [[ nodiscard ]] bool      empty() const noexcept { return order_.empty(); }

    //--------------------------------------------------------------------------
    // Iteration
    //--------------------------------------------------------------------------
    const_iterator begin() const noexcept { return { order_.begin(), items_ }; }
    const_iterator end  () const noexcept { return { order_.end  (), items_ }; }

    /// Lazy views in current order; each call starts a new pass.
    /// The map must not be modified while a view is being consumed.
    [[ nodiscard ]] auto all        () const noexcept { return std::ranges::subrange( begin(), end() ); }
    [[ nodiscard ]] auto keys_view  () const noexcept { return std::views::all( order_ ); }
    [[ nodiscard ]] auto values_view() const noexcept { return all() | std::views::values; }

    /// Calls visit( key, value ) for every entry, in order, until it returns
    /// false.
    template <typename Visitor>
    void range( Visitor && visit ) const
    {
        for ( auto const & key : order_ )
        {
            auto const & [ k, v ]{ entry( key ) };
            if ( !visit( k, v ) )
                break;
        }
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Inserts or updates. A new key is appended (or, with a comparator,
    /// spliced in at its sorted position); an existing key keeps its position.
    void set( Key key, T val )
    {
        auto const pos{ items_.find( key ) };
        if ( pos != items_.end() )
        {
            pos->second = std::move( val );
            return;
        }

        // the position is searched for before anything is modified: a
        // throwing comparator leaves the map untouched
        auto const position{ less_ ? sorted_position( key, val ) : order_.size() };
        splice( position, std::move( key ), std::move( val ) );
    }

    /// Inserts at position, shifting the following entries back. Negative
    /// positions count from the end (-1 places the entry before the current
    /// last one), positions below -size() clamp to the front and positions
    /// past the end append. An existing key is first removed.
    /// Throws usage_error (without modifying the map) while a comparator is
    /// installed.
    void set_at( difference_type position, Key key, T val )
    {
        if ( less_ )
            detail::throw_usage_error( "psi::maps::ordered_map::set_at(): positional insertion while a comparator is installed" );

        if ( position >= ssize() )
        {
            set( std::move( key ), std::move( val ) );
            return;
        }

        erase( key );

        auto const sz{ ssize() };
        if ( position <= -sz )
            position = 0;
        if ( position < 0 )
            position += sz;
        BOOST_ASSERT( ( position >= 0 ) && ( position <= sz ) );

        splice( static_cast<size_type>( position ), std::move( key ), std::move( val ) );
    }

    /// Removes key and returns its value (a value-initialized T if absent).
    T erase( key_arg key )
    {
        auto const pos{ items_.find( key ) };
        if ( pos == items_.end() )
            return T{};

        order_.erase( locate( *pos ) );
        T val{ std::move( pos->second ) };
        items_.erase( pos );
        BOOST_ASSERT( items_.size() == order_.size() );
        return val;
    }

    /// Removes every entry for which pred( key, value ) holds, visiting the
    /// entries in current order. All entries are visited before any is
    /// removed: a throwing predicate leaves the map unchanged.
    template <typename Predicate>
    void erase_if( Predicate && pred )
    {
        std::vector<bool> doomed;
        doomed.reserve( order_.size() );
        for ( auto const & key : order_ )
        {
            auto const & [ k, v ]{ entry( key ) };
            doomed.push_back( static_cast<bool>( pred( k, v ) ) );
        }

        size_type kept{ 0 };
        for ( size_type i{ 0 }; i < order_.size(); ++i )
        {
            if ( doomed[ i ] )
            {
                items_.erase( order_[ i ] );
                continue;
            }
            if ( kept != i )
                order_[ kept ] = std::move( order_[ i ] );
            ++kept;
        }
        order_.erase( order_.begin() + static_cast<difference_type>( kept ), order_.end() );
        BOOST_ASSERT( items_.size() == order_.size() );
    }

    /// Removes all entries and releases the storage. The comparator survives.
    void clear()
    {
        table_type{}.swap( items_ );
        order_type{}.swap( order_ );
    }

    /// Upserts every entry of other (visited in other's order).
    template <compatible_map<ordered_map> Other>
    void copy( Other const & other )
    {
        if ( static_cast<void const *>( &other ) == this )
            return;
        other.range( [ this ]( Key const & key, T const & val ) {
            set( key, val );
            return true;
        } );
    }

    template <compatible_map<ordered_map> Other>
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
    template <compatible_map<ordered_map> Other>
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

    /// Shallow copy of the entries, the order and the comparator.
    [[ nodiscard ]] ordered_map clone() const { return *this; }

    [[ nodiscard ]] std::string to_string() const { return detail::render_map( *this ); }

private: friend struct detail::codec_access;
    [[ nodiscard ]] difference_type ssize() const noexcept { return static_cast<difference_type>( order_.size() ); }

    [[ nodiscard ]] bool in_range( difference_type const position ) const noexcept { return ( position >= 0 ) && ( position < ssize() ); }

    /// Upper bound of ( key, val ) under the installed comparator: new
    /// entries go after the ones they are equivalent to.
    [[ nodiscard ]] size_type sorted_position( Key const & key, T const & val ) const
    {
        BOOST_ASSERT( less_ );
        return detail::search_index( order_.size(), [ & ]( size_type const i ) {
            auto const & [ other_k, other_v ]{ entry( order_[ i ] ) };
            return less_( key, other_k, val, other_v );
        } );
    }

    /// Adds a new key to both the order (at position) and the table,
    /// all-or-nothing.
    void splice( size_type const position, Key key, T val )
    {
        BOOST_ASSERT( position <= order_.size() );
        BOOST_ASSERT( !items_.contains( key ) );
        auto const slot{ order_.insert( order_.begin() + static_cast<difference_type>( position ), key ) };
        try {
            items_.emplace( std::move( key ), std::move( val ) );
        } catch ( ... ) {
            order_.erase( slot );
            throw;
        }
        BOOST_ASSERT( items_.size() == order_.size() );
    }

    [[ nodiscard ]] value_type const & entry( Key const & key ) const
    {
        auto const pos{ items_.find( key ) };
        BOOST_ASSERT_MSG( pos != items_.end(), "Key order out of sync with the table" );
        return *pos;
    }

    /// Position of the (existing) entry in the order vector: binary searched
    /// (first position not ordered before the entry) when a comparator is
    /// installed, linear otherwise.
    [[ nodiscard ]] typename order_type::const_iterator locate( value_type const & target ) const
    {
        auto const & [ key, val ]{ target };
        auto const eq{ items_.key_eq() };
        if ( less_ )
        {
            auto const first
            {
                detail::search_index( order_.size(), [ & ]( size_type const i ) {
                    auto const & [ other_k, other_v ]{ entry( order_[ i ] ) };
                    return !less_( other_k, key, other_v, val );
                } )
            };
            // equivalent entries (and ones whose values were updated since
            // they were placed) may precede the exact key
            for ( auto i{ first }; i < order_.size(); ++i )
            {
                if ( eq( order_[ i ], key ) )
                    return order_.begin() + static_cast<difference_type>( i );
            }
            for ( size_type i{ 0 }; i < first; ++i )
            {
                if ( eq( order_[ i ], key ) )
                    return order_.begin() + static_cast<difference_type>( i );
            }
        }
        else
        {
            auto const pos{ std::ranges::find_if( order_, [ & ]( Key const & k ) { return eq( k, key ); } ) };
            if ( pos != order_.end() )
                return pos;
        }
        BOOST_ASSERT_MSG( false, "Key missing from the order vector" );
        std::unreachable();
    }

    [[ nodiscard ]] bool is_sorted() const
    {
        for ( size_type i{ 1 }; i < order_.size(); ++i )
        {
            auto const & [ prev_k, prev_v ]{ entry( order_[ i - 1 ] ) };
            auto const & [ k     , v      ]{ entry( order_[ i     ] ) };
            if ( less_( k, prev_k, v, prev_v ) )
                return false;
        }
        return true;
    }

    table_type      items_;
    order_type      order_;
    comparator_type less_;
}; // class ordered_map


////////////////////////////////////////////////////////////////////////////////
// \class ordered_map::const_iterator
////////////////////////////////////////////////////////////////////////////////

/// Random access over the key order, dereferencing to the table entry.
template <typename Key, typename T, typename Hash, typename KeyEqual>
class ordered_map<Key, T, Hash, KeyEqual>::const_iterator
    :
    public boost::stl_interfaces::iterator_interface
    <
        const_iterator,
        std::random_access_iterator_tag,
        typename ordered_map::value_type,
        typename ordered_map::value_type const &,
        typename ordered_map::value_type const *
    >
{
private: friend class ordered_map; friend boost::stl_interfaces::access;
    using order_iterator = typename order_type::const_iterator;

    constexpr const_iterator( order_iterator const pos, table_type const & table ) noexcept : pos_{ pos }, table_{ &table } {}

    constexpr order_iterator & base_reference()       noexcept { return pos_; }
    constexpr order_iterator   base_reference() const noexcept { return pos_; }

public:
    constexpr const_iterator() noexcept = default;

    // Boost < 1.75 iterator_interface returns the base iterator from its default operator+=.
    constexpr const_iterator & operator+=( typename const_iterator::difference_type const n ) noexcept { pos_ += n; return *this; }

    typename ordered_map::value_type const & operator*() const
    {
        BOOST_ASSERT( table_ );
        auto const entry{ table_->find( *pos_ ) };
        BOOST_ASSERT_MSG( entry != table_->end(), "Key order out of sync with the table" );
        return *entry;
    }

private:
    order_iterator     pos_  {};
    table_type const * table_{};
}; // class ordered_map::const_iterator

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
