////////////////////////////////////////////////////////////////////////////////
/// psi::maps::safe<C>: readers-writer locked wrapper around any psi::maps
/// container
///
/// Every mutating call takes the exclusive lock, every read (including
/// range(), to_string(), clone() and the all() views) the shared one, each
/// call under a single acquisition. The lock is not reentrant: calling back
/// into the same wrapper from a range() visitor that mutates, or while an
/// all() view of it is alive on the same thread, deadlocks.
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

#include "map.hpp"
#include "ordered_map.hpp"
#include "ordered_set.hpp"
#include "set.hpp"

#include <psi/maps/debug_string.hpp>
#include <psi/maps/interface.hpp>

#include <cstddef>
#include <initializer_list>
#include <mutex>
#include <ranges>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

template <typename C> class safe;

namespace detail
{
    struct codec_access;

    template <typename T> inline constexpr bool is_safe{ false };
    template <typename C> inline constexpr bool is_safe<safe<C>>{ true };

    template <typename C>
    struct safe_member_types
    {
        using key_type   = typename C::key_type;
        using value_type = typename C::value_type;
    };

    template <typename C>
    requires requires { typename C::mapped_type; }
    struct safe_member_types<C>
    {
        using key_type    = typename C::key_type;
        using mapped_type = typename C::mapped_type;
        using value_type  = typename C::value_type;
    };
} // namespace detail


/// A view that keeps its source container read-locked for its lifetime.
template <typename View>
class locked_view
{
public:
    template <typename Make>
    locked_view( std::shared_mutex & mutex, Make && make ) : lock_{ mutex }, view_{ make() } {}

    locked_view( locked_view const & ) = delete;
    locked_view & operator=( locked_view const & ) = delete;

    auto begin() { return std::ranges::begin( view_ ); }
    auto end  () { return std::ranges::end  ( view_ ); }

private:
    std::shared_lock<std::shared_mutex> lock_;
    View                                view_;
}; // class locked_view


template <typename C>
class safe : public detail::safe_member_types<C>
{
public:
    using container_type = C;
    using key_type       = typename detail::safe_member_types<C>::key_type;
    using size_type      = std::size_t;

    safe() = default;
    explicit safe( C container ) noexcept( std::is_nothrow_move_constructible_v<C> ) : c_{ std::move( container ) } {}

    safe( std::initializer_list<typename C::value_type> const il ) : c_( il ) {}

    safe( safe const & ) = delete;
    safe & operator=( safe const & ) = delete;

    template <std::ranges::input_range R>
    [[ nodiscard ]] static safe collect( R && entries ) { return safe( C::collect( std::forward<R>( entries ) ) ); }

    //--------------------------------------------------------------------------
    // Writers
    //--------------------------------------------------------------------------
    template <typename... Args>
    requires requires( C & c, Args &&... args ) { c.set( std::forward<Args>( args )... ); }
    void set( Args &&... args ) { write( [ & ]( C & c ) { c.set( std::forward<Args>( args )... ); } ); }

    /// The usage check, the removal of an existing key and the insertion all
    /// happen under one exclusive lock.
    template <typename... Args>
    requires requires( C & c, Args &&... args ) { c.set_at( std::forward<Args>( args )... ); }
    void set_at( Args &&... args ) { write( [ & ]( C & c ) { c.set_at( std::forward<Args>( args )... ); } ); }

    template <typename Comparator>
    requires requires( C & c, Comparator && less ) { c.set_comparator( std::forward<Comparator>( less ) ); }
    void set_comparator( Comparator && less ) { write( [ & ]( C & c ) { c.set_comparator( std::forward<Comparator>( less ) ); } ); }

    template <typename... Keys>
    requires requires( C & c, Keys &&... keys ) { c.add( std::forward<Keys>( keys )... ); }
    safe & add( Keys &&... keys )
    {
        write( [ & ]( C & c ) { c.add( std::forward<Keys>( keys )... ); } );
        return *this;
    }

    template <typename K>
    decltype( auto ) erase( K const & key ) { return write( [ & ]( C & c ) { return c.erase( key ); } ); }

    template <typename Predicate>
    void erase_if( Predicate && pred ) { write( [ & ]( C & c ) { c.erase_if( std::forward<Predicate>( pred ) ); } ); }

    void clear() { write( []( C & c ) { c.clear(); } ); }

    template <std::ranges::input_range R>
    void insert( R && entries ) { write( [ & ]( C & c ) { c.insert( std::forward<R>( entries ) ); } ); }

    /// other is read (snapshotted, if it is itself a safe<>) before this
    /// wrapper is locked, so that concurrent cross copies cannot deadlock.
    template <typename Other>
    void copy( Other const & other )
    {
        if constexpr ( detail::is_safe<Other> )
        {
            if ( static_cast<void const *>( &other ) == this )
                return;
            auto const snapshot{ other.clone() };
            write( [ & ]( C & c ) { c.copy( snapshot.c_ ); } );
        }
        else
        {
            write( [ & ]( C & c ) { c.copy( other ); } );
        }
    }

    template <typename Other>
    [[ deprecated( "use copy()" ) ]] void merge( Other const & other ) { copy( other ); }

    //--------------------------------------------------------------------------
    // Readers
    //--------------------------------------------------------------------------
    template <typename K>
    [[ nodiscard ]] auto get ( K const & key ) const { return read( [ & ]( C const & c ) { return c.get ( key ); } ); }
    template <typename K>
    [[ nodiscard ]] auto load( K const & key ) const { return read( [ & ]( C const & c ) { return c.load( key ); } ); }
    template <typename K>
    [[ nodiscard ]] bool has ( K const & key ) const { return read( [ & ]( C const & c ) { return c.has ( key ); } ); }

    [[ nodiscard ]] auto get_at    ( std::ptrdiff_t const position ) const requires requires( C const & c ) { c.get_at    ( std::ptrdiff_t{} ); } { return read( [ = ]( C const & c ) { return c.get_at    ( position ); } ); }
    [[ nodiscard ]] auto get_key_at( std::ptrdiff_t const position ) const requires requires( C const & c ) { c.get_key_at( std::ptrdiff_t{} ); } { return read( [ = ]( C const & c ) { return c.get_key_at( position ); } ); }

    [[ nodiscard ]] bool has_comparator() const requires requires( C const & c ) { c.has_comparator(); } { return read( []( C const & c ) { return c.has_comparator(); } ); }

    [[ nodiscard ]] auto keys  () const requires requires( C const & c ) { c.keys(); } { return read( []( C const & c ) { return c.keys  (); } ); }
    [[ nodiscard ]] auto values() const                                                 { return read( []( C const & c ) { return c.values(); } ); }

    [[ nodiscard ]] size_type size () const { return read( []( C const & c ) { return c.size (); } ); }
    [[ nodiscard ]] bool      empty() const { return read( []( C const & c ) { return c.empty(); } ); }

    /// The visitor runs with the shared lock held: it must not mutate this
    /// wrapper.
    template <typename Visitor>
    void range( Visitor && visit ) const { read( [ & ]( C const & c ) { c.range( std::forward<Visitor>( visit ) ); } ); }

    [[ nodiscard ]] auto all() const
    {
        return locked_view<decltype( std::declval<C const &>().all() )>{ mutex_, [ this ] { return c_.all(); } };
    }
    [[ nodiscard ]] auto keys_view() const requires requires( C const & c ) { c.keys_view(); }
    {
        return locked_view<decltype( std::declval<C const &>().keys_view() )>{ mutex_, [ this ] { return c_.keys_view(); } };
    }
    [[ nodiscard ]] auto values_view() const requires requires( C const & c ) { c.values_view(); }
    {
        return locked_view<decltype( std::declval<C const &>().values_view() )>{ mutex_, [ this ] { return c_.values_view(); } };
    }

    template <typename Other>
    [[ nodiscard ]] bool equal( Other const & other ) const
    {
        if constexpr ( detail::is_safe<Other> )
        {
            if ( static_cast<void const *>( &other ) == this )
                return true;
            auto const snapshot{ other.clone() };
            return read( [ & ]( C const & c ) { return c.equal( snapshot.c_ ); } );
        }
        else
        {
            return read( [ & ]( C const & c ) { return c.equal( other ); } );
        }
    }

    [[ nodiscard ]] safe clone() const { return read( []( C const & c ) { return safe( c.clone() ); } ); }

    [[ nodiscard ]] std::string to_string() const { return read( []( C const & c ) { return c.to_string(); } ); }

private: friend struct detail::codec_access; template <typename> friend class safe;
    template <typename F>
    decltype( auto ) read( F && f ) const
    {
        std::shared_lock const lock{ mutex_ };
        return f( c_ );
    }

    template <typename F>
    decltype( auto ) write( F && f )
    {
        std::unique_lock const lock{ mutex_ };
        return f( c_ );
    }

    mutable std::shared_mutex mutex_;
            C                 c_;
}; // class safe


template <typename Key, typename T, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using safe_map         = safe<map        <Key, T, Hash, KeyEqual>>;
template <typename Key, typename T, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using safe_ordered_map = safe<ordered_map<Key, T, Hash, KeyEqual>>;
template <typename Key, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using safe_set         = safe<set        <Key, Hash, KeyEqual>>;
template <typename Key, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using safe_ordered_set = safe<ordered_set<Key, Hash, KeyEqual>>;
template <typename Key, typename Compare = std::less<Key>, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using safe_sorted_set  = safe<sorted_set <Key, Compare, Hash, KeyEqual>>;

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
