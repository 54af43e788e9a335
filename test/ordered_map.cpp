////////////////////////////////////////////////////////////////////////////////
/// psi::maps::ordered_map unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/maps/containers/map.hpp>
#include <psi/maps/containers/ordered_map.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <ranges>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps {
//------------------------------------------------------------------------------

using strings = std::vector<std::string>;

namespace
{
    bool by_key( std::string const & k1, std::string const & k2, int, int ) { return k1 < k2; }

    void expect_consistent( ordered_map<std::string, int> const & m )
    {
        auto const keys  { m.keys  () };
        auto const values{ m.values() };
        ASSERT_EQ( keys  .size(), m.size() );
        ASSERT_EQ( values.size(), m.size() );
        for ( std::size_t i{ 0 }; i < keys.size(); ++i )
        {
            EXPECT_TRUE( m.has( keys[ i ] ) );
            EXPECT_EQ  ( m.get( keys[ i ] ), values[ i ] );
            EXPECT_EQ  ( std::ranges::count( keys, keys[ i ] ), 1 );
        }
    }
} // anonymous namespace

static_assert( map_interface<ordered_map<std::string, int>> );
static_assert( std::ranges::random_access_range<decltype( std::declval<ordered_map<int, int> const &>().all() )> );

//==============================================================================
// Construction
//==============================================================================

TEST( ordered_map, default_construction )
{
    ordered_map<std::string, int> const m;
    EXPECT_TRUE ( m.empty() );
    EXPECT_EQ   ( m.size(), 0 );
    EXPECT_EQ   ( m.begin(), m.end() );
    EXPECT_EQ   ( m.get( "x" ), 0 );
    EXPECT_FALSE( m.has( "x" ) );
    EXPECT_EQ   ( m.load( "x" ), std::make_pair( 0, false ) );
    EXPECT_EQ   ( m.get_at( 0 ), 0 );
    EXPECT_EQ   ( m.get_key_at( 0 ), "" );
    EXPECT_TRUE ( m.keys  ().empty() );
    EXPECT_TRUE ( m.values().empty() );
    EXPECT_EQ   ( m.to_string(), "{}" );
    EXPECT_FALSE( m.has_comparator() );

    int visits{ 0 };
    m.range( [ & ]( std::string const &, int ) { ++visits; return true; } );
    EXPECT_EQ( visits, 0 );
}

TEST( ordered_map, initializer_list_construction )
{
    ordered_map<std::string, int> const m{ { "z", 1 }, { "a", 2 }, { "m", 3 } };
    EXPECT_EQ( m.keys  (), ( strings{ "z", "a", "m" } ) );
    EXPECT_EQ( m.values(), ( std::vector<int>{ 1, 2, 3 } ) );
}

TEST( ordered_map, construction_from_tables )
{
    std::unordered_map<std::string, int> const first { { "a", 1 }, { "b", 2 } };
    std::unordered_map<std::string, int> const second{ { "b", 20 }, { "c", 3 } };
    ordered_map<std::string, int> const m( first, second );

    EXPECT_EQ( m.size(), 3 );
    EXPECT_EQ( m.get( "a" ), 1  );
    EXPECT_EQ( m.get( "b" ), 20 );
    EXPECT_EQ( m.get( "c" ), 3  );
    EXPECT_EQ( m.get_key_at( 2 ), "c" );
    expect_consistent( m );
}

TEST( ordered_map, collect )
{
    std::vector<std::pair<std::string, int>> const pairs{ { "b", 1 }, { "a", 2 }, { "b", 3 } };
    auto const m{ ordered_map<std::string, int>::collect( pairs ) };
    EXPECT_EQ( m.keys(), ( strings{ "b", "a" } ) );
    EXPECT_EQ( m.get( "b" ), 3 );
}

//==============================================================================
// Insertion order
//==============================================================================

TEST( ordered_map, fifo_order )
{
    ordered_map<std::string, int> m;
    m.set( "a", 1 );
    m.set( "b", 2 );
    m.set( "c", 3 );
    EXPECT_EQ( m.keys  (), ( strings{ "a", "b", "c" } ) );
    EXPECT_EQ( m.values(), ( std::vector<int>{ 1, 2, 3 } ) );
    EXPECT_EQ( m.get_at( 1 ), 2 );
    EXPECT_EQ( m.get_key_at( 2 ), "c" );
}

TEST( ordered_map, update_preserves_position )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    m.set( "a", 10 );
    EXPECT_EQ( m.get( "a" ), 10 );
    EXPECT_EQ( m.keys(), ( strings{ "a", "b", "c" } ) );
}

TEST( ordered_map, positional_out_of_range )
{
    ordered_map<std::string, int> const m{ { "a", 1 } };
    EXPECT_EQ( m.get_at( -1 ), 0  );
    EXPECT_EQ( m.get_at(  1 ), 0  );
    EXPECT_EQ( m.get_key_at( -1 ), "" );
    EXPECT_EQ( m.get_key_at(  7 ), "" );
}

//==============================================================================
// set_at
//==============================================================================

TEST( ordered_map, set_at )
{
    ordered_map<std::string, int> m;
    m.set( "b", 2 );
    m.set( "a", 1 );

    m.set_at( 1, "c", 3 );
    EXPECT_EQ( m.keys(), ( strings{ "b", "c", "a" } ) );
    EXPECT_EQ( m.get_at( 1 ), 3 );

    m.set_at( -1, "d", 4 );
    EXPECT_EQ( m.keys(), ( strings{ "b", "c", "d", "a" } ) );

    m.set_at( -100, "e", 5 );
    EXPECT_EQ( m.keys(), ( strings{ "e", "b", "c", "d", "a" } ) );
    EXPECT_EQ( m.get_at( 0 ), 5 );
    expect_consistent( m );
}

TEST( ordered_map, set_at_past_the_end_appends )
{
    ordered_map<std::string, int> m{ { "a", 1 } };
    m.set_at( 5, "b", 2 );
    m.set_at( 2, "c", 3 );
    EXPECT_EQ( m.keys(), ( strings{ "a", "b", "c" } ) );
}

TEST( ordered_map, set_at_moves_existing_key )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    m.set_at( 0, "c", 30 );
    EXPECT_EQ( m.keys(), ( strings{ "c", "a", "b" } ) );
    EXPECT_EQ( m.get( "c" ), 30 );
    EXPECT_EQ( m.size(), 3 );

    m.set_at( -1, "c", 31 );
    EXPECT_EQ( m.keys(), ( strings{ "a", "c", "b" } ) );
    expect_consistent( m );
}

TEST( ordered_map, set_at_into_empty )
{
    ordered_map<std::string, int> m;
    m.set_at( -3, "a", 1 );
    EXPECT_EQ( m.keys(), ( strings{ "a" } ) );
}

TEST( ordered_map, set_at_with_comparator_throws )
{
    ordered_map<std::string, int> m{ { "b", 2 }, { "a", 1 } };
    m.set_comparator( by_key );
    EXPECT_THROW( m.set_at( 0, "z", 26 ), usage_error );
    EXPECT_FALSE( m.has( "z" ) );
    EXPECT_EQ   ( m.keys(), ( strings{ "a", "b" } ) );

    m.set_comparator( nullptr );
    m.set_at( 0, "z", 26 );
    EXPECT_EQ( m.keys(), ( strings{ "z", "a", "b" } ) );
}

//==============================================================================
// Comparator
//==============================================================================

TEST( ordered_map, comparator_sorts_existing_and_new_entries )
{
    ordered_map<std::string, int> m{ { "d", 4 }, { "b", 2 }, { "a", 1 } };
    m.set_comparator( by_key );
    EXPECT_TRUE( m.has_comparator() );
    EXPECT_EQ  ( m.keys(), ( strings{ "a", "b", "d" } ) );

    m.set( "c", 3 );
    m.set( "e", 5 );
    m.set( "0", 0 );
    EXPECT_EQ( m.keys  (), ( strings{ "0", "a", "b", "c", "d", "e" } ) );
    EXPECT_EQ( m.values(), ( std::vector<int>{ 0, 1, 2, 3, 4, 5 } ) );
    EXPECT_TRUE( std::ranges::is_sorted( m.keys() ) );
}

TEST( ordered_map, comparator_over_values )
{
    ordered_map<std::string, int> m{ { "a", 3 }, { "b", 1 }, { "c", 2 } };
    m.set_comparator( []( std::string const &, std::string const &, int v1, int v2 ) { return v1 < v2; } );
    EXPECT_EQ( m.keys(), ( strings{ "b", "c", "a" } ) );

    // an update keeps the position, even though the order is now violated
    m.set( "b", 10 );
    EXPECT_EQ( m.keys(), ( strings{ "b", "c", "a" } ) );

    // erase + set re-sorts
    m.erase( "b" );
    m.set( "b", 10 );
    EXPECT_EQ( m.keys(), ( strings{ "c", "a", "b" } ) );
    expect_consistent( m );
}

TEST( ordered_map, comparator_sort_is_stable )
{
    ordered_map<std::string, int> m{ { "x", 1 }, { "y", 0 }, { "z", 1 }, { "w", 0 } };
    m.set_comparator( []( std::string const &, std::string const &, int v1, int v2 ) { return v1 < v2; } );
    EXPECT_EQ( m.keys(), ( strings{ "y", "w", "x", "z" } ) );

    // new equivalent entries go after the existing ones
    m.set( "v", 0 );
    EXPECT_EQ( m.keys(), ( strings{ "y", "w", "v", "x", "z" } ) );
}

TEST( ordered_map, removing_comparator_keeps_order )
{
    ordered_map<std::string, int> m{ { "c", 3 }, { "a", 1 } };
    m.set_comparator( by_key );
    m.set_comparator( nullptr );
    EXPECT_FALSE( m.has_comparator() );
    m.set( "b", 2 );
    EXPECT_EQ( m.keys(), ( strings{ "a", "c", "b" } ) );
}

TEST( ordered_map, erase_with_comparator )
{
    ordered_map<std::string, int> m;
    m.set_comparator( []( std::string const &, std::string const &, int v1, int v2 ) { return v1 < v2; } );
    m.set( "a", 1 );
    m.set( "b", 1 );
    m.set( "c", 1 );
    m.set( "d", 0 );
    EXPECT_EQ( m.keys(), ( strings{ "d", "a", "b", "c" } ) );

    EXPECT_EQ( m.erase( "b" ), 1 );
    EXPECT_EQ( m.keys(), ( strings{ "d", "a", "c" } ) );

    // a value updated out of order is still found
    m.set( "d", 5 );
    EXPECT_EQ( m.erase( "d" ), 5 );
    EXPECT_EQ( m.keys(), ( strings{ "a", "c" } ) );
    expect_consistent( m );
}

//==============================================================================
// Removal
//==============================================================================

TEST( ordered_map, erase )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    EXPECT_EQ( m.erase( "b" ), 2 );
    EXPECT_EQ( m.keys(), ( strings{ "a", "c" } ) );
    EXPECT_FALSE( m.has( "b" ) );
}

TEST( ordered_map, erase_missing_is_noop )
{
    ordered_map<std::string, int> m{ { "a", 1 } };
    EXPECT_EQ( m.erase( "zz" ), 0 );
    EXPECT_EQ( m.size(), 1 );

    ordered_map<std::string, int> empty;
    EXPECT_EQ( empty.erase( "zz" ), 0 );
    EXPECT_TRUE( empty.empty() );
}

TEST( ordered_map, erase_if )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 }, { "e", 5 } };
    strings visited;
    m.erase_if( [ & ]( std::string const & key, int const val ) {
        visited.push_back( key );
        return val % 2 == 0;
    } );
    EXPECT_EQ( visited , ( strings{ "a", "b", "c", "d", "e" } ) );
    EXPECT_EQ( m.keys(), ( strings{ "a", "c", "e" } ) );
    expect_consistent( m );

    // adjacent matches
    m.erase_if( []( std::string const &, int ) { return true; } );
    EXPECT_TRUE( m.empty() );
}

TEST( ordered_map, clear_keeps_comparator )
{
    ordered_map<std::string, int> m{ { "b", 2 }, { "a", 1 } };
    m.set_comparator( by_key );
    m.clear();
    EXPECT_TRUE( m.empty() );
    EXPECT_TRUE( m.has_comparator() );
    EXPECT_EQ  ( m.to_string(), "{}" );

    m.set( "z", 26 );
    m.set( "y", 25 );
    EXPECT_EQ( m.keys(), ( strings{ "y", "z" } ) );
}

//==============================================================================
// Bulk operations
//==============================================================================

TEST( ordered_map, copy_is_an_upsert )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 } };
    ordered_map<std::string, int> const other{ { "c", 3 }, { "a", 10 } };
    m.copy( other );
    EXPECT_EQ( m.keys  (), ( strings{ "a", "b", "c" } ) );
    EXPECT_EQ( m.values(), ( std::vector<int>{ 10, 2, 3 } ) );
}

TEST( ordered_map, copy_from_itself )
{
    ordered_map<std::string, int> m{ { "delta", 4 }, { "alpha", 1 }, { "charlie", 3 }, { "bravo", 2 } };
    m.copy( m );
    EXPECT_EQ( m.keys  (), ( strings{ "delta", "alpha", "charlie", "bravo" } ) );
    EXPECT_EQ( m.values(), ( std::vector<int>{ 4, 1, 3, 2 } ) );

    m.set_comparator( by_key );
    m.copy( m );
    EXPECT_EQ( m.keys(), ( strings{ "alpha", "bravo", "charlie", "delta" } ) );
    expect_consistent( m );
}

TEST( ordered_map, copy_from_other_variant )
{
    ordered_map<std::string, int> m;
    map<std::string, int> const other{ { "a", 1 } };
    m.copy( other );
    EXPECT_EQ( m.get( "a" ), 1 );
}

TEST( ordered_map, deprecated_merge )
{
    ordered_map<std::string, int> m{ { "a", 1 } };
    m.merge( ordered_map<std::string, int>{ { "b", 2 } } );
    EXPECT_EQ( m.keys(), ( strings{ "a", "b" } ) );
}

TEST( ordered_map, insert_range )
{
    ordered_map<std::string, int> m{ { "a", 1 } };
    std::vector<std::pair<std::string, int>> const pairs{ { "b", 2 }, { "a", 3 }, { "c", 4 } };
    m.insert( pairs );
    EXPECT_EQ( m.keys  (), ( strings{ "a", "b", "c" } ) );
    EXPECT_EQ( m.values(), ( std::vector<int>{ 3, 2, 4 } ) );
}

//==============================================================================
// Equality & cloning
//==============================================================================

TEST( ordered_map, equal_ignores_order )
{
    ordered_map<std::string, int> const forward{ { "a", 1 }, { "b", 2 } };
    ordered_map<std::string, int> const reverse{ { "b", 2 }, { "a", 1 } };
    EXPECT_TRUE ( forward.equal( reverse ) );
    EXPECT_TRUE ( reverse.equal( forward ) );

    ordered_map<std::string, int> const different{ { "a", 1 }, { "b", 3 } };
    EXPECT_FALSE( forward.equal( different ) );
    ordered_map<std::string, int> const longer{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    EXPECT_FALSE( forward.equal( longer ) );

    map<std::string, int> const plain{ { "b", 2 }, { "a", 1 } };
    EXPECT_TRUE( forward.equal( plain ) );
    EXPECT_TRUE( ( ordered_map<std::string, int>{}.equal( map<std::string, int>{} ) ) );
}

namespace
{
    struct approx
    {
        double value{};
        bool equal( approx const & other ) const noexcept { return ( value - other.value ) < 0.5 && ( other.value - value ) < 0.5; }
    };
} // anonymous namespace

TEST( ordered_map, equal_uses_custom_value_equality )
{
    ordered_map<int, approx> const a{ { 1, { 1.0 } } };
    ordered_map<int, approx> const b{ { 1, { 1.2 } } };
    ordered_map<int, approx> const c{ { 1, { 2.0 } } };
    EXPECT_TRUE ( a.equal( b ) );
    EXPECT_FALSE( a.equal( c ) );
}

TEST( ordered_map, clone_is_independent )
{
    ordered_map<std::string, int> m{ { "b", 2 }, { "a", 1 } };
    m.set_comparator( by_key );
    auto clone{ m.clone() };
    EXPECT_TRUE( clone.equal( m ) );
    EXPECT_TRUE( clone.has_comparator() );

    clone.set( "a", 100 );
    clone.set( "0", 0 );
    EXPECT_EQ( m.get( "a" ), 1 );
    EXPECT_EQ( m.size(), 2 );
    EXPECT_EQ( clone.keys(), ( strings{ "0", "a", "b" } ) );
}

//==============================================================================
// Iteration
//==============================================================================

TEST( ordered_map, range_stops_early )
{
    ordered_map<std::string, int> const m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    strings visited;
    m.range( [ & ]( std::string const & key, int ) {
        visited.push_back( key );
        return key != "b";
    } );
    EXPECT_EQ( visited, ( strings{ "a", "b" } ) );
}

TEST( ordered_map, views_follow_order )
{
    ordered_map<std::string, int> m{ { "c", 3 }, { "a", 1 } };
    m.set_at( 1, "b", 2 );

    strings keys;
    std::vector<int> values;
    for ( auto const & [ key, val ] : m.all() )
    {
        keys  .push_back( key );
        values.push_back( val );
    }
    EXPECT_EQ( keys  , ( strings{ "c", "b", "a" } ) );
    EXPECT_EQ( values, ( std::vector<int>{ 3, 2, 1 } ) );

    EXPECT_TRUE( std::ranges::equal( m.keys_view  (), strings{ "c", "b", "a" } ) );
    EXPECT_TRUE( std::ranges::equal( m.values_view(), std::vector<int>{ 3, 2, 1 } ) );

    // each call starts a new pass
    auto const first{ m.all() };
    EXPECT_EQ( std::ranges::distance( first ), 3 );
    EXPECT_EQ( std::ranges::distance( m.all() ), 3 );
}

TEST( ordered_map, random_access_iterator )
{
    ordered_map<int, int> const m{ { 5, 50 }, { 3, 30 }, { 9, 90 } };
    auto it{ m.begin() };
    EXPECT_EQ( it[ 2 ].first, 9 );
    it += 1;
    EXPECT_EQ( it->second, 30 );
    EXPECT_EQ( m.end() - m.begin(), 3 );
    EXPECT_LT( m.begin(), m.end() );
    EXPECT_EQ( ( *--m.end() ).first, 9 );
}

//==============================================================================
// Invariants
//==============================================================================

TEST( ordered_map, bijection_under_mixed_operations )
{
    ordered_map<std::string, int> m;
    for ( int i{ 0 }; i < 64; ++i )
    {
        auto const key{ std::to_string( ( i * 37 ) % 23 ) };
        switch ( i % 5 )
        {
            case 0: m.erase ( key );                 break;
            case 1: m.set_at( i % 7 - 3, key, i );   break;
            default: m.set  ( key, i );              break;
        }
        expect_consistent( m );
    }
}

TEST( ordered_map, many_appends_keep_insertion_order )
{
    constexpr int count{ 5000 };
    ordered_map<int, int> m;
    for ( int i{ count - 1 }; i >= 0; --i )
        m.set( i, -i );
    // updates do not move anything
    for ( int i{ 0 }; i < count; i += 3 )
        m.set( i, i );

    auto const keys{ m.keys() };
    ASSERT_EQ( keys.size(), std::size_t{ count } );
    EXPECT_TRUE( std::ranges::is_sorted( keys, std::greater<>{} ) );
    EXPECT_EQ( m.get_key_at( 0 ), count - 1 );
    EXPECT_EQ( m.get_at( count - 1 ), 0 );
    EXPECT_EQ( m.get( 3 ), 3 );
    EXPECT_EQ( m.get( 4 ), -4 );
}

namespace
{
    struct comparator_failure {};

    // orders by key but refuses to compare against "poison"
    bool picky_by_key( std::string const & k1, std::string const & k2, int, int )
    {
        if ( ( k1 == "poison" ) || ( k2 == "poison" ) )
            throw comparator_failure{};
        return k1 < k2;
    }
} // anonymous namespace

TEST( ordered_map, throwing_comparator_leaves_map_unchanged )
{
    ordered_map<std::string, int> m{ { "c", 3 }, { "a", 1 }, { "b", 2 } };
    m.set_comparator( picky_by_key );
    EXPECT_EQ( m.keys(), ( strings{ "a", "b", "c" } ) );

    EXPECT_THROW( m.set( "poison", 0 ), comparator_failure );
    EXPECT_FALSE( m.has( "poison" ) );
    EXPECT_EQ   ( m.keys(), ( strings{ "a", "b", "c" } ) );
    expect_consistent( m );

    ordered_map<std::string, int> unsorted{ { "poison", 0 }, { "b", 2 }, { "a", 1 } };
    EXPECT_THROW( unsorted.set_comparator( picky_by_key ), comparator_failure );
    EXPECT_FALSE( unsorted.has_comparator() );
    EXPECT_EQ   ( unsorted.keys(), ( strings{ "poison", "b", "a" } ) );
    expect_consistent( unsorted );
}

TEST( ordered_map, throwing_predicate_leaves_map_unchanged )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } };
    EXPECT_THROW
    (
        m.erase_if( []( std::string const & key, int const val ) {
            if ( key == "c" )
                throw comparator_failure{};
            return val % 2 == 0;
        } ),
        comparator_failure
    );
    EXPECT_EQ( m.keys(), ( strings{ "a", "b", "c", "d" } ) );
    expect_consistent( m );
}

TEST( ordered_map, to_string )
{
    ordered_map<std::string, int> const m{ { "b", 2 }, { "a", 1 } };
    EXPECT_EQ( m.to_string(), R"({"b":2,"a":1})" );

    ordered_map<int, std::string> const n{ { 1, "x\"y" } };
    EXPECT_EQ( n.to_string(), R"({1:"x\"y"})" );

    ordered_map<int, int> const numbers{ { 2, 20 }, { 1, -10 } };
    EXPECT_EQ( numbers.to_string(), "{2:20,1:-10}" );
}

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
