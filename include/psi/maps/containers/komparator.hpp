////////////////////////////////////////////////////////////////////////////////
/// Comparator utilities for psi::maps containers.
///
/// Contents:
///   - comp_eq(comp, a, b)         : equality from a strict-weak comparator
///   - Komparator<Comparator>      : EBO wrapper with le/ge/eq + sort
///                                   (read-time sorting for sorted_set)
///   - entry_less<Key, T>          : boxed "A before B" strategy over
///                                   (key, value) pairs (ordered_map)
///   - detail::search_index(n, p)  : first index in [0, n) for which the
///                                   monotonic predicate p holds
///   - detail::stable_sort_entries : stable re-sort of an ordering sequence
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

#include <boost/assert.hpp>
#include <boost/sort/pdqsort/pdqsort.hpp>
#include <boost/sort/spinsort/spinsort.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::maps
{
//------------------------------------------------------------------------------

//==============================================================================
// comp_eq: equality from a strict-weak comparator
//==============================================================================

/// Two-tier dispatch:
///   1. Custom comp.eq() if available
///   2. Standard two-comparison equivalence (!comp(a,b) && !comp(b,a))
template <typename Comp>
[[ gnu::pure ]] constexpr bool comp_eq( Comp const & comp, auto const & left, auto const & right ) noexcept
{
    if constexpr ( requires{ comp.eq( left, right ); } )
        return comp.eq( left, right );
    else
        return !comp( left, right ) && !comp( right, left );
}


//==============================================================================
// Komparator: comparator wrapper (EBO via public inheritance)
//==============================================================================

/// Publicly inherits from Comparator for empty-base optimisation. Being an
/// aggregate means no forwarding constructors are needed:
/// Komparator<C>{ c } or Komparator<C>{}.
///
/// Provides derived comparison operations (le, ge, eq) and a sort() method
/// that dispatches to the Comparator's own sort if available, falling back to
/// pdqsort (branchless variant when the comparator is marked as branchless).
template <typename Comparator>
struct Komparator : Comparator
{
    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    [[ gnu::pure ]] constexpr bool le( auto const & left, auto const & right ) const noexcept { return comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool ge( auto const & left, auto const & right ) const noexcept { return comp()( right, left ); }
    [[ gnu::pure ]] constexpr bool eq( auto const & left, auto const & right ) const noexcept { return comp_eq( comp(), left, right ); }

    template <std::random_access_iterator It>
    void sort( It const first, It const last ) const
    {
        if constexpr ( requires{ comp().sort( first, last ); } )
            comp().sort( first, last );
        else if constexpr ( requires{ Comparator::is_branchless; requires( Comparator::is_branchless ); } )
            boost::sort::pdqsort_branchless( first, last, make_trivially_copyable_predicate( comp() ) );
        else
            boost::sort::pdqsort( first, last, make_trivially_copyable_predicate( comp() ) );
    }
}; // struct Komparator


//==============================================================================
// entry_less: ordering strategy over (key, value) pairs
//==============================================================================

/// A strict less-than relation over entries: returns true when the entry
/// (key1, val1) is to be placed before (key2, val2).
template <typename Key, typename T>
using entry_less = std::function<bool( Key const & key1, Key const & key2, T const & val1, T const & val2 )>;


namespace detail
{
    /// Binary search over [0, n): returns the smallest index for which pred
    /// returns true, assuming pred is false...false,true...true over the
    /// range (n if it never holds). Well defined for any pred.
    template <typename Pred>
    [[ nodiscard ]] std::size_t search_index( std::size_t const n, Pred && pred )
    {
        std::size_t first{ 0 };
        std::size_t last { n };
        while ( first < last )
        {
            auto const mid{ first + ( last - first ) / 2 };
            if ( !pred( mid ) )
                first = mid + 1;
            else
                last  = mid;
        }
        return first;
    }

    /// Stable sort of an ordering sequence of keys, comparing through the
    /// (key, value) entries of table. Equivalent entries keep their relative
    /// order.
    template <typename Key, typename T, typename Table>
    void stable_sort_entries( std::vector<Key> & order, Table const & table, entry_less<Key, T> const & less )
    {
        using entry_ptr = typename Table::value_type const *;

        std::vector<entry_ptr> entries;
        entries.reserve( order.size() );
        for ( auto const & key : order )
        {
            auto const pos{ table.find( key ) };
            BOOST_ASSERT_MSG( pos != table.end(), "Ordering sequence out of sync with the table" );
            entries.push_back( &*pos );
        }

        boost::sort::spinsort
        (
            entries.begin(), entries.end(),
            [ &less ]( entry_ptr const left, entry_ptr const right ) {
                return less( left->first, right->first, left->second, right->second );
            }
        );

        for ( std::size_t i{ 0 }; i < entries.size(); ++i )
            order[ i ] = entries[ i ]->first;
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::maps
//------------------------------------------------------------------------------
