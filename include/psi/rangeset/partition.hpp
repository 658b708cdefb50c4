////////////////////////////////////////////////////////////////////////////////
/// In-place (half-)stable partitioning of mutable sequences.
///
/// Contents:
///   - half_stable_partition    - O(n), keeps the order of the first group only
///   - stable_partition         - O(n log n) swaps, O(1) space: recursive
///                                halving + one rotation per merge
///   - indexed_stable_partition - stable_partition w/ a predicate on positions
///                                rather than on values (used by gather)
///   - stably_partitioned       - non-mutating variant producing a partitioned
///                                copy in a single pass
///
/// In all variants the predicate selects the elements that belong in the
/// second (trailing) partition and the returned position is the start of that
/// partition (the end of the range if no element satisfies the predicate).
/// Unlike std::stable_partition the in-place variants never allocate a
/// temporary buffer: elements are only ever swapped, never copied.
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

#include <psi/rangeset/range.hpp>
#include <psi/rangeset/rotate.hpp>
#include <psi/rangeset/sequence_traits.hpp>

#include <boost/assert.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

template <typename Pred, typename Seq>
concept element_predicate_for =
    indexed_sequence<Seq> &&
    std::predicate<Pred &, decltype( traits_of<Seq>::element( std::declval<std::remove_cvref_t<Seq> const &>(), std::declval<index_t<Seq>>() ) )>;

template <typename Pred, typename Seq>
concept index_predicate_for = indexed_sequence<Seq> && std::predicate<Pred &, index_t<Seq> const &>;


//==============================================================================
// half_stable_partition
//==============================================================================

template <mutable_sequence Seq, element_predicate_for<Seq> Pred>
constexpr index_t<Seq> half_stable_partition( Seq & seq, range<index_t<Seq>> const subrange, Pred && belongs_in_second_partition )
{
    using traits = traits_of<Seq>;
    auto i{ subrange.lower };
    while ( i != subrange.upper && !std::invoke( belongs_in_second_partition, traits::element( std::as_const( seq ), i ) ) )
        i = traits::index_after( seq, i );
    if ( i == subrange.upper )
        return i;

    for ( auto j{ traits::index_after( seq, i ) }; j != subrange.upper; j = traits::index_after( seq, j ) )
    {
        if ( !std::invoke( belongs_in_second_partition, traits::element( std::as_const( seq ), j ) ) )
        {
            traits::swap_at( seq, i, j );
            i = traits::index_after( seq, i );
        }
    }
    return i;
}

template <mutable_sequence Seq, element_predicate_for<Seq> Pred>
constexpr index_t<Seq> half_stable_partition( Seq & seq, Pred && belongs_in_second_partition )
{
    using traits = traits_of<Seq>;
    return half_stable_partition( seq, range{ traits::start_index( seq ), traits::end_index( seq ) }, belongs_in_second_partition );
}


//==============================================================================
// stable_partition & indexed_stable_partition
//==============================================================================

namespace detail
{
    // Shared recursion: `test( seq, position )` decides membership in the
    // second partition. `n` must equal the length of `subrange` (passed down
    // so that non random access sequences do not have to recount).
    template <typename Seq, typename Test>
    constexpr index_t<Seq> stable_partition_impl( Seq & seq, offset_t<Seq> const n, range<index_t<Seq>> const subrange, Test & test )
    {
        using traits = traits_of<Seq>;
        if ( n == 0 )
            return subrange.lower;
        if ( n == 1 )
            return test( seq, subrange.lower ) ? subrange.lower : subrange.upper;

        auto const half  { n / 2 };
        auto const middle{ traits::index_offset( seq, subrange.lower, half ) };
        auto const j{ stable_partition_impl( seq, half    , range{ subrange.lower, middle }, test ) };
        auto const k{ stable_partition_impl( seq, n - half, range{ middle, subrange.upper }, test ) };
        // [lower, j) keep | [j, middle) move | [middle, k) keep | [k, upper) move
        return rotate( seq, range{ j, k }, middle );
    }
} // namespace detail

template <mutable_sequence Seq, element_predicate_for<Seq> Pred>
constexpr index_t<Seq> stable_partition( Seq & seq, range<index_t<Seq>> const subrange, Pred && belongs_in_second_partition )
{
    using traits = traits_of<Seq>;
    BOOST_ASSERT( !( subrange.upper < subrange.lower ) );
    auto test
    {
        [ &belongs_in_second_partition ]( Seq const & s, index_t<Seq> const & i ) -> bool {
            return std::invoke( belongs_in_second_partition, traits::element( s, i ) );
        }
    };
    return detail::stable_partition_impl( seq, traits::distance( seq, subrange.lower, subrange.upper ), subrange, test );
}

template <mutable_sequence Seq, element_predicate_for<Seq> Pred>
constexpr index_t<Seq> stable_partition( Seq & seq, Pred && belongs_in_second_partition )
{
    using traits = traits_of<Seq>;
    return stable_partition( seq, range{ traits::start_index( seq ), traits::end_index( seq ) }, belongs_in_second_partition );
}

/// Stable partition where the predicate is evaluated on the (current)
/// position of an element rather than on its value.
template <mutable_sequence Seq, index_predicate_for<Seq> Pred>
constexpr index_t<Seq> indexed_stable_partition( Seq & seq, range<index_t<Seq>> const subrange, Pred && belongs_in_second_partition )
{
    using traits = traits_of<Seq>;
    BOOST_ASSERT( !( subrange.upper < subrange.lower ) );
    auto test
    {
        [ &belongs_in_second_partition ]( Seq const &, index_t<Seq> const & i ) -> bool {
            return std::invoke( belongs_in_second_partition, i );
        }
    };
    return detail::stable_partition_impl( seq, traits::distance( seq, subrange.lower, subrange.upper ), subrange, test );
}


//==============================================================================
// stably_partitioned
//==============================================================================

/// Returns a copy of the sequence's elements, stably partitioned by the
/// predicate, along with the offset of the second partition.
/// Elements are copied exactly once (second partition elements are moved
/// from a side buffer afterwards).
template <indexed_sequence Seq, element_predicate_for<Seq> Pred>
requires std::copy_constructible<typename traits_of<Seq>::value_type>
auto stably_partitioned( Seq const & seq, Pred && belongs_in_second_partition )
    -> std::pair<std::vector<typename traits_of<Seq>::value_type>, std::size_t>
{
    using traits     = traits_of<Seq>;
    using value_type = typename traits::value_type;

    auto const first{ traits::start_index( seq ) };
    auto const last { traits::end_index  ( seq ) };

    std::vector<value_type> result;
    std::vector<value_type> tail;
    result.reserve( static_cast<std::size_t>( traits::distance( seq, first, last ) ) );
    for ( auto i{ first }; i != last; i = traits::index_after( seq, i ) )
    {
        auto && element{ traits::element( seq, i ) };
        if ( std::invoke( belongs_in_second_partition, std::as_const( element ) ) )
            tail  .push_back( element );
        else
            result.push_back( element );
    }
    auto const partition_point{ result.size() };
    result.insert( result.end(), std::make_move_iterator( tail.begin() ), std::make_move_iterator( tail.end() ) );
    return { std::move( result ), partition_point };
}

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
