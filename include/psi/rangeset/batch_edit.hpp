////////////////////////////////////////////////////////////////////////////////
/// Batch edits of sequences driven by range_sets
///
///   - indices_where / indices_of  - collect the positions of matching
///                                   elements (one pass, O(n))
///   - remove_all                  - in place removal of the elements at a set
///                                   of positions (O(n) swaps + one truncation)
///   - removing_all                - lazy (indexing_view) complement
///   - gather / gather_if          - stable collection of the selected
///                                   elements just before an insertion point
///   - shift / shift_to            - relocation of a contiguous range or a
///                                   single element (one rotation)
///
/// All the mutating algorithms only ever swap elements of the target sequence
/// (except for the remove_all fallback for sequences that can only be rebuilt
/// by appending).
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

#include <psi/rangeset/indexing_view.hpp>
#include <psi/rangeset/partition.hpp>
#include <psi/rangeset/range.hpp>
#include <psi/rangeset/range_set.hpp>
#include <psi/rangeset/rotate.hpp>
#include <psi/rangeset/sequence_traits.hpp>

#include <boost/assert.hpp>

#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

//==============================================================================
// indices_where / indices_of
//==============================================================================

template <indexed_sequence Seq, element_predicate_for<Seq> Pred>
[[ nodiscard ]] constexpr range_set<index_t<Seq>> indices_where( Seq const & seq, Pred && predicate )
{
    using traits = traits_of<Seq>;
    range_set<index_t<Seq>> result;
    auto const end{ traits::end_index( seq ) };
    auto       i  { traits::start_index( seq ) };
    while ( i != end )
    {
        if ( std::invoke( predicate, traits::element( seq, i ) ) )
        {
            auto run_end{ traits::index_after( seq, i ) };
            while ( ( run_end != end ) && std::invoke( predicate, traits::element( seq, run_end ) ) )
                run_end = traits::index_after( seq, run_end );
            result.append( { i, run_end } );
            i = run_end;
        }
        else
        {
            i = traits::index_after( seq, i );
        }
    }
    return result;
}

template <indexed_sequence Seq, typename T>
requires std::equality_comparable_with<typename traits_of<Seq>::value_type, T>
[[ nodiscard ]] constexpr range_set<index_t<Seq>> indices_of( Seq const & seq, T const & value )
{
    return indices_where( seq, [ &value ]( auto const & element ) { return element == value; } );
}


//==============================================================================
// remove_all / removing_all
//==============================================================================

/// Removes the elements at `positions` preserving the order of the remaining
/// ones. Sequences that can be truncated are compacted in place (a single
/// half-stable pass), others are rebuilt from the surviving elements.
template <typename Seq>
requires truncatable_sequence<Seq> || appendable_sequence<Seq>
constexpr void remove_all( Seq & seq, range_set<index_t<Seq>> const & positions )
{
    using traits = traits_of<Seq>;
    auto const & ranges{ positions.ranges() };
    if ( ranges.empty() )
        return;
    BOOST_ASSERT_MSG( !( traits::end_index( seq ) < ranges.back().upper ), "remove_all(): positions past the end of the sequence" );

    if constexpr ( truncatable_sequence<Seq> )
    {
        // The sequence is kept split into three zones:
        //  [start, keep_end)          elements that stay
        //  [keep_end, unprocessed)    elements to be removed
        //  [unprocessed, end)         not yet visited
        // and the elements between consecutive removed ranges get swapped
        // down from the third zone into the first one.
        auto keep_end   { ranges.front().lower };
        auto unprocessed{ ranges.front().upper };
        auto const move_down_until{ [ & ]( index_t<Seq> const boundary ) {
            while ( unprocessed != boundary )
            {
                traits::swap_at( seq, keep_end, unprocessed );
                keep_end    = traits::index_after( seq, keep_end    );
                unprocessed = traits::index_after( seq, unprocessed );
            }
        } };
        for ( auto r{ std::next( ranges.begin() ) }; r != ranges.end(); ++r )
        {
            move_down_until( r->lower );
            unprocessed = r->upper;
        }
        move_down_until( traits::end_index( seq ) );
        traits::truncate( seq, keep_end );
    }
    else
    {
        Seq result;
        for ( auto const & r : positions.inverted( seq ) )
            for ( auto i{ r.lower }; i != r.upper; i = traits::index_after( seq, i ) )
                traits::append( result, std::move( traits::element( seq, i ) ) );
        seq = std::move( result );
    }
}

/// The elements of `seq` _not_ at `positions` (a lazy view: lvalue
/// sequences are referenced, rvalue ones are moved into the view).
template <typename Seq>
requires indexed_sequence<Seq>
[[ nodiscard ]] constexpr indexing_view<Seq> removing_all( Seq && seq, range_set<index_t<Seq>> const & positions )
{
    auto complement{ positions.inverted( seq ) };
    return indexed( std::forward<Seq>( seq ), std::move( complement ) );
}


//==============================================================================
// gather / gather_if
//==============================================================================

/// Stably moves the elements at `positions` to just before the element
/// (originally) at `insertion_point`. Returns the range the gathered elements
/// occupy afterwards.
template <mutable_sequence Seq>
constexpr range<index_t<Seq>> gather( Seq & seq, range_set<index_t<Seq>> const & positions, index_t<Seq> const insertion_point )
{
    using traits = traits_of<Seq>;
    auto const lower{ indexed_stable_partition( seq, range{ traits::start_index( seq ), insertion_point }, [ &positions ]( index_t<Seq> const & i ) { return  positions.contains( i ); } ) };
    auto const upper{ indexed_stable_partition( seq, range{ insertion_point, traits::end_index( seq ) }  , [ &positions ]( index_t<Seq> const & i ) { return !positions.contains( i ); } ) };
    return { lower, upper };
}

/// As gather() but selecting the elements by value.
template <mutable_sequence Seq, element_predicate_for<Seq> Pred>
constexpr range<index_t<Seq>> gather_if( Seq & seq, index_t<Seq> const insertion_point, Pred && predicate )
{
    using traits = traits_of<Seq>;
    auto const lower{ stable_partition( seq, range{ traits::start_index( seq ), insertion_point }, predicate ) };
    auto const upper{ stable_partition( seq, range{ insertion_point, traits::end_index( seq ) }  , std::not_fn( std::ref( predicate ) ) ) };
    return { lower, upper };
}


//==============================================================================
// shift / shift_to
//==============================================================================

/// Moves the contiguous `source` range to just before `insertion_point`,
/// returning its new bounds. An insertion point inside (or at either bound
/// of) the source range leaves the sequence unchanged.
template <mutable_sequence Seq>
constexpr range<index_t<Seq>> shift( Seq & seq, range<index_t<Seq>> const source, index_t<Seq> const insertion_point )
{
    if ( insertion_point < source.lower )
        return { insertion_point, rotate( seq, range{ insertion_point, source.upper }, source.lower ) };
    if ( source.upper < insertion_point )
        return { rotate( seq, range{ source.lower, insertion_point }, source.upper ), insertion_point };
    return source;
}

template <mutable_sequence Seq, range_expression_for<Seq> Expr>
requires( !detail::is_range<Expr> )
constexpr range<index_t<Seq>> shift( Seq & seq, Expr const & source, index_t<Seq> const insertion_point )
{
    return shift( seq, relative_to( source, seq ), insertion_point );
}

/// Moves the element at `source` to just before `insertion_point` and returns
/// its new position.
template <mutable_sequence Seq>
constexpr index_t<Seq> shift( Seq & seq, index_t<Seq> const source, index_t<Seq> const insertion_point )
{
    using traits = traits_of<Seq>;
    BOOST_ASSERT_MSG( source != traits::end_index( seq ), "Shifting the end index" );
    if ( source < insertion_point )
        return rotate( seq, range{ source, insertion_point }, traits::index_after( seq, source ) );
    if ( insertion_point < source )
        rotate( seq, range{ insertion_point, traits::index_after( seq, source ) }, source );
    return insertion_point;
}

/// Moves the element at `source` so that it ends up at position
/// `destination` (which, unlike an insertion point, may not be the end
/// index).
template <mutable_sequence Seq>
constexpr void shift_to( Seq & seq, index_t<Seq> const source, index_t<Seq> const destination )
{
    using traits = traits_of<Seq>;
    BOOST_ASSERT_MSG( source      != traits::end_index( seq ), "Shifting the end index"         );
    BOOST_ASSERT_MSG( destination != traits::end_index( seq ), "Cannot shift_to() the end index" );
    if ( source < destination )
        rotate( seq, range{ source, traits::index_after( seq, destination ) }, traits::index_after( seq, source ) );
    else
    if ( destination < source )
        rotate( seq, range{ destination, traits::index_after( seq, source ) }, source );
}

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
