////////////////////////////////////////////////////////////////////////////////
/// In-place rotation of a subrange of a mutable sequence.
///
/// Block-swap (Gries-Mills) rotation expressed only in terms of forward
/// stepping and positional swaps: O(n) swaps, no buffer, no element copies.
/// Unlike std::rotate it works through sequence_traits and is therefore usable
/// with any mutable_sequence (including ones w/o iterators).
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
#include <psi/rangeset/sequence_traits.hpp>

#include <boost/assert.hpp>

#include <utility>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

namespace detail
{
    // Swaps the elements of two nonempty subranges pairwise until the shorter
    // one is exhausted. Returns the positions where the swapping stopped in
    // each of them - at least one of which equals the respective upper bound.
    //
    //   [a b c d e f g h i j k l m n o p]      [i j k l e f g h a b c d m n o p]
    //    ^^^^^^^         ^^^^^^^^^^^^^    ->            ^               ^
    //    lhs             rhs                            p               q
    template <mutable_sequence Seq>
    constexpr std::pair<index_t<Seq>, index_t<Seq>>
    swap_nonempty_subrange_prefixes( Seq & seq, range<index_t<Seq>> const lhs, range<index_t<Seq>> const rhs )
    {
        using traits = traits_of<Seq>;
        BOOST_ASSERT( !lhs.empty() );
        BOOST_ASSERT( !rhs.empty() );

        auto p{ lhs.lower };
        auto q{ rhs.lower };
        do
        {
            traits::swap_at( seq, p, q );
            p = traits::index_after( seq, p );
            q = traits::index_after( seq, q );
        } while ( p != lhs.upper && q != rhs.upper );
        return { p, q };
    }
} // namespace detail


/// Rotates [subrange.lower, subrange.upper) so that the element at `middle`
/// becomes the first one. Returns the new position of the element that was
/// first before the rotation (i.e. the end of the relocated [middle, upper)
/// block).
template <mutable_sequence Seq>
constexpr index_t<Seq> rotate( Seq & seq, range<index_t<Seq>> const subrange, index_t<Seq> const middle )
{
    BOOST_ASSERT_MSG( !( middle < subrange.lower ) && !( subrange.upper < middle ), "Rotation pivot outside of the rotated range" );

    auto       s{ subrange.lower };
    auto       m{ middle         };
    auto const e{ subrange.upper };

    if ( s == m ) return e;
    if ( m == e ) return s;

    // Two regions of possibly unequal length get exchanged: each pass swaps
    // the leading elements of both (up to the length of the shorter one)
    // which leaves a smaller rotation of the same shape to do.
    //
    //   [a b c d e f g|h i j]   or   [a b c|d e f g h i j]
    //   [h i j d e f g|a b c]   or   [d e f|a b c g h i j]
    //          ^s1    ^m    ^m1/e          ^s1/m ^m1     ^e
    auto result{ e }; // known-incorrect sentinel until the last element lands
    for ( ;; )
    {
        auto const [ s1, m1 ]{ detail::swap_nonempty_subrange_prefixes( seq, range{ s, m }, range{ m, e } ) };
        if ( m1 == e )
        {
            // the element originally at e - 1 is in place now: s1 is the
            // position following it
            if ( result == e )
                result = s1;
            if ( s1 == m )
                break;
        }
        s = s1;
        if ( s == m )
            m = m1;
    }
    return result;
}

/// Rotates the whole sequence so that the element at `new_first` becomes
/// the first one. Returns the new position of the previously first element.
template <mutable_sequence Seq>
constexpr index_t<Seq> rotate( Seq & seq, index_t<Seq> const new_first )
{
    using traits = traits_of<Seq>;
    return rotate( seq, range{ traits::start_index( seq ), traits::end_index( seq ) }, new_first );
}

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
