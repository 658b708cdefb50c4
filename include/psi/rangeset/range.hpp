////////////////////////////////////////////////////////////////////////////////
/// Half-open intervals and range expressions for psi::rangeset.
///
/// Contents:
///   - range<Bound>           - [lower, upper) interval over a totally ordered
///                              bound type (the value type of range_set)
///   - closed_range<Bound>    - [lower, upper]
///   - range_from<Bound>      - [lower, end of sequence)
///   - range_up_to<Bound>     - [start of sequence, upper)
///   - range_through<Bound>   - [start of sequence, upper]
///   - relative_to( expr, seq ) - resolves any of the above against a
///                              sequence into a concrete range<Bound>
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

#include <psi/rangeset/sequence_traits.hpp>

#include <concepts>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

template <std::totally_ordered Bound>
struct range
{
    using bound_type = Bound;

    Bound lower;
    Bound upper;

    [[ nodiscard ]] constexpr bool empty() const noexcept { return !( lower < upper ); }

    [[ nodiscard ]] constexpr bool contains( Bound const & value ) const noexcept { return !( value < lower ) && value < upper; }

    [[ nodiscard ]] constexpr bool overlaps( range const & other ) const noexcept
    {
        return !empty() && !other.empty() && other.lower < upper && lower < other.upper;
    }

    friend constexpr bool operator==( range const &, range const & ) = default;
}; // struct range

template <typename Bound>
range( Bound, Bound ) -> range<Bound>;


template <std::totally_ordered Bound> struct closed_range  { Bound lower; Bound upper; };
template <std::totally_ordered Bound> struct range_from    { Bound lower;              };
template <std::totally_ordered Bound> struct range_up_to   {              Bound upper; };
template <std::totally_ordered Bound> struct range_through {              Bound upper; };

template <typename Bound> closed_range ( Bound, Bound ) -> closed_range <Bound>;
template <typename Bound> range_from   ( Bound        ) -> range_from   <Bound>;
template <typename Bound> range_up_to  ( Bound        ) -> range_up_to  <Bound>;
template <typename Bound> range_through( Bound        ) -> range_through<Bound>;


namespace detail
{
    template <typename T> bool constexpr is_range{ false };
    template <typename B> bool constexpr is_range<range<B>>{ true };
} // namespace detail

//==============================================================================
// relative_to - resolution of range expressions against a sequence
//
// Bounds of any type convertible to the sequence's index type are accepted so
// that plain integer literals work with size_t indexed sequences.
//==============================================================================

template <typename B, typename Seq>
concept bound_for = indexed_sequence<Seq> && std::convertible_to<B, index_t<Seq>>;

template <typename B, indexed_sequence Seq> requires bound_for<B, Seq>
[[ nodiscard ]] constexpr range<index_t<Seq>> relative_to( range<B> const r, Seq const & ) noexcept
{
    return { static_cast<index_t<Seq>>( r.lower ), static_cast<index_t<Seq>>( r.upper ) };
}

template <typename B, indexed_sequence Seq> requires bound_for<B, Seq>
[[ nodiscard ]] constexpr range<index_t<Seq>> relative_to( closed_range<B> const r, Seq const & seq )
{
    return { static_cast<index_t<Seq>>( r.lower ), traits_of<Seq>::index_after( seq, static_cast<index_t<Seq>>( r.upper ) ) };
}

template <typename B, indexed_sequence Seq> requires bound_for<B, Seq>
[[ nodiscard ]] constexpr range<index_t<Seq>> relative_to( range_from<B> const r, Seq const & seq )
{
    return { static_cast<index_t<Seq>>( r.lower ), traits_of<Seq>::end_index( seq ) };
}

template <typename B, indexed_sequence Seq> requires bound_for<B, Seq>
[[ nodiscard ]] constexpr range<index_t<Seq>> relative_to( range_up_to<B> const r, Seq const & seq )
{
    return { traits_of<Seq>::start_index( seq ), static_cast<index_t<Seq>>( r.upper ) };
}

template <typename B, indexed_sequence Seq> requires bound_for<B, Seq>
[[ nodiscard ]] constexpr range<index_t<Seq>> relative_to( range_through<B> const r, Seq const & seq )
{
    return { traits_of<Seq>::start_index( seq ), traits_of<Seq>::index_after( seq, static_cast<index_t<Seq>>( r.upper ) ) };
}

/// Anything that relative_to() can resolve against Seq.
template <typename Expr, typename Seq>
concept range_expression_for =
    indexed_sequence<Seq> &&
    requires( Expr const & expr, Seq const & seq ) {
        { relative_to( expr, seq ) } -> std::same_as<range<index_t<Seq>>>;
    };

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
