////////////////////////////////////////////////////////////////////////////////
/// Capability set of the ordered sequences psi::rangeset algorithms operate on.
///
/// The algorithms never touch a sequence directly - everything goes through
/// sequence_traits<Seq>, a customisation point (user specializations are
/// intended). Each algorithm requires only the capabilities it uses:
///
///   indexed_sequence       - start/end index, stepping forward, offsetting,
///                            distance and element access over a totally
///                            ordered index type
///   bidirectional_sequence - + stepping backward
///   mutable_sequence       - + swapping the elements at two positions
///   truncatable_sequence   - + dropping a tail (the only subrange
///                            replacement the in-place algorithms need)
///   appendable_sequence    - default constructible + appending an element
///                            (for rebuilding sequences that cannot be
///                            modified positionally)
///
/// The provided specialization covers all sized random access ranges
/// (std::vector, std::deque, std::string, std::array, std::span,
/// boost::container vectors...) using the range's size_type as the index type.
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

#include <concepts>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

// Unsupported sequences get an empty traits class (so that the capability
// concepts below fail cleanly instead of hitting an incomplete type).
template <typename Seq>
struct sequence_traits {};

template <typename Seq>
requires std::ranges::random_access_range<Seq> && std::ranges::sized_range<Seq const>
struct sequence_traits<Seq>
{
    using index_type      = std::ranges::range_size_t      <Seq>;
    using difference_type = std::ranges::range_difference_t<Seq>;
    using value_type      = std::ranges::range_value_t     <Seq>;

    [[ nodiscard ]] static constexpr index_type start_index( Seq const &     ) noexcept { return 0; }
    [[ nodiscard ]] static constexpr index_type end_index  ( Seq const & seq ) noexcept { return static_cast<index_type>( std::ranges::size( seq ) ); }

    [[ nodiscard ]] static constexpr index_type index_after ( Seq const &, index_type const i ) noexcept { return i + 1; }
    [[ nodiscard ]] static constexpr index_type index_before( Seq const &, index_type const i ) noexcept { return i - 1; }
    [[ nodiscard ]] static constexpr index_type index_offset( Seq const &, index_type const i, difference_type const n ) noexcept
    {
        return static_cast<index_type>( static_cast<difference_type>( i ) + n );
    }
    [[ nodiscard ]] static constexpr difference_type distance( Seq const &, index_type const from, index_type const to ) noexcept
    {
        return static_cast<difference_type>( to ) - static_cast<difference_type>( from );
    }

    [[ nodiscard ]] static constexpr decltype( auto ) element( Seq       & seq, index_type const i ) noexcept { return std::ranges::begin( seq )[ static_cast<difference_type>( i ) ]; }
    [[ nodiscard ]] static constexpr decltype( auto ) element( Seq const & seq, index_type const i ) noexcept { return std::ranges::begin( seq )[ static_cast<difference_type>( i ) ]; }

    static constexpr void swap_at( Seq & seq, index_type const a, index_type const b )
    requires std::indirectly_swappable<std::ranges::iterator_t<Seq>>
    {
        auto const first{ std::ranges::begin( seq ) };
        std::ranges::iter_swap( first + static_cast<difference_type>( a ), first + static_cast<difference_type>( b ) );
    }

    static constexpr void truncate( Seq & seq, index_type const new_size )
    requires
        requires( Seq & s, index_type const n ) { s.shrink_to( n ); } ||
        requires( Seq & s ) { s.erase( s.begin(), s.end() ); }
    {
        if constexpr ( requires { seq.shrink_to( new_size ); } )
            seq.shrink_to( new_size );
        else
            seq.erase( seq.begin() + static_cast<difference_type>( new_size ), seq.end() );
    }

    template <typename V>
    static constexpr void append( Seq & seq, V && value )
    requires requires( Seq & s, V && v ) { s.push_back( std::forward<V>( v ) ); }
    {
        seq.push_back( std::forward<V>( value ) );
    }
}; // sequence_traits<random access range>


template <typename Seq> using traits_of = sequence_traits<std::remove_cvref_t<Seq>>;
template <typename Seq> using index_t   = typename traits_of<Seq>::index_type;
template <typename Seq> using offset_t  = typename traits_of<Seq>::difference_type;


//==============================================================================
// Capability concepts
//==============================================================================

template <typename Seq>
concept indexed_sequence =
    requires {
        typename traits_of<Seq>::index_type;
        typename traits_of<Seq>::difference_type;
    } &&
    std::totally_ordered<index_t<Seq>> &&
    std::copyable       <index_t<Seq>> &&
    requires( std::remove_cvref_t<Seq> const & seq, index_t<Seq> const i, offset_t<Seq> const n ) {
        { traits_of<Seq>::start_index ( seq       ) } -> std::same_as<index_t<Seq>>;
        { traits_of<Seq>::end_index   ( seq       ) } -> std::same_as<index_t<Seq>>;
        { traits_of<Seq>::index_after ( seq, i    ) } -> std::same_as<index_t<Seq>>;
        { traits_of<Seq>::index_offset( seq, i, n ) } -> std::same_as<index_t<Seq>>;
        { traits_of<Seq>::distance    ( seq, i, i ) } -> std::convertible_to<offset_t<Seq>>;
        traits_of<Seq>::element( seq, i );
    };

template <typename Seq>
concept bidirectional_sequence =
    indexed_sequence<Seq> &&
    requires( std::remove_cvref_t<Seq> const & seq, index_t<Seq> const i ) {
        { traits_of<Seq>::index_before( seq, i ) } -> std::same_as<index_t<Seq>>;
    };

template <typename Seq>
concept mutable_sequence =
    indexed_sequence<Seq> &&
    !std::is_const_v<std::remove_reference_t<Seq>> &&
    requires( std::remove_cvref_t<Seq> & seq, index_t<Seq> const i ) {
        traits_of<Seq>::swap_at( seq, i, i );
    };

template <typename Seq>
concept truncatable_sequence =
    mutable_sequence<Seq> &&
    requires( std::remove_cvref_t<Seq> & seq, index_t<Seq> const i ) {
        traits_of<Seq>::truncate( seq, i );
    };

template <typename Seq>
concept appendable_sequence =
    indexed_sequence<Seq> &&
    std::default_initializable<std::remove_cvref_t<Seq>> &&
    std::movable              <std::remove_cvref_t<Seq>> &&
    requires( std::remove_cvref_t<Seq> & dst, std::remove_cvref_t<Seq> const & src, index_t<Seq> const i ) {
        traits_of<Seq>::append( dst, traits_of<Seq>::element( src, i ) );
    };

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
