////////////////////////////////////////////////////////////////////////////////
/// psi::rangeset::indexing_view
///
/// Lazy projection of the elements of a base sequence at the positions held
/// by a range_set: iteration visits exactly those elements, in ascending
/// position order, and writes go straight through to the base sequence.
/// Construction is O(1) (beyond moving the range_set in) and nothing is ever
/// copied out of the base.
///
/// The Base template parameter is either an lvalue reference to the sequence
/// (the view refers to it) or a plain object type (the view owns it), the
/// same convention std::ranges::owning_view/ref_view split along. Use the
/// indexed() factory to get the right one automatically.
///
/// The view models the sequence_traits capability set itself (forward or
/// bidirectional, mutable if the base is) so it can be fed back into the
/// partitioning algorithms.
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
#include <psi/rangeset/range_set.hpp>
#include <psi/rangeset/sequence_traits.hpp>

#include <boost/assert.hpp>

#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

template <typename Base>
class indexing_view
{
public:
    using base_type     = std::remove_reference_t<Base>;
    using sequence_type = std::remove_cv_t<base_type>;
    using base_traits   = sequence_traits<sequence_type>;
    using base_index    = index_t<sequence_type>;
    using set_type      = range_set<base_index>;
    using value_type    = typename base_traits::value_type;
    using size_type     = std::size_t;

    static_assert( indexed_sequence<sequence_type> );
    static constexpr bool owning       { !std::is_reference_v<Base> };
    static constexpr bool bidirectional{ bidirectional_sequence<sequence_type> };

    // A position of the view: the base position along with the ordinal of the
    // interval that contains it (so that stepping does not have to search).
    struct index
    {
        std::size_t range_offset{};
        base_index  base        {};

        friend constexpr bool operator==( index const & a, index const & b ) noexcept { return   a.base == b.base  ; }
        friend constexpr bool operator< ( index const & a, index const & b ) noexcept { return   a.base <  b.base  ; }
        friend constexpr bool operator> ( index const & a, index const & b ) noexcept { return   b.base <  a.base  ; }
        friend constexpr bool operator<=( index const & a, index const & b ) noexcept { return !( b.base <  a.base ); }
        friend constexpr bool operator>=( index const & a, index const & b ) noexcept { return !( a.base <  b.base ); }
    }; // struct index

private:
    template <bool Const>
    class basic_iterator
    {
    private:
        using view_t = std::conditional_t<Const, indexing_view const, indexing_view>;

    public:
        using iterator_concept = std::conditional_t<bidirectional, std::bidirectional_iterator_tag, std::forward_iterator_tag>;
        using value_type       = typename indexing_view::value_type;
        using difference_type  = std::ptrdiff_t;

        constexpr basic_iterator() = default;
        constexpr basic_iterator( view_t & view, index const position ) noexcept : view_{ &view }, pos_{ position } {}

        constexpr decltype( auto ) operator*() const { return ( *view_ )[ pos_ ]; }

        constexpr basic_iterator & operator++()      { pos_ = view_->index_after( pos_ ); return *this; }
        constexpr basic_iterator   operator++( int ) { auto const tmp{ *this }; ++*this; return tmp; }

        constexpr basic_iterator & operator--()      requires bidirectional { pos_ = view_->index_before( pos_ ); return *this; }
        constexpr basic_iterator   operator--( int ) requires bidirectional { auto const tmp{ *this }; --*this; return tmp; }

        [[ nodiscard ]] constexpr index position() const noexcept { return pos_; }

        friend constexpr bool operator==( basic_iterator const & a, basic_iterator const & b ) noexcept { return a.pos_ == b.pos_; }

    private:
        view_t * view_{};
        index    pos_ {};
    }; // class basic_iterator

public:
    using iterator       = basic_iterator<false>;
    using const_iterator = basic_iterator<true >;

    constexpr indexing_view( Base base, set_type positions )
        noexcept( std::is_nothrow_constructible_v<Base, Base &&> && std::is_nothrow_move_constructible_v<set_type> )
        : base_{ std::forward<Base>( base ) }, positions_{ std::move( positions ) } {}

    [[ nodiscard ]] constexpr base_type       & base()       noexcept { return base_; }
    [[ nodiscard ]] constexpr base_type const & base() const noexcept { return base_; }

    [[ nodiscard ]] constexpr set_type const & positions() const noexcept { return positions_; }

    //--------------------------------------------------------------------------
    // Positions
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr index start_index() const noexcept
    {
        auto const & ranges{ positions_.ranges() };
        return ranges.empty() ? end_index() : index{ 0, ranges.front().lower };
    }

    [[ nodiscard ]] constexpr index end_index() const noexcept
    {
        return { positions_.ranges().size(), base_traits::end_index( base_ ) };
    }

    [[ nodiscard ]] constexpr index index_after( index const i ) const noexcept
    {
        auto const & ranges{ positions_.ranges() };
        BOOST_ASSERT_MSG( i.range_offset < ranges.size(), "Advancing past the end of an indexing_view" );
        auto const next{ base_traits::index_after( base_, i.base ) };
        if ( next != ranges[ i.range_offset ].upper )
            return { i.range_offset, next };

        auto const next_offset{ i.range_offset + 1 };
        return ( next_offset == ranges.size() ) ? end_index() : index{ next_offset, ranges[ next_offset ].lower };
    }

    [[ nodiscard ]] constexpr index index_before( index const i ) const noexcept requires bidirectional
    {
        auto const & ranges{ positions_.ranges() };
        if ( ( i.range_offset == ranges.size() ) || ( i.base == ranges[ i.range_offset ].lower ) )
        {
            BOOST_ASSERT_MSG( i.range_offset != 0, "Stepping back from the start of an indexing_view" );
            auto const previous_offset{ i.range_offset - 1 };
            return { previous_offset, base_traits::index_before( base_, ranges[ previous_offset ].upper ) };
        }
        return { i.range_offset, base_traits::index_before( base_, i.base ) };
    }

    //--------------------------------------------------------------------------
    // Size
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr bool empty() const noexcept { return positions_.empty(); }

    [[ nodiscard ]] constexpr size_type size() const noexcept
    {
        size_type count{ 0 };
        for ( auto const & r : positions_.ranges() )
            count += static_cast<size_type>( base_traits::distance( base_, r.lower, r.upper ) );
        return count;
    }

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    constexpr decltype( auto ) operator[]( index const i )       noexcept { return base_traits::element( base_, i.base ); }
    constexpr decltype( auto ) operator[]( index const i ) const noexcept { return base_traits::element( base_, i.base ); }

    // Checked access by ordinal (the n-th element of the view).
    constexpr decltype( auto ) at( size_type const n )       { return base_traits::element( base_, checked_position( n ) ); }
    constexpr decltype( auto ) at( size_type const n ) const { return base_traits::element( base_, checked_position( n ) ); }

    constexpr decltype( auto ) front()       noexcept { BOOST_ASSERT( !empty() ); return ( *this )[ start_index() ]; }
    constexpr decltype( auto ) front() const noexcept { BOOST_ASSERT( !empty() ); return ( *this )[ start_index() ]; }
    constexpr decltype( auto ) back ()       noexcept requires bidirectional { BOOST_ASSERT( !empty() ); return ( *this )[ index_before( end_index() ) ]; }
    constexpr decltype( auto ) back () const noexcept requires bidirectional { BOOST_ASSERT( !empty() ); return ( *this )[ index_before( end_index() ) ]; }

    /// Overwrites the viewed elements, in order, with `values` (which must
    /// hold exactly size() elements).
    template <std::ranges::input_range R>
    constexpr void assign( R && values )
    {
        auto       source{ std::ranges::begin( values ) };
        auto const source_end{ std::ranges::end( values ) };
        auto       target{ start_index() };
        auto const target_end{ end_index() };
        for ( ; ( target != target_end ) && ( source != source_end ); target = index_after( target ), ++source )
            ( *this )[ target ] = *source;
        BOOST_ASSERT_MSG( ( target == target_end ) && ( source == source_end ), "indexing_view::assign(): value count mismatch" );
    }

    //--------------------------------------------------------------------------
    // Iteration
    //--------------------------------------------------------------------------
    constexpr iterator       begin()       noexcept { return { *this, start_index() }; }
    constexpr iterator       end  ()       noexcept { return { *this, end_index  () }; }
    constexpr const_iterator begin() const noexcept { return { *this, start_index() }; }
    constexpr const_iterator end  () const noexcept { return { *this, end_index  () }; }

private:
    constexpr base_index checked_position( size_type n ) const
    {
        for ( auto const & r : positions_.ranges() )
        {
            auto const length{ static_cast<size_type>( base_traits::distance( base_, r.lower, r.upper ) ) };
            if ( n < length )
                return base_traits::index_offset( base_, r.lower, static_cast<offset_t<sequence_type>>( n ) );
            n -= length;
        }
        detail::throw_out_of_range( "psi::rangeset::indexing_view::at" );
    }

    Base     base_;
    set_type positions_;
}; // class indexing_view

template <typename Seq>
indexing_view( Seq &&, range_set<index_t<Seq>> ) -> indexing_view<Seq>;


/// View of the elements of `seq` at `positions`: refers to lvalue sequences,
/// takes ownership of rvalue ones.
template <typename Seq>
requires indexed_sequence<Seq>
[[ nodiscard ]] constexpr indexing_view<Seq> indexed( Seq && seq, range_set<index_t<Seq>> positions )
{
    return indexing_view<Seq>{ std::forward<Seq>( seq ), std::move( positions ) };
}


//==============================================================================
// The view as a sequence in its own right
//==============================================================================

template <typename Base>
struct sequence_traits<indexing_view<Base>>
{
    using view_type       = indexing_view<Base>;
    using index_type      = typename view_type::index;
    using difference_type = std::ptrdiff_t;
    using value_type      = typename view_type::value_type;

    [[ nodiscard ]] static constexpr index_type start_index( view_type const & view ) noexcept { return view.start_index(); }
    [[ nodiscard ]] static constexpr index_type end_index  ( view_type const & view ) noexcept { return view.end_index  (); }

    [[ nodiscard ]] static constexpr index_type index_after ( view_type const & view, index_type const i ) noexcept { return view.index_after ( i ); }
    [[ nodiscard ]] static constexpr index_type index_before( view_type const & view, index_type const i ) noexcept
    requires view_type::bidirectional
    {
        return view.index_before( i );
    }

    // Linear: the view is not random access.
    [[ nodiscard ]] static constexpr index_type index_offset( view_type const & view, index_type i, difference_type n ) noexcept
    {
        for ( ; n > 0; --n ) i = view.index_after( i );
        if constexpr ( view_type::bidirectional )
            for ( ; n < 0; ++n ) i = view.index_before( i );
        BOOST_ASSERT_MSG( n == 0, "Negative offset on a forward-only indexing_view" );
        return i;
    }
    [[ nodiscard ]] static constexpr difference_type distance( view_type const & view, index_type const from, index_type const to ) noexcept
    {
        if ( to < from )
            return -distance( view, to, from );
        difference_type n{ 0 };
        for ( auto i{ from }; i != to; i = view.index_after( i ) )
            ++n;
        return n;
    }

    [[ nodiscard ]] static constexpr decltype( auto ) element( view_type       & view, index_type const i ) noexcept { return view[ i ]; }
    [[ nodiscard ]] static constexpr decltype( auto ) element( view_type const & view, index_type const i ) noexcept { return view[ i ]; }

    static constexpr void swap_at( view_type & view, index_type const a, index_type const b )
    requires mutable_sequence<typename view_type::base_type>
    {
        view_type::base_traits::swap_at( view.base(), a.base, b.base );
    }
}; // sequence_traits<indexing_view>

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
