////////////////////////////////////////////////////////////////////////////////
/// psi::rangeset::range_set
///
/// A set of values of an ordered type stored as a sorted sequence of disjoint
/// half-open intervals - typically used to hold a discontiguous selection of
/// positions (indices) within some sequence.
///
/// Invariants (checked after every mutation in debug builds, see
/// check_invariants()):
///   - no interval is empty
///   - intervals are sorted ascending (by both bounds)
///   - consecutive intervals neither overlap nor touch
///     (ranges[i].upper < ranges[i + 1].lower): touching intervals are merged
///
/// Operations:
///   - contains, overlaps                      O(log n)
///   - insert/remove of an interval            O(log n) search + O(n) shift
///     (at most two intervals are ever written in place of the replaced span
///     using an inline static_vector buffer - no temporary heap allocations)
///   - append                                  O(1), past-the-end fast path
///   - set algebra (union, subtraction, intersection, symmetric difference,
///     subset/superset/disjointness tests)
///   - element-wise insert/remove/update and an elements() view for discrete
///     bound types
///   - sequence-relative insertion/removal and complement (inverted)
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
#include <boost/container/static_vector.hpp>
#include <boost/sort/pdqsort/pdqsort.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

namespace detail
{
#ifdef PSI_RANGESET_CHECK_INVARIANTS
    inline bool constexpr check_invariants_enabled{ PSI_RANGESET_CHECK_INVARIANTS };
#elif defined( NDEBUG )
    inline bool constexpr check_invariants_enabled{ false };
#else
    inline bool constexpr check_invariants_enabled{ true  };
#endif

    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg );
} // namespace detail

// Hint tag: the supplied interval container already satisfies the range_set
// invariants (sorted, nonempty, disjoint and non-touching intervals).
struct sorted_unique_t { explicit sorted_unique_t() = default; };
inline constexpr sorted_unique_t sorted_unique{};

// Bound types with a notion of 'the next/previous value' (integers,
// iterators...) for which individual elements can be enumerated.
template <typename B>
concept discrete_bound =
    std::totally_ordered<B> &&
    std::incrementable<B>   &&
    requires( B b ) { { --b } -> std::same_as<B &>; };

template <std::totally_ordered Bound, typename Container> class range_set_elements;


template
<
    std::totally_ordered Bound,
    typename Container = std::vector<range<Bound>>
>
class range_set
{
    static_assert( std::is_same_v<range<Bound>, typename Container::value_type>, "Container::value_type must be range<Bound>" );

public:
    using bound_type      = Bound;
    using value_type      = range<Bound>;
    using container_type  = Container;
    using size_type       = typename Container::size_type;
    using difference_type = typename Container::difference_type;
    using iterator        = typename Container::const_iterator;
    using const_iterator  = iterator; // intervals are never modifiable in place

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    constexpr range_set() = default;

    constexpr explicit range_set( range<Bound> const r ) { insert( r ); }

    constexpr range_set( std::initializer_list<range<Bound>> const ranges )
    {
        for ( auto const & r : ranges )
            insert( r );
    }

    template <std::ranges::input_range R>
    requires
        std::convertible_to<std::ranges::range_reference_t<R>, range<Bound>> &&
        ( !std::same_as<std::remove_cvref_t<R>, range_set> )
    constexpr explicit range_set( R && ranges )
    {
        for ( range<Bound> const r : ranges )
            insert( r );
    }

    // From individual elements (in any order, duplicates allowed).
    template <std::ranges::input_range R>
    requires
        discrete_bound<Bound> &&
        std::convertible_to<std::ranges::range_reference_t<R>, Bound> &&
        ( !std::convertible_to<std::ranges::range_reference_t<R>, range<Bound>> )
    constexpr explicit range_set( R && elements )
    {
        std::vector<Bound> sorted;
        if constexpr ( std::ranges::sized_range<R> )
            sorted.reserve( static_cast<std::size_t>( std::ranges::size( elements ) ) );
        for ( Bound const element : elements )
            sorted.push_back( element );
        boost::sort::pdqsort( sorted.begin(), sorted.end() );

        for ( auto const & element : sorted )
        {
            if ( !storage_.empty() && element < storage_.back().upper ) // duplicate
                continue;
            append( { element, next( element ) } );
        }
        check_invariants();
    }

    constexpr range_set( sorted_unique_t, Container ranges ) noexcept( std::is_nothrow_move_constructible_v<Container> )
        : storage_{ std::move( ranges ) }
    {
        check_invariants();
    }

    // A single position within a sequence.
    template <indexed_sequence Seq>
    requires std::same_as<index_t<Seq>, Bound>
    constexpr range_set( Bound const position, Seq const & within ) { insert( position, within ); }

    // The positions denoted by a range expression relative to a sequence.
    template <indexed_sequence Seq, range_expression_for<Seq> Expr>
    requires std::same_as<index_t<Seq>, Bound>
    constexpr range_set( Expr const & positions, Seq const & within ) { insert( positions, within ); }

    constexpr range_set( range_set const & ) = default;
    constexpr range_set( range_set && )      = default;
    constexpr range_set & operator=( range_set const & ) = default;
    constexpr range_set & operator=( range_set && )      = default;

    //--------------------------------------------------------------------------
    // Access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr bool empty() const noexcept { return storage_.empty(); }

    [[ nodiscard ]] constexpr Container const & ranges() const noexcept { return storage_; }

    constexpr iterator begin() const noexcept { return storage_.begin(); }
    constexpr iterator end  () const noexcept { return storage_.end  (); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr bool contains( Bound const & value ) const noexcept
    {
        auto const pos{ std::partition_point( storage_.begin(), storage_.end(), [ &value ]( value_type const & r ) noexcept { return !( value < r.upper ); } ) };
        return ( pos != storage_.end() ) && !( value < pos->lower );
    }

    // Is the whole (nonempty) interval `r` contained in the set.
    [[ nodiscard ]] constexpr bool contains( range<Bound> const & r ) const noexcept
    {
        if ( r.empty() )
            return true;
        auto const pos{ std::partition_point( storage_.begin(), storage_.end(), [ &r ]( value_type const & x ) noexcept { return !( r.lower < x.upper ); } ) };
        return ( pos != storage_.end() ) && !( r.lower < pos->lower ) && !( pos->upper < r.upper );
    }

    [[ nodiscard ]] constexpr bool overlaps( range<Bound> const & r ) const noexcept
    {
        if ( r.empty() )
            return false;
        auto const [ first, last ]{ overlapping_span( r, false ) };
        return first != last;
    }

    //--------------------------------------------------------------------------
    // Modifiers - intervals
    //--------------------------------------------------------------------------

    /// Adds an interval that lies entirely at or past the current upper bound
    /// of the set (merging it with the last interval if the two touch).
    constexpr void append( range<Bound> const r )
    {
        BOOST_ASSERT_MSG( storage_.empty() || !( r.lower < storage_.back().upper ), "range_set::append() only accepts intervals past the end of the set" );
        if ( r.empty() )
            return;
        if ( !storage_.empty() && ( storage_.back().upper == r.lower ) )
            storage_.back().upper = r.upper;
        else
            storage_.push_back( r );
    }

    constexpr void insert( range<Bound> const r )
    {
        if ( r.empty() )
            return;

        if ( storage_.empty() || !( r.lower < storage_.back().upper ) )
        {
            append( r );
        }
        else
        if ( r.upper < storage_.front().lower )
        {
            storage_.insert( storage_.begin(), r );
        }
        else
        {
            auto const [ first, last ]{ overlapping_span( r, true ) };
            if ( first == last )
            {
                storage_.insert( nth( first ), r );
            }
            else
            {
                value_type const merged
                {
                    std::min( r.lower, storage_[ first    ].lower ),
                    std::max( r.upper, storage_[ last - 1 ].upper )
                };
                replace_span( first, last, replacement_buffer{ merged } );
            }
        }
        check_invariants();
    }

    constexpr void remove( range<Bound> const r )
    {
        if ( r.empty() || storage_.empty() )
            return;

        auto const [ first, last ]{ overlapping_span( r, false ) };
        if ( first == last )
            return;

        auto const & front{ storage_[ first    ] };
        auto const & back { storage_[ last - 1 ] };
        // The overlapped span loses [r.lower, r.upper): what remains of it is
        // at most a head piece of its first interval and a tail piece of its
        // last one.
        replacement_buffer remainder;
        if ( front.lower < r.lower ) remainder.push_back( { front.lower, r.lower } );
        if ( r.upper < back.upper  ) remainder.push_back( { r.upper, back.upper } );
        replace_span( first, last, remainder );
        check_invariants();
    }

    //--------------------------------------------------------------------------
    // Modifiers - individual elements
    //--------------------------------------------------------------------------

    // Returns whether the element was newly added.
    constexpr bool insert( Bound const & element ) requires discrete_bound<Bound>
    {
        if ( contains( element ) )
            return false;
        insert( range<Bound>{ element, next( element ) } );
        return true;
    }

    // Returns the removed element (or nothing if it was not a member).
    constexpr std::optional<Bound> remove( Bound const & element ) requires discrete_bound<Bound>
    {
        if ( !contains( element ) )
            return std::nullopt;
        remove( range<Bound>{ element, next( element ) } );
        return element;
    }

    // Returns the already present equal element (or nothing if the element
    // had to be inserted).
    constexpr std::optional<Bound> update( Bound const & element ) requires discrete_bound<Bound>
    {
        if ( contains( element ) )
            return element;
        insert( range<Bound>{ element, next( element ) } );
        return std::nullopt;
    }

    //--------------------------------------------------------------------------
    // Modifiers - positions within a sequence
    //--------------------------------------------------------------------------
    template <indexed_sequence Seq>
    requires std::same_as<index_t<Seq>, Bound>
    constexpr void insert( Bound const position, Seq const & within )
    {
        insert( range<Bound>{ position, traits_of<Seq>::index_after( within, position ) } );
    }

    template <indexed_sequence Seq, range_expression_for<Seq> Expr>
    requires std::same_as<index_t<Seq>, Bound>
    constexpr void insert( Expr const & positions, Seq const & within )
    {
        insert( relative_to( positions, within ) );
    }

    template <indexed_sequence Seq>
    requires std::same_as<index_t<Seq>, Bound>
    constexpr void remove( Bound const position, Seq const & within )
    {
        remove( range<Bound>{ position, traits_of<Seq>::index_after( within, position ) } );
    }

    template <indexed_sequence Seq, range_expression_for<Seq> Expr>
    requires std::same_as<index_t<Seq>, Bound>
    constexpr void remove( Expr const & positions, Seq const & within )
    {
        remove( relative_to( positions, within ) );
    }

    /// The positions of `within` that are _not_ in this set.
    template <indexed_sequence Seq>
    requires std::same_as<index_t<Seq>, Bound>
    [[ nodiscard ]] constexpr range_set inverted( Seq const & within ) const
    {
        using traits = traits_of<Seq>;
        range_set result;
        auto lower{ traits::start_index( within ) };
        for ( auto const & r : storage_ )
        {
            if ( lower < r.lower )
                result.storage_.push_back( { lower, r.lower } );
            lower = r.upper;
        }
        auto const upper{ traits::end_index( within ) };
        if ( lower < upper )
            result.storage_.push_back( { lower, upper } );
        result.check_invariants();
        return result;
    }

    //--------------------------------------------------------------------------
    // Set algebra
    //--------------------------------------------------------------------------
    constexpr void form_union( range_set const & other )
    {
        for ( auto const & r : other.storage_ )
            insert( r );
    }

    constexpr void subtract( range_set const & other )
    {
        for ( auto const & r : other.storage_ )
            remove( r );
    }

    constexpr void form_intersection        ( range_set const & other ) { *this = intersection        ( other ); }
    constexpr void form_symmetric_difference( range_set const & other ) { *this = symmetric_difference( other ); }

    [[ nodiscard ]] constexpr range_set union_with( range_set const & other ) const { auto result{ *this }; result.form_union( other ); return result; }
    [[ nodiscard ]] constexpr range_set subtracting( range_set const & other ) const { auto result{ *this }; result.subtract  ( other ); return result; }

    // Linear two-way sweep over both interval sequences.
    [[ nodiscard ]] constexpr range_set intersection( range_set const & other ) const
    {
        range_set result;
        auto       a    { storage_.begin() };
        auto       b    { other.storage_.begin() };
        auto const a_end{ storage_.end() };
        auto const b_end{ other.storage_.end() };
        while ( ( a != a_end ) && ( b != b_end ) )
        {
            if      ( !( a->lower < b->upper ) ) { ++b; }
            else if ( !( b->lower < a->upper ) ) { ++a; }
            else
            {
                result.storage_.push_back( { std::max( a->lower, b->lower ), std::min( a->upper, b->upper ) } );
                if ( a->upper < b->upper ) ++a;
                else                       ++b;
            }
        }
        result.check_invariants();
        return result;
    }

    [[ nodiscard ]] constexpr range_set symmetric_difference( range_set const & other ) const
    {
        return union_with( other ).subtracting( intersection( other ) );
    }

    [[ nodiscard ]] constexpr bool is_subset_of( range_set const & other ) const noexcept
    {
        return std::ranges::all_of( storage_, [ &other ]( value_type const & r ) noexcept { return other.contains( r ); } );
    }
    [[ nodiscard ]] constexpr bool is_superset_of       ( range_set const & other ) const noexcept { return other.is_subset_of( *this ); }
    [[ nodiscard ]] constexpr bool is_strict_subset_of  ( range_set const & other ) const noexcept { return ( *this != other ) && is_subset_of  ( other ); }
    [[ nodiscard ]] constexpr bool is_strict_superset_of( range_set const & other ) const noexcept { return ( *this != other ) && is_superset_of( other ); }

    [[ nodiscard ]] constexpr bool is_disjoint_with( range_set const & other ) const noexcept
    {
        return std::ranges::none_of( storage_, [ &other ]( value_type const & r ) noexcept { return other.overlaps( r ); } );
    }

    friend constexpr range_set operator| ( range_set const & a, range_set const & b ) { return a.union_with          ( b ); }
    friend constexpr range_set operator- ( range_set const & a, range_set const & b ) { return a.subtracting         ( b ); }
    friend constexpr range_set operator& ( range_set const & a, range_set const & b ) { return a.intersection        ( b ); }
    friend constexpr range_set operator^ ( range_set const & a, range_set const & b ) { return a.symmetric_difference( b ); }

    friend constexpr bool operator==( range_set const & a, range_set const & b ) noexcept { return a.storage_ == b.storage_; }

    //--------------------------------------------------------------------------
    // Elements (discrete bounds)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr range_set_elements<Bound, Container> elements() const noexcept requires discrete_bound<Bound>
    {
        return range_set_elements<Bound, Container>{ *this };
    }

    [[ nodiscard ]] constexpr std::size_t element_count() const noexcept
    requires requires( Bound const b ) { b - b; }
    {
        std::size_t count{ 0 };
        for ( auto const & r : storage_ )
            count += static_cast<std::size_t>( r.upper - r.lower );
        return count;
    }

    //--------------------------------------------------------------------------
    // Capacity & misc
    //--------------------------------------------------------------------------
    constexpr void clear() noexcept { storage_.clear(); }

    constexpr void reserve( size_type const interval_count )
    requires requires( Container & c, size_type const n ) { c.reserve( n ); }
    {
        storage_.reserve( interval_count );
    }

    constexpr void swap( range_set & other ) noexcept { using std::swap; swap( storage_, other.storage_ ); }
    friend constexpr void swap( range_set & a, range_set & b ) noexcept { a.swap( b ); }

    // Asserts the class invariants (a no-op unless
    // detail::check_invariants_enabled).
    constexpr void check_invariants() const noexcept
    {
        if constexpr ( detail::check_invariants_enabled )
        {
            for ( size_type i{ 0 }; i < storage_.size(); ++i )
            {
                BOOST_ASSERT_MSG( !storage_[ i ].empty(), "range_set holds an empty interval" );
                if ( i != 0 )
                    BOOST_ASSERT_MSG( storage_[ i - 1 ].upper < storage_[ i ].lower, "range_set intervals overlap, touch or are out of order" );
            }
        }
    }

private:
    using replacement_buffer = boost::container::static_vector<value_type, 2>;

    static constexpr Bound next( Bound value )
    {
        if constexpr ( std::numeric_limits<Bound>::is_specialized )
            BOOST_ASSERT_MSG( value < std::numeric_limits<Bound>::max(), "The largest Bound value cannot be an element of a range_set" );
        ++value;
        return value;
    }

    constexpr auto nth( size_type const i ) noexcept { return storage_.begin() + static_cast<difference_type>( i ); }

    // Index span [first, last) of the intervals that overlap `r` or, with
    // `include_touching`, also those that merely touch it.
    constexpr std::pair<size_type, size_type> overlapping_span( range<Bound> const & r, bool const include_touching ) const noexcept
    {
        auto const first
        {
            std::partition_point
            (
                storage_.begin(), storage_.end(),
                [ &r, include_touching ]( value_type const & x ) noexcept { return include_touching ? ( x.upper < r.lower ) : !( r.lower < x.upper ); }
            )
        };
        auto const last
        {
            std::partition_point
            (
                first, storage_.end(),
                [ &r, include_touching ]( value_type const & x ) noexcept { return include_touching ? !( r.upper < x.lower ) : ( x.lower < r.upper ); }
            )
        };
        return { static_cast<size_type>( first - storage_.begin() ), static_cast<size_type>( last - storage_.begin() ) };
    }

    // Replaces the intervals [first, last) with `replacement`: overwrites in
    // place as many as possible then erases the surplus or inserts the rest.
    constexpr void replace_span( size_type const first, size_type const last, replacement_buffer const & replacement )
    {
        auto const old_count{ last - first };
        auto const new_count{ static_cast<size_type>( replacement.size() ) };
        auto const common   { std::min( old_count, new_count ) };
        std::copy_n( replacement.begin(), common, nth( first ) );
        if ( old_count > common )
            storage_.erase( nth( first + common ), nth( last ) );
        else
        if ( new_count > common )
            storage_.insert( nth( first + common ), replacement.begin() + static_cast<std::ptrdiff_t>( common ), replacement.end() );
    }

    Container storage_;
}; // class range_set

template <typename Bound>
range_set( range<Bound> ) -> range_set<Bound>;

template <typename Bound>
range_set( std::initializer_list<range<Bound>> ) -> range_set<Bound>;


//==============================================================================
// range_set_elements - bidirectional view of the individual members of a
// range_set over a discrete bound type (in ascending order)
//==============================================================================

template <std::totally_ordered Bound, typename Container>
class range_set_elements
    : public std::ranges::view_interface<range_set_elements<Bound, Container>>
{
    using set_type       = range_set<Bound, Container>;
    using range_iterator = typename Container::const_iterator;

public:
    class iterator
    {
    public:
        using iterator_concept  = std::bidirectional_iterator_tag;
        using iterator_category = std::input_iterator_tag; // elements are produced by value
        using value_type        = Bound;
        using difference_type   = std::ptrdiff_t;
        using reference         = Bound;

        constexpr iterator() = default;

        constexpr Bound operator*() const noexcept { return value_; }

        constexpr iterator & operator++() noexcept
        {
            BOOST_ASSERT( pos_ != ranges_->end() );
            ++value_;
            if ( value_ == pos_->upper )
            {
                ++pos_;
                value_ = ( pos_ != ranges_->end() ) ? pos_->lower : Bound{};
            }
            return *this;
        }
        constexpr iterator operator++( int ) noexcept { auto const tmp{ *this }; ++*this; return tmp; }

        constexpr iterator & operator--() noexcept
        {
            if ( ( pos_ == ranges_->end() ) || ( value_ == pos_->lower ) )
            {
                BOOST_ASSERT( pos_ != ranges_->begin() );
                --pos_;
                value_ = pos_->upper;
            }
            --value_;
            return *this;
        }
        constexpr iterator operator--( int ) noexcept { auto const tmp{ *this }; --*this; return tmp; }

        friend constexpr bool operator==( iterator const & a, iterator const & b ) noexcept { return ( a.pos_ == b.pos_ ) && ( a.value_ == b.value_ ); }

    private: friend class range_set_elements;
        constexpr iterator( Container const & ranges, range_iterator const pos ) noexcept
            : ranges_{ &ranges }, pos_{ pos }, value_{ ( pos != ranges.end() ) ? pos->lower : Bound{} } {}

        Container const * ranges_{};
        range_iterator    pos_   {};
        Bound             value_ {};
    }; // class iterator

    constexpr range_set_elements() = default;
    constexpr explicit range_set_elements( set_type const & set ) noexcept : set_{ &set } {}

    constexpr iterator begin() const noexcept { return { set_->ranges(), set_->ranges().begin() }; }
    constexpr iterator end  () const noexcept { return { set_->ranges(), set_->ranges().end  () }; }

    constexpr std::size_t size() const noexcept requires requires( Bound const b ) { b - b; } { return set_->element_count(); }

private:
    set_type const * set_{};
}; // class range_set_elements


extern template class range_set<std::size_t>;
extern template class range_set<std::ptrdiff_t>;

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
