////////////////////////////////////////////////////////////////////////////////
/// psi::rangeset range_set test suite
////////////////////////////////////////////////////////////////////////////////

#include <psi/rangeset/range_set.hpp>
#include <psi/rangeset/range_set_print.hpp>

#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <limits>
#include <random>
#include <ranges>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace psi::rangeset;

//==============================================================================
// Helpers
//==============================================================================

namespace
{
    using int_set   = range_set<int>;
    using int_range = range<int>;
    using reference = boost::container::flat_set<int>;

    int_set source() { return { { 1, 5 }, { 8, 10 }, { 20, 22 }, { 27, 29 } }; }

    std::vector<int_range> ranges_of( int_set const & set ) { return { set.ranges().begin(), set.ranges().end() }; }

    bool satisfies_invariants( int_set const & set )
    {
        auto const & ranges{ set.ranges() };
        if ( std::ranges::any_of( ranges, []( int_range const r ) { return r.empty(); } ) )
            return false;
        for ( std::size_t i{ 1 }; i < ranges.size(); ++i )
            if ( !( ranges[ i - 1 ].upper < ranges[ i ].lower ) )
                return false;
        return true;
    }

    // Mirrors range_set mutations on an element-wise reference set.
    void insert( reference & ref, int_range const r ) { for ( auto i{ r.lower }; i < r.upper; ++i ) ref.insert( i ); }
    void remove( reference & ref, int_range const r ) { for ( auto i{ r.lower }; i < r.upper; ++i ) ref.erase ( i ); }

    reference to_reference( int_set const & set )
    {
        std::vector<int> elements;
        for ( auto const element : set.elements() )
            elements.push_back( element );
        return reference( boost::container::ordered_unique_range, elements.begin(), elements.end() );
    }

    int_set build_random_set( std::mt19937 & rng, reference * const p_ref = nullptr )
    {
        std::uniform_int_distribution<int> bound{ -100, 100 };
        std::bernoulli_distribution        do_insert{ 0.7 };
        int_set set;
        for ( auto i{ 0 }; i < 100; ++i )
        {
            auto a{ bound( rng ) };
            auto b{ bound( rng ) };
            if ( a > b )
                std::swap( a, b );
            if ( do_insert( rng ) ) { set.insert( int_range{ a, b } ); if ( p_ref ) insert( *p_ref, { a, b } ); }
            else                    { set.remove( int_range{ a, b } ); if ( p_ref ) remove( *p_ref, { a, b } ); }
        }
        return set;
    }

    unsigned make_seed()
    {
        auto const seed{ std::random_device{}() };
        std::printf( "Seed %u\n", seed );
        return seed;
    }
} // anonymous namespace

//==============================================================================
// Construction
//==============================================================================

TEST( range_set, default_construction )
{
    int_set const s;
    EXPECT_TRUE( s.empty() );
    EXPECT_EQ( s.begin(), s.end() );
    EXPECT_FALSE( s.contains( 0 ) );
}

TEST( range_set, single_range_construction )
{
    int_set const s{ int_range{ 3, 7 } };
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 3, 7 } } ) );

    int_set const e{ int_range{ 5, 5 } };
    EXPECT_TRUE( e.empty() );
}

TEST( range_set, initializer_list_construction_merges )
{
    int_set const s{ { 10, 12 }, { 1, 3 }, { 3, 5 }, { 11, 15 }, { 20, 20 } };
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 10, 15 } } ) );
}

TEST( range_set, ranges_construction )
{
    std::vector<int_range> const input{ { 8, 9 }, { 0, 2 }, { 1, 4 } };
    int_set const s( input );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 0, 4 }, { 8, 9 } } ) );
}

TEST( range_set, elements_construction )
{
    std::vector<int> const elements{ 5, 1, 3, 2, 9, 3, 10, 1 };
    int_set const s( elements );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 4 }, { 5, 6 }, { 9, 11 } } ) );
}

TEST( range_set, sorted_unique_construction )
{
    int_set const s( sorted_unique, std::vector<int_range>{ { 1, 3 }, { 5, 7 } } );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 3 }, { 5, 7 } } ) );
    EXPECT_TRUE ( s.contains( 6 ) );
    EXPECT_FALSE( s.contains( 3 ) );
}

TEST( range_set, construction_within_sequence )
{
    std::vector<char> const letters{ 'A', 'B', 'C', 'D', 'E', 'F' };

    range_set<std::size_t> const single( 2, letters );
    EXPECT_EQ( single, ( range_set<std::size_t>{ { 2, 3 } } ) );

    range_set<std::size_t> const from( range_from{ 3 }, letters );
    EXPECT_EQ( from, ( range_set<std::size_t>{ { 3, 6 } } ) );

    range_set<std::size_t> const through( range_through{ 1 }, letters );
    EXPECT_EQ( through, ( range_set<std::size_t>{ { 0, 2 } } ) );

    range_set<std::size_t> const closed( closed_range{ 1, 4 }, letters );
    EXPECT_EQ( closed, ( range_set<std::size_t>{ { 1, 5 } } ) );
}

TEST( range_set, custom_container )
{
    range_set<int, boost::container::small_vector<int_range, 4>> s{ { 1, 5 }, { 8, 10 } };
    s.insert( int_range{ 4, 8 } );
    ASSERT_EQ( s.ranges().size(), 1 );
    EXPECT_EQ( s.ranges().front(), ( int_range{ 1, 10 } ) );
}

//==============================================================================
// Elements
//==============================================================================

TEST( range_set, elements_traversal )
{
    auto const set     { source() };
    auto const elements{ set.elements() };
    static_assert( std::ranges::bidirectional_range<decltype( elements )> );

    EXPECT_EQ( set.element_count(), 10 );
    EXPECT_EQ( elements.size(), 10 );
    EXPECT_EQ( std::ranges::distance( elements ), 10 );

    std::vector<int> const forward( elements.begin(), elements.end() );
    EXPECT_EQ( forward, ( std::vector<int>{ 1, 2, 3, 4, 8, 9, 20, 21, 27, 28 } ) );

    std::vector<int> backward;
    for ( auto it{ elements.end() }; it != elements.begin(); )
        backward.push_back( *--it );
    EXPECT_EQ( backward, ( std::vector<int>{ 28, 27, 21, 20, 9, 8, 4, 3, 2, 1 } ) );

    auto const i{ std::ranges::find( elements, 4  ) };
    auto const j{ std::ranges::find( elements, 20 ) };
    auto const d{ std::ranges::distance( i, j ) };
    EXPECT_EQ( d, 3 );
    EXPECT_EQ( std::ranges::prev( j, d ), i );
    EXPECT_EQ( std::ranges::next( i, d ), j );

    int_set const empty;
    EXPECT_TRUE( empty.elements().empty() );
}

//==============================================================================
// Insertion & removal
//==============================================================================

TEST( range_set, largest_bound_element )
{
    auto constexpr max{ std::numeric_limits<std::size_t>::max() };
    range_set<std::size_t> s;
    EXPECT_TRUE( s.insert( max - 1 ) );
    EXPECT_TRUE( s.contains( max - 1 ) );
    EXPECT_EQ( s, ( range_set<std::size_t>{ { max - 1, max } } ) );
#ifndef NDEBUG
    // max has no successor so [max, max + 1) cannot be represented
    EXPECT_DEATH( s.insert( max ), "largest Bound" );
#endif
}

TEST( range_set, insertions )
{
    { // overlap from middle to middle
        auto s{ source() };
        s.insert( int_range{ 3, 21 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 22 }, { 27, 29 } } ) );
    }
    { // insert in the middle
        auto s{ source() };
        s.insert( int_range{ 13, 15 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 8, 10 }, { 13, 15 }, { 20, 22 }, { 27, 29 } } ) );
    }
    { // extend a range
        auto s{ source() };
        s.insert( int_range{ 22, 25 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 8, 10 }, { 20, 25 }, { 27, 29 } } ) );
    }
    { // extend at the beginning of a range
        auto s{ source() };
        s.insert( int_range{ 17, 20 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 8, 10 }, { 17, 22 }, { 27, 29 } } ) );
    }
    { // insert at the beginning
        auto s{ source() };
        s.insert( int_range{ -10, -5 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { -10, -5 }, { 1, 5 }, { 8, 10 }, { 20, 22 }, { 27, 29 } } ) );
    }
    { // insert at the end
        auto s{ source() };
        s.insert( int_range{ 35, 40 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 8, 10 }, { 20, 22 }, { 27, 29 }, { 35, 40 } } ) );
    }
    { // overlap multiple ranges
        auto s{ source() };
        s.insert( int_range{ 0, 21 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 0, 22 }, { 27, 29 } } ) );
    }
    { // touching the last range
        auto s{ source() };
        s.insert( int_range{ 29, 31 } );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 8, 10 }, { 20, 22 }, { 27, 31 } } ) );
    }
    { // empty range
        auto s{ source() };
        s.insert( int_range{ 14, 14 } );
        EXPECT_EQ( s, source() );
    }
    { // single element at the end of a range
        auto s{ source() };
        EXPECT_TRUE( s.insert( 22 ) );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 8, 10 }, { 20, 23 }, { 27, 29 } } ) );
    }
    { // single element between ranges
        auto s{ source() };
        EXPECT_TRUE ( s.insert( 14 ) );
        EXPECT_FALSE( s.insert( 14 ) );
        EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 8, 10 }, { 14, 15 }, { 20, 22 }, { 27, 29 } } ) );
    }
}

TEST( range_set, removals )
{
    auto s{ source() };
    s.remove( int_range{ 4, 28 } );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 4 }, { 28, 29 } } ) );
    EXPECT_EQ( s.remove( 3 ), 3 );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 3 }, { 28, 29 } } ) );
    EXPECT_EQ( s.remove( 3 ), std::nullopt );

    // split a single range in two
    s.remove( int_range{ 2, 2 } );
    s.insert( int_range{ 10, 20 } );
    s.remove( int_range{ 12, 15 } );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 3 }, { 10, 12 }, { 15, 20 }, { 28, 29 } } ) );

    // remove exactly one whole range, and a range that overlaps nothing
    s.remove( int_range{ 10, 12 } );
    s.remove( int_range{ 40, 50 } );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 3 }, { 15, 20 }, { 28, 29 } } ) );
}

TEST( range_set, update )
{
    auto s{ source() };
    EXPECT_EQ( s.update( 2 ), 2 );
    EXPECT_EQ( s, source() );
    EXPECT_EQ( s.update( 5 ), std::nullopt );
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 6 }, { 8, 10 }, { 20, 22 }, { 27, 29 } } ) );
}

TEST( range_set, append )
{
    int_set s;
    s.append( { 1, 3 } );
    s.append( { 3, 5 } ); // touching: merged
    s.append( { 7, 8 } );
    s.append( { 9, 9 } ); // empty: ignored
    EXPECT_EQ( ranges_of( s ), ( std::vector<int_range>{ { 1, 5 }, { 7, 8 } } ) );
}

TEST( range_set, positions_within_sequence )
{
    std::vector<int> const numbers( 10 );
    range_set<std::size_t> s;
    s.insert( 3, numbers );
    s.insert( closed_range{ 5, 6 }, numbers );
    s.insert( range_from{ 8 }, numbers );
    EXPECT_EQ( s, ( range_set<std::size_t>{ { 3, 4 }, { 5, 7 }, { 8, 10 } } ) );

    s.remove( 6, numbers );
    s.remove( range_up_to{ 4 }, numbers );
    EXPECT_EQ( s, ( range_set<std::size_t>{ { 5, 6 }, { 8, 10 } } ) );

    EXPECT_EQ( s.inverted( numbers ), ( range_set<std::size_t>{ { 0, 5 }, { 6, 8 } } ) );
    EXPECT_EQ( range_set<std::size_t>{}.inverted( numbers ), ( range_set<std::size_t>{ { 0, 10 } } ) );
    EXPECT_TRUE( range_set<std::size_t>( range_from{ 0 }, numbers ).inverted( numbers ).empty() );
}

//==============================================================================
// Lookup
//==============================================================================

TEST( range_set, contains_and_overlaps )
{
    auto const s{ source() };
    EXPECT_TRUE ( s.contains( 1  ) );
    EXPECT_TRUE ( s.contains( 4  ) );
    EXPECT_FALSE( s.contains( 5  ) );
    EXPECT_FALSE( s.contains( 0  ) );
    EXPECT_TRUE ( s.contains( 28 ) );
    EXPECT_FALSE( s.contains( 29 ) );

    EXPECT_TRUE ( s.contains( int_range{ 8, 10 } ) );
    EXPECT_FALSE( s.contains( int_range{ 8, 11 } ) );
    EXPECT_TRUE ( s.contains( int_range{ 6, 6  } ) );

    EXPECT_TRUE ( s.overlaps( int_range{ 4 , 8  } ) );
    EXPECT_FALSE( s.overlaps( int_range{ 5 , 8  } ) );
    EXPECT_FALSE( s.overlaps( int_range{ 10, 20 } ) );
    EXPECT_TRUE ( s.overlaps( int_range{ 0 , 50 } ) );
}

//==============================================================================
// Set algebra
//==============================================================================

TEST( range_set, intersection )
{
    {
        int_set const a{ { 0, 5 }, { 9, 14 } };
        int_set const b{ { 1, 3 }, { 4, 6 }, { 8, 12 } };
        int_set const expected{ { 1, 3 }, { 4, 5 }, { 9, 12 } };
        EXPECT_EQ( a.intersection( b ), expected );
        EXPECT_EQ( b.intersection( a ), expected );
        EXPECT_EQ( a & b, expected );
    }
    { // upper bound / lower bound equality
        int_set const a{ { 10, 20 }, { 30, 40 } };
        int_set const b{ { 15, 30 }, { 40, 50 } };
        int_set const expected{ { 15, 20 } };
        EXPECT_EQ( a.intersection( b ), expected );
        EXPECT_EQ( b.intersection( a ), expected );

        auto c{ a };
        c.form_intersection( b );
        EXPECT_EQ( c, expected );
    }
}

TEST( range_set, symmetric_difference )
{
    {
        int_set const a{ { 0, 5 }, { 9, 14 } };
        int_set const b{ { 1, 3 }, { 4, 6 }, { 8, 12 } };
        int_set const expected{ { 0, 1 }, { 3, 4 }, { 5, 6 }, { 8, 9 }, { 12, 14 } };
        EXPECT_EQ( a.symmetric_difference( b ), expected );
        EXPECT_EQ( b.symmetric_difference( a ), expected );
        EXPECT_EQ( a ^ b, expected );
    }
    {
        int_set const a{ { 10, 20 }, { 30, 40 } };
        int_set const b{ { 15, 30 }, { 40, 50 } };
        int_set const expected{ { 10, 15 }, { 20, 50 } };
        EXPECT_EQ( a.symmetric_difference( b ), expected );
        EXPECT_EQ( b.symmetric_difference( a ), expected );

        auto c{ a };
        c.form_symmetric_difference( b );
        EXPECT_EQ( c, expected );
    }
}

TEST( range_set, union_and_subtraction )
{
    int_set const a{ { 0, 5 }, { 9, 14 } };
    int_set const b{ { 1, 3 }, { 4, 6 }, { 8, 12 } };
    EXPECT_EQ( a | b, ( int_set{ { 0, 6 }, { 8, 14 } } ) );
    EXPECT_EQ( a - b, ( int_set{ { 0, 1 }, { 3, 4 }, { 12, 14 } } ) );
    EXPECT_EQ( b - a, ( int_set{ { 5, 6 }, { 8, 9 } } ) );

    auto c{ a };
    c.form_union( b );
    EXPECT_EQ( c, a.union_with( b ) );
    c.subtract( b );
    EXPECT_EQ( c, ( int_set{ { 0, 1 }, { 3, 4 }, { 12, 14 } } ) );
}

TEST( range_set, subset_relations )
{
    auto const s{ source() };
    int_set const sub{ { 2, 4 }, { 27, 29 } };
    int_set const other{ { 4, 6 } };

    EXPECT_TRUE ( sub.is_subset_of( s ) );
    EXPECT_TRUE ( sub.is_strict_subset_of( s ) );
    EXPECT_TRUE ( s.is_superset_of( sub ) );
    EXPECT_TRUE ( s.is_strict_superset_of( sub ) );
    EXPECT_TRUE ( s.is_subset_of( s ) );
    EXPECT_FALSE( s.is_strict_subset_of( s ) );
    EXPECT_FALSE( other.is_subset_of( s ) );
    EXPECT_TRUE ( int_set{}.is_subset_of( s ) );

    EXPECT_FALSE( other.is_disjoint_with( s ) );
    EXPECT_TRUE ( ( int_set{ { 5, 8 }, { 10, 20 } } ).is_disjoint_with( s ) );
}

//==============================================================================
// Randomized checks against an element-wise reference set
//==============================================================================

TEST( range_set, invariants )
{
    std::mt19937 rng{ make_seed() };
    for ( auto i{ 0 }; i < 1000; ++i )
    {
        reference ref;
        auto const set{ build_random_set( rng, &ref ) };
        ASSERT_TRUE( satisfies_invariants( set ) ) << set;
        ASSERT_EQ( to_reference( set ), ref );
        for ( auto x{ -110 }; x <= 110; ++x )
            ASSERT_EQ( set.contains( x ), ref.count( x ) != 0 ) << x;
    }
}

TEST( range_set, algebra_vs_reference )
{
    std::mt19937 rng{ make_seed() };
    for ( auto i{ 0 }; i < 100; ++i )
    {
        auto const set1{ build_random_set( rng ) };
        auto const set2{ build_random_set( rng ) };
        auto const ref1{ to_reference( set1 ) };
        auto const ref2{ to_reference( set2 ) };

        std::vector<int> expected;
        std::set_intersection( ref1.begin(), ref1.end(), ref2.begin(), ref2.end(), std::back_inserter( expected ) );
        EXPECT_EQ( set1.intersection( set2 ), int_set( expected ) );

        expected.clear();
        std::set_symmetric_difference( ref1.begin(), ref1.end(), ref2.begin(), ref2.end(), std::back_inserter( expected ) );
        EXPECT_EQ( set1.symmetric_difference( set2 ), int_set( expected ) );

        expected.clear();
        std::set_union( ref1.begin(), ref1.end(), ref2.begin(), ref2.end(), std::back_inserter( expected ) );
        EXPECT_EQ( set1 | set2, int_set( expected ) );

        expected.clear();
        std::set_difference( ref1.begin(), ref1.end(), ref2.begin(), ref2.end(), std::back_inserter( expected ) );
        EXPECT_EQ( set1 - set2, int_set( expected ) );

        EXPECT_TRUE( satisfies_invariants( set1 ^ set2 ) );
        EXPECT_EQ( set1.is_disjoint_with( set2 ), ( set1 & set2 ).empty() );
        EXPECT_TRUE( ( set1 & set2 ).is_subset_of( set1 ) );
    }
}

//==============================================================================
// Diagnostics
//==============================================================================

TEST( range_set, formatting )
{
    std::ostringstream os;
    os << int_range{ 1, 5 } << ' ' << source() << ' ' << int_set{};
    EXPECT_EQ( os.str(), "[1, 5) {[1, 5), [8, 10), [20, 22), [27, 29)} {}" );
}

TEST( range_set, print )
{
    testing::internal::CaptureStdout();
    print( source() );
    print( int_set{} );
    std::cout.flush();
    EXPECT_EQ
    (
        testing::internal::GetCapturedStdout(),
        "{[1, 5), [8, 10), [20, 22), [27, 29)} [4 ranges w/ 10 values]\n"
        "The range set is empty.\n"
    );
}

//==============================================================================
// Capacity & misc
//==============================================================================

TEST( range_set, clear_reserve_swap )
{
    auto a{ source() };
    int_set b{ { 100, 101 } };

    a.reserve( 16 );
    EXPECT_GE( a.ranges().capacity(), 16 );
    EXPECT_EQ( a, source() );

    swap( a, b );
    EXPECT_EQ( ranges_of( a ), ( std::vector<int_range>{ { 100, 101 } } ) );
    EXPECT_EQ( b, source() );

    b.swap( a );
    EXPECT_EQ( a, source() );

    a.clear();
    EXPECT_TRUE( a.empty() );
    EXPECT_EQ( a.element_count(), 0 );
    a.check_invariants();
}
