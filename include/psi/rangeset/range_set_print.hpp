////////////////////////////////////////////////////////////////////////////////
/// Debugging aids: stream output for range and range_set ("[1, 5)" and
/// "{[1, 5), [8, 10)}") and print(), a one line dump of a set to stdout.
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

#include <iostream>
#include <ostream>
//------------------------------------------------------------------------------
namespace psi::rangeset
{
//------------------------------------------------------------------------------

template <typename Bound>
std::ostream & operator<<( std::ostream & os, range<Bound> const & r )
{
    return os << '[' << r.lower << ", " << r.upper << ')';
}

template <typename Bound, typename Container>
std::ostream & operator<<( std::ostream & os, range_set<Bound, Container> const & set )
{
    os << '{';
    bool first{ true };
    for ( auto const & r : set.ranges() )
    {
        if ( !first )
            os << ", ";
        os << r;
        first = false;
    }
    return os << '}';
}

template <typename Bound, typename Container>
void print( range_set<Bound, Container> const & set )
{
    if ( set.empty() )
    {
        std::cout << "The range set is empty.\n";
        return;
    }

    std::cout << set << " [" << set.ranges().size() << " ranges";
    if constexpr ( requires { set.element_count(); } )
        std::cout << " w/ " << set.element_count() << " values";
    std::cout << "]\n";
}

//------------------------------------------------------------------------------
} // namespace psi::rangeset
//------------------------------------------------------------------------------
