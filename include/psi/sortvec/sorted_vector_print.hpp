////////////////////////////////////////////////////////////////////////////////
///
/// sorted_vector::print(): debug dump of the cached keys (fmt).
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

#include "sorted_vector.hpp"

#include <fmt/format.h>

#include <cstdio>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

template <typename T, typename KeyOf, typename Compare, typename Container, typename KeyContainer>
requires KeyExtractor<KeyOf, T>
void sorted_vector<T, KeyOf, Compare, Container, KeyContainer>::print() const
{
    if ( empty() )
    {
        std::puts( "The container is empty." );
        return;
    }

    // One run of equivalent keys per entry, with its length if > 1.
    size_type distinct_keys{ 0 };
    std::putchar( '[' );
    for ( size_type run_begin{ 0 }; run_begin < size(); )
    {
        auto run_end{ run_begin + 1 };
        while ( run_end < size() && komp_.eq( base::keys[ run_begin ], base::keys[ run_end ] ) )
            ++run_end;

        if ( distinct_keys++ != 0 )
            fmt::print( ", " );
        fmt::print( "{}", base::keys[ run_begin ] );
        if ( run_end - run_begin > 1 )
            fmt::print( " x{}", run_end - run_begin );

        run_begin = run_end;
    }
    fmt::print( "] [{} elements w/ {} distinct keys]\n", size(), distinct_keys );
}

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
