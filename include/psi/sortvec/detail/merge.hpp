////////////////////////////////////////////////////////////////////////////////
///
/// Stable merge of two consecutive sorted runs of an index permutation.
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

#include "../abi.hpp"

#include <boost/assert.hpp>
#include <boost/move/algo/adaptive_merge.hpp>

#include <algorithm>
#include <cstddef>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::sortvec::detail
{
//------------------------------------------------------------------------------

// adaptive_merge uses spare capacity past size() as scratch buffer which
// trips ASan's container-overflow detection (writes between size/capacity).
#if defined( __SANITIZE_ADDRESS__ )
inline constexpr bool use_adaptive_merge{ false };
#elif defined( __has_feature )
#   if __has_feature( address_sanitizer )
inline constexpr bool use_adaptive_merge{ false };
#   else
inline constexpr bool use_adaptive_merge{ true  };  // boost::movelib::adaptive_merge (vs. std::inplace_merge)
#   endif
#else
inline constexpr bool use_adaptive_merge{ true  };  // boost::movelib::adaptive_merge (vs. std::inplace_merge)
#endif


/// Merges [0, middle) and [middle, size) of order, both sorted by less, keeping
/// the first run's entries ahead of equivalent entries of the second.
template <typename Index, typename Less>
void stable_merge_indices( std::vector<Index> & order, std::size_t const middle, Less const & less )
{
    BOOST_ASSERT( middle <= order.size() );
    if ( middle == 0 || middle == order.size() )
        return;
    auto const wrappedLess{ make_trivially_copyable_predicate( less ) };
    if constexpr ( use_adaptive_merge )
    {
        auto * const first{ order.data() };
        boost::movelib::adaptive_merge
        (
            first,
            first + middle,
            first + order.size(),
            wrappedLess,
            first + order.size(),
            order.capacity() - order.size()
        );
    }
    else
    {
        std::inplace_merge( order.begin(), order.begin() + static_cast<std::ptrdiff_t>( middle ), order.end(), wrappedLess );
    }
}

//------------------------------------------------------------------------------
} // namespace psi::sortvec::detail
//------------------------------------------------------------------------------
