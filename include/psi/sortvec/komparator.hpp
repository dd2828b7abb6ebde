////////////////////////////////////////////////////////////////////////////////
/// Comparator traits, utilities and the Komparator wrapper for psi::sortvec.
///
/// Contents:
///   - is_simple_comparator<T>    : trait: can == replace double-negation test?
///   - comp_eq(comp, a, b)        : optimised equality from strict-weak comparator
///   - prefix_aware_comparator    : concept: comparator with a compare_from() hook
///   - Komparator<Comparator>     : EBO wrapper with le/ge/eq/leq/geq and
///                                   stable (permutation) sorting
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

#include "abi.hpp"

#include <boost/move/algo/adaptive_sort.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <ranges>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

//==============================================================================
// Comparator traits
//==============================================================================

/// Is this a "simple" comparator where operator== can be used instead of
/// the two-comparison equivalence test?  User specializations are intended.
template <typename T> constexpr bool is_simple_comparator{ false };
template <typename T> constexpr bool is_simple_comparator<std::less   <T>>{ std::is_fundamental_v<T> };
template <typename T> constexpr bool is_simple_comparator<std::greater<T>>{ std::is_fundamental_v<T> };
template <> inline constexpr bool is_simple_comparator<std::less   <void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::greater<void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::less   >{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::greater>{ true };


/// Three-tier dispatch:
///   1. Custom comp.eq() if available
///   2. Direct == for simple comparators
///   3. Standard two-comparison equivalence (!comp(a,b) && !comp(b,a))
template <typename Comp>
[[ gnu::pure ]] constexpr bool comp_eq( Comp const & comp, auto const & left, auto const & right ) noexcept
{
    if constexpr ( requires{ comp.eq( left, right ); } )
        return comp.eq( left, right );
    else if constexpr ( is_simple_comparator<Comp> && requires{ left == right; } )
        return left == right;
    else
        return !comp( left, right ) && !comp( right, left );
}


//==============================================================================
// Prefix-aware comparators (sequence keys)
//==============================================================================

/// Result of a prefix-aware three-way comparison: the ordering of the left
/// operand relative to the right one plus the length of their common prefix.
struct prefix_order
{
    std::size_t          prefix;
    std::strong_ordering order;
};

/// A comparator that, besides the strict-weak operator(), can compare two
/// sequences while skipping a prefix already known to be shared.
/// Binary search (lookup.hpp) switches to prefix tracking for such comparators.
template <typename Comp, typename StoredKey, typename Query>
concept prefix_aware_comparator = requires( Comp const & comp, StoredKey const & key, Query const & query, std::size_t const skip )
{
    { comp.compare_from( key, query, skip ) } -> std::same_as<prefix_order>;
};


//==============================================================================
// Komparator: comparator wrapper (EBO via public inheritance)
//==============================================================================

/// Aggregate publicly inheriting from Comparator: Komparator<C>{ c } or
/// Komparator<C>{} need no forwarding constructors.
///
/// Besides the derived comparison operations it sorts index permutations:
/// the containers never sort elements directly, they sort indices by the
/// cached keys and then permute both aligned sequences at once.
template <typename Comparator>
struct Komparator : Comparator
{
    /// True if Comparator supports heterogeneous lookup (has is_transparent tag)
    static constexpr bool transparent_comparator{ requires{ typename Comparator::is_transparent; } };

    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    [[ gnu::pure ]] constexpr bool le ( auto const & left, auto const & right ) const noexcept { return comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool ge ( auto const & left, auto const & right ) const noexcept { return comp()( right, left ); }
    [[ gnu::pure ]] constexpr bool eq ( auto const & left, auto const & right ) const noexcept { return comp_eq( comp(), left, right ); }
    [[ gnu::pure ]] constexpr bool leq( auto const & left, auto const & right ) const noexcept
    {
        if constexpr ( requires{ comp().leq( left, right ); } )
            return comp().leq( left, right );
        else
            return !comp()( right, left );
    }
    [[ gnu::pure ]] constexpr bool geq( auto const & left, auto const & right ) const noexcept
    {
        if constexpr ( requires{ comp().geq( left, right ); } )
            return comp().geq( left, right );
        else
            return !comp()( left, right );
    }

    /// Stable sort of [first, last) by comp( keys[ *a ], keys[ *b ] ), i.e. of
    /// an index permutation over a random access key sequence:
    ///   1. Comparator's own stable_sort() if provided (e.g. radix sort)
    ///   2. boost::movelib::adaptive_sort, using [buffer, buffer + bufferSize)
    ///      as uninitialized scratch (the full range length avoids its
    ///      key-collection phase, which misbehaves on heavily repeated keys)
    template <std::random_access_iterator It, typename Keys>
    constexpr void stable_sort_indices
    (
        It const first, It const last, Keys const & keys,
        std::iter_value_t<It> * const buffer = nullptr, std::size_t const bufferSize = 0
    ) const
    {
        auto const by_key
        {
            [this, &keys]( auto const left, auto const right )
            {
                return comp()( keys[ left ], keys[ right ] );
            }
        };
        if constexpr ( requires{ comp().stable_sort( first, last, by_key ); } )
            comp().stable_sort( first, last, by_key );
        else
            boost::movelib::adaptive_sort( first, last, by_key, buffer, bufferSize );
    }
}; // struct Komparator

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
