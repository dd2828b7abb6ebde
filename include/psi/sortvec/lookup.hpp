////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for psi::sortvec sorted containers.
///
/// Provides:
///   - LookupType concept         : constrains heterogeneous lookup key types
///   - key_const_arg_t alias      : optimal key-passing type for lookups
///   - detail::lower_bound_index  : binary search workers over the cached
///     detail::upper_bound_index     key sequence (plain or prefix-tracking)
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
#include "komparator.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

/// LookupType: which key types a sorted container's lookup functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) the comparator is transparent (has is_transparent tag), allowing
///       heterogeneous lookup with any comparable type, or
///   (b) K is implicitly convertible to the stored key type (this subsumes
///       K == key_type).
///
/// A single constrained template per lookup function replaces the
/// non-template + transparent-only template overload pair:
///   template <LookupType<transparent, key_type> K = key_type>
///   const_iterator find( K const & ) const;
template <typename K, bool transparent_comparator, typename StoredKeyType>
concept LookupType =
    transparent_comparator ||
    std::convertible_to<K const &, StoredKeyType const &>;


/// key_const_arg_t: how a lookup key of type K is handed to the search
/// workers.
///   - trivial/small keys -> pass_in_reg<K> (by value)
///   - transparent comparator that can compare stored keys against the
///     optimal view of K (string -> string_view, vector -> span) ->
///     pass_in_reg<K>
///   - otherwise -> K const & (the comparator only understands K itself)
template <typename K, typename Compare, typename StoredKeyType>
using key_const_arg_t = std::conditional_t<
    can_be_passed_in_reg<K> ||
    (
        Komparator<Compare>::transparent_comparator &&
        std::predicate<Compare const &, StoredKeyType const &, typename pass_in_reg<K>::stored_type const &> &&
        std::predicate<Compare const &, typename pass_in_reg<K>::stored_type const &, StoredKeyType const &>
    ),
    pass_in_reg<K>,
    K const &
>;


namespace detail
{
    //==========================================================================
    // Prefix-tracking binary search
    //
    // With keys sorted lexicographically, every key strictly between two
    // search bounds shares with the query at least the shorter of the two
    // prefixes the bounds share with it. Each probe can therefore skip
    // min( lowerPrefix, upperPrefix ) leading elements.
    //
    // Upper == false: first position whose key is not less than the query
    // Upper == true : first position whose key is greater than the query
    //==========================================================================
    template <bool Upper, typename Keys, typename Comp, typename Query>
    [[nodiscard, gnu::pure]] constexpr std::size_t prefix_bound( Keys const & keys, Comp const & comp, Query const & query ) noexcept
    {
        std::size_t lo{ 0 };
        std::size_t hi{ keys.size() };
        std::size_t loPrefix{ 0 }; // shared with keys[ lo - 1 ]
        std::size_t hiPrefix{ 0 }; // shared with keys[ hi ]
        while ( lo < hi )
        {
            auto const mid { lo + ( hi - lo ) / 2 };
            auto const skip{ std::min( loPrefix, hiPrefix ) };
            auto const [prefix, order]{ comp.compare_from( keys[ mid ], query, skip ) };
            bool const goRight{ Upper ? ( order <= 0 ) : ( order < 0 ) };
            if ( goRight ) {
                lo       = mid + 1;
                loPrefix = prefix;
            } else {
                hi       = mid;
                hiPrefix = prefix;
            }
        }
        return lo;
    }

    template <typename Keys, typename Comp, typename K>
    [[nodiscard, gnu::pure]] constexpr std::size_t lower_bound_index( Keys const & keys, Comp const & comp, K const & key ) noexcept
    {
        decltype( auto ) value = unwrap( key );
        using value_t = std::remove_cvref_t<decltype( value )>;
        if constexpr ( prefix_aware_comparator<Comp, typename Keys::value_type, value_t> )
            return prefix_bound<false>( keys, comp, value );
        else
            return static_cast<std::size_t>( std::lower_bound( keys.begin(), keys.end(), value, make_trivially_copyable_predicate( comp ) ) - keys.begin() );
    }

    template <typename Keys, typename Comp, typename K>
    [[nodiscard, gnu::pure]] constexpr std::size_t upper_bound_index( Keys const & keys, Comp const & comp, K const & key ) noexcept
    {
        decltype( auto ) value = unwrap( key );
        using value_t = std::remove_cvref_t<decltype( value )>;
        if constexpr ( prefix_aware_comparator<Comp, typename Keys::value_type, value_t> )
            return prefix_bound<true>( keys, comp, value );
        else
            return static_cast<std::size_t>( std::upper_bound( keys.begin(), keys.end(), value, make_trivially_copyable_predicate( comp ) ) - keys.begin() );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
