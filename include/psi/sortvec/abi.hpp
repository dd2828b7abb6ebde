////////////////////////////////////////////////////////////////////////////////
/// Argument-passing helpers for the psi::sortvec lookup functions: decide
/// whether a lookup key travels by value or as its cheapest read-only view
/// (string_view for strings, span for contiguous ranges).
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

#include <boost/config.hpp>

#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// A lookup key crosses several layers on its way to the comparator (public
// member, index search, binary search). Small trivial keys are copied once at
// the top; anything else is narrowed to a view there and never copied again.
////////////////////////////////////////////////////////////////////////////////

#if defined( __clang__ )
#   define PSI_SORTVEC_TRIVIAL_ABI [[ clang::trivial_abi ]]
#else
#   define PSI_SORTVEC_TRIVIAL_ABI
#endif

// SysV-like ABI assumed: up to two pointer-sized registers
template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> && std::is_trivially_default_constructible_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) )
};

/// basic_string-like types (traits_type separates them from vector<char>).
template <typename T>
concept string_viewable = requires( T const & t ) {
    std::basic_string_view<typename T::value_type, typename T::traits_type>{ t };
};

template <typename T>
struct optimal_const_ref { using type = T const &; };

template <string_viewable T>
struct optimal_const_ref<T> { using type = std::basic_string_view<typename T::value_type, typename T::traits_type>; };

template <std::ranges::contiguous_range Rng>
requires( !std::ranges::borrowed_range<Rng> && !string_viewable<Rng> )
struct optimal_const_ref<Rng> { using type = std::span<std::ranges::range_value_t<Rng> const>; };

/// A lookup key as handed down to the search workers: the value itself or
/// its optimal_const_ref view.
template <typename T>
struct PSI_SORTVEC_TRIVIAL_ABI pass_in_reg
{
    using stored_type = std::conditional_t<can_be_passed_in_reg<T>, T, typename optimal_const_ref<T>::type>;

    BOOST_FORCEINLINE
    constexpr pass_in_reg( T const & arg ) noexcept : value{ arg } {}

    stored_type value;
}; // pass_in_reg

template <typename T> [[nodiscard]] constexpr decltype( auto ) unwrap( pass_in_reg<T> const obj ) noexcept { return obj.value; }
template <typename T> [[nodiscard]] constexpr T &              unwrap( T &                  obj ) noexcept { return obj; }


// Stateful comparators are handed to std algorithms through a reference
// capturing lambda.
template <typename Pred>
constexpr decltype( auto ) make_trivially_copyable_predicate( Pred && __restrict pred ) noexcept {
    if constexpr ( can_be_passed_in_reg<std::remove_cvref_t<Pred>> ) {
        return std::forward<Pred>( pred );
    } else {
        return [&pred]( auto const & ... args ) noexcept( noexcept( pred( args... ) ) ) {
            return pred( args... );
        };
    }
} // make_trivially_copyable_predicate

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
