////////////////////////////////////////////////////////////////////////////////
/// Sequence (string / byte array) keys for psi::sortvec containers.
///
/// lexicographic_less is a transparent, prefix-aware comparator over
/// contiguous sequences: besides the usual strict-weak operator() it offers
/// compare_from(), which the binary search in lookup.hpp uses to skip the
/// prefix it already knows the probed key shares with the query.
///
/// Element order: character/byte elements compare as unsigned bytes (the
/// order of std::string::compare and of memcmp), everything else with <.
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

#include "komparator.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename E>
    bool constexpr byte_like
    {
        sizeof( E ) == 1 && ( std::is_integral_v<E> || std::is_same_v<E, std::byte> )
    };

    template <typename E>
    bool constexpr character{ std::is_same_v<E, char> || std::is_same_v<E, char8_t> || std::is_same_v<E, wchar_t> || std::is_same_v<E, char16_t> || std::is_same_v<E, char32_t> };

    // Word-at-a-time scan, compiled into the library (src/sequence_key.cpp)
    [[ gnu::pure ]] std::size_t common_byte_prefix_length( std::byte const * a, std::byte const * b, std::size_t length ) noexcept;

    template <typename S>
    concept c_string = std::is_pointer_v<std::decay_t<S>> && character<std::remove_cv_t<std::remove_pointer_t<std::decay_t<S>>>>;

    /// View any supported sequence as a span: contiguous sized ranges as they
    /// are, C strings and character arrays up to (excluding) the terminator.
    template <typename S>
    requires( c_string<S> || ( std::ranges::contiguous_range<S const> && std::ranges::sized_range<S const> ) )
    [[ nodiscard ]] constexpr auto as_span( S const & sequence ) noexcept
    {
        using decayed = std::decay_t<S>;
        if constexpr ( c_string<S> )
        {
            std::basic_string_view<std::remove_cv_t<std::remove_pointer_t<decayed>>> const view{ sequence };
            return std::span{ view.data(), view.size() };
        }
        else
        {
            using element = std::remove_cv_t<std::ranges::range_value_t<S const>>;
            return std::span<element const>{ std::ranges::data( sequence ), std::ranges::size( sequence ) };
        }
    }

    template <typename S>
    using span_element_t = typename decltype( as_span( std::declval<S const &>() ) )::value_type;

    template <typename E>
    [[ nodiscard, gnu::pure ]] constexpr std::strong_ordering element_order( E const & left, E const & right ) noexcept
    {
        if constexpr ( byte_like<E> )
            return static_cast<unsigned char>( left ) <=> static_cast<unsigned char>( right );
        else if constexpr ( std::is_integral_v<E> ) // wider characters: code unit order
            return left <=> right;
        else
            return left < right ? std::strong_ordering::less : ( right < left ? std::strong_ordering::greater : std::strong_ordering::equal );
    }
} // namespace detail


template <typename S>
concept sequence_key =
    requires( S const & s ) { detail::as_span( s ); };


/// Length of the longest common prefix of two sequences.
template <typename E>
[[ nodiscard, gnu::pure ]] constexpr std::size_t common_prefix_length( std::span<E const> const a, std::span<E const> const b ) noexcept
{
    auto const shared{ std::min( a.size(), b.size() ) };
    if constexpr ( detail::byte_like<E> )
    {
        if !consteval
        {
            return detail::common_byte_prefix_length
            (
                reinterpret_cast<std::byte const *>( a.data() ),
                reinterpret_cast<std::byte const *>( b.data() ),
                shared
            );
        }
    }
    auto const first_a{ a.begin() };
    auto const [mismatch_a, mismatch_b]{ std::mismatch( first_a, first_a + static_cast<std::ptrdiff_t>( shared ), b.begin() ) };
    return static_cast<std::size_t>( mismatch_a - first_a );
}


struct lexicographic_less
{
    using is_transparent = void;

    /// Three-way compares key and query, both known to share (at least) their
    /// first `skip` elements. Returns the ordering of key relative to query
    /// and the full length of their common prefix.
    template <sequence_key Key, sequence_key Query>
    requires std::same_as<detail::span_element_t<Key>, detail::span_element_t<Query>>
    [[ nodiscard, gnu::pure ]] constexpr prefix_order compare_from( Key const & key, Query const & query, std::size_t skip ) const noexcept
    {
        auto const a{ detail::as_span( key   ) };
        auto const b{ detail::as_span( query ) };
        auto const shared{ std::min( a.size(), b.size() ) };
        BOOST_ASSERT_MSG( skip <= shared, "Skipped prefix longer than the sequences" );
        skip = std::min( skip, shared );
        auto const prefix{ skip + common_prefix_length( a.subspan( skip, shared - skip ), b.subspan( skip, shared - skip ) ) };
        if ( prefix < shared )
            return { prefix, detail::element_order( a[ prefix ], b[ prefix ] ) };
        return { prefix, a.size() <=> b.size() };
    }

    template <sequence_key Left, sequence_key Right>
    requires std::same_as<detail::span_element_t<Left>, detail::span_element_t<Right>>
    [[ nodiscard, gnu::pure ]] constexpr bool operator()( Left const & left, Right const & right ) const noexcept
    {
        return compare_from( left, right, 0 ).order < 0;
    }

    template <sequence_key Left, sequence_key Right>
    requires std::same_as<detail::span_element_t<Left>, detail::span_element_t<Right>>
    [[ nodiscard, gnu::pure ]] constexpr bool eq( Left const & left, Right const & right ) const noexcept
    {
        auto const a{ detail::as_span( left  ) };
        auto const b{ detail::as_span( right ) };
        return ( a.size() == b.size() ) && ( common_prefix_length( a, b ) == a.size() );
    }
}; // struct lexicographic_less

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
