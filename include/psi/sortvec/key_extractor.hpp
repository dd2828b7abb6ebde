////////////////////////////////////////////////////////////////////////////////
/// Key extractors for psi::sortvec::sorted_vector.
///
/// A key extractor is a (nameable) callable type mapping an element to its
/// key. It is part of the container type, so that a container with a fixed
/// projection can be a plain data member anywhere without dragging template
/// parameters along:
///   - identity             : the element is its own key
///   - member_key<&T::m>    : projects a data member
///   - key_function<T, K>   : type-erased (std::function) projection, one
///                             concrete type for any runtime-chosen callable
///   - any user functor or captureless lambda type
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

#include <boost/assert.hpp>

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

template <typename KeyOf, typename T>
concept KeyExtractor =
    std::regular_invocable<KeyOf const &, T const &> &&
    !std::is_void_v<std::invoke_result_t<KeyOf const &, T const &>>;

/// The (cached, by value) key type produced by KeyOf for elements of type T
template <typename KeyOf, typename T>
requires KeyExtractor<KeyOf, T>
using key_of_t = std::remove_cvref_t<std::invoke_result_t<KeyOf const &, T const &>>;


struct identity
{
    template <typename T>
    [[ nodiscard, gnu::pure ]] constexpr T const & operator()( T const & element ) const noexcept { return element; }
};


template <auto Member>
requires std::is_member_object_pointer_v<decltype( Member )>
struct member_key
{
    template <typename T>
    requires requires( T const & element ) { element.*Member; }
    [[ nodiscard, gnu::pure ]] constexpr decltype( auto ) operator()( T const & element ) const noexcept { return ( element.*Member ); }
};


/// Runtime-dispatched key extraction: every projection producing a K from a
/// T yields the same container type (at the cost of an indirect call per
/// extraction; lookups do not extract, they use the cached keys).
template <typename T, typename K>
class key_function
{
public:
    using result_type = K;

    key_function() = default;

    template <typename F>
    requires( !std::same_as<std::remove_cvref_t<F>, key_function> && std::is_invocable_r_v<K, F const &, T const &> )
    key_function( F && f ) : f_{ std::forward<F>( f ) } {}

    [[ nodiscard ]] K operator()( T const & element ) const
    {
        BOOST_ASSERT_MSG( f_, "key_function used without a projection" );
        return f_( element );
    }

    explicit operator bool() const noexcept { return static_cast<bool>( f_ ); }

private:
    std::function<K( T const & )> f_;
}; // class key_function

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
