////////////////////////////////////////////////////////////////////////////////
///
/// \file sorted_vector.hpp
/// -----------------------
///
/// Array-backed ordered container keyed by a derived key.
///
/// Every element T is associated with a key K = KeyOf( element ). The
/// container keeps two index-aligned sequences: the elements, sorted by key,
/// and the keys themselves, cached so that lookups never re-derive a key.
/// Ties keep their insertion order (construction is a stable sort, insertion
/// goes after existing equal keys, lookups return the first equal key).
///
/// Architecture:
///   sorted_vector privately inherits detail::paired_storage<KC, C>, which
///   keeps the two sequences aligned through every mutation; ordering is
///   never done on the elements directly but on an index permutation over
///   the cached keys (Komparator::stable_sort_indices and
///   detail::stable_merge_indices), applied to both sequences in one pass.
///   Comparators with a compare_from() hook (e.g. lexicographic_less for
///   string and byte sequence keys) get prefix-tracking binary search.
///
/// Elements are exposed only through const references: modifying a stored
/// element in a way that changes its key would silently break the order.
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
#include "error.hpp"
#include "key_extractor.hpp"
#include "komparator.hpp"
#include "log.hpp"
#include "lookup.hpp"
#include "sequence_key.hpp"
#include "detail/merge.hpp"
#include "detail/paired_storage.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <numeric>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
#ifndef PSI_SORTVEC_CHECK_INVARIANTS
#   ifdef NDEBUG
#       define PSI_SORTVEC_CHECK_INVARIANTS 0
#   else
#       define PSI_SORTVEC_CHECK_INVARIANTS 1
#   endif
#endif
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

/// Tag: the elements passed along are already sorted by key (equal keys in
/// the intended order), skip the sort.
struct sorted_equivalent_t { explicit sorted_equivalent_t() = default; };
inline constexpr sorted_equivalent_t sorted_equivalent{};

//==============================================================================
// sorted_vector
//==============================================================================

template
<
    typename T,
    typename KeyOf        = identity,
    typename Compare      = std::less<>,
    typename Container    = std::vector<T>,
    typename KeyContainer = std::vector<key_of_t<KeyOf, T>>
>
requires KeyExtractor<KeyOf, T>
class sorted_vector
    : private detail::paired_storage<KeyContainer, Container>
{
    using base       = detail::paired_storage<KeyContainer, Container>;
    using komparator = Komparator<Compare>;

    static_assert( std::is_same_v<T, typename Container::value_type>, "Container::value_type must be T" );
    static_assert( std::is_same_v<key_of_t<KeyOf, T>, typename KeyContainer::value_type>, "KeyContainer::value_type must be the extracted key type" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using value_type             = T;
    using key_type               = key_of_t<KeyOf, T>;
    using key_extractor_type     = KeyOf;
    using key_compare            = Compare;
    using reference              = value_type const &;
    using const_reference        = value_type const &;
    using size_type              = typename base::size_type;
    using difference_type        = typename base::difference_type;
    using container_type         = Container;
    using key_container_type     = KeyContainer;
    using containers             = base;
    using const_iterator         = typename Container::const_iterator;
    using iterator               = const_iterator;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using reverse_iterator       = const_reverse_iterator;

    static constexpr bool transparent_comparator{ komparator::transparent_comparator };

private:
    template <typename K>
    using key_const_arg = key_const_arg_t<std::decay_t<K const>, Compare, key_type>;

public:
    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    sorted_vector() = default;

    explicit sorted_vector( KeyOf key_of, Compare const & comp = Compare{} )
        : key_of_{ std::move( key_of ) }, komp_{ comp } {}

    explicit sorted_vector( Container elements, KeyOf key_of = KeyOf{}, Compare const & comp = Compare{} )
        : base{ KeyContainer{}, std::move( elements ) }, key_of_{ std::move( key_of ) }, komp_{ comp }
    {
        derive_keys();
        sort_from( 0 );
        debug_validate();
    }

    sorted_vector( sorted_equivalent_t, Container elements, KeyOf key_of = KeyOf{}, Compare const & comp = Compare{} )
        : base{ KeyContainer{}, std::move( elements ) }, key_of_{ std::move( key_of ) }, komp_{ comp }
    {
        derive_keys();
        BOOST_ASSERT_MSG( keys_sorted( 0 ), "sorted_equivalent: elements are not sorted by key" );
        debug_validate();
    }

    template <std::input_iterator InputIt>
    sorted_vector( InputIt first, InputIt const last, KeyOf key_of = KeyOf{}, Compare const & comp = Compare{} )
        : key_of_{ std::move( key_of ) }, komp_{ comp }
    {
        insert( std::move( first ), last );
    }

    sorted_vector( std::initializer_list<value_type> const il, KeyOf key_of = KeyOf{}, Compare const & comp = Compare{} )
        : sorted_vector( Container( il.begin(), il.end() ), std::move( key_of ), comp ) {}

    sorted_vector( sorted_vector const & ) = default;
    sorted_vector( sorted_vector && )      = default;

    sorted_vector & operator=( sorted_vector const & ) = default;
    sorted_vector & operator=( sorted_vector && )      = default;

    sorted_vector & operator=( std::initializer_list<value_type> const il )
    {
        replace( Container( il.begin(), il.end() ) );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators (read-only: keys must not change in place)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] const_iterator begin() const noexcept { return base::elements.begin(); }
    [[ nodiscard ]] const_iterator end  () const noexcept { return base::elements.end  (); }

    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end  (); }

    [[ nodiscard ]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    [[ nodiscard ]] const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    [[ nodiscard ]] const_reverse_iterator crbegin() const noexcept { return rbegin(); }
    [[ nodiscard ]] const_reverse_iterator crend  () const noexcept { return rend  (); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty   () const noexcept { return base::elements.empty(); }
    [[ nodiscard ]] size_type size    () const noexcept { return static_cast<size_type>( base::elements.size() ); }
    [[ nodiscard ]] size_type max_size() const noexcept { return static_cast<size_type>( std::min<std::size_t>( base::keys.max_size(), base::elements.max_size() ) ); }
    [[ nodiscard ]] size_type capacity() const noexcept { return static_cast<size_type>( std::min<std::size_t>( base::keys.capacity(), base::elements.capacity() ) ); }

    using base::reserve;
    using base::shrink_to_fit;

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] const_reference operator[]( size_type const index ) const noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "Index out of bounds" );
        return base::elements[ index ];
    }

    [[ nodiscard ]] const_reference at( size_type const index ) const
    {
        if ( index >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( index_error{ index, size() } );
        return base::elements[ index ];
    }

    [[ nodiscard ]] const_reference front() const noexcept { BOOST_ASSERT( !empty() ); return base::elements.front(); }
    [[ nodiscard ]] const_reference back () const noexcept { BOOST_ASSERT( !empty() ); return base::elements.back (); }

    /// The cached key of the element at index
    [[ nodiscard ]] key_type const & key_at( size_type const index ) const noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "Index out of bounds" );
        return base::keys[ index ];
    }

    [[ nodiscard ]] const_iterator nth( size_type const index ) const noexcept
    {
        BOOST_ASSERT_MSG( index <= size(), "Index out of bounds" );
        return begin() + static_cast<difference_type>( index );
    }

    [[ nodiscard ]] size_type index_of( const_iterator const pos ) const noexcept
    {
        BOOST_ASSERT_MSG( pos >= begin() && pos <= end(), "Iterator does not belong to this container" );
        return static_cast<size_type>( pos - begin() );
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
private:
    template <typename K>
    [[ nodiscard ]] size_type lower_bound_pos( K const & key ) const noexcept
    {
        key_const_arg<K> const arg{ key };
        return static_cast<size_type>( detail::lower_bound_index( base::keys, komp_.comp(), arg ) );
    }
    template <typename K>
    [[ nodiscard ]] size_type upper_bound_pos( K const & key ) const noexcept
    {
        key_const_arg<K> const arg{ key };
        return static_cast<size_type>( detail::upper_bound_index( base::keys, komp_.comp(), arg ) );
    }
    template <typename K>
    [[ nodiscard ]] bool key_eq_at( size_type const pos, K const & key ) const noexcept
    {
        return pos < size() && !komp_.le( key, base::keys[ pos ] );
    }

public:
    /// The first element (in iteration order) whose key is equivalent to key,
    /// end() if there is none.
    template <LookupType<transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] const_iterator find( K const & key ) const noexcept
    {
        auto const pos{ lower_bound_pos( key ) };
        return key_eq_at( pos, key ) ? nth( pos ) : end();
    }

    /// Index of the element find() would return.
    template <LookupType<transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> position( K const & key ) const noexcept
    {
        auto const pos{ lower_bound_pos( key ) };
        if ( key_eq_at( pos, key ) )
            return pos;
        return std::nullopt;
    }

    template <LookupType<transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & key ) const noexcept { return key_eq_at( lower_bound_pos( key ), key ); }

    template <LookupType<transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] size_type count( K const & key ) const noexcept { return upper_bound_pos( key ) - lower_bound_pos( key ); }

    template <LookupType<transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] const_iterator lower_bound( K const & key ) const noexcept { return nth( lower_bound_pos( key ) ); }
    template <LookupType<transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] const_iterator upper_bound( K const & key ) const noexcept { return nth( upper_bound_pos( key ) ); }

    template <LookupType<transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] std::pair<const_iterator, const_iterator> equal_range( K const & key ) const noexcept
    {
        return { lower_bound( key ), upper_bound( key ) };
    }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------
    /// Inserts after all elements with an equivalent key. Strong guarantee.
    const_iterator insert( value_type const & element ) { return insert( value_type( element ) ); }
    const_iterator insert( value_type && element )
    {
        key_type key( derive_key( element ) );
        auto const pos{ upper_bound_pos( key ) };
        base::insert_element_at( pos, std::move( key ), std::move( element ) );
        debug_validate();
        return nth( pos );
    }

    /// Inserts at hint if that keeps the order (and the insertion-order of
    /// equal keys), otherwise as insert( element ).
    const_iterator insert( const_iterator const hint, value_type const & element ) { return insert( hint, value_type( element ) ); }
    const_iterator insert( const_iterator const hint, value_type && element )
    {
        key_type key( derive_key( element ) );
        auto const hintIdx{ index_of( hint ) };
        bool const hintValid
        {
            ( hintIdx == 0      || !komp_.le( key, base::keys[ hintIdx - 1 ] ) ) &&
            ( hintIdx >= size() ||  komp_.le( key, base::keys[ hintIdx     ] ) )
        };
        auto const pos{ hintValid ? hintIdx : upper_bound_pos( key ) };
        base::insert_element_at( pos, std::move( key ), std::move( element ) );
        debug_validate();
        return nth( pos );
    }

    template <typename... Args>
    const_iterator emplace( Args &&... args ) { return insert( value_type( std::forward<Args>( args )... ) ); }

    template <typename... Args>
    const_iterator emplace_hint( const_iterator const hint, Args &&... args ) { return insert( hint, value_type( std::forward<Args>( args )... ) ); }

    /// Bulk insert: append, stable sort the appended tail, stable merge it
    /// with the existing elements (new elements go after existing equal
    /// keys, in input order).
    /// If a key extraction, comparison or copy throws the container is left
    /// as it was; if moving an element throws while reordering it is cleared.
    template <std::input_iterator InputIt>
    void insert( InputIt first, InputIt const last )
    {
        auto const oldSize{ size() };
        try
        {
            for ( ; first != last; ++first )
            {
                value_type element( *first );
                key_type   key    ( derive_key( element ) );
                base::append_element( std::move( key ), std::move( element ) );
            }
            sort_from( oldSize );
        }
        catch ( ... )
        {
            if ( size() >= oldSize )
                base::truncate_to( oldSize );
            throw;
        }
        debug_validate();
    }

    void insert( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    void insert_range( R && rg )
    {
        if constexpr ( std::ranges::sized_range<R> )
            reserve( size() + static_cast<size_type>( std::ranges::size( rg ) ) );
        auto common{ std::forward<R>( rg ) | std::views::common };
        insert( std::ranges::begin( common ), std::ranges::end( common ) );
    }

    //--------------------------------------------------------------------------
    // Removal
    //--------------------------------------------------------------------------
    /// Removes and returns the element find( key ) would return.
    template <LookupType<transparent_comparator, key_type> K = key_type>
    std::optional<value_type> remove( K const & key )
    {
        auto const pos{ lower_bound_pos( key ) };
        if ( !key_eq_at( pos, key ) )
            return std::nullopt;
        return base::take_element_at( pos );
    }

    std::expected<value_type, index_error> remove_at( size_type const index )
    {
        if ( index >= size() ) [[ unlikely ]]
            return std::unexpected( index_error{ index, size() } );
        return base::take_element_at( index );
    }

    std::optional<value_type> pop_back()
    {
        if ( empty() )
            return std::nullopt;
        return base::take_element_at( size() - 1 );
    }

    const_iterator erase( const_iterator const pos ) noexcept
    {
        auto const idx{ index_of( pos ) };
        base::erase_element_at( idx );
        return nth( idx );
    }

    const_iterator erase( const_iterator const first, const_iterator const last ) noexcept
    {
        auto const firstIdx{ index_of( first ) };
        base::erase_elements( firstIdx, index_of( last ) );
        return nth( firstIdx );
    }

    /// Removes the whole equal-key group, returns its size.
    template <LookupType<transparent_comparator, key_type> K = key_type>
    size_type erase( K const & key ) noexcept
    {
        auto const first{ lower_bound_pos( key ) };
        auto const last { upper_bound_pos( key ) };
        base::erase_elements( first, last );
        return last - first;
    }

    template <typename Pred>
    friend size_type erase_if( sorted_vector & c, Pred pred )
    {
        auto const n{ c.size() };
        size_type kept{ 0 };
        size_type i   { 0 };
        try
        {
            for ( ; i < n; ++i )
            {
                if ( pred( std::as_const( c.base::elements[ i ] ) ) )
                    continue;
                if ( kept != i )
                    c.move_slot( i, kept );
                ++kept;
            }
        }
        catch ( ... )
        {
            // drop the moved-from slots, keep the untested tail
            c.erase_elements( kept, i );
            throw;
        }
        c.truncate_to( kept );
        return n - kept;
    }

    /// Shortens the container to its first length elements (no effect if
    /// length >= size()).
    void truncate( size_type const length ) noexcept
    {
        if ( length < size() )
            base::truncate_to( length );
    }

    /// Moves the elements [at, size()) into a new container (same extractor
    /// and comparator); throws std::out_of_range if at > size().
    [[ nodiscard ]] sorted_vector split_off( size_type const at )
    {
        if ( at > size() ) [[ unlikely ]]
            detail::throw_out_of_range( index_error{ at, size() } );
        sorted_vector tail( key_of_, komp_.comp() );
        tail.reserve( size() - at );
        for ( auto i{ at }; i < size(); ++i )
            tail.append_element( std::move( base::keys[ i ] ), std::move( base::elements[ i ] ) );
        base::truncate_to( at );
        return tail;
    }

    /// Keeps only the first element of every equal-key group, returns the
    /// number of removed elements.
    size_type dedup()
    {
        if ( size() < 2 )
            return 0;
        size_type last{ 0 };
        for ( size_type i{ 1 }; i < size(); ++i )
        {
            if ( komp_.eq( base::keys[ last ], base::keys[ i ] ) )
                continue;
            if ( ++last != i )
                base::move_slot( i, last );
        }
        auto const removed{ static_cast<size_type>( size() - ( last + 1 ) ) };
        base::truncate_to( last + 1 );
        debug_validate();
        return removed;
    }

    using base::clear;

    void swap( sorted_vector & other ) noexcept
    {
        base::swap_storage( other );
        using std::swap;
        swap( key_of_, other.key_of_ );
        swap( komp_  , other.komp_   );
    }

    friend void swap( sorted_vector & a, sorted_vector & b ) noexcept { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Extraction & replacement
    //--------------------------------------------------------------------------
    /// Moves out both aligned sequences, leaving the container empty.
    [[ nodiscard ]] containers extract() noexcept( std::is_nothrow_move_constructible_v<base> )
    {
        containers result{ std::move( static_cast<base &>( *this ) ) };
        base::clear();
        return result;
    }

    /// Replaces the contents (keys re-derived, elements sorted).
    void replace( Container elements )
    {
        base::elements = std::move( elements );
        try
        {
            derive_keys();
            sort_from( 0 );
        }
        catch ( ... )
        {
            base::clear();
            throw;
        }
        debug_validate();
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] key_compare        key_comp     () const noexcept { return komp_.comp(); }
    [[ nodiscard ]] KeyOf      const & key_extractor() const noexcept { return key_of_; }

    [[ nodiscard ]] key_container_type const & keys    () const noexcept { return base::keys;     }
    [[ nodiscard ]] container_type     const & elements() const noexcept { return base::elements; }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------
    friend bool operator==( sorted_vector const & a, sorted_vector const & b )
    requires std::equality_comparable<value_type>
    {
        return a.elements() == b.elements();
    }

    //--------------------------------------------------------------------------
    // Diagnostics
    //--------------------------------------------------------------------------
    /// Verifies the alignment, order and key-cache invariants; reports the
    /// first violation through the psi.sortvec logger.
    [[ nodiscard ]] bool check_invariants() const
    {
        if ( base::keys.size() != base::elements.size() ) [[ unlikely ]]
        {
            detail::report_misaligned( base::keys.size(), base::elements.size() );
            return false;
        }
        for ( size_type i{ 0 }; i < size(); ++i )
        {
            if ( i != 0 && komp_.le( base::keys[ i ], base::keys[ i - 1 ] ) ) [[ unlikely ]]
            {
                detail::report_unsorted( i );
                return false;
            }
            if ( !komp_.eq( base::keys[ i ], std::invoke( key_of_, base::elements[ i ] ) ) ) [[ unlikely ]]
            {
                detail::report_stale_key( i );
                return false;
            }
        }
        return true;
    }

    /// Dumps the cached keys to stdout (defined in sorted_vector_print.hpp).
    void print() const;

private:
    //--------------------------------------------------------------------------
    // Private helpers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] key_type derive_key( value_type const & element ) const { return key_type( std::invoke( key_of_, element ) ); }

    void derive_keys()
    {
        base::keys.clear();
        base::keys.reserve( base::elements.size() );
        for ( auto const & element : base::elements )
            base::keys.push_back( derive_key( element ) );
    }

    auto by_key() const noexcept
    {
        return [this]( size_type const left, size_type const right )
        {
            return komp_.le( base::keys[ left ], base::keys[ right ] );
        };
    }

    [[ nodiscard ]] bool keys_sorted( size_type const from ) const
    {
        auto const first{ base::keys.begin() + static_cast<difference_type>( from ) };
        return std::is_sorted( first, base::keys.end(), make_trivially_copyable_predicate( komp_.comp() ) );
    }

    // Restores the order after [sortedPrefix, size()) was appended to an
    // ordered prefix: stable sort of the tail, stable merge with the prefix,
    // both done on an index permutation which is then applied in one pass.
    void sort_from( size_type const sortedPrefix )
    {
        auto const newSize{ size() };
        if ( newSize == sortedPrefix || keys_sorted( sortedPrefix ? sortedPrefix - 1 : 0 ) )
            return;

        auto const tailSize{ static_cast<size_type>( newSize - sortedPrefix ) };
        std::vector<size_type> order;
        // spare capacity is the adaptive_sort and adaptive_merge scratch buffer
        order.reserve( newSize + tailSize );
        order.resize( newSize );
        std::iota( order.begin(), order.end(), size_type{ 0 } );

        komp_.stable_sort_indices
        (
            order.begin() + static_cast<difference_type>( sortedPrefix ), order.end(), base::keys,
            order.data() + newSize, order.capacity() - newSize
        );
        detail::stable_merge_indices( order, sortedPrefix, by_key() );
        base::apply_permutation( order );
    }

    void debug_validate() const
    {
#   if PSI_SORTVEC_CHECK_INVARIANTS
        BOOST_ASSERT( check_invariants() );
#   endif
    }

    //--------------------------------------------------------------------------
    // Data members
    //--------------------------------------------------------------------------
    [[ no_unique_address ]] KeyOf      key_of_;
    [[ no_unique_address ]] komparator komp_;
}; // class sorted_vector

//------------------------------------------------------------------------------
// Deduction guides
//------------------------------------------------------------------------------

template <std::ranges::random_access_range C, typename KeyOf = identity, typename Compare = std::less<>>
requires( !std::is_same_v<C, sorted_equivalent_t> && KeyExtractor<KeyOf, std::ranges::range_value_t<C>> )
sorted_vector( C, KeyOf = KeyOf{}, Compare = Compare{} )
    -> sorted_vector<std::ranges::range_value_t<C>, KeyOf, Compare, C>;

template <std::ranges::random_access_range C, typename KeyOf = identity, typename Compare = std::less<>>
requires KeyExtractor<KeyOf, std::ranges::range_value_t<C>>
sorted_vector( sorted_equivalent_t, C, KeyOf = KeyOf{}, Compare = Compare{} )
    -> sorted_vector<std::ranges::range_value_t<C>, KeyOf, Compare, C>;

template <std::input_iterator InputIt, typename KeyOf = identity, typename Compare = std::less<>>
requires KeyExtractor<KeyOf, std::iter_value_t<InputIt>>
sorted_vector( InputIt, InputIt, KeyOf = KeyOf{}, Compare = Compare{} )
    -> sorted_vector<std::iter_value_t<InputIt>, KeyOf, Compare>;

template <typename T, typename KeyOf = identity, typename Compare = std::less<>>
requires KeyExtractor<KeyOf, T>
sorted_vector( std::initializer_list<T>, KeyOf = KeyOf{}, Compare = Compare{} )
    -> sorted_vector<T, KeyOf, Compare>;


/// Sorts elements by key_of (stable) into a new container.
template <typename Container, typename KeyOf = identity, typename Compare = std::less<>>
requires KeyExtractor<KeyOf, typename Container::value_type>
[[ nodiscard ]] auto make_sorted_vector( Container elements, KeyOf key_of = KeyOf{}, Compare const & comp = Compare{} )
{
    return sorted_vector<typename Container::value_type, KeyOf, Compare, Container>( std::move( elements ), std::move( key_of ), comp );
}


/// Sorted container keyed by a string or other contiguous sequence, with
/// prefix-tracking lookups.
template <typename T, typename KeyOf = identity>
using sequence_sorted_vector = sorted_vector<T, KeyOf, lexicographic_less>;

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------

namespace std
{
/// Hashes the elements in order (keys are derived from them), consistent
/// with operator==.
template <typename T, typename KeyOf, typename Compare, typename Container, typename KeyContainer>
requires requires( T const & element ) { { std::hash<T>{}( element ) } -> std::convertible_to<std::size_t>; }
struct hash<psi::sortvec::sorted_vector<T, KeyOf, Compare, Container, KeyContainer>>
{
    std::size_t operator()( psi::sortvec::sorted_vector<T, KeyOf, Compare, Container, KeyContainer> const & container ) const
    {
        std::size_t seed{ container.size() };
        for ( auto const & element : container )
            boost::hash_combine( seed, std::hash<T>{}( element ) );
        return seed;
    }
};
} // namespace std
