////////////////////////////////////////////////////////////////////////////////
///
/// detail::paired_storage: the element sequence and its cached key sequence,
/// index-aligned, with the synchronised dual-container operations every
/// mutation of a sorted_vector is built from.
///
/// Comparator and key extractor agnostic: it neither orders nor derives
/// keys, it only keeps keys[ i ] next to elements[ i ]. Doubles as the
/// `containers` type returned by sorted_vector::extract().
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

#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sortvec::detail
{
//------------------------------------------------------------------------------

template <typename KeyContainer, typename Container>
struct paired_storage
{
    using size_type = std::conditional_t
    <
        ( sizeof( typename KeyContainer::size_type ) <= sizeof( typename Container::size_type ) ),
        typename KeyContainer::size_type,
        typename Container   ::size_type
    >;
    using difference_type = std::ptrdiff_t;

    KeyContainer keys;
    Container    elements;

    //--------------------------------------------------------------------------
    // Truncate both containers to newSize (shrink-only)
    //--------------------------------------------------------------------------
    void truncate_to( size_type const newSize ) noexcept
    {
        BOOST_ASSERT( newSize <= keys.size() );
        keys    .erase( keys    .begin() + static_cast<difference_type>( newSize ), keys    .end() );
        elements.erase( elements.begin() + static_cast<difference_type>( newSize ), elements.end() );
    }

    //--------------------------------------------------------------------------
    // Synchronised single element insert/append (strong guarantee)
    //--------------------------------------------------------------------------
    template <typename K, typename V>
    void insert_element_at( size_type const pos, K && key, V && element )
    {
        auto const p{ static_cast<difference_type>( pos ) };
        keys.insert( keys.begin() + p, std::forward<K>( key ) );
        try {
            elements.insert( elements.begin() + p, std::forward<V>( element ) );
        } catch ( ... ) {
            keys.erase( keys.begin() + p );
            throw;
        }
    }

    template <typename K, typename V>
    void append_element( K && key, V && element )
    {
        keys.push_back( std::forward<K>( key ) );
        try {
            elements.push_back( std::forward<V>( element ) );
        } catch ( ... ) {
            keys.pop_back();
            throw;
        }
    }

    //--------------------------------------------------------------------------
    // Synchronised erase
    //--------------------------------------------------------------------------
    void erase_element_at( size_type const pos ) noexcept
    {
        auto const p{ static_cast<difference_type>( pos ) };
        keys    .erase( keys    .begin() + p );
        elements.erase( elements.begin() + p );
    }

    void erase_elements( size_type const first, size_type const last ) noexcept
    {
        auto const f{ static_cast<difference_type>( first ) };
        auto const l{ static_cast<difference_type>( last  ) };
        keys    .erase( keys    .begin() + f, keys    .begin() + l );
        elements.erase( elements.begin() + f, elements.begin() + l );
    }

    /// Moves the element at pos out and erases its slot (and key).
    [[ nodiscard ]] typename Container::value_type take_element_at( size_type const pos )
    {
        typename Container::value_type element( std::move( elements[ pos ] ) );
        erase_element_at( pos );
        return element;
    }

    //--------------------------------------------------------------------------
    // Compaction: move slot `from` into slot `to` (to < from)
    //--------------------------------------------------------------------------
    void move_slot( size_type const from, size_type const to )
    {
        BOOST_ASSERT( to < from );
        keys    [ to ] = std::move( keys    [ from ] );
        elements[ to ] = std::move( elements[ from ] );
    }

    //--------------------------------------------------------------------------
    // Rearrange both sequences so that new[ i ] = old[ order[ i ] ].
    // In place, following the permutation's cycles; consumes order (it is
    // left as the identity). If a move throws the storage is cleared (basic
    // guarantee).
    //--------------------------------------------------------------------------
    void apply_permutation( std::span<size_type> const order )
    {
        BOOST_ASSERT( order.size() == keys.size() );
        BOOST_ASSERT( keys.size() == elements.size() );
        try
        {
            for ( size_type start{ 0 }; start < order.size(); ++start )
            {
                if ( order[ start ] == start )
                    continue;
                auto parkedKey    { std::move( keys    [ start ] ) };
                auto parkedElement{ std::move( elements[ start ] ) };
                auto current{ start };
                for ( ;; )
                {
                    auto const source{ order[ current ] };
                    order[ current ] = current;
                    if ( source == start )
                    {
                        keys    [ current ] = std::move( parkedKey     );
                        elements[ current ] = std::move( parkedElement );
                        break;
                    }
                    keys    [ current ] = std::move( keys    [ source ] );
                    elements[ current ] = std::move( elements[ source ] );
                    current = source;
                }
            }
        }
        catch ( ... )
        {
            clear();
            throw;
        }
    }

    //--------------------------------------------------------------------------
    // Reserve / Shrink
    //--------------------------------------------------------------------------
    void reserve( size_type const n )
    {
        keys    .reserve( n );
        elements.reserve( n );
    }

    void shrink_to_fit() noexcept
    {
        keys    .shrink_to_fit();
        elements.shrink_to_fit();
    }

    //--------------------------------------------------------------------------
    // Clear / Swap
    //--------------------------------------------------------------------------
    void clear() noexcept
    {
        keys    .clear();
        elements.clear();
    }

    void swap_storage( paired_storage & other ) noexcept
    {
        using std::swap;
        swap( keys,     other.keys     );
        swap( elements, other.elements );
    }
}; // struct paired_storage

//------------------------------------------------------------------------------
} // namespace psi::sortvec::detail
//------------------------------------------------------------------------------
