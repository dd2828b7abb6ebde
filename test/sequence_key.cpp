////////////////////////////////////////////////////////////////////////////////
/// psi::sortvec sequence (string / byte array) key unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/sortvec/sequence_key.hpp>
#include <psi/sortvec/sorted_vector.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::sortvec {
//------------------------------------------------------------------------------

namespace
{
    template <typename E>
    std::size_t naive_common_prefix( std::span<E const> const a, std::span<E const> const b )
    {
        std::size_t i{ 0 };
        while ( i < a.size() && i < b.size() && a[ i ] == b[ i ] )
            ++i;
        return i;
    }

    std::string random_string( std::mt19937 & rng, std::size_t const maxLength )
    {
        // few symbols, some above 0x7F: long shared prefixes and signedness traps
        static constexpr std::array<char, 5> alphabet{ 'a', 'b', '\0', '\x80', '\xC2' };
        std::uniform_int_distribution<std::size_t> length( 0, maxLength );
        std::uniform_int_distribution<std::size_t> symbol( 0, alphabet.size() - 1 );
        std::string s( length( rng ), 'a' );
        for ( auto & c : s )
            c = alphabet[ symbol( rng ) ];
        return s;
    }

    struct gene
    {
        std::string sequence;
        int         id;
    };
} // anonymous namespace

//==============================================================================
// Common prefix scan
//==============================================================================

TEST( common_prefix_length, word_scan_matches_naive_scan )
{
    std::string const base( 100, 'x' );
    for ( std::size_t length{ 0 }; length <= base.size(); ++length )
    {
        for ( std::size_t const mismatch : { std::size_t{ 0 }, length / 2, length } )
        {
            auto other{ base.substr( 0, length ) };
            if ( mismatch < length )
                other[ mismatch ] = 'y';
            std::span<char const> const a{ base.data(), length };
            std::span<char const> const b{ other };
            EXPECT_EQ( common_prefix_length( a, b ), naive_common_prefix( a, b ) ) << "length " << length << " mismatch " << mismatch;
        }
    }
}

TEST( common_prefix_length, unaligned_and_uneven_inputs )
{
    std::vector<std::uint8_t> const bytes{ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19 };
    auto copy{ bytes };
    copy[ 17 ] = 0xFF;
    std::span<std::uint8_t const> const a{ bytes };
    std::span<std::uint8_t const> const b{ copy };
    EXPECT_EQ( common_prefix_length( a.subspan( 1 ), b.subspan( 1 ) ), 16 );
    EXPECT_EQ( common_prefix_length( a.subspan( 3, 5 ), b.subspan( 3 ) ), 5 );
    EXPECT_EQ( common_prefix_length( a.subspan( 18 ), b.subspan( 18 ) ), 2 );
    EXPECT_EQ( common_prefix_length( a.first( 0 ), b ), 0 );
}

TEST( common_prefix_length, wide_elements )
{
    std::vector<int> const a{ 1, 2, 3, 4 };
    std::vector<int> const b{ 1, 2, 9 };
    EXPECT_EQ( common_prefix_length( std::span<int const>{ a }, std::span<int const>{ b } ), 2 );
}

TEST( common_prefix_length, usable_in_constant_expressions )
{
    static constexpr std::array<char, 4> a{ 'a', 'b', 'c', 'd' };
    static constexpr std::array<char, 4> b{ 'a', 'b', 'x', 'd' };
    static_assert( common_prefix_length( std::span<char const>{ a }, std::span<char const>{ b } ) == 2 );
}

//==============================================================================
// lexicographic_less
//==============================================================================

TEST( lexicographic_less, compare_from )
{
    lexicographic_less const less;
    std::string const key{ "abcd" };

    auto const diverging{ less.compare_from( key, std::string_view{ "abxy" }, 0 ) };
    EXPECT_EQ( diverging.prefix, 2 );
    EXPECT_TRUE( diverging.order < 0 );

    auto const skipped{ less.compare_from( key, std::string_view{ "abxy" }, 2 ) };
    EXPECT_EQ( skipped.prefix, 2 );
    EXPECT_TRUE( skipped.order < 0 );

    auto const longer{ less.compare_from( key, std::string_view{ "abc" }, 1 ) };
    EXPECT_EQ( longer.prefix, 3 );
    EXPECT_TRUE( longer.order > 0 );

    auto const equal{ less.compare_from( key, "abcd", 0 ) };
    EXPECT_EQ( equal.prefix, 4 );
    EXPECT_TRUE( equal.order == 0 );
}

TEST( lexicographic_less, bytes_compare_unsigned )
{
    lexicographic_less const less;
    EXPECT_TRUE ( less( std::string_view{ "a" }, std::string_view{ "\xC2\x80" } ) );
    EXPECT_FALSE( less( std::string_view{ "\xC2\x80" }, std::string_view{ "a" } ) );
    EXPECT_TRUE ( less( std::string_view{ "" }, std::string_view{ "\0", 1 } ) );
}

TEST( lexicographic_less, agrees_with_string_compare )
{
    std::mt19937 rng{ 20231018 };
    lexicographic_less const less;
    for ( auto i{ 0 }; i < 2000; ++i )
    {
        auto const a{ random_string( rng, 12 ) };
        auto const b{ random_string( rng, 12 ) };
        EXPECT_EQ( less( a, b ), a.compare( b ) < 0 );
        EXPECT_EQ( less.eq( a, b ), a == b );
    }
}

TEST( lexicographic_less, non_character_elements )
{
    lexicographic_less const less;
    std::vector<int> const a{ 1, 2, 3 };
    std::vector<int> const b{ 1, -1 };
    EXPECT_TRUE ( less( b, a ) );
    EXPECT_FALSE( less( a, b ) );
    EXPECT_TRUE ( less( std::vector<int>{ 1, 2 }, a ) );
}

//==============================================================================
// sequence_sorted_vector
//==============================================================================

TEST( sequence_sorted_vector, finds_every_key_of_pathological_multibyte_set )
{
    std::vector<std::string> const input
    {
        "\xC2\x80", "\xC2\x80", "\xC2\x80", "\xC2\x80", "", "\xC2\x80", "", "", "\xC2\xA4", "", "", "\xC2\x80",
        "", "\xC2\x80", "", "\xC2\x80", "", std::string{ "\xC2\xA4\0", 3 }, "\xC2\xA5", "", "", "\xC2\xA5", "", "\xC2\x80", "", "", "\xC2\xA5", "\xC2\x80", ""
    };
    sequence_sorted_vector<std::string> const sorted( input );
    EXPECT_TRUE( sorted.check_invariants() );
    for ( auto const & s : input )
    {
        auto const found{ sorted.find( std::string_view{ s } ) };
        ASSERT_NE( found, sorted.end() );
        EXPECT_EQ( *found, s );
    }
}

TEST( sequence_sorted_vector, prefix_search_agrees_with_plain_search )
{
    auto const seed{ std::random_device{}() };
    SCOPED_TRACE( ::testing::Message() << "seed " << seed );
    std::mt19937 rng{ seed };

    for ( auto round{ 0 }; round < 50; ++round )
    {
        std::vector<std::string> input;
        for ( auto i{ 0 }; i < 200; ++i )
            input.push_back( random_string( rng, 10 ) );
        sequence_sorted_vector<std::string> const sorted( input );

        std::vector<std::string> reference{ input };
        std::ranges::stable_sort( reference );
        ASSERT_EQ( sorted.elements(), reference );

        for ( auto i{ 0 }; i < 200; ++i )
        {
            auto const query{ random_string( rng, 10 ) };
            auto const lower{ std::ranges::lower_bound( reference, query ) - reference.begin() };
            auto const upper{ std::ranges::upper_bound( reference, query ) - reference.begin() };
            EXPECT_EQ( sorted.lower_bound( query ) - sorted.begin(), lower );
            EXPECT_EQ( sorted.upper_bound( query ) - sorted.begin(), upper );
            EXPECT_EQ( sorted.contains( query ), lower != upper );
        }
    }
}

TEST( sequence_sorted_vector, member_sequence_key )
{
    using genome = sequence_sorted_vector<gene, member_key<&gene::sequence>>;
    genome g{ { "GATTACA", 1 }, { "GATT", 2 }, { "CAT", 3 }, { "GATTACA", 4 } };
    EXPECT_EQ( g.front().id, 3 );
    EXPECT_EQ( g.find( "GATTACA" )->id, 1 );
    EXPECT_EQ( g.count( std::string_view{ "GATTACA" } ), 2 );
    EXPECT_EQ( g.find( "GAT" ), g.end() );

    g.insert( gene{ "GATTA", 5 } );
    EXPECT_EQ( g.position( "GATTA" ), 2 );
    EXPECT_TRUE( g.check_invariants() );
}

TEST( sequence_sorted_vector, byte_vector_keys )
{
    using bytes = std::vector<std::uint8_t>;
    sequence_sorted_vector<bytes> const v{ bytes{ 0xFF }, bytes{ 0x01, 0x02 }, bytes{}, bytes{ 0x01 } };
    EXPECT_EQ( v.front(), bytes{} );
    EXPECT_EQ( v.back (), bytes{ 0xFF } );

    std::array<std::uint8_t, 2> const query{ 0x01, 0x02 };
    EXPECT_EQ( v.position( std::span<std::uint8_t const>{ query } ), 2 );
    EXPECT_EQ( v.position( bytes{ 0x01 } ), 1 );
    EXPECT_FALSE( v.contains( bytes{ 0x02 } ) );
}

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
