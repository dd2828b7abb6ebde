////////////////////////////////////////////////////////////////////////////////
/// psi::sortvec key extractor unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/sortvec/key_extractor.hpp>
#include <psi/sortvec/sorted_vector.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::sortvec {
//------------------------------------------------------------------------------

namespace
{
    struct employee
    {
        std::string   name;
        std::uint32_t salary;
        std::uint16_t age;
    };

    struct by_age_then_name
    {
        std::pair<std::uint16_t, std::string> operator()( employee const & e ) const { return { e.age, e.name }; }
    };

    std::vector<employee> staff()
    {
        return {
            { "dora" , 5100, 41 },
            { "ann"  , 4200, 29 },
            { "cecil", 3900, 29 },
            { "bob"  , 6100, 35 },
        };
    }
} // anonymous namespace

//==============================================================================
// Concepts and traits
//==============================================================================

static_assert(  KeyExtractor<identity, int> );
static_assert(  KeyExtractor<member_key<&employee::age>, employee> );
static_assert( !KeyExtractor<member_key<&employee::age>, int> );
static_assert(  std::is_same_v<key_of_t<identity, std::string>, std::string> );
static_assert(  std::is_same_v<key_of_t<member_key<&employee::salary>, employee>, std::uint32_t> );
static_assert(  std::is_same_v<key_of_t<by_age_then_name, employee>, std::pair<std::uint16_t, std::string>> );
static_assert(  std::is_same_v<key_of_t<key_function<employee, std::string>, employee>, std::string> );

// stateless extractors and comparators add nothing to the container
static_assert( sizeof( sorted_vector<int> ) == 2 * sizeof( std::vector<int> ) );
static_assert( sizeof( sorted_vector<employee, member_key<&employee::age>> ) == sizeof( std::vector<employee> ) + sizeof( std::vector<std::uint16_t> ) );

// check_invariants() re-derives every key after each mutation
#if PSI_SORTVEC_CHECK_INVARIANTS && !defined( NDEBUG )
constexpr int validation_derivations{ 1 };
#else
constexpr int validation_derivations{ 0 };
#endif

//==============================================================================
// Extractors
//==============================================================================

TEST( key_extractor, identity_returns_the_element )
{
    std::string const s{ "self" };
    EXPECT_EQ( &identity{}( s ), &s );
}

TEST( key_extractor, member_key_projects_the_member )
{
    auto const people{ staff() };
    EXPECT_EQ( member_key<&employee::salary>{}( people[ 1 ] ), 4200 );
    EXPECT_EQ( &member_key<&employee::name>{}( people[ 0 ] ), &people[ 0 ].name );
}

TEST( key_extractor, member_key_container )
{
    sorted_vector<employee, member_key<&employee::salary>> const bySalary( staff() );
    EXPECT_EQ( bySalary.keys(), ( std::vector<std::uint32_t>{ 3900, 4200, 5100, 6100 } ) );
    EXPECT_EQ( bySalary.find( 5100u )->name, "dora" );
    EXPECT_EQ( bySalary.position( 6100u ), 3 );
}

TEST( key_extractor, composite_key_functor )
{
    sorted_vector<employee, by_age_then_name> const v( staff() );
    std::vector<std::string> order;
    for ( auto const & e : v )
        order.push_back( e.name );
    EXPECT_EQ( order, ( std::vector<std::string>{ "ann", "cecil", "bob", "dora" } ) );
    EXPECT_TRUE( v.contains( std::pair<std::uint16_t, std::string>{ 35, "bob" } ) );
    EXPECT_FALSE( v.contains( std::pair<std::uint16_t, std::string>{ 35, "ann" } ) );
}

TEST( key_extractor, lambda_key_is_derived_once_per_element )
{
    int calls{ 0 };
    auto counting{ [&calls]( employee const & e ) { ++calls; return e.age; } };
    sorted_vector<employee, decltype( counting )> v( staff(), counting );
    EXPECT_EQ( calls, 4 * ( 1 + validation_derivations ) );

    calls = 0;
    EXPECT_NE( v.find( std::uint16_t{ 29 } ), v.end() );
    EXPECT_EQ( v.position( std::uint16_t{ 41 } ), 3 );
    EXPECT_EQ( v.count( std::uint16_t{ 29 } ), 2 );
    EXPECT_EQ( calls, 0 );

    v.insert( employee{ "eve", 100, 30 } );
    EXPECT_EQ( calls, 1 + 5 * validation_derivations );
}

TEST( key_extractor, key_function_is_one_type_for_any_projection )
{
    using by_string = key_function<employee, std::string>;
    using container = sorted_vector<employee, by_string>;

    container const byName( staff(), by_string{ []( employee const & e ) { return e.name; } } );
    container const bySalaryText( staff(), by_string{ []( employee const & e ) { return std::to_string( e.salary ); } } );

    EXPECT_EQ( byName.front().name, "ann" );
    EXPECT_EQ( bySalaryText.front().name, "cecil" ); // "3900" < "4200" < ...
    EXPECT_TRUE( byName.contains( std::string{ "bob" } ) );
    EXPECT_TRUE( bySalaryText.contains( std::string{ "6100" } ) );
}

TEST( key_function, emptiness )
{
    key_function<employee, int> empty;
    EXPECT_FALSE( static_cast<bool>( empty ) );
    key_function<employee, int> const age{ []( employee const & e ) { return int{ e.age }; } };
    EXPECT_TRUE( static_cast<bool>( age ) );
    EXPECT_EQ( age( staff()[ 0 ] ), 41 );
}

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
