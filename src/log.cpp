////////////////////////////////////////////////////////////////////////////////
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
#include <psi/sortvec/log.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> logger()
{
    if ( auto registered{ spdlog::get( std::string{ logger_name } ) } )
        return registered;
    return spdlog::default_logger();
}

void set_logger( std::shared_ptr<spdlog::logger> replacement )
{
    std::string const name{ logger_name };
    spdlog::drop( name );
    if ( !replacement )
        return;
    if ( replacement->name() != name )
        replacement = replacement->clone( name );
    spdlog::register_logger( std::move( replacement ) );
}

namespace detail
{
    void report_misaligned( std::size_t const key_count, std::size_t const element_count )
    {
        logger()->error( "sorted_vector: {} cached keys for {} elements", key_count, element_count );
    }

    void report_stale_key( std::size_t const position )
    {
        logger()->error( "sorted_vector: cached key at position {} differs from the key of its element", position );
    }

    void report_unsorted( std::size_t const position )
    {
        logger()->error( "sorted_vector: key at position {} orders before its predecessor", position );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
