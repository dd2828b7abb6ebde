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
#include <psi/sortvec/error.hpp>

#include <fmt/format.h>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

std::string index_error::message() const
{
    return fmt::format( "index {} out of bounds for length {}", index, size );
}

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( index_error const & error ) { throw std::out_of_range( error.message() ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
