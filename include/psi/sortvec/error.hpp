////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
///
/// Positional access errors of psi::sortvec containers.
///
/// Not-found is not an error (end() / std::nullopt). An index past the end is:
/// remove_at() returns it as std::expected<T, index_error>, the checked at()
/// accessor throws it as std::out_of_range.
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

#include <cstddef>
#include <string>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

struct index_error
{
    std::size_t index; // requested position
    std::size_t size;  // container size at the time of the request

    [[ nodiscard ]] std::string message() const;

    friend constexpr bool operator==( index_error const &, index_error const & ) noexcept = default;
}; // struct index_error

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( index_error const & error );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
