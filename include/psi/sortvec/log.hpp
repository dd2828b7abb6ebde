////////////////////////////////////////////////////////////////////////////////
///
/// \file log.hpp
/// -------------
///
/// Diagnostics channel of psi::sortvec (spdlog).
///
/// The containers themselves never log on their hot paths: only invariant
/// violations found by check_invariants() are reported, through the
/// out-of-line (cold) detail::report_* functions below.
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
#include <memory>
#include <string_view>
//------------------------------------------------------------------------------
namespace spdlog { class logger; }
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

inline constexpr std::string_view logger_name{ "psi.sortvec" };

/// The logger registered (in the spdlog registry) under logger_name or, if
/// none is, spdlog's default logger.
[[ nodiscard ]] std::shared_ptr<spdlog::logger> logger();

/// Registers (a clone of, if named differently) the given logger under
/// logger_name, replacing any previous one. nullptr reverts to spdlog's
/// default logger.
void set_logger( std::shared_ptr<spdlog::logger> );

namespace detail
{
    [[ gnu::cold ]] void report_misaligned( std::size_t key_count, std::size_t element_count );
    [[ gnu::cold ]] void report_stale_key ( std::size_t position );
    [[ gnu::cold ]] void report_unsorted  ( std::size_t position );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
