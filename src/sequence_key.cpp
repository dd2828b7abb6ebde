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
#include <psi/sortvec/sequence_key.hpp>

#include <bit>
#include <climits>
#include <cstdint>
#include <cstring>
//------------------------------------------------------------------------------
namespace psi::sortvec
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ gnu::pure ]]
    std::size_t common_byte_prefix_length( std::byte const * const a, std::byte const * const b, std::size_t const length ) noexcept
    {
        using word = std::size_t;
        static_assert( std::endian::native == std::endian::little || std::endian::native == std::endian::big );

        std::size_t offset{ 0 };
        for ( ; offset + sizeof( word ) <= length; offset += sizeof( word ) )
        {
            word wa;
            word wb;
            std::memcpy( &wa, a + offset, sizeof( wa ) );
            std::memcpy( &wb, b + offset, sizeof( wb ) );
            if ( auto const diff{ wa ^ wb }; diff != 0 )
            {
                // the first differing byte is the lowest addressed one
                auto const bits{ ( std::endian::native == std::endian::little ) ? std::countr_zero( diff ) : std::countl_zero( diff ) };
                return offset + static_cast<std::size_t>( bits ) / CHAR_BIT;
            }
        }
        while ( offset < length && a[ offset ] == b[ offset ] )
            ++offset;
        return offset;
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sortvec
//------------------------------------------------------------------------------
