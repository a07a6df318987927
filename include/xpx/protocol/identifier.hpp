#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <xpx/protocol/error.hpp>

namespace xpx::protocol {

constexpr std::uint64_t namespace_bit     = std::uint64_t( 1 ) << 63;
constexpr std::size_t identifier_hex_size = 16;

constexpr bool has_bits( std::uint64_t value, std::uint64_t bits ) noexcept
{
  return ( value & bits ) == bits;
}

// Fixed width, lowercase, zero padded
std::string uint64_to_hex( std::uint64_t value );
result< std::uint64_t > uint64_from_hex( std::string_view sv ) noexcept;

} // namespace xpx::protocol
