#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace xpx::protocol {

/**
 * Network identifiers double as the version byte of an address.
 */
enum class network_type : std::uint8_t
{
  not_supported   = 0x00,
  mijin           = 0x60,
  mijin_test      = 0x90,
  alias_address   = 0x91,
  private_network = 0xc8,
  private_test    = 0xb0,
  public_network  = 0xb8,
  public_test     = 0xa8
};

std::optional< network_type > network_type_from_version( std::byte version ) noexcept;
std::optional< network_type > network_type_from_string( std::string_view name ) noexcept;

std::byte version_byte( network_type type ) noexcept;
std::string_view to_string( network_type type ) noexcept;

} // namespace xpx::protocol
