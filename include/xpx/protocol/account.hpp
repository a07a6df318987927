#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <xpx/protocol/address.hpp>
#include <xpx/protocol/error.hpp>
#include <xpx/protocol/network_type.hpp>

namespace xpx::protocol {

constexpr std::string_view empty_public_key = "0000000000000000000000000000000000000000000000000000000000000000";

enum class account_type : std::uint8_t
{
  unlinked = 0,
  main,
  remote,
  remote_unlinked
};

struct public_account
{
  protocol::address address;
  std::string public_key;

  bool operator==( const public_account& ) const = default;
};

result< public_account > public_account_from_public_key( std::string_view public_key_hex, network_type network );

} // namespace xpx::protocol
