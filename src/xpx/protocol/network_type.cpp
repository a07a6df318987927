#include <xpx/protocol/network_type.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace xpx::protocol {

namespace {

struct network_entry
{
  network_type type;
  std::string_view name;
};

// Version bytes accepted at the head of a decoded address
constexpr std::array< network_entry, 7 > address_networks{
  network_entry{ network_type::mijin, "mijin" },
  network_entry{ network_type::mijin_test, "mijin-test" },
  network_entry{ network_type::public_network, "public" },
  network_entry{ network_type::public_test, "public-test" },
  network_entry{ network_type::private_network, "private" },
  network_entry{ network_type::private_test, "private-test" },
  network_entry{ network_type::alias_address, "alias-address" }
};

} // namespace

std::optional< network_type > network_type_from_version( std::byte version ) noexcept
{
  auto it = std::ranges::find_if( address_networks,
                                  [ version ]( const network_entry& entry )
                                  {
                                    return std::to_underlying( entry.type ) == std::to_integer< std::uint8_t >( version );
                                  } );

  if( it == address_networks.end() )
    return std::nullopt;

  return it->type;
}

std::optional< network_type > network_type_from_string( std::string_view name ) noexcept
{
  auto it = std::ranges::find( address_networks, name, &network_entry::name );

  if( it == address_networks.end() )
    return std::nullopt;

  return it->type;
}

std::byte version_byte( network_type type ) noexcept
{
  return std::byte{ std::to_underlying( type ) };
}

std::string_view to_string( network_type type ) noexcept
{
  auto it = std::ranges::find( address_networks, type, &network_entry::type );

  if( it == address_networks.end() )
    return "not-supported";

  return it->name;
}

} // namespace xpx::protocol
