#include <xpx/protocol/account.hpp>

#include <utility>

namespace xpx::protocol {

result< public_account > public_account_from_public_key( std::string_view public_key_hex, network_type network )
{
  return address_from_public_key( public_key_hex, network )
    .transform(
      [ public_key_hex ]( address&& addr )
      {
        return public_account{ std::move( addr ), std::string( public_key_hex ) };
      } );
}

} // namespace xpx::protocol
