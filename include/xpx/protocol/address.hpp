#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <xpx/crypto/checksum.hpp>
#include <xpx/crypto/hash.hpp>
#include <xpx/protocol/error.hpp>
#include <xpx/protocol/namespace_id.hpp>
#include <xpx/protocol/network_type.hpp>

namespace xpx::protocol {

constexpr std::size_t public_key_length     = 32;
constexpr std::size_t address_header_length = 1 + crypto::ripemd160_digest_length;
constexpr std::size_t address_length        = address_header_length + crypto::checksum_length;
constexpr std::size_t address_text_length   = 40;

using public_key_data = std::array< std::byte, public_key_length >;
using address_data    = std::array< std::byte, address_length >;

/**
 * A 25 byte account or alias address.
 *
 * Key derived addresses are laid out as version, RIPEMD-160( SHA3-256( key ) )
 * and a four byte checksum over the preceding 21 bytes. Alias addresses are
 * the alias version byte, the little endian namespace id and 16 zero bytes,
 * with no checksum.
 *
 * An address always carries a version byte from the network table.
 */
class address
{
public:
  static result< address > from_bytes( std::span< const std::byte > bytes ) noexcept;

  network_type network() const noexcept;
  bool alias() const noexcept;
  const address_data& bytes() const noexcept;

  // Canonical uppercase base32 text
  std::string plain() const;

  // Dash grouped presentation form, accepted back by parse_address
  std::string pretty() const;

  // 0x prefixed hex of the raw bytes
  std::string encoded() const;

  bool operator==( const address& rhs ) const noexcept = default;

private:
  address( network_type type, const address_data& bytes ) noexcept;

  network_type _network = network_type::not_supported;
  address_data _bytes{};
};

std::string normalize_address( std::string_view text );

result< address > address_from_public_key( std::span< const std::byte, public_key_length > public_key,
                                           network_type network );
result< address > address_from_public_key( std::string_view public_key_hex, network_type network );

result< address > address_from_namespace( const namespace_id& id );

// Validates the version byte only, see verify_checksum
result< address > parse_address( std::string_view text );

result< void > verify_checksum( const address& addr );

result< address > address_from_encoded( std::string_view hex );
result< std::vector< address > > addresses_from_encoded( std::span< const std::string > hexes );

} // namespace xpx::protocol
