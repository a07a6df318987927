#include <xpx/protocol/address.hpp>

#include <algorithm>
#include <cctype>

#include <boost/endian.hpp>

#include <xpx/encode.hpp>
#include <xpx/memory/memory.hpp>

namespace xpx::protocol {

constexpr std::size_t pretty_block_length = 6;
constexpr std::size_t pretty_block_count  = 6;
constexpr char pretty_separator           = '-';

address::address( network_type type, const address_data& bytes ) noexcept:
    _network( type ),
    _bytes( bytes )
{}

result< address > address::from_bytes( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != address_length )
    return std::unexpected( protocol_errc::invalid_address );

  auto type = network_type_from_version( bytes.front() );
  if( !type )
    return std::unexpected( protocol_errc::invalid_address );

  address_data data{};
  std::ranges::copy( bytes, data.begin() );
  return address( *type, data );
}

network_type address::network() const noexcept
{
  return _network;
}

bool address::alias() const noexcept
{
  return _network == network_type::alias_address;
}

const address_data& address::bytes() const noexcept
{
  return _bytes;
}

std::string address::plain() const
{
  return encode::to_base32( _bytes );
}

std::string address::pretty() const
{
  const auto text = plain();

  std::string out;
  out.reserve( text.size() + pretty_block_count );

  for( std::size_t i = 0; i < pretty_block_count; ++i )
  {
    out.append( text, i * pretty_block_length, pretty_block_length );
    out.push_back( pretty_separator );
  }

  out.append( text, pretty_block_count * pretty_block_length );
  return out;
}

std::string address::encoded() const
{
  return encode::to_hex( _bytes );
}

std::string normalize_address( std::string_view text )
{
  std::string out;
  out.reserve( text.size() );

  for( char c: text )
  {
    if( c == pretty_separator )
      continue;

    out.push_back( static_cast< char >( std::toupper( static_cast< unsigned char >( c ) ) ) );
  }

  return out;
}

result< address > address_from_public_key( std::span< const std::byte, public_key_length > public_key,
                                           network_type network )
{
  if( network == network_type::alias_address )
    return std::unexpected( protocol_errc::invalid_address );

  auto identity = crypto::ripemd160( crypto::sha3_256( public_key ) );

  address_data data{};
  data.front() = version_byte( network );
  std::ranges::copy( identity, data.begin() + 1 );

  auto sum = crypto::checksum( std::span( data ).first< address_header_length >() );
  std::ranges::copy( sum, data.begin() + address_header_length );

  return address::from_bytes( data );
}

result< address > address_from_public_key( std::string_view public_key_hex, network_type network )
{
  auto key = encode::from_hex( public_key_hex );
  if( !key || key->size() != public_key_length )
    return std::unexpected( protocol_errc::invalid_public_key );

  return address_from_public_key( std::span< const std::byte, public_key_length >( key->data(), public_key_length ),
                                  network );
}

result< address > address_from_namespace( const namespace_id& id )
{
  const auto little_id = boost::endian::native_to_little( id.id() );

  // The remaining 16 bytes stay zero, alias addresses carry no checksum
  address_data data{};
  data.front() = version_byte( network_type::alias_address );
  std::ranges::copy( memory::as_bytes( little_id ), data.begin() + 1 );

  return address::from_bytes( data );
}

result< address > parse_address( std::string_view text )
{
  const auto normalized = normalize_address( text );
  if( normalized.size() != address_text_length )
    return std::unexpected( protocol_errc::invalid_address );

  auto bytes = encode::from_base32( normalized );
  if( !bytes )
    return std::unexpected( protocol_errc::invalid_address );

  return address::from_bytes( *bytes );
}

result< void > verify_checksum( const address& addr )
{
  if( addr.alias() )
    return {};

  const auto bytes = std::span( addr.bytes() );
  auto sum         = crypto::checksum( bytes.first< address_header_length >() );

  if( !std::ranges::equal( sum, bytes.last< crypto::checksum_length >() ) )
    return std::unexpected( protocol_errc::checksum_mismatch );

  return {};
}

result< address > address_from_encoded( std::string_view hex )
{
  auto bytes = encode::from_hex( hex );
  if( !bytes )
    return std::unexpected( protocol_errc::invalid_address );

  return address::from_bytes( *bytes );
}

result< std::vector< address > > addresses_from_encoded( std::span< const std::string > hexes )
{
  std::vector< address > addresses;
  addresses.reserve( hexes.size() );

  for( const auto& hex: hexes )
  {
    auto addr = address_from_encoded( hex );
    if( !addr )
      return std::unexpected( addr.error() );

    addresses.push_back( *addr );
  }

  return addresses;
}

} // namespace xpx::protocol
