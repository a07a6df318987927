#include <xpx/protocol/identifier.hpp>

#include <format>

#include <boost/endian.hpp>

#include <xpx/encode/hex.hpp>
#include <xpx/memory/memory.hpp>

namespace xpx::protocol {

std::string uint64_to_hex( std::uint64_t value )
{
  return std::format( "{:016x}", value );
}

result< std::uint64_t > uint64_from_hex( std::string_view sv ) noexcept
{
  if( sv.size() != identifier_hex_size )
    return std::unexpected( protocol_errc::invalid_identifier );

  auto bytes = encode::from_hex( sv );
  if( !bytes || bytes->size() != sizeof( std::uint64_t ) )
    return std::unexpected( protocol_errc::invalid_identifier );

  auto value = memory::bit_cast< std::uint64_t >( *bytes );
  boost::endian::big_to_native_inplace( value );
  return value;
}

} // namespace xpx::protocol
