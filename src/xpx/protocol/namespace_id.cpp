#include <xpx/protocol/namespace_id.hpp>

namespace xpx::protocol {

result< namespace_id > namespace_id::create( std::uint64_t id ) noexcept
{
  if( id != 0 && !has_bits( id, namespace_bit ) )
    return std::unexpected( protocol_errc::wrong_bit_namespace_id );

  return unchecked( id );
}

result< namespace_id > namespace_id::from_hex( std::string_view sv ) noexcept
{
  return uint64_from_hex( sv ).and_then( &namespace_id::create );
}

std::string namespace_id::to_hex() const
{
  return uint64_to_hex( _id );
}

} // namespace xpx::protocol
