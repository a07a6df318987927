#include <xpx/protocol/mosaic_id.hpp>

namespace xpx::protocol {

result< mosaic_id > mosaic_id::create( std::uint64_t id ) noexcept
{
  if( has_bits( id, namespace_bit ) )
    return std::unexpected( protocol_errc::wrong_bit_mosaic_id );

  return mosaic_id( id );
}

result< mosaic_id > mosaic_id::from_hex( std::string_view sv ) noexcept
{
  return uint64_from_hex( sv ).and_then( &mosaic_id::create );
}

std::string mosaic_id::to_hex() const
{
  return uint64_to_hex( _id );
}

} // namespace xpx::protocol
