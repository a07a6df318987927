#include <xpx/protocol/error.hpp>

#include <string>
#include <utility>

namespace xpx::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "protocol";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< protocol_errc >( condition ) )
    {
      case protocol_errc::ok:
        return "ok"s;
      case protocol_errc::invalid_name:
        return "invalid namespace name"s;
      case protocol_errc::too_many_parts:
        return "namespace name has too many parts"s;
      case protocol_errc::wrong_bit_namespace_id:
        return "namespace id must have the high bit set"s;
      case protocol_errc::wrong_bit_mosaic_id:
        return "mosaic id must not have the high bit set"s;
      case protocol_errc::invalid_identifier:
        return "invalid identifier"s;
      case protocol_errc::invalid_address:
        return "invalid address"s;
      case protocol_errc::checksum_mismatch:
        return "address checksum mismatch"s;
      case protocol_errc::invalid_public_key:
        return "invalid public key"s;
    }
    std::unreachable();
  }
};

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace xpx::protocol
