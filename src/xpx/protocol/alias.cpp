#include <xpx/protocol/alias.hpp>

namespace xpx::protocol {

namespace_alias namespace_alias::for_address( const protocol::address& addr ) noexcept
{
  namespace_alias alias;
  alias._target = addr;
  return alias;
}

namespace_alias namespace_alias::for_mosaic( const mosaic_id& id ) noexcept
{
  namespace_alias alias;
  alias._target = id;
  return alias;
}

result< namespace_alias > namespace_alias::create( alias_type type, std::string_view text )
{
  switch( type )
  {
    case alias_type::none:
      return namespace_alias{};
    case alias_type::mosaic:
      return mosaic_id::from_hex( text ).transform( &namespace_alias::for_mosaic );
    case alias_type::address:
      return parse_address( text ).transform( &namespace_alias::for_address );
  }

  return std::unexpected( protocol_errc::invalid_identifier );
}

alias_type namespace_alias::type() const noexcept
{
  if( std::holds_alternative< protocol::address >( _target ) )
    return alias_type::address;

  if( std::holds_alternative< mosaic_id >( _target ) )
    return alias_type::mosaic;

  return alias_type::none;
}

std::optional< protocol::address > namespace_alias::aliased_address() const
{
  if( const auto* addr = std::get_if< protocol::address >( &_target ) )
    return *addr;

  return std::nullopt;
}

std::optional< mosaic_id > namespace_alias::aliased_mosaic() const noexcept
{
  if( const auto* id = std::get_if< mosaic_id >( &_target ) )
    return *id;

  return std::nullopt;
}

} // namespace xpx::protocol
