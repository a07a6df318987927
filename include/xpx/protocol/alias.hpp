#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include <xpx/protocol/address.hpp>
#include <xpx/protocol/error.hpp>
#include <xpx/protocol/mosaic_id.hpp>

namespace xpx::protocol {

enum class alias_type : std::uint8_t
{
  none    = 0,
  mosaic  = 1,
  address = 2
};

/**
 * Binds a namespace to either an address or a mosaic. The payload always
 * agrees with the alias type, a `none` alias carries nothing.
 */
class namespace_alias
{
public:
  namespace_alias() noexcept = default;

  static namespace_alias for_address( const protocol::address& addr ) noexcept;
  static namespace_alias for_mosaic( const mosaic_id& id ) noexcept;

  // Builds an alias from its wire text, base32 for addresses and hex for mosaics
  static result< namespace_alias > create( alias_type type, std::string_view text );

  alias_type type() const noexcept;
  std::optional< protocol::address > aliased_address() const;
  std::optional< mosaic_id > aliased_mosaic() const noexcept;

  bool operator==( const namespace_alias& ) const = default;

private:
  std::variant< std::monostate, protocol::address, mosaic_id > _target;
};

} // namespace xpx::protocol
