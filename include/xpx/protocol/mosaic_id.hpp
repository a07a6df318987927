#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include <xpx/protocol/error.hpp>
#include <xpx/protocol/identifier.hpp>

namespace xpx::protocol {

class mosaic_id
{
public:
  constexpr mosaic_id() noexcept = default;

  static result< mosaic_id > create( std::uint64_t id ) noexcept;
  static result< mosaic_id > from_hex( std::string_view sv ) noexcept;

  constexpr std::uint64_t id() const noexcept
  {
    return _id;
  }

  std::string to_hex() const;

  constexpr auto operator<=>( const mosaic_id& ) const noexcept = default;

private:
  constexpr explicit mosaic_id( std::uint64_t id ) noexcept:
      _id( id )
  {}

  std::uint64_t _id = 0;
};

} // namespace xpx::protocol
