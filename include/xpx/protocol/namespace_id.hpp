#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include <xpx/protocol/error.hpp>
#include <xpx/protocol/identifier.hpp>

namespace xpx::protocol {

/**
 * A 64 bit namespace identifier.
 *
 * Every namespace identifier carries the namespace bit. The value zero is
 * reserved as the parent of root namespaces and is the only exception.
 */
class namespace_id
{
public:
  constexpr namespace_id() noexcept = default;

  static result< namespace_id > create( std::uint64_t id ) noexcept;
  static constexpr namespace_id unchecked( std::uint64_t id ) noexcept
  {
    return namespace_id( id );
  }

  static result< namespace_id > from_hex( std::string_view sv ) noexcept;

  constexpr std::uint64_t id() const noexcept
  {
    return _id;
  }

  constexpr bool empty() const noexcept
  {
    return _id == 0;
  }

  std::string to_hex() const;

  constexpr auto operator<=>( const namespace_id& ) const noexcept = default;

private:
  constexpr explicit namespace_id( std::uint64_t id ) noexcept:
      _id( id )
  {}

  std::uint64_t _id = 0;
};

constexpr namespace_id root_namespace_parent{};

} // namespace xpx::protocol
