#pragma once

#include <expected>
#include <system_error>

namespace xpx::protocol {

enum class protocol_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_name,
  too_many_parts,
  wrong_bit_namespace_id,
  wrong_bit_mosaic_id,
  invalid_identifier,
  invalid_address,
  checksum_mismatch,
  invalid_public_key
};

const std::error_category& protocol_category() noexcept;

std::error_code make_error_code( protocol_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace xpx::protocol

template<>
struct std::is_error_code_enum< xpx::protocol::protocol_errc >: public std::true_type
{};
