#pragma once

#include <expected>
#include <system_error>

namespace xpx::config {

enum class config_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_base_urls,
  invalid_base_url,
  invalid_network_type,
  invalid_reputation,
  file_not_found,
  parse_error
};

const std::error_category& config_category() noexcept;

std::error_code make_error_code( config_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace xpx::config

template<>
struct std::is_error_code_enum< xpx::config::config_errc >: public std::true_type
{};
