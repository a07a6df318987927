#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <xpx/encode/error.hpp>

namespace xpx::encode {

/**
 * RFC 4648 base32 with the standard alphabet (A-Z, 2-7).
 *
 * Output is padded with '=' to a multiple of eight characters. Inputs whose
 * length is a multiple of five bytes, such as addresses, never carry padding.
 */
std::string to_base32( std::span< const std::byte > s ) noexcept;

/**
 * Decodes uppercase standard base32. Trailing padding is optional, but when
 * present the input length must be a multiple of eight.
 */
result< std::vector< std::byte > > from_base32( std::string_view sv ) noexcept;

} // namespace xpx::encode
