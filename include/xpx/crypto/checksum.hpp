#pragma once

#include <array>
#include <cstddef>
#include <span>

namespace xpx::crypto {

constexpr std::size_t checksum_length = 4;

using checksum_data = std::array< std::byte, checksum_length >;

/**
 * The leading bytes of the SHA3-256 digest of the input.
 */
checksum_data checksum( std::span< const std::byte > s );

} // namespace xpx::crypto
