#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

namespace xpx::crypto {

constexpr std::size_t digest_length           = 32;
constexpr std::size_t ripemd160_digest_length = 20;

using digest           = std::array< std::byte, digest_length >;
using ripemd160_digest = std::array< std::byte, ripemd160_digest_length >;

digest sha3_256( std::span< const std::byte > s );
digest sha3_256( std::string_view sv );

ripemd160_digest ripemd160( std::span< const std::byte > s );
ripemd160_digest ripemd160( std::string_view sv );

} // namespace xpx::crypto
