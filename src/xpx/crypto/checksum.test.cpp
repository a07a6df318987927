// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include <xpx/crypto.hpp>
#include <xpx/encode.hpp>

TEST( checksum, empty_input )
{
  auto sum = xpx::crypto::checksum( {} );
  EXPECT_TRUE( std::ranges::equal( sum, *xpx::encode::from_hex( "a7ffc6f8" ) ) );
}

TEST( checksum, digest_prefix )
{
  std::vector< std::byte > buffer( 21, std::byte{ 0x5a } );

  auto sum  = xpx::crypto::checksum( buffer );
  auto hash = xpx::crypto::sha3_256( buffer );

  EXPECT_TRUE( std::ranges::equal( sum, std::span( hash ).first( xpx::crypto::checksum_length ) ) );

  buffer.back() = std::byte{ 0x5b };
  EXPECT_NE( xpx::crypto::checksum( buffer ), sum );
}

// NOLINTEND
