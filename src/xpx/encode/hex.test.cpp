#include <gtest/gtest.h>

#include <algorithm>

#include <xpx/encode/hex.hpp>
#include <xpx/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  auto encoded_data = xpx::encode::to_hex( xpx::memory::as_bytes( data ) );

  EXPECT_EQ( encoded_data, valid_hex_str );
  EXPECT_EQ( xpx::encode::to_hex( {} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = xpx::encode::from_hex( valid_hex_str );

  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, xpx::memory::as_bytes( data ) ) );

  decoded_data = xpx::encode::from_hex( valid_hex_str.substr( 2 ) );
  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, xpx::memory::as_bytes( data ) ) );

  decoded_data = xpx::encode::from_hex( "04080F10172A"sv );
  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, xpx::memory::as_bytes( data ) ) );

  decoded_data = xpx::encode::from_hex( ""sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );

  decoded_data = xpx::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error().value(), static_cast< int >( xpx::encode::encode_errc::invalid_length ) );
    EXPECT_EQ(
      decoded_data.error().message(),
      xpx::encode::encode_category().message( static_cast< int >( xpx::encode::encode_errc::invalid_length ) ) );
  }

  decoded_data = xpx::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error().value(), static_cast< int >( xpx::encode::encode_errc::invalid_character ) );
    EXPECT_EQ(
      decoded_data.error().message(),
      xpx::encode::encode_category().message( static_cast< int >( xpx::encode::encode_errc::invalid_character ) ) );
  }
}
