// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include <xpx/encode.hpp>
#include <xpx/protocol/address.hpp>
#include <xpx/protocol/namespace_path.hpp>

using namespace std::string_view_literals;

constexpr auto public_key       = "C2F93346E27CE6AD1A9F8F5E3066F8326593A406BDF357ACB041E2F9AB402EFE"sv;
constexpr auto mijin_test_text  = "SCTVW23D2MN5VE4AQ4TZIDZENGNOZXPRPRLIKCF2"sv;
constexpr auto public_test_text = "VCTVW23D2MN5VE4AQ4TZIDZENGNOZXPRPR3HTEHT"sv;

TEST( address, from_public_key )
{
  auto addr = xpx::protocol::address_from_public_key( public_key, xpx::protocol::network_type::mijin_test );
  ASSERT_TRUE( addr ) << addr.error().message();
  EXPECT_EQ( addr->plain(), mijin_test_text );
  EXPECT_EQ( addr->network(), xpx::protocol::network_type::mijin_test );
  EXPECT_FALSE( addr->alias() );
  EXPECT_EQ( addr->encoded(), "0x90a75b6b63d31bda93808727940f24699aecddf17c568508ba" );

  auto lowercase = xpx::protocol::address_from_public_key( "c2f93346e27ce6ad1a9f8f5e3066f8326593a406bdf357acb041e2f9ab402efe"sv,
                                                           xpx::protocol::network_type::mijin_test );
  ASSERT_TRUE( lowercase );
  EXPECT_EQ( *lowercase, *addr );
}

TEST( address, network_changes_version_and_checksum )
{
  auto mijin_test  = xpx::protocol::address_from_public_key( public_key, xpx::protocol::network_type::mijin_test );
  auto public_test = xpx::protocol::address_from_public_key( public_key, xpx::protocol::network_type::public_test );
  ASSERT_TRUE( mijin_test );
  ASSERT_TRUE( public_test );

  EXPECT_EQ( public_test->plain(), public_test_text );
  EXPECT_NE( mijin_test->bytes().front(), public_test->bytes().front() );
  EXPECT_TRUE( std::equal( mijin_test->bytes().begin() + 1,
                           mijin_test->bytes().begin() + xpx::protocol::address_header_length,
                           public_test->bytes().begin() + 1 ) );
  EXPECT_FALSE( std::equal( mijin_test->bytes().begin() + xpx::protocol::address_header_length,
                            mijin_test->bytes().end(),
                            public_test->bytes().begin() + xpx::protocol::address_header_length ) );
}

TEST( address, from_raw_public_key )
{
  auto key = xpx::encode::from_hex( public_key );
  ASSERT_TRUE( key );

  xpx::protocol::public_key_data data{};
  std::ranges::copy( *key, data.begin() );

  auto addr = xpx::protocol::address_from_public_key( data, xpx::protocol::network_type::mijin_test );
  ASSERT_TRUE( addr );
  EXPECT_EQ( addr->plain(), mijin_test_text );
}

TEST( address, invalid_public_key )
{
  for( auto key: { ""sv, "C2F9"sv, "Z2F93346E27CE6AD1A9F8F5E3066F8326593A406BDF357ACB041E2F9AB402EFE"sv } )
  {
    auto addr = xpx::protocol::address_from_public_key( key, xpx::protocol::network_type::mijin_test );
    ASSERT_FALSE( addr );
    EXPECT_EQ( addr.error(), xpx::protocol::protocol_errc::invalid_public_key );
  }

  auto addr = xpx::protocol::address_from_public_key( public_key, xpx::protocol::network_type::not_supported );
  ASSERT_FALSE( addr );
  EXPECT_EQ( addr.error(), xpx::protocol::protocol_errc::invalid_address );

  addr = xpx::protocol::address_from_public_key( public_key, xpx::protocol::network_type::alias_address );
  ASSERT_FALSE( addr );
  EXPECT_EQ( addr.error(), xpx::protocol::protocol_errc::invalid_address );

  auto key = xpx::encode::from_hex( public_key );
  ASSERT_TRUE( key );

  xpx::protocol::public_key_data data{};
  std::ranges::copy( *key, data.begin() );

  addr = xpx::protocol::address_from_public_key( data, xpx::protocol::network_type::alias_address );
  ASSERT_FALSE( addr );
  EXPECT_EQ( addr.error(), xpx::protocol::protocol_errc::invalid_address );
}

TEST( address, from_namespace )
{
  auto id   = xpx::protocol::namespace_id::unchecked( 0xbffb42a19116bdf6 );
  auto addr = xpx::protocol::address_from_namespace( id );
  ASSERT_TRUE( addr );

  EXPECT_EQ( addr->plain(), "SH3L2FURUFBPXPYAAAAAAAAAAAAAAAAAAAAAAAAA" );
  EXPECT_EQ( addr->network(), xpx::protocol::network_type::alias_address );
  EXPECT_TRUE( addr->alias() );
  EXPECT_EQ( addr->bytes().front(), std::byte{ 0x91 } );
  EXPECT_TRUE( std::all_of( addr->bytes().begin() + 9,
                            addr->bytes().end(),
                            []( std::byte b )
                            {
                              return b == std::byte{ 0x00 };
                            } ) );

  auto verified = xpx::protocol::verify_checksum( *addr );
  EXPECT_TRUE( verified );
}

TEST( address, from_namespace_is_injective )
{
  std::set< std::string > texts;
  std::vector< xpx::protocol::namespace_id > ids{ xpx::protocol::root_namespace_parent };

  for( auto name: { "a"sv, "b"sv, "a.b"sv, "a.b.c"sv, "prx"sv, "prx.xpx"sv } )
  {
    auto id = xpx::protocol::namespace_id_from_name( name );
    ASSERT_TRUE( id );
    ids.push_back( *id );
  }

  for( const auto& id: ids )
  {
    auto addr = xpx::protocol::address_from_namespace( id );
    ASSERT_TRUE( addr );
    EXPECT_EQ( addr->bytes().front(), xpx::protocol::version_byte( xpx::protocol::network_type::alias_address ) );
    texts.insert( addr->plain() );
  }

  EXPECT_EQ( texts.size(), ids.size() );
}

TEST( address, parse_round_trip )
{
  auto key_derived = xpx::protocol::address_from_public_key( public_key, xpx::protocol::network_type::public_network );
  auto alias       = xpx::protocol::address_from_namespace( xpx::protocol::namespace_id::unchecked( 0x84b3552d375ffa4b ) );
  ASSERT_TRUE( key_derived );
  ASSERT_TRUE( alias );

  for( const auto& addr: { *key_derived, *alias } )
  {
    auto parsed = xpx::protocol::parse_address( addr.plain() );
    ASSERT_TRUE( parsed );
    EXPECT_EQ( *parsed, addr );
    EXPECT_EQ( parsed->network(), addr.network() );
  }
}

TEST( address, parse_normalizes )
{
  auto parsed = xpx::protocol::parse_address( "sctvw2-3d2mn5-ve4aq4-tzidze-ngnozx-prprli-kcf2"sv );
  ASSERT_TRUE( parsed );
  EXPECT_EQ( parsed->plain(), mijin_test_text );
  EXPECT_EQ( xpx::protocol::normalize_address( "sctvw2-3d2mn5" ), "SCTVW23D2MN5" );
}

TEST( address, pretty )
{
  auto parsed = xpx::protocol::parse_address( mijin_test_text );
  ASSERT_TRUE( parsed );

  auto pretty = parsed->pretty();
  EXPECT_EQ( pretty, "SCTVW2-3D2MN5-VE4AQ4-TZIDZE-NGNOZX-PRPRLI-KCF2" );
  EXPECT_EQ( xpx::protocol::normalize_address( pretty ), parsed->plain() );

  auto reparsed = xpx::protocol::parse_address( pretty );
  ASSERT_TRUE( reparsed );
  EXPECT_EQ( *reparsed, *parsed );
}

TEST( address, parse_errors )
{
  for( auto text: { ""sv,
                    "SCTVW23D2MN5VE4AQ4TZIDZENGNOZXPRPRLIKCF"sv,
                    "SCTVW23D2MN5VE4AQ4TZIDZENGNOZXPRPRLIKCF2A"sv,
                    "SCTVW23D2MN5VE4AQ4TZIDZENGNOZXPRPRLIKCF1"sv,
                    "ACTVW23D2MN5VE4AQ4TZIDZENGNOZXPRPRLIKCF2"sv } )
  {
    auto parsed = xpx::protocol::parse_address( text );
    ASSERT_FALSE( parsed ) << text;
    EXPECT_EQ( parsed.error(), xpx::protocol::protocol_errc::invalid_address ) << text;
  }
}

TEST( address, checksum_verification )
{
  auto parsed = xpx::protocol::parse_address( mijin_test_text );
  ASSERT_TRUE( parsed );
  EXPECT_TRUE( xpx::protocol::verify_checksum( *parsed ) );

  for( std::size_t i = xpx::protocol::address_header_length; i < xpx::protocol::address_length; ++i )
  {
    auto bytes = parsed->bytes();
    bytes[ i ] ^= std::byte{ 0x01 };

    auto tampered = xpx::protocol::parse_address( xpx::encode::to_base32( bytes ) );
    ASSERT_TRUE( tampered ) << i;

    auto verified = xpx::protocol::verify_checksum( *tampered );
    ASSERT_FALSE( verified ) << i;
    EXPECT_EQ( verified.error(), xpx::protocol::protocol_errc::checksum_mismatch );
  }
}

TEST( address, encoded )
{
  auto addr = xpx::protocol::address_from_encoded( "90a75b6b63d31bda93808727940f24699aecddf17c568508ba"sv );
  ASSERT_TRUE( addr );
  EXPECT_EQ( addr->plain(), mijin_test_text );

  auto prefixed = xpx::protocol::address_from_encoded( addr->encoded() );
  ASSERT_TRUE( prefixed );
  EXPECT_EQ( *prefixed, *addr );

  auto bad = xpx::protocol::address_from_encoded( "90a75b"sv );
  ASSERT_FALSE( bad );
  EXPECT_EQ( bad.error(), xpx::protocol::protocol_errc::invalid_address );

  std::vector< std::string > hexes{ "90a75b6b63d31bda93808727940f24699aecddf17c568508ba",
                                    "914bfa5f372d55b38400000000000000000000000000000000" };
  auto addresses = xpx::protocol::addresses_from_encoded( hexes );
  ASSERT_TRUE( addresses );
  ASSERT_EQ( addresses->size(), 2 );
  EXPECT_EQ( addresses->at( 1 ).plain(), "SFF7UXZXFVK3HBAAAAAAAAAAAAAAAAAAAAAAAAAA" );

  hexes.emplace_back( "zz" );
  addresses = xpx::protocol::addresses_from_encoded( hexes );
  ASSERT_FALSE( addresses );
  EXPECT_EQ( addresses.error(), xpx::protocol::protocol_errc::invalid_address );
}

// NOLINTEND
