#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <print>
#include <ranges>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

#include <xpx/config.hpp>
#include <xpx/log.hpp>
#include <xpx/protocol.hpp>

namespace {

int print_namespace( std::string_view name )
{
  auto path = xpx::protocol::derive_namespace_path( name );
  if( !path )
  {
    LOG_ERROR( xpx::log::instance(), "Invalid namespace '{}': {}", name, path.error().message() );
    return EXIT_FAILURE;
  }

  auto levels = name | std::views::split( xpx::protocol::namespace_separator );
  for( const auto& [ level, id ]: std::views::zip( levels, *path ) )
    std::println( "{} {}", std::string_view( level.begin(), level.end() ), id.to_hex() );

  auto alias = xpx::protocol::address_from_namespace( path->back() );
  if( !alias )
  {
    LOG_ERROR( xpx::log::instance(), "Unable to alias namespace '{}': {}", name, alias.error().message() );
    return EXIT_FAILURE;
  }

  std::println( "alias {}", alias->plain() );
  return EXIT_SUCCESS;
}

int print_public_key( std::string_view public_key, xpx::protocol::network_type network )
{
  auto addr = xpx::protocol::address_from_public_key( public_key, network );
  if( !addr )
  {
    LOG_ERROR( xpx::log::instance(), "Invalid public key '{}': {}", public_key, addr.error().message() );
    return EXIT_FAILURE;
  }

  LOG_INFO( xpx::log::instance(),
            "Derived {} address {}",
            xpx::protocol::to_string( network ),
            xpx::log::hex{ addr->bytes().data(), addr->bytes().size() } );
  std::println( "{}", addr->plain() );
  std::println( "{}", addr->pretty() );
  return EXIT_SUCCESS;
}

int print_address( std::string_view text, bool verify )
{
  auto addr = xpx::protocol::parse_address( text );
  if( !addr )
  {
    LOG_ERROR( xpx::log::instance(), "Invalid address '{}': {}", text, addr.error().message() );
    return EXIT_FAILURE;
  }

  LOG_INFO( xpx::log::instance(),
            "Decoded {} address {}",
            xpx::protocol::to_string( addr->network() ),
            xpx::log::base32{ addr->bytes().data(), addr->bytes().size() } );

  std::println( "network: {}", xpx::protocol::to_string( addr->network() ) );
  std::println( "plain:   {}", addr->plain() );
  std::println( "pretty:  {}", addr->pretty() );
  std::println( "encoded: {}", addr->encoded() );

  if( verify )
  {
    if( auto valid = xpx::protocol::verify_checksum( *addr ); !valid )
    {
      LOG_ERROR( xpx::log::instance(), "Address {} failed verification: {}", addr->plain(), valid.error().message() );
      return EXIT_FAILURE;
    }

    std::println( "checksum: ok" );
  }

  return EXIT_SUCCESS;
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  xpx::log::initialize();

  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( "help,h"      , "Print this help message and exit" )
    ( "version,v"   , "Print version string and exit" )
    ( "config,c"    , boost::program_options::value< std::string >(), "Client configuration file" )
    ( "namespace,n" , boost::program_options::value< std::string >(), "Derive the ids of a dotted namespace name" )
    ( "public-key,k", boost::program_options::value< std::string >(), "Derive the address of a hex public key" )
    ( "network"     , boost::program_options::value< std::string >(), "Network of derived addresses (e.g. mijin-test)" )
    ( "address,a"   , boost::program_options::value< std::string >(), "Decode an address in plain or pretty form" )
    ( "verify"      , "Verify the checksum of the decoded address" );
  // clang-format on

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );
  }
  catch( const boost::program_options::error& e )
  {
    LOG_ERROR( xpx::log::instance(), "Invalid arguments: {}", e.what() );
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    options.print( std::cout );
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::println( "v0.0.1" );
    return EXIT_SUCCESS;
  }

  auto network     = xpx::protocol::network_type::mijin_test;
  bool config_only = false;

  if( args.count( "config" ) )
  {
    const std::filesystem::path path = args[ "config" ].as< std::string >();
    auto conf                        = xpx::config::load( path );
    if( !conf )
    {
      LOG_ERROR( xpx::log::instance(), "Unable to load {}: {}", path.string(), conf.error().message() );
      return EXIT_FAILURE;
    }

    network = conf->network();
    std::println( "network: {}", xpx::protocol::to_string( network ) );
    LOG_INFO( xpx::log::instance(),
              "Using gateway {} on network {}",
              conf->used_base_url(),
              xpx::protocol::to_string( network ) );

    config_only = true;
  }

  if( args.count( "network" ) )
  {
    const std::string name = args[ "network" ].as< std::string >();
    auto type              = xpx::protocol::network_type_from_string( name );
    if( !type )
    {
      LOG_ERROR( xpx::log::instance(), "Unknown network '{}'", name );
      return EXIT_FAILURE;
    }
    network = *type;
  }

  if( args.count( "namespace" ) )
    return print_namespace( args[ "namespace" ].as< std::string >() );

  if( args.count( "public-key" ) )
    return print_public_key( args[ "public-key" ].as< std::string >(), network );

  if( args.count( "address" ) )
    return print_address( args[ "address" ].as< std::string >(), args.count( "verify" ) > 0 );

  if( config_only )
    return EXIT_SUCCESS;

  options.print( std::cout );
  return EXIT_FAILURE;
}
