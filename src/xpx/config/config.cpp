#include <xpx/config/config.hpp>
#include <xpx/log.hpp>

#include <algorithm>
#include <utility>

#include <boost/url.hpp>

namespace xpx::config {

namespace constants {

constexpr auto base_urls_key               = "base-urls";
constexpr auto network_type_key            = "network-type";
constexpr auto ws_reconnection_timeout_key = "ws-reconnection-timeout";
constexpr auto reputation_key              = "reputation";
constexpr auto min_interactions_key        = "min-interactions";
constexpr auto default_reputation_key      = "default-reputation";

} // namespace constants

namespace {

// Missing keys take the fallback, malformed values throw YAML::BadConversion
template< typename T >
T value_or( const YAML::Node& node, const T& fallback )
{
  if( !node )
    return fallback;

  return node.as< T >();
}

} // namespace

reputation_config::reputation_config( std::uint64_t min_interactions, double default_reputation ) noexcept:
    _min_interactions( min_interactions ),
    _default_reputation( default_reputation )
{}

result< reputation_config > reputation_config::create( std::uint64_t min_interactions,
                                                       double default_reputation ) noexcept
{
  if( !( default_reputation >= 0.0 && default_reputation <= 1.0 ) )
    return std::unexpected( config_errc::invalid_reputation );

  return reputation_config( min_interactions, default_reputation );
}

std::uint64_t reputation_config::min_interactions() const noexcept
{
  return _min_interactions;
}

double reputation_config::default_reputation() const noexcept
{
  return _default_reputation;
}

bool is_valid_base_url( std::string_view url ) noexcept
{
  auto parsed = boost::urls::parse_uri( url );
  if( !parsed )
    return false;

  const boost::urls::url_view& view = *parsed;
  return view.has_scheme() && view.has_authority() && !view.encoded_host().empty();
}

result< client_config > client_config::create( std::vector< std::string > base_urls,
                                               protocol::network_type network,
                                               std::chrono::milliseconds ws_reconnection_timeout,
                                               reputation_config reputation )
{
  if( base_urls.empty() )
    return std::unexpected( config_errc::empty_base_urls );

  if( !std::ranges::all_of( base_urls, is_valid_base_url ) )
    return std::unexpected( config_errc::invalid_base_url );

  if( network == protocol::network_type::not_supported || network == protocol::network_type::alias_address )
    return std::unexpected( config_errc::invalid_network_type );

  if( ws_reconnection_timeout == std::chrono::milliseconds::zero() )
    ws_reconnection_timeout = default_ws_reconnection_timeout;

  client_config conf;
  conf._base_urls               = std::move( base_urls );
  conf._network                 = network;
  conf._ws_reconnection_timeout = ws_reconnection_timeout;
  conf._reputation              = reputation;
  return conf;
}

const std::vector< std::string >& client_config::base_urls() const noexcept
{
  return _base_urls;
}

const std::string& client_config::used_base_url() const noexcept
{
  return _base_urls.front();
}

protocol::network_type client_config::network() const noexcept
{
  return _network;
}

std::chrono::milliseconds client_config::ws_reconnection_timeout() const noexcept
{
  return _ws_reconnection_timeout;
}

const reputation_config& client_config::reputation() const noexcept
{
  return _reputation;
}

result< client_config > load( const YAML::Node& node )
{
  try
  {
    std::vector< std::string > base_urls;
    if( auto urls = node[ constants::base_urls_key ]; urls )
    {
      if( urls.IsSequence() )
        base_urls = urls.as< std::vector< std::string > >();
      else
        base_urls.push_back( urls.as< std::string >() );
    }

    auto network =
      protocol::network_type_from_string( value_or< std::string >( node[ constants::network_type_key ], "" ) );
    if( !network )
      return std::unexpected( config_errc::invalid_network_type );

    auto timeout =
      std::chrono::milliseconds( value_or< std::int64_t >( node[ constants::ws_reconnection_timeout_key ], 0 ) );
    if( timeout < std::chrono::milliseconds::zero() )
      return std::unexpected( config_errc::parse_error );

    reputation_config reputation;
    if( auto rep = node[ constants::reputation_key ]; rep )
    {
      auto rep_config =
        reputation_config::create( value_or( rep[ constants::min_interactions_key ], default_min_interactions ),
                                   value_or( rep[ constants::default_reputation_key ], default_reputation ) );
      if( !rep_config )
        return std::unexpected( rep_config.error() );

      reputation = *rep_config;
    }

    return client_config::create( std::move( base_urls ), *network, timeout, reputation );
  }
  catch( const YAML::Exception& e )
  {
    LOG_DEBUG( xpx::log::instance(), "Unable to read configuration: {}", e.what() );
    return std::unexpected( config_errc::parse_error );
  }
}

result< client_config > load( const std::filesystem::path& path )
{
  if( !std::filesystem::exists( path ) )
    return std::unexpected( config_errc::file_not_found );

  LOG_DEBUG( xpx::log::instance(), "Loading configuration from {}", path.string() );

  YAML::Node node;
  try
  {
    node = YAML::LoadFile( path.string() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_DEBUG( xpx::log::instance(), "Unable to parse {}: {}", path.string(), e.what() );
    return std::unexpected( config_errc::parse_error );
  }

  return load( node );
}

} // namespace xpx::config
