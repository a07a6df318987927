#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <xpx/config/error.hpp>
#include <xpx/protocol/network_type.hpp>

namespace xpx::config {

constexpr std::chrono::milliseconds default_ws_reconnection_timeout{ 5'000 };
constexpr std::uint64_t default_min_interactions = 10;
constexpr double default_reputation              = 0.9;

class reputation_config
{
public:
  reputation_config() noexcept = default;

  static result< reputation_config > create( std::uint64_t min_interactions, double default_reputation ) noexcept;

  std::uint64_t min_interactions() const noexcept;
  double default_reputation() const noexcept;

  bool operator==( const reputation_config& ) const = default;

private:
  reputation_config( std::uint64_t min_interactions, double default_reputation ) noexcept;

  std::uint64_t _min_interactions = config::default_min_interactions;
  double _default_reputation      = config::default_reputation;
};

/**
 * Connection settings for a client of the REST gateway.
 *
 * The first base url is the one in use, the rest are failover candidates.
 * A zero reconnection timeout selects the default.
 */
class client_config
{
public:
  static result< client_config >
  create( std::vector< std::string > base_urls,
          protocol::network_type network,
          std::chrono::milliseconds ws_reconnection_timeout = std::chrono::milliseconds::zero(),
          reputation_config reputation                      = {} );

  const std::vector< std::string >& base_urls() const noexcept;
  const std::string& used_base_url() const noexcept;
  protocol::network_type network() const noexcept;
  std::chrono::milliseconds ws_reconnection_timeout() const noexcept;
  const reputation_config& reputation() const noexcept;

private:
  client_config() = default;

  std::vector< std::string > _base_urls;
  protocol::network_type _network = protocol::network_type::not_supported;
  std::chrono::milliseconds _ws_reconnection_timeout{ default_ws_reconnection_timeout };
  reputation_config _reputation;
};

bool is_valid_base_url( std::string_view url ) noexcept;

/**
 * Reads a client configuration from YAML.
 *
 *   base-urls: [ "http://localhost:3000" ]
 *   network-type: mijin-test
 *   ws-reconnection-timeout: 5000
 *   reputation:
 *     min-interactions: 10
 *     default-reputation: 0.9
 */
result< client_config > load( const YAML::Node& node );
result< client_config > load( const std::filesystem::path& path );

} // namespace xpx::config
