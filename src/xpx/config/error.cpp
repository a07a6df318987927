#include <xpx/config/error.hpp>

#include <string>
#include <utility>

namespace xpx::config {

struct _config_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "config";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< config_errc >( condition ) )
    {
      case config_errc::ok:
        return "ok"s;
      case config_errc::empty_base_urls:
        return "empty base urls"s;
      case config_errc::invalid_base_url:
        return "invalid base url"s;
      case config_errc::invalid_network_type:
        return "invalid network type"s;
      case config_errc::invalid_reputation:
        return "default reputation must be between 0 and 1"s;
      case config_errc::file_not_found:
        return "configuration file not found"s;
      case config_errc::parse_error:
        return "configuration parse error"s;
    }
    std::unreachable();
  }
};

const std::error_category& config_category() noexcept
{
  static _config_category category;
  return category;
}

std::error_code make_error_code( config_errc e )
{
  return std::error_code( static_cast< int >( e ), config_category() );
}

} // namespace xpx::config
