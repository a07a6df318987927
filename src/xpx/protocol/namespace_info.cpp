#include <xpx/protocol/namespace_info.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace xpx::protocol {

std::optional< namespace_id > namespace_info::parent_id() const
{
  if( levels.size() < 2 )
    return std::nullopt;

  return levels[ levels.size() - 2 ];
}

namespace_ids::namespace_ids( std::vector< namespace_id > ids ) noexcept:
    _ids( std::move( ids ) )
{}

result< namespace_ids > namespace_ids::from_strings( std::span< const std::string > strings )
{
  std::vector< namespace_id > ids;
  ids.reserve( strings.size() );

  for( const auto& s: strings )
  {
    auto id = namespace_id::from_hex( s );
    if( !id )
      return std::unexpected( id.error() );

    ids.push_back( *id );
  }

  return namespace_ids( std::move( ids ) );
}

std::vector< std::string > namespace_ids::to_strings() const
{
  std::vector< std::string > strings;
  strings.reserve( _ids.size() );
  std::ranges::transform( _ids, std::back_inserter( strings ), &namespace_id::to_hex );
  return strings;
}

const std::vector< namespace_id >& namespace_ids::ids() const noexcept
{
  return _ids;
}

bool namespace_ids::empty() const noexcept
{
  return _ids.empty();
}

std::size_t namespace_ids::size() const noexcept
{
  return _ids.size();
}

} // namespace xpx::protocol
