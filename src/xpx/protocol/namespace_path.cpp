#include <xpx/protocol/namespace_path.hpp>

#include <algorithm>
#include <ranges>
#include <vector>

#include <boost/endian.hpp>

#include <xpx/crypto/hash.hpp>
#include <xpx/memory/memory.hpp>

namespace xpx::protocol {

static constexpr bool is_name_char( char c ) noexcept
{
  return ( c >= 'a' && c <= 'z' ) || ( c >= '0' && c <= '9' );
}

bool is_valid_namespace_name( std::string_view name ) noexcept
{
  if( name.empty() || !is_name_char( name.front() ) )
    return false;

  return std::ranges::all_of( name.substr( 1 ),
                              []( char c )
                              {
                                return is_name_char( c ) || c == '_' || c == '-';
                              } );
}

namespace_id derive_namespace_id( std::string_view name, const namespace_id& parent )
{
  const auto parent_id    = boost::endian::native_to_little( parent.id() );
  const auto parent_bytes = memory::as_bytes( parent_id );
  const auto name_bytes   = memory::as_bytes( name );

  std::vector< std::byte > buffer;
  buffer.reserve( parent_bytes.size() + name_bytes.size() );
  buffer.insert( buffer.end(), parent_bytes.begin(), parent_bytes.end() );
  buffer.insert( buffer.end(), name_bytes.begin(), name_bytes.end() );

  auto digest = crypto::sha3_256( buffer );

  auto id = memory::bit_cast< std::uint64_t >( digest );
  boost::endian::little_to_native_inplace( id );

  return namespace_id::unchecked( id | namespace_bit );
}

result< namespace_path > derive_namespace_path( std::string_view name )
{
  std::vector< std::string_view > parts;
  for( auto part: name | std::views::split( namespace_separator ) )
    parts.emplace_back( part.begin(), part.end() );

  if( parts.empty() )
    return std::unexpected( protocol_errc::invalid_name );

  if( parts.size() > max_namespace_depth )
    return std::unexpected( protocol_errc::too_many_parts );

  namespace_path path;
  path.reserve( parts.size() );

  namespace_id parent = root_namespace_parent;
  for( const auto& part: parts )
  {
    if( !is_valid_namespace_name( part ) )
      return std::unexpected( protocol_errc::invalid_name );

    parent = derive_namespace_id( part, parent );
    path.push_back( parent );
  }

  return path;
}

result< namespace_id > namespace_id_from_name( std::string_view name )
{
  return derive_namespace_path( name ).transform(
    []( const namespace_path& path )
    {
      return path.back();
    } );
}

} // namespace xpx::protocol
