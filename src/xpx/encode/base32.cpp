#include <xpx/encode/base32.hpp>

#include <array>
#include <cstdint>

namespace xpx::encode {

constexpr std::string_view base32_alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr char base32_padding              = '=';
constexpr std::size_t bits_per_char        = 5;
constexpr std::size_t chars_per_block      = 8;
constexpr std::uint32_t char_mask          = 0x1f;
constexpr std::int8_t invalid_char         = -1;

static constexpr auto base32_decode_table = []()
{
  std::array< std::int8_t, 256 > table{};
  table.fill( invalid_char );
  for( std::size_t i = 0; i < base32_alphabet.size(); ++i )
    table[ static_cast< unsigned char >( base32_alphabet[ i ] ) ] = static_cast< std::int8_t >( i );
  return table;
}();

std::string to_base32( std::span< const std::byte > s ) noexcept
{
  std::string out;
  out.reserve( ( s.size() + 4 ) / 5 * chars_per_block );

  std::uint32_t buffer  = 0;
  std::size_t bits_left = 0;

  for( const auto& b: s )
  {
    buffer     = ( buffer << 8 ) | std::to_integer< std::uint32_t >( b );
    bits_left += 8;

    while( bits_left >= bits_per_char )
    {
      out.push_back( base32_alphabet[ ( buffer >> ( bits_left - bits_per_char ) ) & char_mask ] );
      bits_left -= bits_per_char;
    }
  }

  if( bits_left )
    out.push_back( base32_alphabet[ ( buffer << ( bits_per_char - bits_left ) ) & char_mask ] );

  while( out.size() % chars_per_block )
    out.push_back( base32_padding );

  return out;
}

result< std::vector< std::byte > > from_base32( std::string_view sv ) noexcept
{
  std::size_t padding = 0;
  while( sv.size() > padding && sv[ sv.size() - padding - 1 ] == base32_padding )
    ++padding;

  if( padding && ( sv.size() % chars_per_block != 0 || padding >= chars_per_block ) )
    return std::unexpected( encode_errc::invalid_padding );

  sv.remove_suffix( padding );

  // A trailing group of 1, 3 or 6 characters cannot come from whole bytes
  switch( sv.size() % chars_per_block )
  {
    case 1:
    case 3:
    case 6:
      return std::unexpected( encode_errc::invalid_length );
    default:
      break;
  }

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() * bits_per_char / 8 );

  std::uint32_t buffer  = 0;
  std::size_t bits_left = 0;

  for( char c: sv )
  {
    auto value = base32_decode_table[ static_cast< unsigned char >( c ) ];
    if( value == invalid_char )
      return std::unexpected( encode_errc::invalid_character );

    buffer     = ( buffer << bits_per_char ) | static_cast< std::uint32_t >( value );
    bits_left += bits_per_char;

    if( bits_left >= 8 )
    {
      bytes.push_back( static_cast< std::byte >( ( buffer >> ( bits_left - 8 ) ) & 0xff ) );
      bits_left -= 8;
    }
  }

  return bytes;
}

} // namespace xpx::encode
