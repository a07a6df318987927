#include <xpx/crypto/hash.hpp>
#include <xpx/memory/memory.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace xpx::crypto {

using md_context = std::unique_ptr< EVP_MD_CTX, decltype( &EVP_MD_CTX_free ) >;

template< std::size_t N >
static std::array< std::byte, N > evp_digest( const EVP_MD* md, std::span< const std::byte > s )
{
  if( md == nullptr )
    throw std::runtime_error( "message digest is unavailable" );

  if( static_cast< std::size_t >( EVP_MD_get_size( md ) ) != N )
    throw std::runtime_error( std::string( "unexpected digest size for " ) + EVP_MD_get0_name( md ) );

  md_context ctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
  if( !ctx )
    throw std::runtime_error( "failed to allocate digest context" );

  if( EVP_DigestInit_ex( ctx.get(), md, nullptr ) != 1 )
    throw std::runtime_error( "digest initialization failed" );

  if( EVP_DigestUpdate( ctx.get(), s.data(), s.size() ) != 1 )
    throw std::runtime_error( "digest update failed" );

  std::array< std::byte, N > out{};
  unsigned int out_len = 0;
  if( EVP_DigestFinal_ex( ctx.get(), memory::pointer_cast< unsigned char* >( out.data() ), &out_len ) != 1 )
    throw std::runtime_error( "digest finalization failed" );

  return out;
}

digest sha3_256( std::span< const std::byte > s )
{
  return evp_digest< digest_length >( EVP_sha3_256(), s );
}

digest sha3_256( std::string_view sv )
{
  return sha3_256( memory::as_bytes( sv ) );
}

ripemd160_digest ripemd160( std::span< const std::byte > s )
{
  return evp_digest< ripemd160_digest_length >( EVP_ripemd160(), s );
}

ripemd160_digest ripemd160( std::string_view sv )
{
  return ripemd160( memory::as_bytes( sv ) );
}

} // namespace xpx::crypto
