#include <xpx/crypto/checksum.hpp>
#include <xpx/crypto/hash.hpp>

#include <algorithm>

namespace xpx::crypto {

checksum_data checksum( std::span< const std::byte > s )
{
  auto hash = sha3_256( s );

  checksum_data out{};
  std::copy_n( hash.begin(), checksum_length, out.begin() );
  return out;
}

} // namespace xpx::crypto
