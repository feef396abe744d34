#include <base58check/crypto/checksum.hpp>
#include <base58check/crypto/hash.hpp>

#include <algorithm>

namespace base58check::crypto {

static_assert( checksum_length <= sha256_length );

checksum_data checksum( std::span< const std::byte > s )
{
  auto digest = hash256( s );

  checksum_data out;
  std::copy_n( digest.begin(), checksum_length, out.begin() );
  return out;
}

} // namespace base58check::crypto
