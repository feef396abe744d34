#include <base58check/crypto/hash.hpp>
#include <base58check/memory.hpp>

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace base58check::crypto {

namespace detail {

template< std::size_t N >
std::array< std::byte, N > digest( const EVP_MD* md, std::span< const std::byte > s )
{
  if( !md )
    throw std::runtime_error( "unknown openssl hash id" );

  if( EVP_MD_size( md ) != static_cast< int >( N ) )
    throw std::runtime_error( "OpenSSL digest size does not match expected hash size" );

  std::unique_ptr< EVP_MD_CTX, decltype( &EVP_MD_CTX_free ) > mdctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
  if( !mdctx )
    throw std::runtime_error( "EVP_MD_CTX_new returned failure" );

  if( !EVP_DigestInit_ex( mdctx.get(), md, nullptr ) )
    throw std::runtime_error( "EVP_DigestInit_ex returned failure" );

  if( !EVP_DigestUpdate( mdctx.get(), s.data(), s.size() ) )
    throw std::runtime_error( "EVP_DigestUpdate returned failure" );

  std::array< std::byte, N > out{};
  unsigned int size = 0;

  if( !EVP_DigestFinal_ex( mdctx.get(), memory::pointer_cast< unsigned char* >( out.data() ), &size ) )
    throw std::runtime_error( "EVP_DigestFinal_ex returned failure" );

  if( size != N )
    throw std::runtime_error( "OpenSSL EVP_DigestFinal_ex returned hash size does not match expected hash size" );

  return out;
}

} // namespace detail

sha256_digest sha256( std::span< const std::byte > s )
{
  return detail::digest< sha256_length >( EVP_sha256(), s );
}

ripemd160_digest ripemd160( std::span< const std::byte > s )
{
  return detail::digest< ripemd160_length >( EVP_ripemd160(), s );
}

sha256_digest hash256( std::span< const std::byte > s )
{
  return sha256( sha256( s ) );
}

ripemd160_digest hash160( std::span< const std::byte > s )
{
  return ripemd160( sha256( s ) );
}

} // namespace base58check::crypto
