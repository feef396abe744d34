#include <base58check/codec/codec.hpp>
#include <base58check/crypto/checksum.hpp>
#include <base58check/encode/alphabet.hpp>
#include <base58check/encode/base58.hpp>
#include <base58check/log.hpp>

#include <algorithm>

namespace base58check::codec {

result< codec_result > encode( std::span< const std::byte > payload, const version::version_spec& spec )
{
  auto resolved = version::resolve( spec );
  if( !resolved )
    return std::unexpected( resolved.error() );

  std::vector< std::byte > buffer;
  buffer.reserve( resolved->prefix.size() + payload.size() + crypto::checksum_length );
  buffer.insert( buffer.end(), resolved->prefix.begin(), resolved->prefix.end() );
  buffer.insert( buffer.end(), payload.begin(), payload.end() );

  auto check = crypto::checksum( buffer );
  buffer.insert( buffer.end(), check.begin(), check.end() );

  return codec_result{ .encoded = encode::to_base58( buffer ),
                       .payload = std::vector< std::byte >( payload.begin(), payload.end() ),
                       .tag     = resolved->tag,
                       .prefix  = std::move( resolved->prefix ) };
}

result< codec_result > decode( std::string_view text )
{
  if( !encode::validate_alphabet( text ) )
  {
    LOG_DEBUG( log::instance(), "Rejected '{}', not a base58 string", text );
    return std::unexpected( codec_errc::incorrect_base58 );
  }

  auto bytes = encode::from_base58( text );
  if( !bytes )
    return std::unexpected( codec_errc::incorrect_base58 );

  if( bytes->size() < crypto::checksum_length )
  {
    LOG_DEBUG( log::instance(), "Rejected '{}', {} bytes cannot hold a checksum", text, bytes->size() );
    return std::unexpected( codec_errc::checksum_incorrect );
  }

  auto head = std::span< const std::byte >( *bytes ).first( bytes->size() - crypto::checksum_length );
  auto tail = std::span< const std::byte >( *bytes ).last( crypto::checksum_length );

  if( auto check = crypto::checksum( head ); !std::ranges::equal( check, tail ) )
  {
    LOG_DEBUG( log::instance(),
               "Rejected '{}', checksum {} does not match {}",
               text,
               log::hex{ tail.data(), tail.size() },
               log::hex{ check.data(), check.size() } );
    return std::unexpected( codec_errc::checksum_incorrect );
  }

  auto matched = version::match_prefix( head );
  auto payload = head.subspan( matched.prefix.size() );

  return codec_result{ .encoded = std::string( text ),
                       .payload = std::vector< std::byte >( payload.begin(), payload.end() ),
                       .tag     = matched.tag,
                       .prefix  = std::move( matched.prefix ) };
}

} // namespace base58check::codec
