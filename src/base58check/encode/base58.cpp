#include <base58check/encode/alphabet.hpp>
#include <base58check/encode/base58.hpp>
#include <base58check/memory.hpp>

#include <algorithm>
#include <iterator>

#include <boost/multiprecision/cpp_int.hpp>

namespace base58check::encode {

using boost::multiprecision::cpp_int;

constexpr unsigned bits_per_byte = 8;

std::vector< std::uint8_t > bytes_to_digits( std::span< const std::byte > bytes )
{
  std::vector< std::uint8_t > digits;
  if( bytes.empty() )
    return digits;

  const auto* first = memory::pointer_cast< const std::uint8_t* >( bytes.data() );

  cpp_int value;
  boost::multiprecision::import_bits( value, first, first + bytes.size(), bits_per_byte );

  const cpp_int divisor( base );
  cpp_int quotient, remainder;

  while( value > 0 )
  {
    boost::multiprecision::divide_qr( value, divisor, quotient, remainder );
    digits.push_back( static_cast< std::uint8_t >( remainder ) );
    value.swap( quotient );
  }

  std::ranges::reverse( digits );
  return digits;
}

std::vector< std::byte > digits_to_bytes( std::span< const std::uint8_t > digits )
{
  cpp_int value;
  for( auto d: digits )
  {
    value *= base;
    value += d;
  }

  std::vector< std::byte > bytes;
  if( value == 0 )
    return bytes;

  std::vector< std::uint8_t > raw;
  boost::multiprecision::export_bits( value, std::back_inserter( raw ), bits_per_byte );

  bytes.reserve( raw.size() );
  for( auto b: raw )
    bytes.push_back( std::byte{ b } );

  return bytes;
}

std::string to_base58( std::span< const std::byte > s ) noexcept
{
  auto zeros = static_cast< std::size_t >( std::ranges::distance(
    s.begin(),
    std::ranges::find_if( s,
                          []( std::byte b )
                          {
                            return b != std::byte{ 0x00 };
                          } ) ) );

  std::string encoded( zeros, zero_symbol );

  for( auto d: bytes_to_digits( s.subspan( zeros ) ) )
    encoded.push_back( alphabet[ d ] );

  return encoded;
}

result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept
{
  auto zeros = std::min( sv.find_first_not_of( zero_symbol ), sv.size() );

  auto digits = to_digits( sv.substr( zeros ) );
  if( !digits )
    return std::unexpected( digits.error() );

  std::vector< std::byte > bytes( zeros, std::byte{ 0x00 } );
  std::ranges::copy( digits_to_bytes( *digits ), std::back_inserter( bytes ) );

  return bytes;
}

} // namespace base58check::encode
