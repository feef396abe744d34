#include <base58check/encode/alphabet.hpp>

#include <array>
#include <limits>

namespace base58check::encode {

namespace {

constexpr std::int8_t no_digit = -1;

constexpr auto digit_map = []()
{
  std::array< std::int8_t, std::numeric_limits< unsigned char >::max() + 1 > map{};
  map.fill( no_digit );

  for( std::size_t i = 0; i < alphabet.size(); ++i )
    map[ static_cast< unsigned char >( alphabet[ i ] ) ] = static_cast< std::int8_t >( i );

  return map;
}();

} // namespace

result< char > digit_to_char( std::uint8_t digit ) noexcept
{
  if( digit >= base )
    return std::unexpected( encode_errc::invalid_digit );

  return alphabet[ digit ];
}

result< std::uint8_t > char_to_digit( char c ) noexcept
{
  auto digit = digit_map[ static_cast< unsigned char >( c ) ];
  if( digit == no_digit )
    return std::unexpected( encode_errc::invalid_character );

  return static_cast< std::uint8_t >( digit );
}

bool validate_alphabet( std::string_view sv ) noexcept
{
  for( auto c: sv )
  {
    if( digit_map[ static_cast< unsigned char >( c ) ] == no_digit )
      return false;
  }

  return true;
}

result< std::vector< std::uint8_t > > to_digits( std::string_view sv ) noexcept
{
  std::vector< std::uint8_t > digits;
  digits.reserve( sv.size() );

  for( auto c: sv )
  {
    if( auto digit = char_to_digit( c ); digit )
      digits.push_back( *digit );
    else
      return std::unexpected( digit.error() );
  }

  return digits;
}

result< std::string > to_chars( std::span< const std::uint8_t > digits ) noexcept
{
  std::string chars;
  chars.reserve( digits.size() );

  for( auto d: digits )
  {
    if( auto c = digit_to_char( d ); c )
      chars.push_back( *c );
    else
      return std::unexpected( c.error() );
  }

  return chars;
}

} // namespace base58check::encode
