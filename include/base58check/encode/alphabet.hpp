#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <base58check/encode/error.hpp>

namespace base58check::encode {

// Bitcoin ordering. Omits 0, O, I and l.
constexpr std::string_view alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr std::size_t base         = alphabet.size();
constexpr char zero_symbol         = alphabet.front();

static_assert( base == 58 );

result< char > digit_to_char( std::uint8_t digit ) noexcept;
result< std::uint8_t > char_to_digit( char c ) noexcept;

bool validate_alphabet( std::string_view sv ) noexcept;

result< std::vector< std::uint8_t > > to_digits( std::string_view sv ) noexcept;
result< std::string > to_chars( std::span< const std::uint8_t > digits ) noexcept;

} // namespace base58check::encode
