#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <base58check/encode/error.hpp>

namespace base58check::encode {

/**
 * Plain base58 without version prefix or checksum.
 *
 * Each leading zero byte maps to one leading zero symbol ('1') and back, the
 * remaining bytes are treated as a single big-endian unsigned integer.
 */
std::string to_base58( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept;

/**
 * Big-endian base256 <-> base58 digit conversion.
 *
 * Both directions produce the minimal representation, so zero (including an
 * empty input) converts to an empty sequence. Leading zeros are not preserved
 * here, callers handle them.
 */
std::vector< std::uint8_t > bytes_to_digits( std::span< const std::byte > bytes );
std::vector< std::byte > digits_to_bytes( std::span< const std::uint8_t > digits );

} // namespace base58check::encode
