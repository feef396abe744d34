#pragma once

#include <array>
#include <cstddef>
#include <span>

namespace base58check::crypto {

constexpr std::size_t checksum_length = 4;

using checksum_data = std::array< std::byte, checksum_length >;

// First four bytes of hash256( s ). Defined for any length, including zero.
checksum_data checksum( std::span< const std::byte > s );

} // namespace base58check::crypto
