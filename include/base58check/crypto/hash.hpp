#pragma once

#include <array>
#include <cstddef>
#include <span>

namespace base58check::crypto {

constexpr std::size_t sha256_length    = 32;
constexpr std::size_t ripemd160_length = 20;

using sha256_digest    = std::array< std::byte, sha256_length >;
using ripemd160_digest = std::array< std::byte, ripemd160_length >;

sha256_digest sha256( std::span< const std::byte > s );
ripemd160_digest ripemd160( std::span< const std::byte > s );

// sha256( sha256( s ) )
sha256_digest hash256( std::span< const std::byte > s );

// ripemd160( sha256( s ) )
ripemd160_digest hash160( std::span< const std::byte > s );

} // namespace base58check::crypto
