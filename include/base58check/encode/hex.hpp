#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <base58check/encode/error.hpp>

namespace base58check::encode {

// Lowercase without prefix. from_hex accepts either case and an optional 0x.
std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace base58check::encode
