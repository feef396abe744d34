#pragma once

#include <expected>
#include <system_error>

namespace base58check::codec {

enum class codec_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  incorrect_base58,
  checksum_incorrect
};

const std::error_category& codec_category() noexcept;

std::error_code make_error_code( codec_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace base58check::codec

template<>
struct std::is_error_code_enum< base58check::codec::codec_errc >: public std::true_type
{};
