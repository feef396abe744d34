#pragma once

#include <expected>
#include <system_error>

namespace base58check::version {

enum class version_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unrecognized_version
};

const std::error_category& version_category() noexcept;

std::error_code make_error_code( version_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace base58check::version

template<>
struct std::is_error_code_enum< base58check::version::version_errc >: public std::true_type
{};
