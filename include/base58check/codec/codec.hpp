#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <base58check/codec/error.hpp>
#include <base58check/version/registry.hpp>

namespace base58check::codec {

struct codec_result
{
  std::string encoded;
  std::vector< std::byte > payload;
  std::optional< version::version_tag > tag;
  std::vector< std::byte > prefix;

  bool operator==( const codec_result& ) const = default;
};

/**
 * Encode payload as base58check under the version named by spec.
 *
 * The only failure is version::version_errc::unrecognized_version, returned
 * when spec is a symbolic name missing from the registry.
 */
result< codec_result > encode( std::span< const std::byte > payload, const version::version_spec& spec );

/**
 * Decode base58check text.
 *
 * Fails with codec_errc::incorrect_base58 if any character is outside the
 * alphabet, and with codec_errc::checksum_incorrect if the checksum does not
 * match or the decoded bytes are too short to hold one. A prefix missing from
 * the registry is not an error. The whole head is returned as payload with an
 * empty tag and prefix.
 */
result< codec_result > decode( std::string_view text );

} // namespace base58check::codec
