#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <base58check/version/error.hpp>

namespace base58check::version {

// https://en.bitcoin.it/wiki/List_of_address_prefixes
enum class version_tag : std::uint8_t // NOLINT(performance-enum-size)
{
  p2pkh,
  p2sh,
  wif,
  bip32_pubkey,
  bip32_privkey,
  testnet_p2pkh,
  testnet_p2sh,
  testnet_wif,
  testnet_bip32_pubkey,
  testnet_bip32_privkey
};

constexpr std::size_t max_prefix_length = 4;

struct version_entry
{
  version_tag tag;
  std::string_view name;
  std::array< std::byte, max_prefix_length > data;
  std::size_t length;

  constexpr std::span< const std::byte > prefix() const noexcept
  {
    return std::span< const std::byte >( data.data(), length );
  }
};

/**
 * Any of the accepted ways of naming a version prefix:
 *  - a symbolic tag name, e.g. "bip32_pubkey"
 *  - an integer, converted to its minimal big-endian bytes, e.g. 0x0488B21E
 *  - a list of byte values, e.g. { 4, 136, 178, 30 }
 *  - the raw prefix bytes
 */
using version_spec = std::variant< std::string, std::uint64_t, std::vector< std::uint8_t >, std::vector< std::byte > >;

struct resolved_version
{
  std::optional< version_tag > tag;
  std::vector< std::byte > prefix;

  bool operator==( const resolved_version& ) const = default;
};

std::span< const version_entry > entries() noexcept;

std::string_view to_string( version_tag tag ) noexcept;
std::optional< version_tag > from_string( std::string_view name ) noexcept;

// Comma separated names of every known tag, in table order
std::string known_tags();

std::span< const std::byte > prefix_of( version_tag tag ) noexcept;
std::optional< version_tag > tag_for_prefix( std::span< const std::byte > prefix ) noexcept;

std::vector< std::byte > to_prefix( std::uint64_t value );

/**
 * Normalize a version specifier to its canonical prefix bytes.
 *
 * Only a symbolic name that is not in the table is an error. Prefix bytes
 * without a matching tag resolve with an empty tag.
 */
result< resolved_version > resolve( const version_spec& spec );

/**
 * Find the known prefix at the start of a versioned payload.
 *
 * Entries are tried in table order. The table is prefix free, so at most one
 * entry can match. With no match the tag is empty and so is the prefix.
 */
resolved_version match_prefix( std::span< const std::byte > versioned_payload );

} // namespace base58check::version
