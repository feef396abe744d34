#include <base58check/log.hpp>
#include <base58check/version/registry.hpp>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>

namespace base58check::version {

namespace {

constexpr version_entry
make_entry( version_tag tag, std::string_view name, std::initializer_list< std::uint8_t > bytes )
{
  if( bytes.size() == 0 || bytes.size() > max_prefix_length )
    throw std::logic_error( "version prefix length out of range" );

  version_entry entry{ tag, name, {}, bytes.size() };
  std::ranges::transform( bytes,
                          entry.data.begin(),
                          []( std::uint8_t b )
                          {
                            return std::byte{ b };
                          } );
  return entry;
}

// clang-format off
constexpr std::array version_table{
  make_entry( version_tag::p2pkh,                 "p2pkh",                 { 0x00 }                   ),
  make_entry( version_tag::p2sh,                  "p2sh",                  { 0x05 }                   ),
  make_entry( version_tag::wif,                   "wif",                   { 0x80 }                   ),
  make_entry( version_tag::bip32_pubkey,          "bip32_pubkey",          { 0x04, 0x88, 0xb2, 0x1e } ),
  make_entry( version_tag::bip32_privkey,         "bip32_privkey",         { 0x04, 0x88, 0xad, 0xe4 } ),
  make_entry( version_tag::testnet_p2pkh,         "testnet_p2pkh",         { 0x6f }                   ),
  make_entry( version_tag::testnet_p2sh,          "testnet_p2sh",          { 0xc4 }                   ),
  make_entry( version_tag::testnet_wif,           "testnet_wif",           { 0xef }                   ),
  make_entry( version_tag::testnet_bip32_pubkey,  "testnet_bip32_pubkey",  { 0x04, 0x35, 0x87, 0xcf } ),
  make_entry( version_tag::testnet_bip32_privkey, "testnet_bip32_privkey", { 0x04, 0x35, 0x83, 0x94 } )
};
// clang-format on

constexpr bool indexed_by_tag( std::span< const version_entry > table )
{
  for( std::size_t i = 0; i < table.size(); ++i )
  {
    if( static_cast< std::size_t >( table[ i ].tag ) != i )
      return false;
  }

  return true;
}

// No prefix may start another, otherwise match_prefix would depend on table order
constexpr bool prefix_free( std::span< const version_entry > table )
{
  for( std::size_t i = 0; i < table.size(); ++i )
  {
    for( std::size_t j = 0; j < table.size(); ++j )
    {
      if( i == j )
        continue;

      auto shorter = table[ i ].prefix();
      auto longer  = table[ j ].prefix();

      if( shorter.size() <= longer.size() && std::ranges::equal( shorter, longer.first( shorter.size() ) ) )
        return false;
    }
  }

  return true;
}

static_assert( indexed_by_tag( version_table ) );
static_assert( prefix_free( version_table ) );

} // namespace

std::span< const version_entry > entries() noexcept
{
  return version_table;
}

std::string_view to_string( version_tag tag ) noexcept
{
  return version_table[ static_cast< std::size_t >( tag ) ].name;
}

std::optional< version_tag > from_string( std::string_view name ) noexcept
{
  auto itr = std::ranges::find( version_table, name, &version_entry::name );
  if( itr == version_table.end() )
    return {};

  return itr->tag;
}

std::string known_tags()
{
  std::string tags;
  for( const auto& entry: version_table )
  {
    if( !tags.empty() )
      tags += ", ";
    tags += entry.name;
  }

  return tags;
}

std::span< const std::byte > prefix_of( version_tag tag ) noexcept
{
  return version_table[ static_cast< std::size_t >( tag ) ].prefix();
}

std::optional< version_tag > tag_for_prefix( std::span< const std::byte > prefix ) noexcept
{
  for( const auto& entry: version_table )
  {
    if( std::ranges::equal( entry.prefix(), prefix ) )
      return entry.tag;
  }

  return {};
}

std::vector< std::byte > to_prefix( std::uint64_t value )
{
  constexpr unsigned bits_per_byte = 8;

  // Zero still takes one byte
  std::size_t length = 1;
  while( length < sizeof( value ) && ( value >> ( length * bits_per_byte ) ) != 0 )
    ++length;

  std::vector< std::byte > bytes( length );
  for( auto itr = bytes.rbegin(); itr != bytes.rend(); ++itr )
  {
    *itr    = static_cast< std::byte >( value & 0xff );
    value >>= bits_per_byte;
  }

  return bytes;
}

result< resolved_version > resolve( const version_spec& spec )
{
  std::vector< std::byte > prefix;

  if( std::holds_alternative< std::string >( spec ) )
  {
    const auto& name = std::get< std::string >( spec );
    auto tag         = from_string( name );
    if( !tag )
    {
      LOG_WARNING( log::instance(), "Version '{}' is not recognized, known versions are: {}", name, known_tags() );
      return std::unexpected( version_errc::unrecognized_version );
    }

    auto bytes = prefix_of( *tag );
    return resolved_version{ tag, std::vector< std::byte >( bytes.begin(), bytes.end() ) };
  }
  else if( std::holds_alternative< std::uint64_t >( spec ) )
  {
    prefix = to_prefix( std::get< std::uint64_t >( spec ) );
  }
  else if( std::holds_alternative< std::vector< std::uint8_t > >( spec ) )
  {
    const auto& values = std::get< std::vector< std::uint8_t > >( spec );
    prefix.reserve( values.size() );
    for( auto v: values )
      prefix.push_back( std::byte{ v } );
  }
  else if( std::holds_alternative< std::vector< std::byte > >( spec ) )
  {
    prefix = std::get< std::vector< std::byte > >( spec );
  }

  return resolved_version{ tag_for_prefix( prefix ), std::move( prefix ) };
}

resolved_version match_prefix( std::span< const std::byte > versioned_payload )
{
  for( const auto& entry: version_table )
  {
    auto prefix = entry.prefix();
    if( versioned_payload.size() >= prefix.size()
        && std::ranges::equal( prefix, versioned_payload.first( prefix.size() ) ) )
      return resolved_version{ entry.tag, std::vector< std::byte >( prefix.begin(), prefix.end() ) };
  }

  return resolved_version{};
}

} // namespace base58check::version
