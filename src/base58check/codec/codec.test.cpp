// NOLINTBEGIN

#include <gtest/gtest.h>

#include <base58check/codec.hpp>
#include <base58check/encode.hpp>
#include <base58check/version.hpp>

using namespace std::string_literals;
using namespace std::string_view_literals;
using base58check::codec::codec_errc;
using base58check::version::version_tag;

namespace {

constexpr auto private_key_hex  = "0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF"sv;
constexpr auto private_key_wif  = "5HpneLQNKrcznVCQpzodYwAmZ4AoHeyjuRf9iAHAa498rP5kuWb"sv;
constexpr auto pubkey_hash_hex  = "7C6AE6BE09965185A94B0DA18BC92A9DFCEE6117"sv;
constexpr auto pubkey_hash_addr = "1CLrrRUwXswyF2EVAtuXyqdk4qb8DSUHCX"sv;

std::vector< std::byte > bytes_of( std::string_view hex )
{
  return *base58check::encode::from_hex( hex );
}

} // namespace

TEST( codec, encode_wif )
{
  auto result = base58check::codec::encode( bytes_of( private_key_hex ), "wif"s );
  ASSERT_TRUE( result );

  EXPECT_EQ( result->encoded, private_key_wif );
  EXPECT_EQ( result->payload, bytes_of( private_key_hex ) );
  EXPECT_EQ( result->tag, version_tag::wif );
  EXPECT_EQ( result->prefix, bytes_of( "80" ) );
}

TEST( codec, encode_p2pkh )
{
  auto result = base58check::codec::encode( bytes_of( pubkey_hash_hex ), "p2pkh"s );
  ASSERT_TRUE( result );

  EXPECT_EQ( result->encoded, pubkey_hash_addr );
  EXPECT_EQ( result->tag, version_tag::p2pkh );
  EXPECT_EQ( result->prefix, bytes_of( "00" ) );
}

TEST( codec, encode_empty_payload )
{
  auto result = base58check::codec::encode( {}, std::vector< std::uint8_t >{ 0 } );
  ASSERT_TRUE( result );

  EXPECT_EQ( result->encoded, "1Wh4bh" );
  EXPECT_TRUE( result->payload.empty() );
  EXPECT_EQ( result->tag, version_tag::p2pkh );

  auto decoded = base58check::codec::decode( result->encoded );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( *decoded, *result );
}

TEST( codec, encode_other_versions )
{
  auto p2sh = base58check::codec::encode( bytes_of( private_key_hex ), "p2sh"s );
  ASSERT_TRUE( p2sh );
  EXPECT_EQ( p2sh->encoded, "AjDwpCSWXS9CaifKhTjEVRWv2RUL3L37owuhjfuJTKS9sL6Ni2" );

  auto xpub = base58check::codec::encode( bytes_of( private_key_hex ), std::uint64_t{ 0x0488b21e } );
  ASSERT_TRUE( xpub );
  EXPECT_EQ( xpub->tag, version_tag::bip32_pubkey );
  EXPECT_EQ( xpub->encoded, "E4r7cuu1YsUwBwhVQVgNnzXS3KomY7aNsGnrzqxXsgh29p3sdDkLso" );

  auto testnet = base58check::codec::encode( bytes_of( private_key_hex ), "testnet_p2pkh"s );
  ASSERT_TRUE( testnet );
  EXPECT_EQ( testnet->encoded, "4in8ePmpqd89VYKRR9FeLUybz7hbEgerXZTKZcavfv2YTi4VXVU" );
}

TEST( codec, version_equivalence )
{
  auto payload = bytes_of( private_key_hex );

  std::vector< base58check::version::version_spec > specs{ "wif"s,
                                                           std::uint64_t{ 0x80 },
                                                           std::vector< std::uint8_t >{ 128 },
                                                           std::vector< std::byte >{ std::byte{ 0x80 } } };

  for( const auto& spec: specs )
  {
    auto result = base58check::codec::encode( payload, spec );
    ASSERT_TRUE( result ) << "spec index " << spec.index();
    EXPECT_EQ( result->encoded, private_key_wif ) << "spec index " << spec.index();
    EXPECT_EQ( result->tag, version_tag::wif ) << "spec index " << spec.index();
    EXPECT_EQ( result->prefix, bytes_of( "80" ) ) << "spec index " << spec.index();
  }
}

TEST( codec, unrecognized_version )
{
  auto result = base58check::codec::encode( bytes_of( "00" ), "sahdkjfhkjasdfhksldjf"s );
  if( result )
    ADD_FAILURE() << "encode erroneously succeeded";
  else
  {
    EXPECT_EQ( result.error(), base58check::version::version_errc::unrecognized_version );
    EXPECT_NE( result.error().message().find( "testnet_bip32_privkey" ), std::string::npos );
  }
}

TEST( codec, decode_wif )
{
  auto result = base58check::codec::decode( private_key_wif );
  ASSERT_TRUE( result );

  EXPECT_EQ( result->encoded, private_key_wif );
  EXPECT_EQ( result->payload, bytes_of( private_key_hex ) );
  EXPECT_EQ( result->tag, version_tag::wif );
  EXPECT_EQ( result->prefix, bytes_of( "80" ) );
}

TEST( codec, decode_p2pkh )
{
  auto result = base58check::codec::decode( pubkey_hash_addr );
  ASSERT_TRUE( result );

  EXPECT_EQ( result->payload, bytes_of( pubkey_hash_hex ) );
  EXPECT_EQ( result->tag, version_tag::p2pkh );
  EXPECT_EQ( result->prefix, bytes_of( "00" ) );
}

TEST( codec, round_trip )
{
  std::vector< std::vector< std::byte > > payloads{ {},
                                                    bytes_of( "00" ),
                                                    bytes_of( "0000" ),
                                                    bytes_of( "ff" ),
                                                    bytes_of( pubkey_hash_hex ),
                                                    bytes_of( private_key_hex ) };

  for( const auto& entry: base58check::version::entries() )
  {
    for( const auto& payload: payloads )
    {
      auto encoded = base58check::codec::encode( payload, std::string( entry.name ) );
      ASSERT_TRUE( encoded ) << entry.name;

      auto decoded = base58check::codec::decode( encoded->encoded );
      ASSERT_TRUE( decoded ) << entry.name << " " << encoded->encoded;
      EXPECT_EQ( *decoded, *encoded ) << entry.name << " " << encoded->encoded;
      EXPECT_EQ( decoded->tag, entry.tag );
      EXPECT_TRUE( std::ranges::equal( decoded->prefix, entry.prefix() ) );
    }
  }
}

TEST( codec, leading_zeros )
{
  auto payload = bytes_of( "00000102" );

  auto encoded = base58check::codec::encode( payload, "p2pkh"s );
  ASSERT_TRUE( encoded );
  EXPECT_EQ( encoded->encoded, "111W9ycZ2q" );

  auto decoded = base58check::codec::decode( encoded->encoded );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( decoded->payload, payload );
  EXPECT_EQ( decoded->tag, version_tag::p2pkh );

  encoded = base58check::codec::encode( payload, "wif"s );
  ASSERT_TRUE( encoded );

  decoded = base58check::codec::decode( encoded->encoded );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( decoded->payload, payload );
}

TEST( codec, unknown_prefix )
{
  auto encoded = base58check::codec::encode( bytes_of( "010203" ), std::vector< std::byte >{ std::byte{ 0x09 } } );
  ASSERT_TRUE( encoded );
  EXPECT_EQ( encoded->encoded, "2WMGcHPABWr" );
  EXPECT_FALSE( encoded->tag );
  EXPECT_EQ( encoded->prefix, bytes_of( "09" ) );

  auto decoded = base58check::codec::decode( encoded->encoded );
  ASSERT_TRUE( decoded );
  EXPECT_FALSE( decoded->tag );
  EXPECT_TRUE( decoded->prefix.empty() );
  EXPECT_EQ( decoded->payload, bytes_of( "09010203" ) );
}

TEST( codec, incorrect_base58 )
{
  for( auto text: { "50pneLQNKrcznVCQpzodYwAmZ4AoHeyjuRf9iAHAa498rP5kuWb"sv,
                    "5HpneLQNKrcznVCQpzodYwAmZ4AoHeyjuRf9iAHAa498rP5kuWO"sv,
                    "I5HpneLQNKrcznVCQpzodYwAmZ4AoHeyjuRf9iAHAa498rP5kuWb"sv,
                    "5HpneLQNKrcznVCQpzodYwAmZ4AoHeyjuRf9iAHAa498rP5kuWb "sv,
                    "Ol"sv } )
  {
    auto result = base58check::codec::decode( text );
    if( result )
      ADD_FAILURE() << "decode erroneously succeeded for " << text;
    else
    {
      EXPECT_EQ( result.error(), codec_errc::incorrect_base58 ) << text;
      EXPECT_EQ( result.error().message(),
                 base58check::codec::codec_category().message( static_cast< int >( codec_errc::incorrect_base58 ) ) );
    }
  }
}

TEST( codec, checksum_incorrect )
{
  for( auto text: { "5JpneLQNKrcznVCQpzodYwAmZ4AoHeyjuRf9iAHAa498rP5kuWb"sv,
                    "5HpneLQNKrcznVCQpzodYwAmZ4AoHeyjuRf9iAHAa498rP5kuWc"sv,
                    "1"sv,
                    "111"sv,
                    "2WMGcH"sv } )
  {
    auto result = base58check::codec::decode( text );
    if( result )
      ADD_FAILURE() << "decode erroneously succeeded for " << text;
    else
      EXPECT_EQ( result.error(), codec_errc::checksum_incorrect ) << text;
  }
}

TEST( codec, empty_input )
{
  auto result = base58check::codec::decode( ""sv );
  if( result )
    ADD_FAILURE() << "decode erroneously succeeded";
  else
    EXPECT_EQ( result.error(), codec_errc::checksum_incorrect );
}

TEST( codec, single_character_corruption )
{
  const auto& alphabet = base58check::encode::alphabet;

  for( std::size_t i = 0; i < private_key_wif.size(); ++i )
  {
    std::string corrupted( private_key_wif );
    auto pos       = alphabet.find( corrupted[ i ] );
    corrupted[ i ] = alphabet[ ( pos + 1 ) % alphabet.size() ];

    auto result = base58check::codec::decode( corrupted );
    if( result )
      ADD_FAILURE() << "decode erroneously succeeded for " << corrupted;
    else
      EXPECT_EQ( result.error(), codec_errc::checksum_incorrect ) << corrupted;
  }
}

// NOLINTEND
