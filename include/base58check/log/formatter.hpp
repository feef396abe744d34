#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <base58check/encode.hpp>
#include <base58check/version/registry.hpp>

namespace base58check::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

struct base58_tag
{};

using base58 = quill::BinaryData< base58_tag >;

} // namespace base58check::log

template<>
struct fmtquill::formatter< base58check::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const base58check::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "0x{}",
                                base58check::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< base58check::log::hex >: quill::BinaryDataDeferredFormatCodec< base58check::log::hex >
{};

template<>
struct fmtquill::formatter< base58check::log::base58 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const base58check::log::base58& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                base58check::encode::to_base58( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< base58check::log::base58 >: quill::BinaryDataDeferredFormatCodec< base58check::log::base58 >
{};

template<>
struct fmtquill::formatter< base58check::version::version_tag >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const base58check::version::version_tag& tag, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", base58check::version::to_string( tag ) );
  }
};

template<>
struct quill::Codec< base58check::version::version_tag >: quill::DeferredFormatCodec< base58check::version::version_tag >
{};
