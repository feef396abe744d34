#include <base58check/codec/error.hpp>

#include <utility>

namespace base58check::codec {

struct _codec_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _codec_category::name() const noexcept
{
  return "codec";
}

std::string _codec_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< codec_errc >( condition ) )
  {
    case codec_errc::ok:
      return "ok"s;
    case codec_errc::incorrect_base58:
      return "incorrect base58"s;
    case codec_errc::checksum_incorrect:
      return "checksum incorrect"s;
  }
  std::unreachable();
}

const std::error_category& codec_category() noexcept
{
  static _codec_category category;
  return category;
}

std::error_code make_error_code( codec_errc e )
{
  return std::error_code( static_cast< int >( e ), codec_category() );
}

} // namespace base58check::codec
