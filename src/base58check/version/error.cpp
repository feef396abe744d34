#include <base58check/version/error.hpp>
#include <base58check/version/registry.hpp>

#include <utility>

namespace base58check::version {

struct _version_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _version_category::name() const noexcept
{
  return "version";
}

std::string _version_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< version_errc >( condition ) )
  {
    case version_errc::ok:
      return "ok"s;
    case version_errc::unrecognized_version:
      return "unrecognized version, pass a byte list, an integer, raw prefix bytes or one of: "s + known_tags();
  }
  std::unreachable();
}

const std::error_category& version_category() noexcept
{
  static _version_category category;
  return category;
}

std::error_code make_error_code( version_errc e )
{
  return std::error_code( static_cast< int >( e ), version_category() );
}

} // namespace base58check::version
