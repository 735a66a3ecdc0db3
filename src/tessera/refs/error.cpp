#include <tessera/refs/error.hpp>

#include <string>
#include <utility>

namespace tessera::refs {

struct _refs_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "refs";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< refs_errc >( condition ) )
    {
      case refs_errc::ok:
        return "ok"s;
      case refs_errc::invalid_encoding:
        return "identifier is not validly encoded"s;
      case refs_errc::invalid_length:
        return "identifier has invalid length"s;
      case refs_errc::invalid_format:
        return "identifier has invalid format"s;
      case refs_errc::invalid_version:
        return "owner identifier has unsupported version"s;
      case refs_errc::invalid_checksum:
        return "owner identifier checksum mismatch"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    if( static_cast< refs_errc >( condition ) == refs_errc::ok )
      return make_error_condition( error_kind::none );

    return make_error_condition( error_kind::format );
  }
};

const std::error_category& refs_category() noexcept
{
  static _refs_category category;
  return category;
}

std::error_code make_error_code( refs_errc e )
{
  return std::error_code( static_cast< int >( e ), refs_category() );
}

} // namespace tessera::refs
