#include <tessera/verify/error.hpp>

#include <string>
#include <utility>

namespace tessera::verify {

struct _verify_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "verify";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< verify_errc >( condition ) )
    {
      case verify_errc::ok:
        return "ok"s;
      case verify_errc::hash_count_mismatch:
        return "service returned a different number of hashes than ranges requested"s;
      case verify_errc::fragment_count_mismatch:
        return "service returned a different number of fragments than ranges requested"s;
      case verify_errc::no_ranges:
        return "no ranges to verify"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    switch( static_cast< verify_errc >( condition ) )
    {
      case verify_errc::ok:
        return make_error_condition( error_kind::none );
      case verify_errc::hash_count_mismatch:
      case verify_errc::fragment_count_mismatch:
        return make_error_condition( error_kind::protocol_integrity );
      case verify_errc::no_ranges:
        return make_error_condition( error_kind::format );
    }
    std::unreachable();
  }
};

const std::error_category& verify_category() noexcept
{
  static _verify_category category;
  return category;
}

std::error_code make_error_code( verify_errc e )
{
  return std::error_code( static_cast< int >( e ), verify_category() );
}

} // namespace tessera::verify
