#include <tessera/crypto/error.hpp>

#include <string>
#include <utility>

namespace tessera::crypto {

struct _crypto_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "crypto";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< crypto_errc >( condition ) )
    {
      case crypto_errc::ok:
        return "ok"s;
      case crypto_errc::empty_concat:
        return "cannot concatenate an empty digest sequence"s;
      case crypto_errc::invalid_digest:
        return "invalid digest"s;
      case crypto_errc::invalid_key:
        return "invalid key"s;
      case crypto_errc::invalid_signature:
        return "invalid signature"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    switch( static_cast< crypto_errc >( condition ) )
    {
      case crypto_errc::ok:
        return make_error_condition( error_kind::none );
      case crypto_errc::invalid_key:
        return make_error_condition( error_kind::format );
      default:
        return make_error_condition( error_kind::protocol_integrity );
    }
  }
};

const std::error_category& crypto_category() noexcept
{
  static _crypto_category category;
  return category;
}

std::error_code make_error_code( crypto_errc e )
{
  return std::error_code( static_cast< int >( e ), crypto_category() );
}

} // namespace tessera::crypto
