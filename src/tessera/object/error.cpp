#include <tessera/object/error.hpp>

#include <string>
#include <utility>

namespace tessera::object {

struct _object_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "object";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< object_errc >( condition ) )
    {
      case object_errc::ok:
        return "ok"s;
      case object_errc::invalid_range:
        return "invalid range, expected offset:length"s;
      case object_errc::invalid_user_header:
        return "invalid user header, expected key=value"s;
      case object_errc::invalid_filter:
        return "search filters must be name value pairs"s;
      case object_errc::missing_integrity_header:
        return "object is missing its integrity header"s;
      case object_errc::missing_verification_header:
        return "object is missing its verification header"s;
      case object_errc::checksum_mismatch:
        return "object headers checksum mismatch"s;
      case object_errc::invalid_signature:
        return "object integrity signature is invalid"s;
      case object_errc::owner_mismatch:
        return "object owner does not match the verification key"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    switch( static_cast< object_errc >( condition ) )
    {
      case object_errc::ok:
        return make_error_condition( error_kind::none );
      case object_errc::invalid_range:
      case object_errc::invalid_user_header:
      case object_errc::invalid_filter:
        return make_error_condition( error_kind::format );
      case object_errc::missing_integrity_header:
      case object_errc::missing_verification_header:
      case object_errc::checksum_mismatch:
      case object_errc::invalid_signature:
      case object_errc::owner_mismatch:
        return make_error_condition( error_kind::protocol_integrity );
    }
    std::unreachable();
  }
};

const std::error_category& object_category() noexcept
{
  static _object_category category;
  return category;
}

std::error_code make_error_code( object_errc e )
{
  return std::error_code( static_cast< int >( e ), object_category() );
}

} // namespace tessera::object
