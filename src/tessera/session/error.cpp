#include <tessera/session/error.hpp>

#include <string>
#include <utility>

namespace tessera::session {

struct _session_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "session";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< session_errc >( condition ) )
    {
      case session_errc::ok:
        return "ok"s;
      case session_errc::invalid_state:
        return "negotiation step out of order"s;
      case session_errc::unexpected_response:
        return "unexpected session response"s;
      case session_errc::token_mismatch:
        return "token does not match the proposal"s;
      case session_errc::missing_public_key:
        return "token header carries no public key"s;
      case session_errc::expected_result_token:
        return "expected the result token"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    if( static_cast< session_errc >( condition ) == session_errc::ok )
      return make_error_condition( error_kind::none );

    return make_error_condition( error_kind::protocol_integrity );
  }
};

const std::error_category& session_category() noexcept
{
  static _session_category category;
  return category;
}

std::error_code make_error_code( session_errc e )
{
  return std::error_code( static_cast< int >( e ), session_category() );
}

} // namespace tessera::session
