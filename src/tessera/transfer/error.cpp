#include <tessera/transfer/error.hpp>

#include <string>
#include <utility>

namespace tessera::transfer {

struct _transfer_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "transfer";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< transfer_errc >( condition ) )
    {
      case transfer_errc::ok:
        return "ok"s;
      case transfer_errc::invalid_state:
        return "transfer operation out of order"s;
      case transfer_errc::payload_overflow:
        return "payload exceeds the declared length"s;
      case transfer_errc::payload_underflow:
        return "payload is shorter than the declared length"s;
      case transfer_errc::unexpected_frame:
        return "unexpected frame"s;
      case transfer_errc::unexpected_end:
        return "stream ended before the object header"s;
      case transfer_errc::object_corrupted:
        return "object failed verification"s;
      case transfer_errc::address_mismatch:
        return "service committed a different address"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    if( static_cast< transfer_errc >( condition ) == transfer_errc::ok )
      return make_error_condition( error_kind::none );

    return make_error_condition( error_kind::protocol_integrity );
  }
};

const std::error_category& transfer_category() noexcept
{
  static _transfer_category category;
  return category;
}

std::error_code make_error_code( transfer_errc e )
{
  return std::error_code( static_cast< int >( e ), transfer_category() );
}

} // namespace tessera::transfer
