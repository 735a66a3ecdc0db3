#include <tessera/net/error.hpp>

#include <string>
#include <utility>

namespace tessera::net {

struct _net_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "net";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< net_errc >( condition ) )
    {
      case net_errc::ok:
        return "ok"s;
      case net_errc::connection_failed:
        return "connection failed"s;
      case net_errc::ssl_handshake_failed:
        return "SSL handshake failed"s;
      case net_errc::timed_out:
        return "deadline exceeded"s;
      case net_errc::cancelled:
        return "operation cancelled"s;
      case net_errc::channel_busy:
        return "channel is serving another stream"s;
      case net_errc::stream_closed:
        return "stream closed"s;
      case net_errc::malformed_frame:
        return "malformed frame"s;
      case net_errc::frame_too_large:
        return "frame exceeds the maximum frame size"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    switch( static_cast< net_errc >( condition ) )
    {
      case net_errc::ok:
        return make_error_condition( error_kind::none );
      case net_errc::malformed_frame:
      case net_errc::frame_too_large:
        return make_error_condition( error_kind::protocol_integrity );
      default:
        return make_error_condition( error_kind::connection );
    }
  }
};

const std::error_category& net_category() noexcept
{
  static _net_category category;
  return category;
}

std::error_code make_error_code( net_errc e )
{
  return std::error_code( static_cast< int >( e ), net_category() );
}

struct _status_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "remote status";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< status_code >( condition ) )
    {
      case status_code::ok:
        return "ok"s;
      case status_code::cancelled:
        return "cancelled"s;
      case status_code::unknown:
        return "unknown"s;
      case status_code::invalid_argument:
        return "invalid argument"s;
      case status_code::deadline_exceeded:
        return "deadline exceeded"s;
      case status_code::not_found:
        return "not found"s;
      case status_code::already_exists:
        return "already exists"s;
      case status_code::permission_denied:
        return "permission denied"s;
      case status_code::resource_exhausted:
        return "resource exhausted"s;
      case status_code::failed_precondition:
        return "failed precondition"s;
      case status_code::aborted:
        return "aborted"s;
      case status_code::out_of_range:
        return "out of range"s;
      case status_code::unimplemented:
        return "unimplemented"s;
      case status_code::internal:
        return "internal"s;
      case status_code::unavailable:
        return "unavailable"s;
      case status_code::data_loss:
        return "data loss"s;
      case status_code::unauthenticated:
        return "unauthenticated"s;
    }
    return "unrecognized remote status "s + std::to_string( condition );
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    if( static_cast< status_code >( condition ) == status_code::ok )
      return make_error_condition( error_kind::none );

    return make_error_condition( error_kind::remote_rejection );
  }
};

const std::error_category& status_category() noexcept
{
  static _status_category category;
  return category;
}

std::error_code make_error_code( status_code e )
{
  return std::error_code( static_cast< int >( e ), status_category() );
}

} // namespace tessera::net
