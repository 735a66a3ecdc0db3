#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::net {

enum class net_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  connection_failed,
  ssl_handshake_failed,
  timed_out,
  cancelled,
  channel_busy,
  stream_closed,
  malformed_frame,
  frame_too_large
};

const std::error_category& net_category() noexcept;

std::error_code make_error_code( net_errc e );

// Failure codes reported by the remote service in a status frame
enum class status_code : std::uint32_t // NOLINT(performance-enum-size)
{
  ok = 0,
  cancelled,
  unknown,
  invalid_argument,
  deadline_exceeded,
  not_found,
  already_exists,
  permission_denied,
  resource_exhausted,
  failed_precondition,
  aborted,
  out_of_range,
  unimplemented,
  internal,
  unavailable,
  data_loss,
  unauthenticated
};

const std::error_category& status_category() noexcept;

std::error_code make_error_code( status_code e );

// A rejection as reported by the service, message included
struct remote_status
{
  status_code code = status_code::unknown;
  std::string message;

  bool operator==( const remote_status& ) const = default;
};

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::net

template<>
struct std::is_error_code_enum< tessera::net::net_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< tessera::net::status_code >: public std::true_type
{};
