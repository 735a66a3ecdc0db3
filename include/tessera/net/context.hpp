#pragma once

#include <chrono>
#include <optional>
#include <stop_token>

#include <tessera/net/error.hpp>

namespace tessera::net {

using clock = std::chrono::steady_clock;

/*
 * Per call deadline and cancellation. A default constructed context never
 * expires and cannot be cancelled.
 */
class call_context
{
public:
  call_context() = default;
  explicit call_context( clock::duration timeout, std::stop_token stop = {} );
  call_context( std::optional< clock::time_point > deadline, std::stop_token stop ) noexcept;

  const std::optional< clock::time_point >& deadline() const noexcept;
  const std::stop_token& stop_token() const noexcept;

  // Time left before the deadline, nullopt without one
  std::optional< clock::duration > remaining() const noexcept;

  // timed_out or cancelled once the call must stop
  result< void > check() const noexcept;

private:
  std::optional< clock::time_point > _deadline;
  std::stop_token _stop;
};

} // namespace tessera::net
