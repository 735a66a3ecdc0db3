#include <tessera/net/context.hpp>

#include <algorithm>

namespace tessera::net {

call_context::call_context( clock::duration timeout, std::stop_token stop ):
    _deadline( clock::now() + timeout ),
    _stop( std::move( stop ) )
{}

call_context::call_context( std::optional< clock::time_point > deadline, std::stop_token stop ) noexcept:
    _deadline( deadline ),
    _stop( std::move( stop ) )
{}

const std::optional< clock::time_point >& call_context::deadline() const noexcept
{
  return _deadline;
}

const std::stop_token& call_context::stop_token() const noexcept
{
  return _stop;
}

std::optional< clock::duration > call_context::remaining() const noexcept
{
  if( !_deadline )
    return std::nullopt;

  return std::max( *_deadline - clock::now(), clock::duration::zero() );
}

result< void > call_context::check() const noexcept
{
  if( _stop.stop_requested() )
    return std::unexpected( net_errc::cancelled );

  if( _deadline && clock::now() >= *_deadline )
    return std::unexpected( net_errc::timed_out );

  return {};
}

} // namespace tessera::net
