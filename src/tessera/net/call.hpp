#pragma once

#include <optional>
#include <span>
#include <vector>

#include <tessera/encode/archive.hpp>
#include <tessera/net/channel.hpp>
#include <tessera/net/stream.hpp>

namespace tessera::net {

/*
 * One call on a channel. The call owns the channel's busy flag for its
 * lifetime; a call dropped before the remote end finished is cancelled.
 */
class call
{
public:
  call( channel& ch, net::method m, const call_context& ctx ) noexcept;
  call( const call& )            = delete;
  call( call&& )                 = delete;
  call& operator=( const call& ) = delete;
  call& operator=( call&& )      = delete;
  ~call();

  result< void > open( std::span< const std::byte > payload );
  result< void > send( std::span< const std::byte > payload );
  result< void > close_send();

  // nullopt once the remote end finished the call
  result< std::optional< std::vector< std::byte > > > receive();

  void cancel() noexcept;

private:
  result< void > write( frame_kind kind, std::span< const std::byte > payload );

  channel& _channel;
  net::method _method;
  call_context _ctx;
  bool _send_closed = false;
  bool _finished    = false;
};

template< typename Response >
result< Response > decode( const std::vector< std::byte >& payload ) noexcept
{
  auto response = encode::from_bytes< Response >( payload );
  if( !response )
    return std::unexpected( response.error() );

  return std::move( *response );
}

// Reads the single response of a call and the end of stream after it
template< typename Response >
result< Response > receive_single( call& c )
{
  auto payload = c.receive();
  if( !payload )
    return std::unexpected( payload.error() );

  if( !*payload )
    return std::unexpected( net_errc::stream_closed );

  auto response = decode< Response >( **payload );
  if( !response )
    return std::unexpected( response.error() );

  auto end = c.receive();
  if( !end )
    return std::unexpected( end.error() );

  if( *end )
    return std::unexpected( net_errc::malformed_frame );

  return response;
}

template< typename Request, typename Response >
class framed_client_stream final: public client_stream< Request, Response >
{
public:
  explicit framed_client_stream( std::unique_ptr< call > c ) noexcept:
      _call( std::move( c ) )
  {}

  result< void > send( const Request& request ) override
  {
    return _call->send( encode::to_bytes( request ) );
  }

  result< Response > close_and_receive() override
  {
    if( auto closed = _call->close_send(); !closed )
      return std::unexpected( closed.error() );

    return receive_single< Response >( *_call );
  }

  void cancel() noexcept override
  {
    _call->cancel();
  }

private:
  std::unique_ptr< call > _call;
};

template< typename Response >
class framed_server_stream final: public server_stream< Response >
{
public:
  explicit framed_server_stream( std::unique_ptr< call > c ) noexcept:
      _call( std::move( c ) )
  {}

  result< std::optional< Response > > receive() override
  {
    auto payload = _call->receive();
    if( !payload )
      return std::unexpected( payload.error() );

    if( !*payload )
      return std::nullopt;

    auto response = decode< Response >( **payload );
    if( !response )
      return std::unexpected( response.error() );

    return std::move( *response );
  }

  void cancel() noexcept override
  {
    _call->cancel();
  }

private:
  std::unique_ptr< call > _call;
};

template< typename Request, typename Response >
class framed_bidi_stream final: public bidi_stream< Request, Response >
{
public:
  explicit framed_bidi_stream( std::unique_ptr< call > c ) noexcept:
      _call( std::move( c ) )
  {}

  result< void > send( const Request& request ) override
  {
    return _call->send( encode::to_bytes( request ) );
  }

  result< std::optional< Response > > receive() override
  {
    auto payload = _call->receive();
    if( !payload )
      return std::unexpected( payload.error() );

    if( !*payload )
      return std::nullopt;

    auto response = decode< Response >( **payload );
    if( !response )
      return std::unexpected( response.error() );

    return std::move( *response );
  }

  result< void > close_send() override
  {
    return _call->close_send();
  }

  void cancel() noexcept override
  {
    _call->cancel();
  }

private:
  std::unique_ptr< call > _call;
};

} // namespace tessera::net
