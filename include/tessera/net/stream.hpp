#pragma once

#include <optional>

#include <tessera/net/error.hpp>

namespace tessera::net {

// Client streamed call: many requests, one response after the send side closes
template< typename Request, typename Response >
class client_stream
{
public:
  virtual ~client_stream() = default;

  virtual result< void > send( const Request& request ) = 0;
  virtual result< Response > close_and_receive()        = 0;
  virtual void cancel() noexcept                        = 0;
};

// Server streamed call: nullopt marks the end of the stream
template< typename Response >
class server_stream
{
public:
  virtual ~server_stream() = default;

  virtual result< std::optional< Response > > receive() = 0;
  virtual void cancel() noexcept                        = 0;
};

// Bidirectional call: nullopt marks the end of the remote side
template< typename Request, typename Response >
class bidi_stream
{
public:
  virtual ~bidi_stream() = default;

  virtual result< void > send( const Request& request ) = 0;
  virtual result< std::optional< Response > > receive() = 0;
  virtual result< void > close_send()                   = 0;
  virtual void cancel() noexcept                        = 0;
};

} // namespace tessera::net
