#include "call.hpp"

#include <tessera/log.hpp>
#include <tessera/memory.hpp>

namespace tessera::net {

call::call( channel& ch, net::method m, const call_context& ctx ) noexcept:
    _channel( ch ),
    _method( m ),
    _ctx( ctx )
{}

call::~call()
{
  if( !_finished )
    cancel();

  _channel.release();
}

result< void > call::write( frame_kind kind, std::span< const std::byte > payload )
{
  if( _finished )
    return std::unexpected( net_errc::stream_closed );

  frame f;
  f.kind    = kind;
  f.method  = _method;
  f.payload = memory::to_vector( payload );

  if( auto written = _channel.write_frame( f, _ctx ); !written )
  {
    _finished = true;
    return written;
  }

  return {};
}

result< void > call::open( std::span< const std::byte > payload )
{
  LOG_DEBUG( tessera::log::instance(), "Opening {} call", to_string( _method ) );
  return write( frame_kind::open, payload );
}

result< void > call::send( std::span< const std::byte > payload )
{
  if( _send_closed )
    return std::unexpected( net_errc::stream_closed );

  return write( frame_kind::message, payload );
}

result< void > call::close_send()
{
  if( _send_closed )
    return {};

  _send_closed = true;
  return write( frame_kind::close_send, {} );
}

result< std::optional< std::vector< std::byte > > > call::receive()
{
  if( _finished )
    return std::nullopt;

  auto f = _channel.read_frame( _ctx );
  if( !f )
  {
    _finished = true;
    return std::unexpected( f.error() );
  }

  if( f->method != _method )
  {
    LOG_ERROR( tessera::log::instance(),
               "Received a {} frame for {} during a {} call",
               to_string( f->kind ),
               to_string( f->method ),
               to_string( _method ) );
    _finished = true;
    _channel.abort();
    return std::unexpected( net_errc::malformed_frame );
  }

  switch( f->kind )
  {
    case frame_kind::message:
      return std::move( f->payload );
    case frame_kind::end:
      _finished = true;
      return std::nullopt;
    case frame_kind::status:
      {
        _finished   = true;
        auto status = encode::from_bytes< net::status >( f->payload );
        if( !status )
          return std::unexpected( net_errc::malformed_frame );

        LOG_WARNING( tessera::log::instance(),
                     "{} rejected by the service with code {}: {}",
                     to_string( _method ),
                     status->code,
                     status->message );
        auto code = status->code == static_cast< std::uint32_t >( status_code::ok )
                      ? status_code::unknown
                      : static_cast< status_code >( status->code );

        _channel.reject( remote_status{ code, std::move( status->message ) } );
        return std::unexpected( code );
      }
    default:
      break;
  }

  LOG_ERROR( tessera::log::instance(), "Unexpected {} frame from the service", to_string( f->kind ) );
  _finished = true;
  _channel.abort();
  return std::unexpected( net_errc::malformed_frame );
}

void call::cancel() noexcept
{
  if( _finished )
    return;

  _finished = true;
  LOG_DEBUG( tessera::log::instance(), "Cancelling {} call", to_string( _method ) );

  // The connection cannot be resynchronized with the remote end mid call
  _channel.abort();
}

} // namespace tessera::net
