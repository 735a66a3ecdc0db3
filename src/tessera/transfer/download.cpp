#include <tessera/transfer/download.hpp>

#include <tessera/log.hpp>

namespace tessera::transfer {

const char* to_string( download_state s ) noexcept
{
  switch( s )
  {
    case download_state::idle:
      return "idle";
    case download_state::awaiting_first:
      return "awaiting the object header";
    case download_state::receiving:
      return "receiving";
    case download_state::done:
      return "done";
    case download_state::removed:
      return "removed";
    case download_state::failed:
      return "failed";
  }
  std::unreachable();
}

download::download( net::object_service& service ) noexcept:
    _service( service )
{}

download::~download()
{
  if( _stream && ( _state == download_state::awaiting_first || _state == download_state::receiving ) )
  {
    LOG_WARNING( tessera::log::instance(), "Abandoning download while {}", to_string( _state ) );
    _stream->cancel();
  }
}

std::error_code download::fail( std::error_code ec ) noexcept
{
  LOG_ERROR( tessera::log::instance(),
             "Download failed while {} after {} bytes: {}",
             to_string( _state ),
             _bytes_received,
             ec.message() );

  _state = download_state::failed;
  if( _stream )
    _stream->cancel();

  return ec;
}

result< void > download::open( const refs::address& addr, std::uint32_t ttl, const net::call_context& ctx )
{
  if( _state != download_state::idle )
    return std::unexpected( transfer_errc::invalid_state );

  protocol::get_request req;
  req.address = addr;
  req.ttl     = ttl;

  auto stream = _service.get( req, ctx );
  if( !stream )
    return std::unexpected( fail( stream.error() ) );

  _stream  = std::move( *stream );
  _address = addr;
  _state   = download_state::awaiting_first;
  return {};
}

result< void > download::append( io::sink& sink, std::span< const std::byte > bytes )
{
  if( _bytes_received + bytes.size() > _header->system.payload_length )
    return std::unexpected( fail( transfer_errc::payload_overflow ) );

  if( auto written = sink.write( bytes ); !written )
    return std::unexpected( fail( written.error() ) );

  _hasher.absorb( bytes );
  _bytes_received += bytes.size();
  return {};
}

result< download_outcome > download::finish_removed()
{
  auto end = _stream->receive();
  if( !end )
    return std::unexpected( fail( end.error() ) );

  if( *end )
    return std::unexpected( fail( transfer_errc::unexpected_frame ) );

  _state = download_state::removed;
  LOG_INFO( tessera::log::instance(), "Object {} has been removed", *_address );
  return download_outcome::removed;
}

result< download_outcome > download::receive( io::sink& sink )
{
  if( _state != download_state::awaiting_first )
    return std::unexpected( transfer_errc::invalid_state );

  auto first = _stream->receive();
  if( !first )
    return std::unexpected( fail( first.error() ) );

  if( !*first )
    return std::unexpected( fail( transfer_errc::unexpected_end ) );

  auto* obj = std::get_if< object::object >( &**first );
  if( !obj )
    return std::unexpected( fail( transfer_errc::unexpected_frame ) );

  _header = std::move( *obj );
  auto payload = std::move( _header->payload );
  _header->payload.clear();

  if( _header->is_tombstone() )
  {
    if( auto verified = object::verify( *_header ); !verified )
    {
      LOG_ERROR( tessera::log::instance(),
                 "Tombstone of {} failed verification: {}",
                 *_address,
                 verified.error().message() );
      return std::unexpected( fail( transfer_errc::object_corrupted ) );
    }

    return finish_removed();
  }

  LOG_DEBUG( tessera::log::instance(),
             "Received header of {}, {} payload bytes declared",
             *_address,
             _header->system.payload_length );

  _state = download_state::receiving;

  if( !payload.empty() )
  {
    if( auto appended = append( sink, payload ); !appended )
      return std::unexpected( appended.error() );
  }

  for( ;; )
  {
    auto next = _stream->receive();
    if( !next )
      return std::unexpected( fail( next.error() ) );

    if( !*next )
      break;

    auto* c = std::get_if< protocol::chunk >( &**next );
    if( !c )
      return std::unexpected( fail( transfer_errc::unexpected_frame ) );

    if( auto appended = append( sink, c->data ); !appended )
      return std::unexpected( appended.error() );

    ++_chunks_received;
    LOG_DEBUG( tessera::log::instance(),
               "Received chunk {} of {} bytes, {}",
               _chunks_received,
               c->data.size(),
               tessera::log::percent{ _bytes_received, _header->system.payload_length } );
  }

  if( _bytes_received < _header->system.payload_length )
    return std::unexpected( fail( transfer_errc::payload_underflow ) );

  _state = download_state::done;
  LOG_INFO( tessera::log::instance(),
            "Downloaded {}, {} bytes in {} chunks",
            *_address,
            _bytes_received,
            _chunks_received );
  return download_outcome::fetched;
}

download_state download::state() const noexcept
{
  return _state;
}

const std::optional< object::object >& download::header() const noexcept
{
  return _header;
}

std::uint64_t download::bytes_received() const noexcept
{
  return _bytes_received;
}

std::size_t download::chunks_received() const noexcept
{
  return _chunks_received;
}

crypto::tz::digest download::payload_digest() const noexcept
{
  return _hasher.finalize();
}

} // namespace tessera::transfer
