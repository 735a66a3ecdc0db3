#include <tessera/transfer/upload.hpp>

#include <tessera/log.hpp>

namespace tessera::transfer {

const char* to_string( upload_state s ) noexcept
{
  switch( s )
  {
    case upload_state::idle:
      return "idle";
    case upload_state::header_sent:
      return "header sent";
    case upload_state::streaming:
      return "streaming";
    case upload_state::closed:
      return "closed";
    case upload_state::failed:
      return "failed";
  }
  std::unreachable();
}

upload::upload( net::object_service& service, std::size_t chunk_size ) noexcept:
    _service( service ),
    _chunk_size( chunk_size ? chunk_size : default_chunk_size )
{}

upload::~upload()
{
  if( _stream && _state != upload_state::closed && _state != upload_state::failed )
  {
    LOG_WARNING( tessera::log::instance(), "Abandoning upload while {}", to_string( _state ) );
    _stream->cancel();
  }
}

std::error_code upload::fail( std::error_code ec ) noexcept
{
  LOG_ERROR( tessera::log::instance(),
             "Upload failed while {} after {} chunks: {}",
             to_string( _state ),
             _chunks_sent,
             ec.message() );

  _state = upload_state::failed;
  if( _stream )
    _stream->cancel();

  return ec;
}

result< void > upload::send_header( const object::object& obj,
                                    const session::token& token,
                                    std::uint32_t ttl,
                                    const net::call_context& ctx )
{
  if( _state != upload_state::idle )
    return std::unexpected( transfer_errc::invalid_state );

  auto stream = _service.put( ctx );
  if( !stream )
    return std::unexpected( fail( stream.error() ) );

  _stream = std::move( *stream );

  protocol::put_header header;
  header.object = obj;
  header.object.payload.clear();
  header.token = token;
  header.ttl   = ttl;

  if( auto sent = _stream->send( header ); !sent )
    return std::unexpected( fail( sent.error() ) );

  _address        = obj.address();
  _payload_length = obj.system.payload_length;
  _state          = upload_state::header_sent;

  LOG_DEBUG( tessera::log::instance(), "Sent header of {}, {} payload bytes declared", *_address, _payload_length );
  return {};
}

result< void > upload::stream( io::source& src )
{
  if( _state != upload_state::header_sent )
    return std::unexpected( transfer_errc::invalid_state );

  _state = upload_state::streaming;

  for( ;; )
  {
    auto bytes = io::read_range( src, _bytes_sent, _chunk_size );
    if( !bytes )
      return std::unexpected( fail( bytes.error() ) );

    if( bytes->empty() )
      break;

    if( _bytes_sent + bytes->size() > _payload_length )
      return std::unexpected( fail( transfer_errc::payload_overflow ) );

    _hasher.absorb( *bytes );

    protocol::chunk c;
    c.data = std::move( *bytes );

    if( auto sent = _stream->send( c ); !sent )
      return std::unexpected( fail( sent.error() ) );

    _bytes_sent += c.data.size();
    ++_chunks_sent;

    LOG_DEBUG( tessera::log::instance(),
               "Sent chunk {} of {} bytes, {}",
               _chunks_sent,
               c.data.size(),
               tessera::log::percent{ _bytes_sent, _payload_length } );
  }

  if( _bytes_sent < _payload_length )
    return std::unexpected( fail( transfer_errc::payload_underflow ) );

  return {};
}

result< refs::address > upload::close()
{
  if( _state != upload_state::streaming && !( _state == upload_state::header_sent && _payload_length == 0 ) )
    return std::unexpected( transfer_errc::invalid_state );

  auto response = _stream->close_and_receive();
  if( !response )
    return std::unexpected( fail( response.error() ) );

  if( response->address != *_address )
  {
    LOG_ERROR( tessera::log::instance(),
               "Service committed {} instead of {}",
               response->address,
               *_address );
    _state = upload_state::failed;
    return std::unexpected( transfer_errc::address_mismatch );
  }

  _state = upload_state::closed;
  LOG_INFO( tessera::log::instance(),
            "Uploaded {}, {} bytes in {} chunks",
            response->address,
            _bytes_sent,
            _chunks_sent );
  return response->address;
}

upload_state upload::state() const noexcept
{
  return _state;
}

std::uint64_t upload::payload_length() const noexcept
{
  return _payload_length;
}

std::uint64_t upload::bytes_sent() const noexcept
{
  return _bytes_sent;
}

std::size_t upload::chunks_sent() const noexcept
{
  return _chunks_sent;
}

crypto::tz::digest upload::payload_digest() const noexcept
{
  return _hasher.finalize();
}

} // namespace tessera::transfer
