#include <tessera/net/channel.hpp>

#include <mutex>
#include <optional>
#include <stop_token>

#include <openssl/ssl.h>

#include <tessera/log.hpp>
#include <tessera/memory.hpp>

#include "call.hpp"

namespace tessera::net {

channel::channel( channel_options options ):
    _options( std::move( options ) ),
    _context( boost::asio::ssl::context::tls_client )
{
  _context.set_options( boost::asio::ssl::context::default_workarounds | boost::asio::ssl::context::no_sslv2
                        | boost::asio::ssl::context::no_sslv3 );

  if( _options.tls )
  {
    if( _options.ca_path.empty() )
      _context.set_default_verify_paths();
    else
      _context.load_verify_file( _options.ca_path );

    _context.set_verify_mode( _options.verify_peer ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none );
  }

  _stream = std::make_unique< tls_stream >( _io, _context );
}

channel::~channel()
{
  disconnect();
}

result< std::unique_ptr< channel > > channel::connect( const channel_options& options, const call_context& ctx )
{
  std::unique_ptr< channel > ch;

  try
  {
    ch.reset( new channel( options ) );
  }
  catch( const boost::system::system_error& e )
  {
    LOG_ERROR( tessera::log::instance(), "Unable to set up the TLS context: {}", e.what() );
    return std::unexpected( net_errc::ssl_handshake_failed );
  }

  if( auto opened = ch->open( ctx ); !opened )
    return std::unexpected( opened.error() );

  return ch;
}

result< void > channel::open( const call_context& ctx )
{
  {
    std::lock_guard< std::mutex > lock( _abort_mutex );
    _aborting = false;
  }

  boost::asio::ip::tcp::resolver resolver( _io );
  boost::asio::ip::tcp::resolver::results_type endpoints;

  auto resolved = run( ctx,
                       net_errc::connection_failed,
                       [ & ]( completion done )
                       {
                         resolver.async_resolve( _options.host,
                                                 _options.port,
                                                 [ &endpoints, done ]( const boost::system::error_code& ec,
                                                                       boost::asio::ip::tcp::resolver::results_type r )
                                                 {
                                                   endpoints = std::move( r );
                                                   done( ec );
                                                 } );
                       } );
  if( !resolved )
  {
    LOG_ERROR( tessera::log::instance(), "Unable to resolve {}:{}", _options.host, _options.port );
    return resolved;
  }

  auto connected = run( ctx,
                        net_errc::connection_failed,
                        [ & ]( completion done )
                        {
                          boost::asio::async_connect( _stream->lowest_layer(),
                                                      endpoints,
                                                      [ done ]( const boost::system::error_code& ec,
                                                                const boost::asio::ip::tcp::endpoint& /*endpoint*/ )
                                                      {
                                                        done( ec );
                                                      } );
                        } );
  if( !connected )
  {
    LOG_ERROR( tessera::log::instance(), "Unable to connect to {}:{}", _options.host, _options.port );
    return connected;
  }

  if( _options.tls )
  {
    if( !SSL_set_tlsext_host_name( _stream->native_handle(), _options.host.c_str() ) )
    {
      LOG_ERROR( tessera::log::instance(), "Unable to set the TLS server name to {}", _options.host );
      abort();
      return std::unexpected( net_errc::ssl_handshake_failed );
    }

    auto handshake = run( ctx,
                          net_errc::ssl_handshake_failed,
                          [ & ]( completion done )
                          {
                            _stream->async_handshake( boost::asio::ssl::stream_base::client, done );
                          } );
    if( !handshake )
    {
      LOG_ERROR( tessera::log::instance(), "TLS handshake with {} failed", _options.host );
      return handshake;
    }
  }

  _connected = true;
  LOG_INFO( tessera::log::instance(),
            "Connected to {}:{}{}",
            _options.host,
            _options.port,
            _options.tls ? " over TLS" : "" );
  return {};
}

bool channel::connected() const noexcept
{
  return _connected;
}

bool channel::busy() const noexcept
{
  return _busy;
}

const std::optional< remote_status >& channel::last_rejection() const noexcept
{
  return _rejection;
}

const channel_options& channel::options() const noexcept
{
  return _options;
}

void channel::reject( remote_status status )
{
  _rejection = std::move( status );
}

void channel::release() noexcept
{
  _busy = false;
}

void channel::disconnect() noexcept
{
  if( !_connected )
    return;

  _connected = false;

  boost::system::error_code ec;
  _stream->lowest_layer().shutdown( boost::asio::ip::tcp::socket::shutdown_both, ec );
  if( ec && ec != boost::asio::error::not_connected )
    LOG_DEBUG( tessera::log::instance(), "Socket shutdown: {}", ec.message() );

  _stream->lowest_layer().close( ec );
  if( ec )
    LOG_WARNING( tessera::log::instance(), "Unable to close the connection: {}", ec.message() );
}

void channel::abort() noexcept
{
  {
    std::lock_guard< std::mutex > lock( _abort_mutex );
    _aborting = true;
  }

  boost::system::error_code ec;
  _stream->lowest_layer().cancel( ec );
  if( ec )
    LOG_DEBUG( tessera::log::instance(), "Socket cancel: {}", ec.message() );

  _stream->lowest_layer().close( ec );
  if( ec )
    LOG_WARNING( tessera::log::instance(), "Unable to close the connection: {}", ec.message() );

  _connected = false;

  // Drain the aborted handlers, they reference the frames of the caller.
  // A stop request can no longer interrupt the loop once aborting is set.
  _io.restart();
  _io.run();
}

result< void > channel::run( const call_context& ctx, net_errc failure, const std::function< void( completion ) >& initiate )
{
  if( auto status = ctx.check(); !status )
    return status;

  std::optional< boost::system::error_code > outcome;

  _io.restart();
  initiate(
    [ &outcome ]( const boost::system::error_code& ec )
    {
      outcome = ec;
    } );

  std::stop_callback on_stop( ctx.stop_token(),
                              [ this ]()
                              {
                                std::lock_guard< std::mutex > lock( _abort_mutex );
                                if( !_aborting )
                                  _io.stop();
                              } );

  while( !outcome )
  {
    if( auto status = ctx.check(); !status )
    {
      LOG_DEBUG( tessera::log::instance(), "Aborting connection: {}", status.error().message() );
      abort();
      return status;
    }

    if( _io.stopped() )
      _io.restart();

    if( auto left = ctx.remaining() )
      _io.run_for( *left );
    else
      _io.run();
  }

  if( *outcome )
  {
    if( *outcome == boost::asio::error::eof )
    {
      LOG_DEBUG( tessera::log::instance(), "Connection closed by the service" );
      _connected = false;
      return std::unexpected( net_errc::stream_closed );
    }

    LOG_ERROR( tessera::log::instance(), "Network error: {}", outcome->message() );
    _connected = false;
    return std::unexpected( failure );
  }

  return {};
}

result< void > channel::write_frame( const frame& f, const call_context& ctx )
{
  if( !_connected )
    return std::unexpected( net_errc::stream_closed );

  auto bytes = encode_frame( f );
  if( !bytes )
    return std::unexpected( bytes.error() );

  LOG_DEBUG( tessera::log::instance(),
             "Sending {} {} frame, {} bytes",
             to_string( f.method ),
             to_string( f.kind ),
             f.payload.size() );

  return run( ctx,
              net_errc::connection_failed,
              [ & ]( completion done )
              {
                auto on_written = [ done ]( const boost::system::error_code& ec, std::size_t /*length*/ )
                {
                  done( ec );
                };

                if( _options.tls )
                  boost::asio::async_write( *_stream, boost::asio::buffer( *bytes ), on_written );
                else
                  boost::asio::async_write( _stream->next_layer(), boost::asio::buffer( *bytes ), on_written );
              } );
}

result< frame > channel::read_frame( const call_context& ctx )
{
  if( !_connected )
    return std::unexpected( net_errc::stream_closed );

  auto read_exactly = [ & ]( std::span< std::byte > buffer ) -> result< void >
  {
    return run( ctx,
                net_errc::connection_failed,
                [ & ]( completion done )
                {
                  auto on_read = [ done ]( const boost::system::error_code& ec, std::size_t /*length*/ )
                  {
                    done( ec );
                  };

                  if( _options.tls )
                    boost::asio::async_read( *_stream, boost::asio::buffer( buffer.data(), buffer.size() ), on_read );
                  else
                    boost::asio::async_read( _stream->next_layer(),
                                             boost::asio::buffer( buffer.data(), buffer.size() ),
                                             on_read );
                } );
  };

  frame_header_data header_bytes{};
  if( auto read = read_exactly( header_bytes ); !read )
    return std::unexpected( read.error() );

  auto header = decode_frame_header( header_bytes );
  if( !header )
  {
    LOG_ERROR( tessera::log::instance(), "Rejecting frame from the service: {}", header.error().message() );
    abort();
    return std::unexpected( header.error() );
  }

  frame f;
  f.kind   = header->kind;
  f.method = header->method;
  f.payload.resize( header->length );

  if( header->length )
  {
    if( auto read = read_exactly( f.payload ); !read )
      return std::unexpected( read.error() );
  }

  LOG_DEBUG( tessera::log::instance(),
             "Received {} {} frame, {} bytes",
             to_string( f.method ),
             to_string( f.kind ),
             f.payload.size() );

  return f;
}

result< std::unique_ptr< call > > channel::begin( net::method m, const call_context& ctx )
{
  if( !_connected )
    return std::unexpected( net_errc::stream_closed );

  if( _busy.exchange( true ) )
  {
    LOG_WARNING( tessera::log::instance(), "Refusing {} call, the channel is serving another stream", to_string( m ) );
    return std::unexpected( net_errc::channel_busy );
  }

  _rejection.reset();

  return std::make_unique< call >( *this, m, ctx );
}

template< typename Response, typename Request >
result< Response > channel::unary( net::method m, const Request& request, const call_context& ctx )
{
  auto c = begin( m, ctx );
  if( !c )
    return std::unexpected( c.error() );

  if( auto opened = ( *c )->open( encode::to_bytes( request ) ); !opened )
    return std::unexpected( opened.error() );

  return receive_single< Response >( **c );
}

result< std::unique_ptr< put_stream > > channel::put( const call_context& ctx )
{
  auto c = begin( method::put, ctx );
  if( !c )
    return std::unexpected( c.error() );

  if( auto opened = ( *c )->open( {} ); !opened )
    return std::unexpected( opened.error() );

  return std::make_unique< framed_client_stream< protocol::put_request, protocol::put_response > >( std::move( *c ) );
}

result< std::unique_ptr< get_stream > > channel::get( const protocol::get_request& req, const call_context& ctx )
{
  auto c = begin( method::get, ctx );
  if( !c )
    return std::unexpected( c.error() );

  if( auto opened = ( *c )->open( encode::to_bytes( req ) ); !opened )
    return std::unexpected( opened.error() );

  return std::make_unique< framed_server_stream< protocol::get_response > >( std::move( *c ) );
}

result< protocol::delete_response > channel::remove( const protocol::delete_request& req, const call_context& ctx )
{
  return unary< protocol::delete_response >( method::remove, req, ctx );
}

result< protocol::head_response > channel::head( const protocol::head_request& req, const call_context& ctx )
{
  return unary< protocol::head_response >( method::head, req, ctx );
}

result< protocol::search_response > channel::search( const protocol::search_request& req, const call_context& ctx )
{
  return unary< protocol::search_response >( method::search, req, ctx );
}

result< protocol::range_response > channel::get_range( const protocol::range_request& req, const call_context& ctx )
{
  return unary< protocol::range_response >( method::get_range, req, ctx );
}

result< protocol::range_hash_response > channel::get_range_hash( const protocol::range_hash_request& req,
                                                                 const call_context& ctx )
{
  return unary< protocol::range_hash_response >( method::get_range_hash, req, ctx );
}

result< std::unique_ptr< session_stream > > channel::create( const call_context& ctx )
{
  auto c = begin( method::session_create, ctx );
  if( !c )
    return std::unexpected( c.error() );

  if( auto opened = ( *c )->open( {} ); !opened )
    return std::unexpected( opened.error() );

  return std::make_unique< framed_bidi_stream< protocol::session_request, protocol::session_response > >(
    std::move( *c ) );
}

} // namespace tessera::net
