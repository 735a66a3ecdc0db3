#include <tessera/client/client.hpp>

#include <chrono>
#include <limits>

#include <tessera/log.hpp>
#include <tessera/session/negotiator.hpp>

namespace tessera::client {

namespace {

constexpr std::uint64_t object_version = 1;

} // namespace

client::client( net::object_service& objects,
                net::session_service& sessions,
                const crypto::secret_key& key,
                config cfg ):
    _objects( objects ),
    _sessions( sessions ),
    _key( key ),
    _owner_id( refs::make_owner_id( key.public_key() ) ),
    _config( std::move( cfg ) )
{}

const refs::owner_id& client::owner_id() const noexcept
{
  return _owner_id;
}

const config& client::configuration() const noexcept
{
  return _config;
}

net::call_context client::make_context( std::stop_token stop ) const
{
  if( _config.timeout )
    return net::call_context( *_config.timeout, std::move( stop ) );

  return net::call_context( std::nullopt, std::move( stop ) );
}

result< put_receipt > client::put( const refs::container_id& container,
                                   io::source& payload,
                                   std::vector< object::header > headers,
                                   bool verify_payload,
                                   std::stop_token stop )
{
  auto ctx = make_context( std::move( stop ) );
  auto id  = refs::object_id::generate();

  auto token = session::negotiate( _sessions, _key, { id }, 0, std::numeric_limits< std::uint64_t >::max(), ctx );
  if( !token )
    return std::unexpected( token.error() );

  object::object obj;
  obj.system.id             = id;
  obj.system.owner_id       = _owner_id;
  obj.system.container_id   = container;
  obj.system.payload_length = payload.size();
  obj.system.version        = object_version;
  obj.system.created_at.unix_time =
    std::chrono::duration_cast< std::chrono::seconds >( std::chrono::system_clock::now().time_since_epoch() ).count();
  obj.headers = std::move( headers );
  object::sign( obj, _key );

  transfer::upload up( _objects, _config.chunk_size );

  if( auto sent = up.send_header( obj, *token, _config.ttl, ctx ); !sent )
    return std::unexpected( sent.error() );

  if( auto streamed = up.stream( payload ); !streamed )
    return std::unexpected( streamed.error() );

  auto address = up.close();
  if( !address )
    return std::unexpected( address.error() );

  put_receipt receipt;
  receipt.address        = *address;
  receipt.payload_length = up.bytes_sent();
  receipt.chunks         = up.chunks_sent();
  receipt.payload_digest = up.payload_digest();

  if( verify_payload )
  {
    verify::range_verifier verifier( _objects, _config.ttl );
    receipt.verification = verifier.verify_payload( *address, up.bytes_sent(), receipt.payload_digest, ctx );
  }

  return receipt;
}

result< transfer::download_outcome > client::get( const refs::address& addr, io::sink& sink, std::stop_token stop )
{
  auto ctx = make_context( std::move( stop ) );

  transfer::download down( _objects );

  if( auto opened = down.open( addr, _config.ttl, ctx ); !opened )
    return std::unexpected( opened.error() );

  return down.receive( sink );
}

result< void > client::remove( const refs::address& addr, std::stop_token stop )
{
  auto ctx = make_context( std::move( stop ) );

  auto token =
    session::negotiate( _sessions, _key, { addr.object() }, 0, std::numeric_limits< std::uint64_t >::max(), ctx );
  if( !token )
    return std::unexpected( token.error() );

  protocol::delete_request req;
  req.address  = addr;
  req.owner_id = _owner_id;
  req.token    = std::move( *token );
  req.ttl      = _config.ttl;

  auto response = _objects.remove( req, ctx );
  if( !response )
    return std::unexpected( response.error() );

  LOG_INFO( tessera::log::instance(), "Removed {}", addr );
  return {};
}

result< object::object > client::head( const refs::address& addr, bool full_headers, std::stop_token stop )
{
  protocol::head_request req;
  req.address      = addr;
  req.full_headers = full_headers;
  req.ttl          = _config.ttl;

  auto response = _objects.head( req, make_context( std::move( stop ) ) );
  if( !response )
    return std::unexpected( response.error() );

  return std::move( response->object );
}

result< std::vector< refs::address > >
client::search( const refs::container_id& container, const object::query& q, std::stop_token stop )
{
  protocol::search_request req;
  req.container_id = container;
  req.query        = q;
  req.ttl          = _config.ttl;

  auto response = _objects.search( req, make_context( std::move( stop ) ) );
  if( !response )
    return std::unexpected( response.error() );

  LOG_DEBUG( tessera::log::instance(), "Search in {} matched {} objects", container, response->addresses.size() );
  return std::move( response->addresses );
}

result< std::vector< std::vector< std::byte > > >
client::get_range( const refs::address& addr, std::span< const object::range > ranges, std::stop_token stop )
{
  protocol::range_request req;
  req.address = addr;
  req.ranges.assign( ranges.begin(), ranges.end() );
  req.ttl = _config.ttl;

  auto response = _objects.get_range( req, make_context( std::move( stop ) ) );
  if( !response )
    return std::unexpected( response.error() );

  if( response->fragments.size() != ranges.size() )
  {
    LOG_ERROR( tessera::log::instance(),
               "Requested {} ranges of {} but received {}",
               ranges.size(),
               addr,
               response->fragments.size() );
    return std::unexpected( verify::verify_errc::fragment_count_mismatch );
  }

  return std::move( response->fragments );
}

result< std::vector< verify::range_check > > client::get_range_hash( const refs::address& addr,
                                                                     std::span< const object::range > ranges,
                                                                     std::span< const std::byte > salt,
                                                                     io::source* local,
                                                                     std::stop_token stop )
{
  verify::range_verifier verifier( _objects, _config.ttl );
  return verifier.verify( addr, ranges, salt, local, make_context( std::move( stop ) ) );
}

} // namespace tessera::client
