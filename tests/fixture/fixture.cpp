// NOLINTBEGIN

#include <test/fixture.hpp>

#include <chrono>
#include <limits>
#include <string_view>

#include <gtest/gtest.h>

#include <tessera/log.hpp>

namespace test {

using namespace std::chrono_literals;

fixture::fixture( const std::string& name, const std::string& log_level ):
    _node_key( tessera::crypto::secret_key::create( tessera::crypto::hash( "node" ) ) ),
    _node( _node_key )
{
  tessera::log::initialize( log_level );

  tessera::refs::container_id_data cid{};
  auto digest = tessera::crypto::hash( std::string_view( name ) );
  std::ranges::copy( digest, cid.begin() );
  _container = tessera::refs::container_id( cid );

  LOG_INFO( tessera::log::instance(), "Using container {} for {}", _container, name );
}

std::vector< std::byte > fixture::make_payload( std::size_t length, std::uint8_t seed ) const
{
  std::vector< std::byte > payload( length );
  std::uint32_t state = seed * 2'654'435'761U + 1;

  for( auto& b: payload )
  {
    state = state * 1'103'515'245U + 12'345U;
    b     = std::byte( state >> 24 );
  }

  return payload;
}

tessera::object::object fixture::make_object( const tessera::crypto::secret_key& key,
                                              std::uint64_t payload_length,
                                              std::vector< tessera::object::header > headers ) const
{
  tessera::object::object obj;
  obj.system.id             = tessera::refs::object_id::generate();
  obj.system.owner_id       = tessera::refs::make_owner_id( key.public_key() );
  obj.system.container_id   = _container;
  obj.system.payload_length = payload_length;
  obj.system.version        = 1;
  obj.headers               = std::move( headers );
  tessera::object::sign( obj, key );
  return obj;
}

tessera::session::token fixture::negotiate( const tessera::crypto::secret_key& key,
                                            std::vector< tessera::refs::object_id > scope )
{
  auto t = tessera::session::negotiate( _node,
                                        key,
                                        std::move( scope ),
                                        0,
                                        std::numeric_limits< std::uint64_t >::max(),
                                        context() );
  EXPECT_TRUE( t ) << t.error().message();
  return t ? *t : tessera::session::token{};
}

tessera::refs::address fixture::upload( const tessera::crypto::secret_key& key,
                                        const std::vector< std::byte >& payload,
                                        std::vector< tessera::object::header > headers,
                                        std::size_t chunk_size )
{
  auto obj   = make_object( key, payload.size(), std::move( headers ) );
  auto token = negotiate( key, { obj.system.id } );

  tessera::io::memory_source src( payload );
  tessera::transfer::upload up( _node, chunk_size );

  auto sent = up.send_header( obj, token, tessera::protocol::default_ttl, context() );
  EXPECT_TRUE( sent ) << sent.error().message();

  auto streamed = up.stream( src );
  EXPECT_TRUE( streamed ) << streamed.error().message();

  auto address = up.close();
  EXPECT_TRUE( address ) << address.error().message();
  return address.value_or( obj.address() );
}

tessera::client::client fixture::make_client( const tessera::crypto::secret_key& key, tessera::client::config cfg )
{
  return tessera::client::client( _node, _node, key, std::move( cfg ) );
}

tessera::net::call_context fixture::context() const
{
  return tessera::net::call_context( 5s );
}

} // namespace test

// NOLINTEND
