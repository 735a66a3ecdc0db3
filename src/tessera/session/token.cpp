#include <tessera/session/token.hpp>

#include <algorithm>

namespace tessera::session {

bool token::permits( std::span< const refs::object_id > ids, std::uint64_t epoch ) const noexcept
{
  if( epoch < first_epoch || epoch > last_epoch )
    return false;

  return std::ranges::all_of( ids,
                              [ this ]( const refs::object_id& id )
                              {
                                return std::ranges::find( object_ids, id ) != object_ids.end();
                              } );
}

crypto::digest make_digest( const token& t ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( t.owner_id.bytes() );

  crypto::hasher_update( static_cast< std::uint64_t >( t.object_ids.size() ) );
  for( const auto& id: t.object_ids )
    crypto::hasher_update( id.bytes() );

  crypto::hasher_update( t.first_epoch );
  crypto::hasher_update( t.last_epoch );
  crypto::hasher_update( t.header.public_key );

  return crypto::hasher_finalize();
}

bool has_public_key( const token& t ) noexcept
{
  return std::ranges::any_of( t.header.public_key,
                              []( std::byte b )
                              {
                                return b != std::byte{ 0x00 };
                              } );
}

bool verify_signature( const token& t ) noexcept
{
  return crypto::public_key( t.owner_key ).verify( t.signature, make_digest( t ) );
}

} // namespace tessera::session
