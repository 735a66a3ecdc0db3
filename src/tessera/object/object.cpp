#include <tessera/object/object.hpp>

#include <algorithm>
#include <ranges>

#include <tessera/log.hpp>

namespace tessera::object {

refs::address object::address() const noexcept
{
  return refs::address( system.container_id, system.id );
}

bool object::is_tombstone() const noexcept
{
  return last_header< tombstone >() != nullptr;
}

crypto::digest headers_checksum( const system_header& system, std::span< const header > headers )
{
  crypto::hasher_reset();
  crypto::hasher_update( encode::to_bytes( system ) );

  for( const auto& h: headers )
    crypto::hasher_update( encode::to_bytes( h ) );

  return crypto::hasher_finalize();
}

void sign( object& obj, const crypto::secret_key& key )
{
  std::erase_if( obj.headers,
                 []( const header& h )
                 {
                   return std::holds_alternative< verification_header >( h )
                          || std::holds_alternative< integrity_header >( h );
                 } );

  obj.headers.emplace_back( verification_header{ .public_key = key.public_key().bytes() } );

  integrity_header integrity;
  integrity.headers_checksum = headers_checksum( obj.system, obj.headers );
  integrity.signature        = key.sign( integrity.headers_checksum );
  obj.headers.emplace_back( integrity );
}

result< void > verify( const object& obj )
{
  if( obj.headers.empty() || !std::holds_alternative< integrity_header >( obj.headers.back() ) )
    return std::unexpected( object_errc::missing_integrity_header );

  const auto& integrity = std::get< integrity_header >( obj.headers.back() );
  auto covered          = std::span< const header >( obj.headers ).first( obj.headers.size() - 1 );

  auto reversed     = covered | std::views::reverse;
  auto verification = std::ranges::find_if( reversed,
                                            []( const header& h )
                                            {
                                              return std::holds_alternative< verification_header >( h );
                                            } );
  if( verification == reversed.end() )
    return std::unexpected( object_errc::missing_verification_header );

  crypto::public_key key( std::get< verification_header >( *verification ).public_key );

  if( auto checksum = headers_checksum( obj.system, covered ); checksum != integrity.headers_checksum )
  {
    LOG_WARNING( tessera::log::instance(),
                 "Headers checksum mismatch for object {}, computed {} but the object carries {}",
                 obj.address(),
                 tessera::log::hex{ checksum.data(), checksum.size() },
                 tessera::log::hex{ integrity.headers_checksum.data(), integrity.headers_checksum.size() } );
    return std::unexpected( object_errc::checksum_mismatch );
  }

  if( !key.verify( integrity.signature, integrity.headers_checksum ) )
  {
    LOG_WARNING( tessera::log::instance(), "Integrity signature rejected for object {}", obj.address() );
    return std::unexpected( object_errc::invalid_signature );
  }

  if( refs::make_owner_id( key ) != obj.system.owner_id )
  {
    LOG_WARNING( tessera::log::instance(), "Verification key is not bound to the owner of object {}", obj.address() );
    return std::unexpected( object_errc::owner_mismatch );
  }

  return {};
}

} // namespace tessera::object
