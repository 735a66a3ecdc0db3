#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <tessera/crypto/hash.hpp>
#include <tessera/crypto/public_key.hpp>
#include <tessera/crypto/secret_key.hpp>
#include <tessera/encode/archive.hpp>
#include <tessera/object/error.hpp>
#include <tessera/refs.hpp>

namespace tessera::object {

struct creation_point
{
  std::uint64_t epoch    = 0;
  std::int64_t unix_time = 0;

  bool operator==( const creation_point& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & epoch;
    ar & unix_time;
  }
};

struct system_header
{
  refs::object_id id;
  refs::owner_id owner_id;
  refs::container_id container_id;
  std::uint64_t payload_length = 0;
  std::uint64_t version        = 0;
  creation_point created_at;

  bool operator==( const system_header& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int /*file_version*/ )
  {
    ar & id;
    ar & owner_id;
    ar & container_id;
    ar & payload_length;
    ar & version;
    ar & created_at;
  }
};

struct user_header
{
  std::string key;
  std::string value;

  bool operator==( const user_header& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & key;
    ar & value;
  }
};

struct tombstone
{
  std::uint64_t epoch = 0;

  bool operator==( const tombstone& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & epoch;
  }
};

struct storage_group
{
  std::uint64_t validation_data_size = 0;

  bool operator==( const storage_group& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & validation_data_size;
  }
};

struct root_marker
{
  bool operator==( const root_marker& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {}
};

struct verification_header
{
  crypto::public_key_data public_key{};

  bool operator==( const verification_header& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & public_key;
  }
};

struct integrity_header
{
  crypto::digest headers_checksum{};
  crypto::signature signature{};

  bool operator==( const integrity_header& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & headers_checksum;
    ar & signature;
  }
};

using header = std::variant< user_header, tombstone, storage_group, root_marker, verification_header, integrity_header >;

struct object
{
  system_header system;
  std::vector< header > headers;
  std::vector< std::byte > payload;

  bool operator==( const object& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & system;
    ar & headers;
    ar & payload;
  }

  refs::address address() const noexcept;

  // Last header of the given kind, if any
  template< typename Header >
  const Header* last_header() const noexcept
  {
    for( auto it = headers.rbegin(); it != headers.rend(); ++it )
    {
      if( const auto* h = std::get_if< Header >( &*it ) )
        return h;
    }

    return nullptr;
  }

  bool is_tombstone() const noexcept;
};

/*
 * Integrity of an object's metadata. The checksum covers the serialized
 * system header followed by every header preceding the integrity header,
 * and is signed by the key carried in the verification header.
 */
crypto::digest headers_checksum( const system_header& system, std::span< const header > headers );

void sign( object& obj, const crypto::secret_key& key );
result< void > verify( const object& obj );

} // namespace tessera::object
