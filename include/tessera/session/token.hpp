#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/vector.hpp>

#include <tessera/crypto/hash.hpp>
#include <tessera/crypto/public_key.hpp>
#include <tessera/refs.hpp>

namespace tessera::session {

struct token_header
{
  crypto::public_key_data public_key{};
  crypto::signature key_signature{};

  bool operator==( const token_header& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & public_key;
    ar & key_signature;
  }
};

/*
 * Session token scoping an owner to an ordered set of objects over an epoch
 * window. The service proposes it unsigned, the owner signs it and the
 * service answers with the final form.
 */
struct token
{
  refs::owner_id owner_id;
  std::vector< refs::object_id > object_ids;
  std::uint64_t first_epoch = 0;
  std::uint64_t last_epoch  = 0;
  token_header header;
  crypto::public_key_data owner_key{};
  crypto::signature signature{};

  bool operator==( const token& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner_id;
    ar & object_ids;
    ar & first_epoch;
    ar & last_epoch;
    ar & header;
    ar & owner_key;
    ar & signature;
  }

  bool permits( std::span< const refs::object_id > ids, std::uint64_t epoch ) const noexcept;
};

// Digest signed by the owner: owner id, scope, epoch window and header key
crypto::digest make_digest( const token& t ) noexcept;

bool has_public_key( const token& t ) noexcept;
bool verify_signature( const token& t ) noexcept;

} // namespace tessera::session
