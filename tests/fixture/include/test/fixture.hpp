#pragma once

#include <string>
#include <vector>

#include <tessera/client.hpp>
#include <tessera/crypto.hpp>
#include <tessera/io.hpp>
#include <tessera/refs.hpp>
#include <tessera/session.hpp>
#include <tessera/transfer.hpp>
#include <tessera/verify.hpp>

#include <test/fake_node.hpp>

namespace test {

constexpr std::size_t mebibyte = 1'024 * 1'024;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture() = default;

  // Deterministic payload of the given length
  std::vector< std::byte > make_payload( std::size_t length, std::uint8_t seed = 0 ) const;

  // Signed object without payload, owned by the key
  tessera::object::object make_object( const tessera::crypto::secret_key& key,
                                       std::uint64_t payload_length,
                                       std::vector< tessera::object::header > headers = {} ) const;

  tessera::session::token negotiate( const tessera::crypto::secret_key& key,
                                     std::vector< tessera::refs::object_id > scope );

  // Uploads through a fresh session, returning the committed address
  tessera::refs::address upload( const tessera::crypto::secret_key& key,
                                 const std::vector< std::byte >& payload,
                                 std::vector< tessera::object::header > headers = {},
                                 std::size_t chunk_size                          = tessera::transfer::default_chunk_size );

  tessera::client::client make_client( const tessera::crypto::secret_key& key, tessera::client::config cfg = {} );

  tessera::net::call_context context() const;

  tessera::crypto::secret_key _node_key;
  fake_node _node;
  tessera::refs::container_id _container;
};

} // namespace test
