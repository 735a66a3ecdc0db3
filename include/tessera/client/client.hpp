#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <system_error>
#include <vector>

#include <tessera/crypto/secret_key.hpp>
#include <tessera/crypto/tz.hpp>
#include <tessera/io.hpp>
#include <tessera/net/context.hpp>
#include <tessera/net/service.hpp>
#include <tessera/object.hpp>
#include <tessera/protocol/object.hpp>
#include <tessera/refs.hpp>
#include <tessera/transfer/download.hpp>
#include <tessera/transfer/upload.hpp>
#include <tessera/verify/range_verifier.hpp>

namespace tessera::client {

template< typename T >
using result = std::expected< T, std::error_code >;

struct config
{
  std::size_t chunk_size = transfer::default_chunk_size;
  std::uint32_t ttl      = protocol::default_ttl;
  std::optional< std::chrono::milliseconds > timeout;
};

struct put_receipt
{
  refs::address address;
  std::uint64_t payload_length = 0;
  std::size_t chunks           = 0;
  crypto::tz::digest payload_digest{};
  std::optional< verify::result< verify::range_check > > verification;
};

/*
 * Object operations on behalf of one key. Operations that need proof of
 * ownership negotiate a session scoped to exactly the objects involved.
 */
class client
{
public:
  client( net::object_service& objects,
          net::session_service& sessions,
          const crypto::secret_key& key,
          config cfg = {} );

  result< put_receipt > put( const refs::container_id& container,
                             io::source& payload,
                             std::vector< object::header > headers = {},
                             bool verify_payload                  = false,
                             std::stop_token stop                 = {} );

  result< transfer::download_outcome >
  get( const refs::address& addr, io::sink& sink, std::stop_token stop = {} );

  result< void > remove( const refs::address& addr, std::stop_token stop = {} );

  result< object::object > head( const refs::address& addr, bool full_headers = false, std::stop_token stop = {} );

  result< std::vector< refs::address > >
  search( const refs::container_id& container, const object::query& q, std::stop_token stop = {} );

  result< std::vector< std::vector< std::byte > > >
  get_range( const refs::address& addr, std::span< const object::range > ranges, std::stop_token stop = {} );

  result< std::vector< verify::range_check > > get_range_hash( const refs::address& addr,
                                                               std::span< const object::range > ranges,
                                                               std::span< const std::byte > salt,
                                                               io::source* local    = nullptr,
                                                               std::stop_token stop = {} );

  const refs::owner_id& owner_id() const noexcept;
  const config& configuration() const noexcept;

private:
  net::call_context make_context( std::stop_token stop ) const;

  net::object_service& _objects;
  net::session_service& _sessions;
  crypto::secret_key _key;
  refs::owner_id _owner_id;
  config _config;
};

} // namespace tessera::client
