#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <tessera/crypto/tz.hpp>
#include <tessera/io/source.hpp>
#include <tessera/net/context.hpp>
#include <tessera/net/service.hpp>
#include <tessera/object/range.hpp>
#include <tessera/protocol/object.hpp>
#include <tessera/refs.hpp>
#include <tessera/verify/error.hpp>

namespace tessera::verify {

struct range_check
{
  object::range range;
  crypto::tz::digest digest{};
  std::optional< bool > matches_local;
};

/*
 * Compares range hashes computed by the service with hashes of a local
 * copy. Digests are matched to ranges strictly by position.
 */
class range_verifier
{
public:
  explicit range_verifier( net::object_service& service, std::uint32_t ttl = protocol::default_ttl ) noexcept;

  result< std::vector< range_check > > verify( const refs::address& addr,
                                               std::span< const object::range > ranges,
                                               std::span< const std::byte > salt,
                                               io::source* local,
                                               const net::call_context& ctx );

  // One hash over [0, payload_length) against a digest computed while uploading
  result< range_check > verify_payload( const refs::address& addr,
                                        std::uint64_t payload_length,
                                        const crypto::tz::digest& expected,
                                        const net::call_context& ctx );

private:
  net::object_service& _service;
  std::uint32_t _ttl;
};

} // namespace tessera::verify
