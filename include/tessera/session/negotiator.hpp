#pragma once

#include <cstdint>
#include <vector>

#include <tessera/crypto/secret_key.hpp>
#include <tessera/net/context.hpp>
#include <tessera/net/service.hpp>
#include <tessera/protocol/session.hpp>
#include <tessera/refs.hpp>
#include <tessera/session/error.hpp>
#include <tessera/session/token.hpp>

namespace tessera::session {

enum class state : std::uint8_t
{
  idle,
  proposed,
  signature_sent,
  established,
  failed
};

const char* to_string( state s ) noexcept;

/*
 * Challenge-response negotiation of one session token.
 *
 *   idle --propose--> proposed --accept--> signature_sent --complete--> established
 *
 * Every step validates the service's answer against the proposal. Any
 * failure moves the negotiator to failed, from which no step is accepted.
 */
class negotiator
{
public:
  negotiator( const crypto::secret_key& key,
              std::vector< refs::object_id > scope,
              std::uint64_t first_epoch,
              std::uint64_t last_epoch );

  // The init request carrying the proposal
  result< protocol::session_request > propose();

  // Checks the unsigned echo and answers with the signed token
  result< protocol::session_request > accept( const protocol::session_response& response );

  // Checks the result token and finishes the negotiation
  result< token > complete( const protocol::session_response& response );

  state current_state() const noexcept;
  const protocol::session_init& proposal() const noexcept;

private:
  result< void > check_echo( const token& t ) const;
  std::error_code fail( session_errc e ) noexcept;

  crypto::secret_key _key;
  protocol::session_init _proposal;
  state _state = state::idle;
};

// Runs a full negotiation over a session stream of the service
result< token > negotiate( net::session_service& service,
                           const crypto::secret_key& key,
                           std::vector< refs::object_id > scope,
                           std::uint64_t first_epoch,
                           std::uint64_t last_epoch,
                           const net::call_context& ctx );

} // namespace tessera::session
