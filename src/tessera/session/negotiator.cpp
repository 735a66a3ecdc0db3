#include <tessera/session/negotiator.hpp>

#include <tessera/log.hpp>

namespace tessera::session {

const char* to_string( state s ) noexcept
{
  switch( s )
  {
    case state::idle:
      return "idle";
    case state::proposed:
      return "proposed";
    case state::signature_sent:
      return "signature sent";
    case state::established:
      return "established";
    case state::failed:
      return "failed";
  }
  std::unreachable();
}

negotiator::negotiator( const crypto::secret_key& key,
                        std::vector< refs::object_id > scope,
                        std::uint64_t first_epoch,
                        std::uint64_t last_epoch ):
    _key( key )
{
  _proposal.owner_id    = refs::make_owner_id( _key.public_key() );
  _proposal.object_ids  = std::move( scope );
  _proposal.first_epoch = first_epoch;
  _proposal.last_epoch  = last_epoch;
}

state negotiator::current_state() const noexcept
{
  return _state;
}

const protocol::session_init& negotiator::proposal() const noexcept
{
  return _proposal;
}

std::error_code negotiator::fail( session_errc e ) noexcept
{
  _state = state::failed;
  return make_error_code( e );
}

result< protocol::session_request > negotiator::propose()
{
  if( _state != state::idle )
    return std::unexpected( make_error_code( session_errc::invalid_state ) );

  _state = state::proposed;
  return _proposal;
}

result< void > negotiator::check_echo( const token& t ) const
{
  if( t.owner_id != _proposal.owner_id )
  {
    LOG_ERROR( tessera::log::instance(),
               "Session owner {} does not match the proposed owner {}",
               t.owner_id,
               _proposal.owner_id );
    return std::unexpected( session_errc::token_mismatch );
  }

  if( t.first_epoch != _proposal.first_epoch || t.last_epoch != _proposal.last_epoch )
  {
    LOG_ERROR( tessera::log::instance(),
               "Session epochs [{}, {}] do not match the proposed epochs [{}, {}]",
               t.first_epoch,
               t.last_epoch,
               _proposal.first_epoch,
               _proposal.last_epoch );
    return std::unexpected( session_errc::token_mismatch );
  }

  if( t.object_ids != _proposal.object_ids )
  {
    LOG_ERROR( tessera::log::instance(),
               "Session scope of {} objects does not match the proposed scope of {} objects",
               t.object_ids.size(),
               _proposal.object_ids.size() );
    return std::unexpected( session_errc::token_mismatch );
  }

  return {};
}

result< protocol::session_request > negotiator::accept( const protocol::session_response& response )
{
  if( _state != state::proposed )
    return std::unexpected( make_error_code( session_errc::invalid_state ) );

  const auto* echo = std::get_if< protocol::session_unsigned >( &response );
  if( !echo )
    return std::unexpected( fail( session_errc::unexpected_response ) );

  if( auto matched = check_echo( echo->token ); !matched )
  {
    _state = state::failed;
    return std::unexpected( matched.error() );
  }

  if( !has_public_key( echo->token ) )
    return std::unexpected( fail( session_errc::missing_public_key ) );

  protocol::session_signed answer;
  answer.token           = echo->token;
  answer.token.owner_key = _key.public_key().bytes();
  answer.token.signature = _key.sign( make_digest( answer.token ) );

  _state = state::signature_sent;
  return answer;
}

result< token > negotiator::complete( const protocol::session_response& response )
{
  if( _state != state::signature_sent )
    return std::unexpected( make_error_code( session_errc::invalid_state ) );

  const auto* final_token = std::get_if< protocol::session_result >( &response );
  if( !final_token )
    return std::unexpected( fail( session_errc::expected_result_token ) );

  if( auto matched = check_echo( final_token->token ); !matched )
  {
    _state = state::failed;
    return std::unexpected( matched.error() );
  }

  _state = state::established;
  return final_token->token;
}

namespace {

result< protocol::session_response > receive_response( net::session_stream& stream )
{
  auto response = stream.receive();
  if( !response )
    return std::unexpected( response.error() );

  if( !*response )
    return std::unexpected( net::net_errc::stream_closed );

  return std::move( **response );
}

} // namespace

result< token > negotiate( net::session_service& service,
                           const crypto::secret_key& key,
                           std::vector< refs::object_id > scope,
                           std::uint64_t first_epoch,
                           std::uint64_t last_epoch,
                           const net::call_context& ctx )
{
  negotiator n( key, std::move( scope ), first_epoch, last_epoch );

  auto stream = service.create( ctx );
  if( !stream )
    return std::unexpected( stream.error() );

  auto stop = [ & ]( std::error_code ec ) -> result< token >
  {
    LOG_ERROR( tessera::log::instance(),
               "Session negotiation failed while {}: {}",
               to_string( n.current_state() ),
               ec.message() );
    ( *stream )->cancel();
    return std::unexpected( ec );
  };

  auto init = n.propose();
  if( !init )
    return stop( init.error() );

  if( auto sent = ( *stream )->send( *init ); !sent )
    return stop( sent.error() );

  auto unsigned_response = receive_response( **stream );
  if( !unsigned_response )
    return stop( unsigned_response.error() );

  auto signed_request = n.accept( *unsigned_response );
  if( !signed_request )
    return stop( signed_request.error() );

  if( auto sent = ( *stream )->send( *signed_request ); !sent )
    return stop( sent.error() );

  if( auto closed = ( *stream )->close_send(); !closed )
    return stop( closed.error() );

  auto result_response = receive_response( **stream );
  if( !result_response )
    return stop( result_response.error() );

  auto t = n.complete( *result_response );
  if( !t )
    return stop( t.error() );

  auto end = ( *stream )->receive();
  if( !end )
    return stop( end.error() );

  if( *end )
    return stop( make_error_code( session_errc::unexpected_response ) );

  LOG_INFO( tessera::log::instance(),
            "Session established for {} objects, epochs [{}, {}], session key {}",
            t->object_ids.size(),
            t->first_epoch,
            t->last_epoch,
            tessera::log::base58{ t->header.public_key.data(), t->header.public_key.size() } );
  return t;
}

} // namespace tessera::session
