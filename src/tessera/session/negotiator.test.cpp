// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tessera/crypto/hash.hpp>
#include <tessera/crypto/secret_key.hpp>
#include <tessera/session.hpp>

namespace {

using tessera::session::state;

struct negotiation
{
  tessera::crypto::secret_key owner   = tessera::crypto::secret_key::create( tessera::crypto::hash( "alice" ) );
  tessera::crypto::secret_key service = tessera::crypto::secret_key::create( tessera::crypto::hash( "service" ) );
  std::vector< tessera::refs::object_id > scope{ tessera::refs::object_id::generate(),
                                                 tessera::refs::object_id::generate() };
  tessera::session::negotiator n{ owner, scope, 10, 20 };

  // The service's unsigned echo of the proposal
  tessera::session::token echo( const tessera::protocol::session_init& init ) const
  {
    tessera::session::token t;
    t.owner_id             = init.owner_id;
    t.object_ids           = init.object_ids;
    t.first_epoch          = init.first_epoch;
    t.last_epoch           = init.last_epoch;
    t.header.public_key    = service.public_key().bytes();
    t.header.key_signature = service.sign( tessera::crypto::hash( t.header.public_key ) );
    return t;
  }

  tessera::session::token proposed_echo()
  {
    auto init = n.propose();
    EXPECT_TRUE( init );
    return echo( std::get< tessera::protocol::session_init >( *init ) );
  }
};

} // namespace

TEST( negotiator, establishes )
{
  negotiation s;
  EXPECT_EQ( s.n.current_state(), state::idle );

  auto init = s.n.propose();
  ASSERT_TRUE( init );
  ASSERT_TRUE( std::holds_alternative< tessera::protocol::session_init >( *init ) );
  EXPECT_EQ( s.n.current_state(), state::proposed );

  const auto& proposal = std::get< tessera::protocol::session_init >( *init );
  EXPECT_EQ( proposal.owner_id, tessera::refs::make_owner_id( s.owner.public_key() ) );
  EXPECT_EQ( proposal.object_ids, s.scope );
  EXPECT_EQ( proposal.first_epoch, 10 );
  EXPECT_EQ( proposal.last_epoch, 20 );

  auto answer = s.n.accept( tessera::protocol::session_unsigned{ s.echo( proposal ) } );
  ASSERT_TRUE( answer );
  EXPECT_EQ( s.n.current_state(), state::signature_sent );

  const auto& signed_token = std::get< tessera::protocol::session_signed >( *answer ).token;
  EXPECT_EQ( signed_token.owner_key, s.owner.public_key().bytes() );
  EXPECT_TRUE( tessera::session::verify_signature( signed_token ) );

  auto t = s.n.complete( tessera::protocol::session_result{ signed_token } );
  ASSERT_TRUE( t );
  EXPECT_EQ( s.n.current_state(), state::established );
  EXPECT_TRUE( t->permits( s.scope, 15 ) );
  EXPECT_FALSE( t->permits( s.scope, 21 ) );
  EXPECT_FALSE( t->permits( std::vector{ tessera::refs::object_id::generate() }, 15 ) );
}

TEST( negotiator, steps_out_of_order )
{
  negotiation s;

  auto t = s.n.complete( tessera::protocol::session_result{} );
  ASSERT_FALSE( t );
  EXPECT_EQ( t.error(), tessera::session::session_errc::invalid_state );

  auto answer = s.n.accept( tessera::protocol::session_unsigned{} );
  ASSERT_FALSE( answer );
  EXPECT_EQ( answer.error(), tessera::session::session_errc::invalid_state );
  EXPECT_EQ( s.n.current_state(), state::idle );

  ASSERT_TRUE( s.n.propose() );
  auto again = s.n.propose();
  ASSERT_FALSE( again );
  EXPECT_EQ( again.error(), tessera::session::session_errc::invalid_state );
}

TEST( negotiator, dropped_object )
{
  negotiation s;
  auto t = s.proposed_echo();
  t.object_ids.pop_back();

  auto answer = s.n.accept( tessera::protocol::session_unsigned{ t } );
  ASSERT_FALSE( answer );
  EXPECT_EQ( answer.error(), tessera::session::session_errc::token_mismatch );
  EXPECT_EQ( answer.error(), tessera::error_kind::protocol_integrity );
  EXPECT_EQ( s.n.current_state(), state::failed );

  auto retry = s.n.accept( tessera::protocol::session_unsigned{ s.echo( s.n.proposal() ) } );
  ASSERT_FALSE( retry );
  EXPECT_EQ( retry.error(), tessera::session::session_errc::invalid_state );
}

TEST( negotiator, reordered_scope )
{
  negotiation s;
  auto t = s.proposed_echo();
  std::swap( t.object_ids[ 0 ], t.object_ids[ 1 ] );

  auto answer = s.n.accept( tessera::protocol::session_unsigned{ t } );
  ASSERT_FALSE( answer );
  EXPECT_EQ( answer.error(), tessera::session::session_errc::token_mismatch );
}

TEST( negotiator, altered_epochs )
{
  negotiation s;
  auto t = s.proposed_echo();
  t.last_epoch = 21;

  auto answer = s.n.accept( tessera::protocol::session_unsigned{ t } );
  ASSERT_FALSE( answer );
  EXPECT_EQ( answer.error(), tessera::session::session_errc::token_mismatch );
}

TEST( negotiator, altered_owner )
{
  negotiation s;
  auto t     = s.proposed_echo();
  t.owner_id = tessera::refs::make_owner_id( s.service.public_key() );

  auto answer = s.n.accept( tessera::protocol::session_unsigned{ t } );
  ASSERT_FALSE( answer );
  EXPECT_EQ( answer.error(), tessera::session::session_errc::token_mismatch );
}

TEST( negotiator, missing_public_key )
{
  negotiation s;
  auto t              = s.proposed_echo();
  t.header.public_key = {};

  auto answer = s.n.accept( tessera::protocol::session_unsigned{ t } );
  ASSERT_FALSE( answer );
  EXPECT_EQ( answer.error(), tessera::session::session_errc::missing_public_key );
  EXPECT_EQ( s.n.current_state(), state::failed );
}

TEST( negotiator, wrong_response_kind )
{
  negotiation s;
  auto t = s.proposed_echo();

  auto answer = s.n.accept( tessera::protocol::session_result{ t } );
  ASSERT_FALSE( answer );
  EXPECT_EQ( answer.error(), tessera::session::session_errc::unexpected_response );

  negotiation other;
  auto echo = other.proposed_echo();
  ASSERT_TRUE( other.n.accept( tessera::protocol::session_unsigned{ echo } ) );

  auto final_token = other.n.complete( tessera::protocol::session_unsigned{ echo } );
  ASSERT_FALSE( final_token );
  EXPECT_EQ( final_token.error(), tessera::session::session_errc::expected_result_token );
  EXPECT_EQ( other.n.current_state(), state::failed );
}

TEST( negotiator, result_differs_from_proposal )
{
  negotiation s;
  auto t = s.proposed_echo();
  ASSERT_TRUE( s.n.accept( tessera::protocol::session_unsigned{ t } ) );

  t.object_ids.push_back( tessera::refs::object_id::generate() );
  auto final_token = s.n.complete( tessera::protocol::session_result{ t } );
  ASSERT_FALSE( final_token );
  EXPECT_EQ( final_token.error(), tessera::session::session_errc::token_mismatch );
}

TEST( token, digest_covers_scope )
{
  negotiation s;
  auto t = s.proposed_echo();

  auto digest = tessera::session::make_digest( t );

  auto reordered = t;
  std::swap( reordered.object_ids[ 0 ], reordered.object_ids[ 1 ] );
  EXPECT_NE( tessera::session::make_digest( reordered ), digest );

  auto shifted        = t;
  shifted.first_epoch = 11;
  EXPECT_NE( tessera::session::make_digest( shifted ), digest );

  t.owner_key = s.owner.public_key().bytes();
  t.signature = s.owner.sign( digest );
  EXPECT_TRUE( tessera::session::verify_signature( t ) );

  t.last_epoch = 99;
  EXPECT_FALSE( tessera::session::verify_signature( t ) );
}

// NOLINTEND
