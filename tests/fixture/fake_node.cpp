// NOLINTBEGIN

#include <test/fake_node.hpp>

#include <algorithm>
#include <deque>
#include <regex>

#include <tessera/log.hpp>

namespace test {

using tessera::net::status_code;

namespace {

std::string key_of( const tessera::refs::address& addr )
{
  return tessera::refs::to_string( addr );
}

std::vector< std::byte > slice( const std::vector< std::byte >& payload, const tessera::object::range& r )
{
  if( r.offset + r.length > payload.size() )
    return {};

  auto first = payload.begin() + static_cast< std::ptrdiff_t >( r.offset );
  return std::vector< std::byte >( first, first + static_cast< std::ptrdiff_t >( r.length ) );
}

bool in_bounds( const std::vector< std::byte >& payload, const tessera::object::range& r )
{
  return r.offset + r.length <= payload.size();
}

bool matches( const tessera::object::object& obj, const tessera::object::filter& f )
{
  if( f.type == tessera::object::match_type::exact && f.name == tessera::object::root_object_key )
    return obj.last_header< tessera::object::root_marker >() != nullptr;

  if( f.type == tessera::object::match_type::exact && f.name == tessera::object::storage_group_key )
    return obj.last_header< tessera::object::storage_group >() != nullptr;

  return std::ranges::any_of( obj.headers,
                              [ & ]( const tessera::object::header& h )
                              {
                                const auto* user = std::get_if< tessera::object::user_header >( &h );
                                if( !user || user->key != f.name )
                                  return false;

                                if( f.type == tessera::object::match_type::exact )
                                  return user->value == f.value;

                                return std::regex_search( user->value, std::regex( f.value ) );
                              } );
}

} // namespace

class fake_put_stream final: public tessera::net::put_stream
{
public:
  fake_put_stream( fake_node& node, const tessera::net::call_context& ctx ):
      _node( node ),
      _ctx( ctx )
  {}

  tessera::net::result< void > send( const tessera::protocol::put_request& request ) override
  {
    if( _cancelled )
      return std::unexpected( tessera::net::net_errc::stream_closed );

    if( auto status = _ctx.check(); !status )
      return std::unexpected( status.error() );

    if( const auto* header = std::get_if< tessera::protocol::put_header >( &request ) )
    {
      ++_node.header_frames;
      if( _header )
        return std::unexpected( status_code::invalid_argument );

      _header = *header;
      return {};
    }

    const auto& c = std::get< tessera::protocol::chunk >( request );
    _node.chunk_frames.push_back( c.data.size() );

    if( !_header )
      return std::unexpected( status_code::invalid_argument );

    _payload.insert( _payload.end(), c.data.begin(), c.data.end() );

    if( _node.interrupt_after_chunks && _node.chunk_frames.size() == *_node.interrupt_after_chunks )
      _node.interrupt.request_stop();

    return {};
  }

  tessera::net::result< tessera::protocol::put_response > close_and_receive() override
  {
    if( _cancelled )
      return std::unexpected( tessera::net::net_errc::stream_closed );

    if( auto status = _ctx.check(); !status )
      return std::unexpected( status.error() );

    if( !_header )
      return std::unexpected( status_code::invalid_argument );

    if( auto committed = _node.commit( *_header, std::move( _payload ) ); !committed )
      return std::unexpected( committed.error() );

    tessera::protocol::put_response response;
    response.address = _node.commit_address.value_or( _header->object.address() );
    return response;
  }

  void cancel() noexcept override
  {
    if( !_cancelled )
      ++_node.cancelled_streams;

    _cancelled = true;
  }

private:
  fake_node& _node;
  tessera::net::call_context _ctx;
  std::optional< tessera::protocol::put_header > _header;
  std::vector< std::byte > _payload;
  bool _cancelled = false;
};

class fake_get_stream final: public tessera::net::get_stream
{
public:
  fake_get_stream( fake_node& node, std::deque< tessera::protocol::get_response > frames ):
      _node( node ),
      _frames( std::move( frames ) )
  {}

  fake_get_stream( fake_node& node, std::error_code error ):
      _node( node ),
      _error( error )
  {}

  tessera::net::result< std::optional< tessera::protocol::get_response > > receive() override
  {
    if( _cancelled )
      return std::unexpected( tessera::net::net_errc::stream_closed );

    if( _error )
      return std::unexpected( *_error );

    if( _frames.empty() )
      return std::nullopt;

    auto f = std::move( _frames.front() );
    _frames.pop_front();
    return f;
  }

  void cancel() noexcept override
  {
    if( !_cancelled )
      ++_node.cancelled_streams;

    _cancelled = true;
  }

private:
  fake_node& _node;
  std::deque< tessera::protocol::get_response > _frames;
  std::optional< std::error_code > _error;
  bool _cancelled = false;
};

class fake_session_stream final: public tessera::net::session_stream
{
public:
  explicit fake_session_stream( fake_node& node ):
      _node( node )
  {}

  tessera::net::result< void > send( const tessera::protocol::session_request& request ) override
  {
    if( _cancelled || _send_closed )
      return std::unexpected( tessera::net::net_errc::stream_closed );

    if( const auto* init = std::get_if< tessera::protocol::session_init >( &request ) )
    {
      tessera::session::token t;
      t.owner_id    = init->owner_id;
      t.object_ids  = init->object_ids;
      t.first_epoch = init->first_epoch;
      t.last_epoch  = init->last_epoch;

      if( _node.scope == scope_fault::drop && !t.object_ids.empty() )
        t.object_ids.pop_back();
      else if( _node.scope == scope_fault::reorder )
        std::ranges::reverse( t.object_ids );

      if( !_node.omit_public_key )
      {
        t.header.public_key    = _node.key().public_key().bytes();
        t.header.key_signature = _node.key().sign( tessera::crypto::hash( t.header.public_key ) );
      }

      _pending.push_back( tessera::protocol::session_unsigned{ t } );
      return {};
    }

    auto t = std::get< tessera::protocol::session_signed >( request ).token;

    if( !tessera::session::verify_signature( t )
        || tessera::refs::make_owner_id( tessera::crypto::public_key( t.owner_key ) ) != t.owner_id )
    {
      _error = tessera::net::make_error_code( status_code::unauthenticated );
      return {};
    }

    _node.issued_tokens.push_back( t );
    ++_node.sessions_established;

    if( _node.tamper_result )
      t.last_epoch -= 1;

    _pending.push_back( tessera::protocol::session_result{ t } );
    return {};
  }

  tessera::net::result< std::optional< tessera::protocol::session_response > > receive() override
  {
    if( _cancelled )
      return std::unexpected( tessera::net::net_errc::stream_closed );

    if( !_pending.empty() )
    {
      auto response = std::move( _pending.front() );
      _pending.pop_front();
      return response;
    }

    if( _error )
      return std::unexpected( *_error );

    if( _send_closed )
      return std::nullopt;

    // A real node would wait for the next request forever
    return std::unexpected( tessera::net::net_errc::timed_out );
  }

  tessera::net::result< void > close_send() override
  {
    _send_closed = true;
    return {};
  }

  void cancel() noexcept override
  {
    if( !_cancelled )
      ++_node.cancelled_streams;

    _cancelled = true;
  }

private:
  fake_node& _node;
  std::deque< tessera::protocol::session_response > _pending;
  std::optional< std::error_code > _error;
  bool _send_closed = false;
  bool _cancelled   = false;
};

fake_node::fake_node( const tessera::crypto::secret_key& key ):
    _key( key )
{}

const tessera::crypto::secret_key& fake_node::key() const noexcept
{
  return _key;
}

void fake_node::store( tessera::object::object obj, std::vector< std::byte > payload )
{
  auto addr = obj.address();
  obj.payload.clear();
  _objects[ key_of( addr ) ] = stored_object{ std::move( obj ), std::move( payload ) };
}

const fake_node::stored_object* fake_node::find( const tessera::refs::address& addr ) const
{
  auto it = _objects.find( key_of( addr ) );
  return it == _objects.end() ? nullptr : &it->second;
}

tessera::net::result< void > fake_node::check_token( const tessera::session::token& t,
                                                     std::span< const tessera::refs::object_id > ids ) const
{
  if( !tessera::session::verify_signature( t ) )
    return std::unexpected( status_code::unauthenticated );

  if( !t.permits( ids, epoch ) )
    return std::unexpected( status_code::permission_denied );

  if( std::ranges::find( issued_tokens, t ) == issued_tokens.end() )
    return std::unexpected( status_code::permission_denied );

  return {};
}

tessera::net::result< void > fake_node::commit( const tessera::protocol::put_header& header,
                                                std::vector< std::byte > payload )
{
  const auto& obj = header.object;

  if( auto permitted = check_token( header.token, std::span( &obj.system.id, 1 ) ); !permitted )
    return permitted;

  if( header.token.owner_id != obj.system.owner_id )
    return std::unexpected( status_code::permission_denied );

  if( !tessera::object::verify( obj ) )
    return std::unexpected( status_code::invalid_argument );

  if( payload.size() != obj.system.payload_length )
    return std::unexpected( status_code::invalid_argument );

  if( corrupt_stored_payload && !payload.empty() )
    payload.front() ^= std::byte{ 0xff };

  LOG_DEBUG( tessera::log::instance(), "Node stored {}, {} bytes", obj.address(), payload.size() );
  store( obj, std::move( payload ) );
  return {};
}

tessera::net::result< std::unique_ptr< tessera::net::put_stream > >
fake_node::put( const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  return std::make_unique< fake_put_stream >( *this, ctx );
}

tessera::net::result< std::unique_ptr< tessera::net::get_stream > >
fake_node::get( const tessera::protocol::get_request& req, const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  const auto* stored = find( req.address );
  if( !stored )
    return std::make_unique< fake_get_stream >( *this, tessera::net::make_error_code( status_code::not_found ) );

  auto payload = stored->payload;
  payload.resize( payload.size() + extra_payload, std::byte{ 0x5a } );
  payload.resize( payload.size() - std::min( missing_payload, payload.size() ) );

  std::deque< tessera::protocol::get_response > frames;

  auto first      = stored->object;
  auto inline_end = std::min( inline_payload, payload.size() );
  first.payload.assign( payload.begin(), payload.begin() + static_cast< std::ptrdiff_t >( inline_end ) );
  frames.emplace_back( first );

  if( duplicate_header )
    frames.emplace_back( stored->object );

  for( std::size_t offset = inline_end; offset < payload.size(); offset += get_chunk_size )
  {
    auto end = std::min( offset + get_chunk_size, payload.size() );

    tessera::protocol::chunk c;
    c.data.assign( payload.begin() + static_cast< std::ptrdiff_t >( offset ),
                   payload.begin() + static_cast< std::ptrdiff_t >( end ) );
    frames.emplace_back( std::move( c ) );
  }

  return std::make_unique< fake_get_stream >( *this, std::move( frames ) );
}

tessera::net::result< tessera::protocol::delete_response >
fake_node::remove( const tessera::protocol::delete_request& req, const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  auto it = _objects.find( key_of( req.address ) );
  if( it == _objects.end() )
    return std::unexpected( status_code::not_found );

  if( auto permitted = check_token( req.token, std::span( &req.address.object(), 1 ) ); !permitted )
    return std::unexpected( permitted.error() );

  if( req.token.owner_id != it->second.object.system.owner_id || req.owner_id != req.token.owner_id )
    return std::unexpected( status_code::permission_denied );

  // The node issues the tombstone in place of the removed object
  tessera::object::object tomb;
  tomb.system                = it->second.object.system;
  tomb.system.owner_id       = tessera::refs::make_owner_id( _key.public_key() );
  tomb.system.payload_length = 0;
  tomb.headers.emplace_back( tessera::object::tombstone{ epoch } );
  tessera::object::sign( tomb, _key );

  if( tamper_tombstone )
    std::get< tessera::object::tombstone >( tomb.headers.front() ).epoch += 1;

  it->second = stored_object{ std::move( tomb ), {} };
  return tessera::protocol::delete_response{};
}

tessera::net::result< tessera::protocol::head_response >
fake_node::head( const tessera::protocol::head_request& req, const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  const auto* stored = find( req.address );
  if( !stored )
    return std::unexpected( status_code::not_found );

  tessera::protocol::head_response response;
  response.object = stored->object;
  if( !req.full_headers )
    response.object.headers.clear();

  return response;
}

tessera::net::result< tessera::protocol::search_response >
fake_node::search( const tessera::protocol::search_request& req, const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  tessera::protocol::search_response response;

  for( const auto& [ key, stored ]: _objects )
  {
    if( stored.object.system.container_id != req.container_id )
      continue;

    if( std::ranges::all_of( req.query.filters,
                             [ & ]( const tessera::object::filter& f )
                             {
                               return matches( stored.object, f );
                             } ) )
      response.addresses.push_back( stored.object.address() );
  }

  return response;
}

tessera::net::result< tessera::protocol::range_response >
fake_node::get_range( const tessera::protocol::range_request& req, const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  const auto* stored = find( req.address );
  if( !stored )
    return std::unexpected( status_code::not_found );

  tessera::protocol::range_response response;
  for( const auto& r: req.ranges )
  {
    if( !in_bounds( stored->payload, r ) )
      return std::unexpected( status_code::out_of_range );

    response.fragments.push_back( slice( stored->payload, r ) );
  }

  if( fragment_count )
    response.fragments.resize( *fragment_count );

  return response;
}

tessera::net::result< tessera::protocol::range_hash_response >
fake_node::get_range_hash( const tessera::protocol::range_hash_request& req, const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  const auto* stored = find( req.address );
  if( !stored )
    return std::unexpected( status_code::not_found );

  tessera::protocol::range_hash_response response;
  for( const auto& r: req.ranges )
  {
    if( !in_bounds( stored->payload, r ) )
      return std::unexpected( status_code::out_of_range );

    auto salted = tessera::crypto::tz::salt_xor( slice( stored->payload, r ), req.salt );
    response.hashes.push_back( tessera::crypto::tz::sum( salted ) );
  }

  if( hash_count )
    response.hashes.resize( *hash_count, tessera::crypto::tz::sum( {} ) );

  return response;
}

tessera::net::result< std::unique_ptr< tessera::net::session_stream > >
fake_node::create( const tessera::net::call_context& ctx )
{
  if( auto status = ctx.check(); !status )
    return std::unexpected( status.error() );

  ++sessions_created;
  return std::make_unique< fake_session_stream >( *this );
}

} // namespace test

// NOLINTEND
