#include <tessera/verify/range_verifier.hpp>

#include <tessera/log.hpp>
#include <tessera/memory.hpp>

namespace tessera::verify {

namespace {

result< crypto::tz::digest > local_digest( io::source& local,
                                           const object::range& r,
                                           std::span< const std::byte > salt,
                                           bool& complete )
{
  auto bytes = io::read_range( local, r.offset, r.length );
  if( !bytes )
    return std::unexpected( bytes.error() );

  complete = bytes->size() == r.length;
  return crypto::tz::sum( crypto::tz::salt_xor( *bytes, salt ) );
}

} // namespace

range_verifier::range_verifier( net::object_service& service, std::uint32_t ttl ) noexcept:
    _service( service ),
    _ttl( ttl )
{}

result< std::vector< range_check > > range_verifier::verify( const refs::address& addr,
                                                             std::span< const object::range > ranges,
                                                             std::span< const std::byte > salt,
                                                             io::source* local,
                                                             const net::call_context& ctx )
{
  if( ranges.empty() )
    return std::unexpected( verify_errc::no_ranges );

  protocol::range_hash_request req;
  req.address = addr;
  req.ranges.assign( ranges.begin(), ranges.end() );
  req.salt = memory::to_vector( salt );
  req.ttl  = _ttl;

  auto response = _service.get_range_hash( req, ctx );
  if( !response )
    return std::unexpected( response.error() );

  if( response->hashes.size() != ranges.size() )
  {
    LOG_ERROR( tessera::log::instance(),
               "Requested {} range hashes of {} but received {}",
               ranges.size(),
               addr,
               response->hashes.size() );
    return std::unexpected( verify_errc::hash_count_mismatch );
  }

  std::vector< range_check > checks;
  checks.reserve( ranges.size() );

  for( std::size_t i = 0; i < ranges.size(); ++i )
  {
    range_check check{ .range = ranges[ i ], .digest = response->hashes[ i ], .matches_local = std::nullopt };

    if( local )
    {
      bool complete = false;
      auto digest   = local_digest( *local, ranges[ i ], salt, complete );
      if( !digest )
        return std::unexpected( digest.error() );

      check.matches_local = complete && *digest == check.digest;

      if( !*check.matches_local )
        LOG_WARNING( tessera::log::instance(),
                     "Range {} of {} does not match the local copy, service digest {}",
                     object::to_string( ranges[ i ] ),
                     addr,
                     tessera::log::hex{ check.digest.data(), check.digest.size() } );
    }

    checks.push_back( check );
  }

  return checks;
}

result< range_check > range_verifier::verify_payload( const refs::address& addr,
                                                      std::uint64_t payload_length,
                                                      const crypto::tz::digest& expected,
                                                      const net::call_context& ctx )
{
  protocol::range_hash_request req;
  req.address = addr;
  req.ranges.push_back( object::range{ .offset = 0, .length = payload_length } );
  req.ttl = _ttl;

  auto response = _service.get_range_hash( req, ctx );
  if( !response )
    return std::unexpected( response.error() );

  if( response->hashes.size() != 1 )
  {
    LOG_ERROR( tessera::log::instance(),
               "Requested one payload hash of {} but received {}",
               addr,
               response->hashes.size() );
    return std::unexpected( verify_errc::hash_count_mismatch );
  }

  range_check check{ .range         = req.ranges.front(),
                     .digest        = response->hashes.front(),
                     .matches_local = response->hashes.front() == expected };

  if( *check.matches_local )
    LOG_INFO( tessera::log::instance(), "Payload of {} verified", addr );
  else
    LOG_WARNING( tessera::log::instance(),
                 "Payload of {} differs from the uploaded data, expected {} but the service has {}",
                 addr,
                 tessera::log::hex{ expected.data(), expected.size() },
                 tessera::log::hex{ check.digest.data(), check.digest.size() } );

  return check;
}

} // namespace tessera::verify
