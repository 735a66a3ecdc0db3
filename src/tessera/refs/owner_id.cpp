#include <tessera/refs/owner_id.hpp>

#include <algorithm>

#include <tessera/crypto/hash.hpp>
#include <tessera/encode/base58.hpp>
#include <tessera/memory.hpp>

namespace tessera::refs {

namespace {

constexpr std::size_t key_digest_length = 20;
constexpr std::size_t checksum_offset   = 1 + key_digest_length;
constexpr std::size_t checksum_length   = owner_id_length - checksum_offset;

crypto::digest checksum( const owner_id_data& data ) noexcept
{
  return crypto::hash( crypto::hash( data.data(), checksum_offset ) );
}

} // namespace

owner_id::owner_id( const owner_id_data& bytes ) noexcept:
    _bytes( bytes )
{}

const owner_id_data& owner_id::bytes() const noexcept
{
  return _bytes;
}

owner_id make_owner_id( const crypto::public_key& key ) noexcept
{
  owner_id_data data{};
  data[ 0 ] = owner_id_version;

  auto key_digest = crypto::hash( key.bytes() );
  std::copy_n( key_digest.begin(), key_digest_length, data.begin() + 1 );

  auto sum = checksum( data );
  std::copy_n( sum.begin(), checksum_length, data.begin() + checksum_offset );

  return owner_id( data );
}

result< owner_id > parse_owner_id( std::string_view text ) noexcept
{
  auto decoded = encode::from_base58( text );
  if( !decoded )
    return std::unexpected( refs_errc::invalid_encoding );

  if( decoded->size() != owner_id_length )
    return std::unexpected( refs_errc::invalid_length );

  owner_id_data data{};
  std::ranges::copy( *decoded, data.begin() );

  if( data[ 0 ] != owner_id_version )
    return std::unexpected( refs_errc::invalid_version );

  auto sum = checksum( data );
  if( !std::equal( sum.begin(), sum.begin() + checksum_length, data.begin() + checksum_offset ) )
    return std::unexpected( refs_errc::invalid_checksum );

  return owner_id( data );
}

std::string to_string( const owner_id& id ) noexcept
{
  return encode::to_base58( memory::as_bytes( id.bytes() ) );
}

} // namespace tessera::refs
