#include <tessera/refs/container_id.hpp>

#include <algorithm>

#include <tessera/encode/base58.hpp>
#include <tessera/memory.hpp>

namespace tessera::refs {

container_id::container_id( const container_id_data& bytes ) noexcept:
    _bytes( bytes )
{}

const container_id_data& container_id::bytes() const noexcept
{
  return _bytes;
}

result< container_id > parse_container_id( std::string_view text ) noexcept
{
  auto decoded = encode::from_base58( text );
  if( !decoded )
    return std::unexpected( refs_errc::invalid_encoding );

  if( decoded->size() != container_id_length )
    return std::unexpected( refs_errc::invalid_length );

  container_id_data data{};
  std::ranges::copy( *decoded, data.begin() );
  return container_id( data );
}

std::string to_string( const container_id& id ) noexcept
{
  return encode::to_base58( memory::as_bytes( id.bytes() ) );
}

} // namespace tessera::refs
