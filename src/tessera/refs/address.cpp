#include <tessera/refs/address.hpp>

namespace tessera::refs {

address::address( const container_id& container, const object_id& object ) noexcept:
    _container( container ),
    _object( object )
{}

const container_id& address::container() const noexcept
{
  return _container;
}

const object_id& address::object() const noexcept
{
  return _object;
}

result< address > parse_address( std::string_view text ) noexcept
{
  auto separator = text.find( '/' );
  if( separator == std::string_view::npos )
    return std::unexpected( refs_errc::invalid_format );

  auto container = parse_container_id( text.substr( 0, separator ) );
  if( !container )
    return std::unexpected( container.error() );

  auto object = parse_object_id( text.substr( separator + 1 ) );
  if( !object )
    return std::unexpected( object.error() );

  return address( *container, *object );
}

std::string to_string( const address& addr ) noexcept
{
  return to_string( addr.container() ) + "/" + to_string( addr.object() );
}

} // namespace tessera::refs
