#include <tessera/net/frame.hpp>

#include <algorithm>
#include <utility>

#include <boost/endian/conversion.hpp>

#include <tessera/memory.hpp>

namespace tessera::net {

result< std::vector< std::byte > > encode_frame( const frame& f )
{
  if( f.payload.size() > max_frame_size )
    return std::unexpected( net_errc::frame_too_large );

  std::vector< std::byte > bytes( frame_header_length + f.payload.size() );

  boost::endian::store_big_u32( memory::pointer_cast< unsigned char* >( bytes.data() ),
                                static_cast< std::uint32_t >( f.payload.size() ) );
  bytes[ 4 ] = static_cast< std::byte >( f.kind );
  bytes[ 5 ] = static_cast< std::byte >( f.method );

  std::ranges::copy( f.payload, bytes.begin() + frame_header_length );
  return bytes;
}

result< frame_header > decode_frame_header( std::span< const std::byte > header ) noexcept
{
  if( header.size() != frame_header_length )
    return std::unexpected( net_errc::malformed_frame );

  frame_header fh;
  fh.length = boost::endian::load_big_u32( memory::pointer_cast< const unsigned char* >( header.data() ) );

  if( fh.length > max_frame_size )
    return std::unexpected( net_errc::frame_too_large );

  auto kind = std::to_integer< std::uint8_t >( header[ 4 ] );
  if( kind > static_cast< std::uint8_t >( frame_kind::status ) )
    return std::unexpected( net_errc::malformed_frame );

  auto m = std::to_integer< std::uint8_t >( header[ 5 ] );
  if( m > static_cast< std::uint8_t >( method::session_create ) )
    return std::unexpected( net_errc::malformed_frame );

  fh.kind   = static_cast< frame_kind >( kind );
  fh.method = static_cast< method >( m );
  return fh;
}

const char* to_string( frame_kind kind ) noexcept
{
  switch( kind )
  {
    case frame_kind::open:
      return "open";
    case frame_kind::message:
      return "message";
    case frame_kind::close_send:
      return "close_send";
    case frame_kind::end:
      return "end";
    case frame_kind::status:
      return "status";
  }
  std::unreachable();
}

const char* to_string( net::method m ) noexcept
{
  switch( m )
  {
    case method::put:
      return "Put";
    case method::get:
      return "Get";
    case method::remove:
      return "Delete";
    case method::head:
      return "Head";
    case method::search:
      return "Search";
    case method::get_range:
      return "GetRange";
    case method::get_range_hash:
      return "GetRangeHash";
    case method::session_create:
      return "Session.Create";
  }
  std::unreachable();
}

} // namespace tessera::net
