#include <tessera/object/range.hpp>

#include <charconv>
#include <limits>

namespace tessera::object {

namespace {

result< std::uint64_t > parse_uint32( std::string_view text ) noexcept
{
  std::uint32_t value = 0;
  auto [ ptr, ec ]    = std::from_chars( text.data(), text.data() + text.size(), value );

  if( text.empty() || ec != std::errc() || ptr != text.data() + text.size() )
    return std::unexpected( object_errc::invalid_range );

  return value;
}

} // namespace

result< range > parse_range( std::string_view text ) noexcept
{
  auto separator = text.find( ':' );
  if( separator == std::string_view::npos )
    return std::unexpected( object_errc::invalid_range );

  auto offset = parse_uint32( text.substr( 0, separator ) );
  if( !offset )
    return std::unexpected( offset.error() );

  auto length = parse_uint32( text.substr( separator + 1 ) );
  if( !length )
    return std::unexpected( length.error() );

  return range{ .offset = *offset, .length = *length };
}

result< std::vector< range > > parse_ranges( const std::vector< std::string >& texts ) noexcept
{
  std::vector< range > ranges;
  ranges.reserve( texts.size() );

  for( const auto& text: texts )
  {
    auto r = parse_range( text );
    if( !r )
      return std::unexpected( r.error() );

    ranges.push_back( *r );
  }

  return ranges;
}

result< user_header > parse_user_header( std::string_view text ) noexcept
{
  auto separator = text.find( '=' );
  auto key       = text.substr( 0, separator );

  if( key.empty() )
    return std::unexpected( object_errc::invalid_user_header );

  user_header h;
  h.key = std::string( key );

  if( separator != std::string_view::npos )
    h.value = std::string( text.substr( separator + 1 ) );

  return h;
}

result< std::vector< header > > parse_user_headers( const std::vector< std::string >& texts ) noexcept
{
  std::vector< header > headers;
  headers.reserve( texts.size() );

  for( const auto& text: texts )
  {
    auto h = parse_user_header( text );
    if( !h )
      return std::unexpected( h.error() );

    headers.emplace_back( std::move( *h ) );
  }

  return headers;
}

std::string to_string( const range& r )
{
  return std::to_string( r.offset ) + ":" + std::to_string( r.length );
}

} // namespace tessera::object
