#include <tessera/refs/object_id.hpp>

#include <algorithm>
#include <array>

#include <tessera/crypto/random.hpp>
#include <tessera/encode/hex.hpp>
#include <tessera/memory.hpp>

namespace tessera::refs {

namespace {

constexpr std::size_t uuid_text_length                  = 36;
constexpr std::array< std::size_t, 4 > uuid_hyphens     = { 8, 13, 18, 23 };
constexpr std::size_t uuid_version_byte                 = 6;
constexpr std::size_t uuid_variant_byte                 = 8;
constexpr std::byte uuid_version_mask{ 0x0f };
constexpr std::byte uuid_version_4{ 0x40 };
constexpr std::byte uuid_variant_mask{ 0x3f };
constexpr std::byte uuid_variant_rfc4122{ 0x80 };

} // namespace

object_id::object_id( const object_id_data& bytes ) noexcept:
    _bytes( bytes )
{}

object_id object_id::generate() noexcept
{
  object_id_data data{};
  crypto::random_bytes( data );

  data[ uuid_version_byte ] = ( data[ uuid_version_byte ] & uuid_version_mask ) | uuid_version_4;
  data[ uuid_variant_byte ] = ( data[ uuid_variant_byte ] & uuid_variant_mask ) | uuid_variant_rfc4122;

  return object_id( data );
}

const object_id_data& object_id::bytes() const noexcept
{
  return _bytes;
}

result< object_id > parse_object_id( std::string_view text ) noexcept
{
  if( text.size() != uuid_text_length )
    return std::unexpected( refs_errc::invalid_length );

  std::string digits;
  digits.reserve( 2 * object_id_length );

  for( std::size_t i = 0; i < text.size(); ++i )
  {
    if( std::ranges::find( uuid_hyphens, i ) != uuid_hyphens.end() )
    {
      if( text[ i ] != '-' )
        return std::unexpected( refs_errc::invalid_format );
    }
    else
      digits.push_back( text[ i ] );
  }

  auto decoded = encode::from_hex( digits );
  if( !decoded || decoded->size() != object_id_length )
    return std::unexpected( refs_errc::invalid_format );

  object_id_data data{};
  std::ranges::copy( *decoded, data.begin() );
  return object_id( data );
}

std::string to_string( const object_id& id ) noexcept
{
  auto digits = encode::to_hex( memory::as_bytes( id.bytes() ), false );

  std::string text;
  text.reserve( uuid_text_length );

  for( std::size_t i = 0, hyphen = 0; i < digits.size(); ++i )
  {
    if( hyphen < uuid_hyphens.size() && text.size() == uuid_hyphens[ hyphen ] )
    {
      text.push_back( '-' );
      ++hyphen;
    }
    text.push_back( digits[ i ] );
  }

  return text;
}

} // namespace tessera::refs
