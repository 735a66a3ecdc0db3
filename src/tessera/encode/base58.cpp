#include <tessera/encode/base58.hpp>

#include <cstdint>

namespace tessera::encode {

constexpr std::string_view base58_alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr unsigned int base58_radix        = 58;
constexpr unsigned int base256_radix       = 256;

// Size ratios log(256) / log(58) and log(58) / log(256), scaled by 1000
constexpr std::size_t base58_expansion  = 1'380;
constexpr std::size_t base256_expansion = 733;
constexpr std::size_t expansion_scale   = 1'000;

std::string to_base58( std::span< const std::byte > s ) noexcept
{
  std::size_t zeros = 0;
  while( zeros < s.size() && s[ zeros ] == std::byte{ 0x00 } )
    ++zeros;

  std::vector< std::uint8_t > digits( ( s.size() - zeros ) * base58_expansion / expansion_scale + 1 );
  std::size_t length = 0;

  for( auto it = s.begin() + zeros; it != s.end(); ++it )
  {
    unsigned int carry = std::to_integer< unsigned int >( *it );
    std::size_t i      = 0;

    for( auto digit = digits.rbegin(); ( carry != 0 || i < length ) && digit != digits.rend(); ++digit, ++i )
    {
      carry  += base256_radix * *digit;
      *digit  = static_cast< std::uint8_t >( carry % base58_radix );
      carry  /= base58_radix;
    }

    length = i;
  }

  auto it = digits.end() - static_cast< std::ptrdiff_t >( length );
  while( it != digits.end() && *it == 0 )
    ++it;

  std::string encoded( zeros, base58_alphabet.front() );
  encoded.reserve( zeros + static_cast< std::size_t >( digits.end() - it ) );

  for( ; it != digits.end(); ++it )
    encoded.push_back( base58_alphabet[ *it ] );

  return encoded;
}

result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept
{
  std::size_t zeros = 0;
  while( zeros < sv.size() && sv[ zeros ] == base58_alphabet.front() )
    ++zeros;

  std::vector< std::uint8_t > digits( ( sv.size() - zeros ) * base256_expansion / expansion_scale + 1 );
  std::size_t length = 0;

  for( auto it = sv.begin() + zeros; it != sv.end(); ++it )
  {
    auto pos = base58_alphabet.find( *it );
    if( pos == std::string_view::npos )
      return std::unexpected( encode_errc::invalid_character );

    auto carry    = static_cast< unsigned int >( pos );
    std::size_t i = 0;

    for( auto digit = digits.rbegin(); ( carry != 0 || i < length ) && digit != digits.rend(); ++digit, ++i )
    {
      carry  += base58_radix * *digit;
      *digit  = static_cast< std::uint8_t >( carry % base256_radix );
      carry  /= base256_radix;
    }

    length = i;
  }

  auto it = digits.end() - static_cast< std::ptrdiff_t >( length );
  while( it != digits.end() && *it == 0 )
    ++it;

  std::vector< std::byte > decoded( zeros, std::byte{ 0x00 } );
  decoded.reserve( zeros + static_cast< std::size_t >( digits.end() - it ) );

  for( ; it != digits.end(); ++it )
    decoded.push_back( static_cast< std::byte >( *it ) );

  return decoded;
}

} // namespace tessera::encode
