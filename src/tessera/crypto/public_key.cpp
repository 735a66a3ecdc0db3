#include <tessera/crypto/public_key.hpp>
#include <tessera/memory.hpp>

#include <algorithm>

#include "sodium.hpp"

namespace tessera::crypto {

public_key::public_key( const public_key_data& bytes ) noexcept:
    _bytes( bytes )
{
  detail::initialize_sodium();
}

bool public_key::operator==( const public_key& rhs ) const noexcept
{
  return std::ranges::equal( _bytes, rhs._bytes );
}

bool public_key::operator!=( const public_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

result< public_key > public_key::from_bytes( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != public_key_length )
    return std::unexpected( crypto_errc::invalid_key );

  public_key_data data{};
  std::ranges::copy( bytes, data.begin() );
  return public_key( data );
}

bool public_key::verify( const signature& sig, const digest& dig ) const noexcept
{
  detail::initialize_sodium();
  return !crypto_sign_verify_detached( memory::pointer_cast< const unsigned char* >( sig.data() ),
                                       memory::pointer_cast< const unsigned char* >( dig.data() ),
                                       dig.size(),
                                       memory::pointer_cast< const unsigned char* >( _bytes.data() ) );
}

const public_key_data& public_key::bytes() const noexcept
{
  return _bytes;
}

result< signature > make_signature( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != signature_length )
    return std::unexpected( crypto_errc::invalid_signature );

  signature sig{};
  std::ranges::copy( bytes, sig.begin() );
  return sig;
}

} // namespace tessera::crypto
