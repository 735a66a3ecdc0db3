#include <tessera/crypto/secret_key.hpp>
#include <tessera/memory.hpp>

#include <cassert>
#include <cstring>

#include "sodium.hpp"

namespace tessera::crypto {

secret_key::secret_key( const secret_key_data& secret_bytes, const public_key_data& public_bytes ) noexcept:
    _public_bytes( public_bytes ),
    _secret_bytes( secret_bytes )
{
  detail::initialize_sodium();
}

bool secret_key::operator==( const secret_key& rhs ) const noexcept
{
  return !std::memcmp( _secret_bytes.data(), rhs._secret_bytes.data(), secret_key_length )
         && !std::memcmp( _public_bytes.data(), rhs._public_bytes.data(), public_key_length );
}

bool secret_key::operator!=( const secret_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

secret_key secret_key::create() noexcept
{
  detail::initialize_sodium();

  secret_key new_key;
  [[maybe_unused]]
  int retcode = crypto_sign_keypair( memory::pointer_cast< unsigned char* >( new_key._public_bytes.data() ),
                                     memory::pointer_cast< unsigned char* >( new_key._secret_bytes.data() ) );
  assert( retcode >= 0 );

  return new_key;
}

secret_key secret_key::create( const digest& seed ) noexcept
{
  detail::initialize_sodium();

  secret_key new_key;
  [[maybe_unused]]
  int retcode = crypto_sign_seed_keypair( memory::pointer_cast< unsigned char* >( new_key._public_bytes.data() ),
                                          memory::pointer_cast< unsigned char* >( new_key._secret_bytes.data() ),
                                          memory::pointer_cast< const unsigned char* >( seed.data() ) );
  assert( retcode >= 0 );

  return new_key;
}

result< secret_key > secret_key::from_seed( std::span< const std::byte > seed ) noexcept
{
  if( seed.size() != digest_length )
    return std::unexpected( crypto_errc::invalid_key );

  return create( memory::to_array< digest_length >( seed ) );
}

secret_key_data secret_key::bytes() const noexcept
{
  return _secret_bytes;
}

public_key secret_key::public_key() const noexcept
{
  return crypto::public_key( _public_bytes );
}

signature secret_key::sign( const digest& d ) const noexcept
{
  signature sig;

  [[maybe_unused]]
  auto retcode = crypto_sign_detached( memory::pointer_cast< unsigned char* >( sig.data() ),
                                       nullptr,
                                       memory::pointer_cast< const unsigned char* >( d.data() ),
                                       d.size(),
                                       memory::pointer_cast< const unsigned char* >( _secret_bytes.data() ) );
  assert( retcode >= 0 );

  return sig;
}

} // namespace tessera::crypto
