#include <tessera/crypto/random.hpp>

#include "sodium.hpp"

namespace tessera::crypto {

void random_bytes( std::span< std::byte > out ) noexcept
{
  detail::initialize_sodium();
  randombytes_buf( out.data(), out.size() );
}

} // namespace tessera::crypto
