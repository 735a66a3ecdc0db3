#pragma once

#include <array>
#include <span>

#include <tessera/crypto/error.hpp>
#include <tessera/crypto/hash.hpp>
#include <tessera/crypto/public_key.hpp>

namespace tessera::crypto {

constexpr std::size_t secret_key_length = 64;

using secret_key_data = std::array< std::byte, secret_key_length >;

class secret_key
{
public:
  secret_key()                                = default;
  secret_key( secret_key&& sk ) noexcept      = default;
  secret_key( const secret_key& sk ) noexcept = default;
  secret_key( const secret_key_data& secret_bytes, const public_key_data& public_bytes ) noexcept;
  ~secret_key() noexcept = default;

  secret_key& operator=( secret_key&& sk ) noexcept      = default;
  secret_key& operator=( const secret_key& sk ) noexcept = default;

  bool operator==( const secret_key& rhs ) const noexcept;
  bool operator!=( const secret_key& rhs ) const noexcept;

  static secret_key create() noexcept;
  static secret_key create( const digest& seed ) noexcept;

  // Deterministic key from a seed of exactly digest_length bytes
  static result< secret_key > from_seed( std::span< const std::byte > seed ) noexcept;

  signature sign( const digest& digest ) const noexcept;
  crypto::public_key public_key() const noexcept;
  secret_key_data bytes() const noexcept;

private:
  public_key_data _public_bytes{};
  secret_key_data _secret_bytes{};
};

} // namespace tessera::crypto
