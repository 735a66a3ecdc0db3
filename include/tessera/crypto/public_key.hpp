#pragma once

#include <array>
#include <span>

#include <tessera/crypto/error.hpp>
#include <tessera/crypto/hash.hpp>

namespace tessera::crypto {

constexpr std::size_t public_key_length = 32;
constexpr std::size_t signature_length  = 64;

using public_key_data = std::array< std::byte, public_key_length >;
using signature       = std::array< std::byte, signature_length >;

class public_key
{
public:
  public_key() = default;
  explicit public_key( const public_key_data& bytes ) noexcept;
  public_key( const public_key& pk ) noexcept = default;
  public_key( public_key&& pk ) noexcept      = default;
  ~public_key() noexcept                      = default;

  public_key& operator=( const public_key& pk ) noexcept = default;
  public_key& operator=( public_key&& pk ) noexcept      = default;

  bool operator==( const public_key& rhs ) const noexcept;
  bool operator!=( const public_key& rhs ) const noexcept;

  static result< public_key > from_bytes( std::span< const std::byte > bytes ) noexcept;

  bool verify( const signature& sig, const digest& dig ) const noexcept;
  const public_key_data& bytes() const noexcept;

private:
  public_key_data _bytes{};
};

result< signature > make_signature( std::span< const std::byte > bytes ) noexcept;

} // namespace tessera::crypto
