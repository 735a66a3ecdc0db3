#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <tessera/crypto/error.hpp>

/*
 * Tillich-Zemor hashing over SL(2, GF(2^127)).
 *
 * Every input bit selects one of two generator matrices and the digest is
 * their ordered product, so the digest of a concatenation is the product of
 * the digests of its parts. This lets a payload be hashed chunk by chunk and
 * lets digests of adjacent ranges be combined without the original bytes.
 */
namespace tessera::crypto::tz {

constexpr std::size_t element_length = 16;
constexpr std::size_t digest_length  = 4 * element_length;

using digest = std::array< std::byte, digest_length >;

namespace detail {

// Element of GF(2^127) modulo x^127 + x^63 + 1, bit i is the coefficient of x^i
struct gf127
{
  std::uint64_t lo = 0;
  std::uint64_t hi = 0;

  bool operator==( const gf127& ) const = default;
};

// Row-major 2x2 matrix [[a, b], [c, d]]
struct sl2
{
  gf127 a{ 1, 0 };
  gf127 b{};
  gf127 c{};
  gf127 d{ 1, 0 };
};

} // namespace detail

class hasher
{
public:
  hasher() noexcept = default;

  void absorb( std::span< const std::byte > data ) noexcept;
  digest finalize() const noexcept;
  void reset() noexcept;

  std::uint64_t size() const noexcept;

private:
  detail::sl2 _state{};
  std::uint64_t _size = 0;
};

digest sum( std::span< const std::byte > data ) noexcept;
result< digest > concat( std::span< const digest > digests ) noexcept;

std::vector< std::byte > salt_xor( std::span< const std::byte > data, std::span< const std::byte > salt );

} // namespace tessera::crypto::tz
