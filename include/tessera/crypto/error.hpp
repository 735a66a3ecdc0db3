#pragma once

#include <expected>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::crypto {

enum class crypto_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_concat,
  invalid_digest,
  invalid_key,
  invalid_signature
};

const std::error_category& crypto_category() noexcept;

std::error_code make_error_code( crypto_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::crypto

template<>
struct std::is_error_code_enum< tessera::crypto::crypto_errc >: public std::true_type
{};
