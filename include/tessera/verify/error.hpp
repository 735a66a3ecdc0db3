#pragma once

#include <expected>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::verify {

enum class verify_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  hash_count_mismatch,
  fragment_count_mismatch,
  no_ranges
};

const std::error_category& verify_category() noexcept;

std::error_code make_error_code( verify_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::verify

template<>
struct std::is_error_code_enum< tessera::verify::verify_errc >: public std::true_type
{};
