#pragma once

#include <expected>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::refs {

enum class refs_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_encoding,
  invalid_length,
  invalid_format,
  invalid_version,
  invalid_checksum
};

const std::error_category& refs_category() noexcept;

std::error_code make_error_code( refs_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::refs

template<>
struct std::is_error_code_enum< tessera::refs::refs_errc >: public std::true_type
{};
