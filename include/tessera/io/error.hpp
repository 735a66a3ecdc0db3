#pragma once

#include <expected>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::io {

enum class io_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  open_failed,
  read_failed,
  write_failed,
  seek_failed
};

const std::error_category& io_category() noexcept;

std::error_code make_error_code( io_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::io

template<>
struct std::is_error_code_enum< tessera::io::io_errc >: public std::true_type
{};
