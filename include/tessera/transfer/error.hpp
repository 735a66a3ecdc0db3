#pragma once

#include <expected>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::transfer {

enum class transfer_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_state,
  payload_overflow,
  payload_underflow,
  unexpected_frame,
  unexpected_end,
  object_corrupted,
  address_mismatch
};

const std::error_category& transfer_category() noexcept;

std::error_code make_error_code( transfer_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::transfer

template<>
struct std::is_error_code_enum< tessera::transfer::transfer_errc >: public std::true_type
{};
