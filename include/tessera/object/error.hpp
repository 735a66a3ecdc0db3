#pragma once

#include <expected>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::object {

enum class object_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_range,
  invalid_user_header,
  invalid_filter,
  missing_integrity_header,
  missing_verification_header,
  checksum_mismatch,
  invalid_signature,
  owner_mismatch
};

const std::error_category& object_category() noexcept;

std::error_code make_error_code( object_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::object

template<>
struct std::is_error_code_enum< tessera::object::object_errc >: public std::true_type
{};
