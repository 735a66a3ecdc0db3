#pragma once

#include <expected>
#include <system_error>

#include <tessera/error.hpp>

namespace tessera::session {

enum class session_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_state,
  unexpected_response,
  token_mismatch,
  missing_public_key,
  expected_result_token
};

const std::error_category& session_category() noexcept;

std::error_code make_error_code( session_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::session

template<>
struct std::is_error_code_enum< tessera::session::session_errc >: public std::true_type
{};
