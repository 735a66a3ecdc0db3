#pragma once

#include <system_error>

namespace tessera {

// Coarse classification shared by every module error category
enum class error_kind : int // NOLINT(performance-enum-size)
{
  none = 0,
  format,
  connection,
  protocol_integrity,
  remote_rejection,
  io
};

const std::error_category& error_kind_category() noexcept;

std::error_condition make_error_condition( error_kind e ) noexcept;

} // namespace tessera

template<>
struct std::is_error_condition_enum< tessera::error_kind >: public std::true_type
{};
