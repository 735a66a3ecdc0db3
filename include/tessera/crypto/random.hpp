#pragma once

#include <span>

namespace tessera::crypto {

void random_bytes( std::span< std::byte > out ) noexcept;

} // namespace tessera::crypto
