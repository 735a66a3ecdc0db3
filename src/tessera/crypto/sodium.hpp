#pragma once

#include <cassert>

#include <sodium.h>

namespace tessera::crypto::detail {

inline void initialize_sodium()
{
  [[maybe_unused]]
  static int retval = sodium_init();
  assert( retval >= 0 );
}

} // namespace tessera::crypto::detail
