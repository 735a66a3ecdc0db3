#pragma once

#include <tessera/crypto/error.hpp>
#include <tessera/crypto/hash.hpp>
#include <tessera/crypto/public_key.hpp>
#include <tessera/crypto/random.hpp>
#include <tessera/crypto/secret_key.hpp>
#include <tessera/crypto/tz.hpp>
