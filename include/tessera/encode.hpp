#pragma once

#include <tessera/encode/archive.hpp>
#include <tessera/encode/base58.hpp>
#include <tessera/encode/error.hpp>
#include <tessera/encode/hex.hpp>
