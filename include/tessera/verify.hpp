#pragma once

#include <tessera/verify/error.hpp>
#include <tessera/verify/range_verifier.hpp>
