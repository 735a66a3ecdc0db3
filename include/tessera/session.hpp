#pragma once

#include <tessera/session/error.hpp>
#include <tessera/session/negotiator.hpp>
#include <tessera/session/token.hpp>
