#pragma once

#include <tessera/protocol/object.hpp>
#include <tessera/protocol/session.hpp>
