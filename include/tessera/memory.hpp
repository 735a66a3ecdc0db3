#pragma once

#include <tessera/memory/memory.hpp>
