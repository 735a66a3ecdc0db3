#pragma once

#include <tessera/client/client.hpp>
