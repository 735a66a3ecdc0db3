#pragma once

#include <tessera/refs/address.hpp>
#include <tessera/refs/container_id.hpp>
#include <tessera/refs/error.hpp>
#include <tessera/refs/object_id.hpp>
#include <tessera/refs/owner_id.hpp>
