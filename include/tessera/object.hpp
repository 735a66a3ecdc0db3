#pragma once

#include <tessera/object/error.hpp>
#include <tessera/object/object.hpp>
#include <tessera/object/query.hpp>
#include <tessera/object/range.hpp>
