#pragma once

#include <tessera/io/error.hpp>
#include <tessera/io/sink.hpp>
#include <tessera/io/source.hpp>
