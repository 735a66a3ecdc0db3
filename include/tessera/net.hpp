#pragma once

#include <tessera/net/channel.hpp>
#include <tessera/net/context.hpp>
#include <tessera/net/error.hpp>
#include <tessera/net/frame.hpp>
#include <tessera/net/service.hpp>
#include <tessera/net/stream.hpp>
