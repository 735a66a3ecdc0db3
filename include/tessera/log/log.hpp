#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <tessera/log/formatter.hpp>
#include <tessera/log/frontend.hpp>

namespace tessera::log {

void initialize( std::string_view level = "info" ) noexcept;
logger* instance() noexcept;

} // namespace tessera::log
