#pragma once

#include <tessera/transfer/download.hpp>
#include <tessera/transfer/error.hpp>
#include <tessera/transfer/upload.hpp>
