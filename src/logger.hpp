#pragma once

#include <spdlog/spdlog.h>

namespace weft::detail {

// The named "weft" logger, created on first use and registered with spdlog.
auto logger() -> spdlog::logger&;

}  // namespace weft::detail
