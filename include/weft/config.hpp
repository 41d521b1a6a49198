#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include "weft/log.hpp"

namespace weft {

struct runtime_config {
  // Size of the computation pool; 0 picks the hardware concurrency
  std::size_t computation_threads = 0;

  // Upper bound on blocking threads; 0 leaves the pool unbounded
  std::size_t blocking_max_threads = 0;

  // How long an idle blocking thread waits for work before it retires
  std::chrono::milliseconds blocking_keep_alive{std::chrono::seconds{60}};

  // Applied to the weft logger when the runtime starts; unset leaves the
  // logger alone
  std::optional<weft::log_level> log_level;

  // Defaults overridden by the environment:
  //   WEFT_COMPUTATION_THREADS     unsigned integer
  //   WEFT_BLOCKING_MAX_THREADS    unsigned integer
  //   WEFT_BLOCKING_KEEP_ALIVE_MS  unsigned integer, milliseconds
  //   WEFT_LOG_LEVEL               trace, debug, info, warn, error, critical, off
  // A malformed value is reported and ignored.
  [[nodiscard]] static auto from_env() -> runtime_config;
};

}  // namespace weft
