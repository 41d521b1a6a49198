#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace weft {

// Verbosity of the library's internal "weft" logger. spdlog stays an
// implementation detail: nothing in the public headers names it.
enum class log_level : std::uint8_t {
  trace    = 0,
  debug    = 1,
  info     = 2,
  warn     = 3,
  error    = 4,
  critical = 5,
  off      = 6,
};

void set_log_level(log_level level) noexcept;

[[nodiscard]] auto get_log_level() noexcept -> log_level;

// Accepts the spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"); case-sensitive.
[[nodiscard]] auto parse_log_level(std::string_view text) noexcept -> std::optional<log_level>;

[[nodiscard]] auto to_string(log_level level) noexcept -> std::string_view;

}  // namespace weft
