#include "weft/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

#include "logger.hpp"

namespace weft {
namespace {

auto read_env(const char* name) -> std::optional<std::string_view> {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return std::nullopt;
  }
  return std::string_view{raw};
}

auto parse_count(const char* name, std::string_view text) -> std::optional<std::size_t> {
  std::size_t value = 0;
  const auto* last  = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last || text.empty()) {
    detail::logger().warn("ignoring {}='{}': expected an unsigned integer", name, text);
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto runtime_config::from_env() -> runtime_config {
  runtime_config config;

  if (auto text = read_env("WEFT_COMPUTATION_THREADS")) {
    if (auto count = parse_count("WEFT_COMPUTATION_THREADS", *text)) {
      config.computation_threads = *count;
    }
  }

  if (auto text = read_env("WEFT_BLOCKING_MAX_THREADS")) {
    if (auto count = parse_count("WEFT_BLOCKING_MAX_THREADS", *text)) {
      config.blocking_max_threads = *count;
    }
  }

  if (auto text = read_env("WEFT_BLOCKING_KEEP_ALIVE_MS")) {
    if (auto millis = parse_count("WEFT_BLOCKING_KEEP_ALIVE_MS", *text)) {
      config.blocking_keep_alive = std::chrono::milliseconds{*millis};
    }
  }

  if (auto text = read_env("WEFT_LOG_LEVEL")) {
    if (auto level = parse_log_level(*text)) {
      config.log_level = *level;
    } else {
      detail::logger().warn("ignoring WEFT_LOG_LEVEL='{}': unknown level", *text);
    }
  }

  return config;
}

}  // namespace weft
