#include "weft/log.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "logger.hpp"

namespace weft {
namespace {

[[nodiscard]] auto to_spdlog_level(log_level level) noexcept -> spdlog::level::level_enum {
  switch (level) {
    case log_level::trace:
      return spdlog::level::trace;
    case log_level::debug:
      return spdlog::level::debug;
    case log_level::info:
      return spdlog::level::info;
    case log_level::warn:
      return spdlog::level::warn;
    case log_level::error:
      return spdlog::level::err;
    case log_level::critical:
      return spdlog::level::critical;
    case log_level::off:
      return spdlog::level::off;
  }
  return spdlog::level::off;
}

[[nodiscard]] auto from_spdlog_level(spdlog::level::level_enum level) noexcept -> log_level {
  switch (level) {
    case spdlog::level::trace:
      return log_level::trace;
    case spdlog::level::debug:
      return log_level::debug;
    case spdlog::level::info:
      return log_level::info;
    case spdlog::level::warn:
      return log_level::warn;
    case spdlog::level::err:
      return log_level::error;
    case spdlog::level::critical:
      return log_level::critical;
    default:
      return log_level::off;
  }
}

auto make_logger() -> std::shared_ptr<spdlog::logger> {
  // An application may register its own "weft" logger before first use.
  if (auto existing = spdlog::get("weft")) {
    return existing;
  }
  auto created = spdlog::stderr_color_mt("weft");
  created->set_level(spdlog::level::warn);
  return created;
}

}  // namespace

namespace detail {

auto logger() -> spdlog::logger& {
  static const std::shared_ptr<spdlog::logger> instance = make_logger();
  return *instance;
}

}  // namespace detail

void set_log_level(log_level level) noexcept {
  detail::logger().set_level(to_spdlog_level(level));
}

auto get_log_level() noexcept -> log_level {
  return from_spdlog_level(detail::logger().level());
}

auto parse_log_level(std::string_view text) noexcept -> std::optional<log_level> {
  for (auto level : {log_level::trace, log_level::debug, log_level::info, log_level::warn,
                     log_level::error, log_level::critical, log_level::off}) {
    if (to_string(level) == text) {
      return level;
    }
  }
  return std::nullopt;
}

auto to_string(log_level level) noexcept -> std::string_view {
  switch (level) {
    case log_level::trace:
      return "trace";
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warn:
      return "warn";
    case log_level::error:
      return "error";
    case log_level::critical:
      return "critical";
    case log_level::off:
      return "off";
  }
  return "off";
}

}  // namespace weft
