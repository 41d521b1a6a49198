#include "weft/detail/diagnostics.hpp"

#include <string>

#include "logger.hpp"

namespace weft::detail {
namespace {

auto fault_message(const std::exception_ptr& fault) -> std::string {
  try {
    std::rethrow_exception(fault);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

}  // namespace

void trace_fork(std::uint64_t fiber, std::string_view kind) noexcept {
  logger().trace("fiber {}: forked with a {} node", fiber, kind);
}

void trace_ignored_resolution(std::uint64_t fiber, std::string_view origin) noexcept {
  logger().trace("fiber {}: {} already resolved, later completion ignored", fiber, origin);
}

void trace_cancellation(std::uint64_t fiber, std::string_view origin) noexcept {
  logger().debug("fiber {}: {} interrupted, running cancellation", fiber, origin);
}

void report_cancel_fault(std::uint64_t      fiber,
                         std::string_view   origin,
                         std::exception_ptr fault) noexcept {
  logger().warn("fiber {}: {} cancellation threw: {}", fiber, origin, fault_message(fault));
}

void report_defect(std::uint64_t fiber, const defect& d) noexcept {
  logger().error("fiber {} died: {}", fiber, d.describe());
}

}  // namespace weft::detail
