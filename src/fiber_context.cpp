#include "weft/effect/fiber_context.hpp"

#include <stdexcept>

#include "logger.hpp"

namespace weft {

auto to_string(fiber_status status) noexcept -> std::string_view {
  switch (status) {
    case fiber_status::pending:
      return "pending";
    case fiber_status::running:
      return "running";
    case fiber_status::completed:
      return "completed";
    case fiber_status::failed:
      return "failed";
    case fiber_status::interrupted:
      return "interrupted";
  }
  return "unknown";
}

auto pool_binding::submit(std::function<void()>& task) -> submit_result {
  std::scoped_lock lock(mutex_);
  if (computation_ == nullptr) {
    return submit_result::detached;
  }
  return computation_->submit(task) ? submit_result::queued : submit_result::stopped;
}

auto pool_binding::submit_blocking(std::function<void()>& task) -> submit_result {
  std::scoped_lock lock(mutex_);
  if (blocking_ == nullptr) {
    return submit_result::detached;
  }
  return blocking_->submit(task) ? submit_result::queued : submit_result::stopped;
}

auto pool_binding::scheduler() const -> execution::thread_pool::thread_pool_scheduler {
  std::scoped_lock lock(mutex_);
  if (computation_ == nullptr) {
    throw std::runtime_error("runtime has been shut down");
  }
  return computation_->get_scheduler();
}

void pool_binding::detach() noexcept {
  std::scoped_lock lock(mutex_);
  computation_ = nullptr;
  blocking_    = nullptr;
}

auto pool_binding::attached() const noexcept -> bool {
  std::scoped_lock lock(mutex_);
  return computation_ != nullptr;
}

void fiber_context::post(std::function<void()> task) {
  switch (pools_->submit(task)) {
    case pool_binding::submit_result::queued:
      return;
    case pool_binding::submit_result::stopped:
      // The pool is draining for shutdown; finish the work here instead of
      // leaving the fiber suspended forever.
      detail::logger().debug("fiber {}: computation pool stopped, running continuation inline", id_);
      task();
      return;
    case pool_binding::submit_result::detached:
      detail::logger().warn("fiber {}: runtime is gone, dropping continuation", id_);
      return;
  }
}

void fiber_context::post_blocking(std::function<void()> task) {
  switch (pools_->submit_blocking(task)) {
    case pool_binding::submit_result::queued:
      return;
    case pool_binding::submit_result::stopped:
      detail::logger().debug("fiber {}: blocking pool stopped, running task inline", id_);
      task();
      return;
    case pool_binding::submit_result::detached:
      detail::logger().warn("fiber {}: runtime is gone, dropping blocking task", id_);
      return;
  }
}

auto fiber_context::interrupt() -> bool {
  if (is_terminal(status())) {
    return false;
  }
  const bool delivered = interrupts_.request_interrupt();
  if (delivered) {
    detail::logger().debug("fiber {}: interruption delivered while {}", id_, to_string(status()));
  }
  return delivered;
}

void fiber_context::abandon() {
  if (is_terminal(status()) || !abandon_hook_) {
    return;
  }
  detail::logger().warn("fiber {}: abandoned while {} by a stopping runtime", id_, to_string(status()));
  abandon_hook_();
}

auto fiber_context::mark_running() noexcept -> bool {
  auto expected = fiber_status::pending;
  return status_.compare_exchange_strong(expected, fiber_status::running,
                                         std::memory_order_acq_rel);
}

auto fiber_context::mark_done(fiber_status terminal) noexcept -> bool {
  auto current = status_.load(std::memory_order_acquire);
  while (!is_terminal(current)) {
    if (status_.compare_exchange_weak(current, terminal, std::memory_order_acq_rel)) {
      return true;
    }
  }
  return false;
}

}  // namespace weft
