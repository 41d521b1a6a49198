#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

#include "weft/effect/interrupt.hpp"
#include "weft/execution/blocking_pool.hpp"
#include "weft/execution/thread_pool.hpp"

namespace weft {

// Lifecycle of one unit of execution:
//   pending -> running -> {completed | failed | interrupted}
// interrupted is also reachable straight from pending. Terminal states are
// final.
enum class fiber_status : std::uint8_t { pending, running, completed, failed, interrupted };

[[nodiscard]] auto to_string(fiber_status status) noexcept -> std::string_view;

[[nodiscard]] constexpr auto is_terminal(fiber_status status) noexcept -> bool {
  return status == fiber_status::completed || status == fiber_status::failed
         || status == fiber_status::interrupted;
}

// The pools of one runtime as its fibers see them. Fibers share it with the
// runtime and may outlive it; the runtime detaches it before its pools are
// destroyed, after which nothing is submitted anywhere.
class pool_binding {
 public:
  enum class submit_result : std::uint8_t { queued, stopped, detached };

  pool_binding(execution::thread_pool& computation, execution::blocking_pool& blocking) noexcept
      : computation_(&computation), blocking_(&blocking) {}

  pool_binding(const pool_binding&)                    = delete;
  auto operator=(const pool_binding&) -> pool_binding& = delete;

  // task is left untouched unless it was queued
  auto submit(std::function<void()>& task) -> submit_result;

  auto submit_blocking(std::function<void()>& task) -> submit_result;

  // Throws std::runtime_error once detached
  [[nodiscard]] auto scheduler() const -> execution::thread_pool::thread_pool_scheduler;

  void detach() noexcept;

  [[nodiscard]] auto attached() const noexcept -> bool;

 private:
  mutable std::mutex        mutex_;
  execution::thread_pool*   computation_;
  execution::blocking_pool* blocking_;
};

// The scheduling surface an effect node is run against. Holds the pool
// binding and the interruption signal of a single fiber:
//   - post           enqueue on the computation pool
//   - post_blocking  enqueue on the blocking pool
//   - resume         hand an outcome back to a suspended continuation
//   - interrupt / on_interrupt  deliver and observe interruption
// Suspension needs no call of its own: a node suspends by returning without
// invoking its continuation.
class fiber_context {
 public:
  fiber_context(std::shared_ptr<pool_binding> pools, std::uint64_t id) noexcept
      : pools_(std::move(pools)), id_(id) {}

  fiber_context(const fiber_context&)                    = delete;
  auto operator=(const fiber_context&) -> fiber_context& = delete;

  // Runs task inline when the pool is draining. Once the runtime is gone the
  // task is dropped.
  void post(std::function<void()> task);

  void post_blocking(std::function<void()> task);

  template <class K, class Outcome>
  void resume(K continuation, Outcome outcome) {
    post([k = std::move(continuation), o = std::move(outcome)] mutable -> void {
      std::move(k)(std::move(o));
    });
  }

  [[nodiscard]] auto scheduler() const -> execution::thread_pool::thread_pool_scheduler {
    return pools_->scheduler();
  }

  // Returns true for the call that delivered the signal. Rethrows the first
  // exception raised by an interruption callback, after running them all.
  auto interrupt() -> bool;

  [[nodiscard]] auto interrupt_requested() const noexcept -> bool {
    return interrupts_.interrupt_requested();
  }

  [[nodiscard]] auto on_interrupt(std::function<void()> callback) const -> interrupt_registration {
    return interrupts_.get_token().on_interrupt(std::move(callback));
  }

  // Set once by the runtime before the fiber is first posted. abandon() runs
  // it when the runtime goes away while the fiber is still suspended.
  void on_abandon(std::function<void()> hook) {
    abandon_hook_ = std::move(hook);
  }

  void abandon();

  [[nodiscard]] auto status() const noexcept -> fiber_status {
    return status_.load(std::memory_order_acquire);
  }

  // pending -> running; false if the fiber already left pending
  auto mark_running() noexcept -> bool;

  // Moves to a terminal state; false if one was already reached
  auto mark_done(fiber_status terminal) noexcept -> bool;

  [[nodiscard]] auto id() const noexcept -> std::uint64_t {
    return id_;
  }

 private:
  std::shared_ptr<pool_binding> pools_;
  std::uint64_t                 id_;
  interrupt_source              interrupts_;
  std::function<void()>         abandon_hook_;
  std::atomic<fiber_status>     status_{fiber_status::pending};
};

}  // namespace weft
