#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "weft/detail/diagnostics.hpp"
#include "weft/effect/exit.hpp"
#include "weft/effect/fiber_context.hpp"

namespace weft {

namespace _fiber_detail {

template <class E, class A>
struct _fiber_state {
  explicit _fiber_state(std::shared_ptr<fiber_context> ctx) noexcept : context(std::move(ctx)) {}

  std::shared_ptr<fiber_context>  context;
  std::mutex                      mutex;
  std::condition_variable         cv;
  std::optional<exit<E, A>>       outcome;

  // The first call decides the outcome; a runtime that stops while the run
  // is suspended races the run itself here.
  void complete(exit<E, A> result) {
    if (!context->mark_done(terminal_status(result))) {
      return;
    }
    if (result.is_defect()) {
      detail::report_defect(context->id(), result.defect());
    }
    {
      std::scoped_lock lock(mutex);
      outcome.emplace(std::move(result));
    }
    cv.notify_all();
  }

  static auto terminal_status(const exit<E, A>& result) noexcept -> fiber_status {
    if (result.is_success()) {
      return fiber_status::completed;
    }
    if (result.is_interrupted()) {
      return fiber_status::interrupted;
    }
    return fiber_status::failed;
  }
};

}  // namespace _fiber_detail

// Handle to one running effect. Copies refer to the same fiber; the fiber
// keeps running when every handle is gone.
template <class E, class A>
class fiber {
 public:
  using error_type = E;
  using value_type = A;

  explicit fiber(std::shared_ptr<_fiber_detail::_fiber_state<E, A>> state) noexcept
      : state_(std::move(state)) {}

  // Blocks until the fiber reaches a terminal state
  [[nodiscard]] auto join() const -> exit<E, A> {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] -> bool { return state_->outcome.has_value(); });
    return *state_->outcome;
  }

  // As join, giving up after timeout
  template <class Rep, class Period>
  [[nodiscard]] auto join_for(std::chrono::duration<Rep, Period> timeout) const
      -> std::optional<exit<E, A>> {
    std::unique_lock lock(state_->mutex);
    if (!state_->cv.wait_for(lock, timeout, [this] -> bool { return state_->outcome.has_value(); })) {
      return std::nullopt;
    }
    return state_->outcome;
  }

  // Requests interruption. Returns false if the fiber was already
  // interrupted or had finished. Rethrows what an interruption callback
  // threw, such as a failed post of the interrupted continuation.
  auto interrupt() const -> bool {
    return state_->context->interrupt();
  }

  [[nodiscard]] auto status() const noexcept -> fiber_status {
    return state_->context->status();
  }

  [[nodiscard]] auto id() const noexcept -> std::uint64_t {
    return state_->context->id();
  }

 private:
  std::shared_ptr<_fiber_detail::_fiber_state<E, A>> state_;
};

}  // namespace weft
