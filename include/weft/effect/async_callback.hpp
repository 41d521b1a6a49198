#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

#include "weft/detail/diagnostics.hpp"
#include "weft/effect/exit.hpp"
#include "weft/effect/fiber_context.hpp"
#include "weft/effect/interrupt.hpp"

namespace weft {

namespace _async_detail {

// One-shot completion channel of a single run of an async node. Whoever
// claims it first (the callback, a registration fault, or interruption)
// decides the outcome; every later attempt is dropped. A fresh state is
// created for each run, so concurrent runs never share a guard.
template <class E, class A>
class _async_state {
 public:
  _async_state(std::shared_ptr<fiber_context> ctx,
               continuation<E, A>             k,
               bool                           interruptible,
               std::string_view               origin) noexcept
      : ctx_(std::move(ctx)), k_(std::move(k)), interruptible_(interruptible), origin_(origin) {}

  _async_state(const _async_state&)                    = delete;
  auto operator=(const _async_state&) -> _async_state& = delete;

  auto claim() noexcept -> bool {
    return !resolved_.exchange(true, std::memory_order_acq_rel);
  }

  [[nodiscard]] auto resolved() const noexcept -> bool {
    return resolved_.load(std::memory_order_acquire);
  }

  // Completion from the outside world
  void resolve(exit<E, A> outcome) {
    if (!claim()) {
      detail::trace_ignored_resolution(ctx_->id(), origin_);
      return;
    }
    {
      std::scoped_lock lock(mutex_);
      registration_.reset();
    }
    deliver(std::move(outcome));
  }

  // Hands the outcome to the suspended continuation. Only the claimant calls
  // this. A run that could not be interrupted while pending observes a
  // pending interruption here.
  void deliver(exit<E, A> outcome) {
    if (!interruptible_ && ctx_->interrupt_requested()) {
      outcome = exit<E, A>::interrupt();
    }
    ctx_->resume(std::move(k_), std::move(outcome));
  }

  // Keeps callback registered against interruption until the run resolves.
  // callback may run right away if the fiber is already interrupted.
  void arm(std::function<void()> callback) {
    std::scoped_lock lock(mutex_);
    if (resolved()) {
      return;
    }
    registration_ = ctx_->on_interrupt(std::move(callback));
  }

  [[nodiscard]] auto context() const noexcept -> const std::shared_ptr<fiber_context>& {
    return ctx_;
  }

  [[nodiscard]] auto origin() const noexcept -> std::string_view {
    return origin_;
  }

 private:
  std::shared_ptr<fiber_context> ctx_;
  continuation<E, A>             k_;
  bool                           interruptible_;
  std::string_view               origin_;
  std::atomic<bool>              resolved_{false};
  std::mutex                     mutex_;
  interrupt_registration         registration_;
};

}  // namespace _async_detail

// The completion callback handed to an async registration function. Copies
// share one guard: the first invocation across all of them decides the
// outcome, the rest are no-ops. Safe to call from any thread.
template <class E, class A>
class async_callback {
 public:
  explicit async_callback(std::shared_ptr<_async_detail::_async_state<E, A>> state) noexcept
      : state_(std::move(state)) {}

  void operator()(exit<E, A> outcome) const {
    state_->resolve(std::move(outcome));
  }

  void succeed(A value) const {
    state_->resolve(exit<E, A>::succeed(std::move(value)));
  }

  void fail(E error) const {
    state_->resolve(exit<E, A>::fail(std::move(error)));
  }

  [[nodiscard]] auto resolved() const noexcept -> bool {
    return state_->resolved();
  }

 private:
  std::shared_ptr<_async_detail::_async_state<E, A>> state_;
};

}  // namespace weft
