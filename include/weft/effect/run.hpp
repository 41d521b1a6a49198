#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "weft/detail/diagnostics.hpp"
#include "weft/effect/async_callback.hpp"
#include "weft/effect/exit.hpp"
#include "weft/effect/fiber_context.hpp"
#include "weft/effect/interrupt.hpp"
#include "weft/effect/node.hpp"

namespace weft {

namespace _run_detail {

// A caught exception as the typed failure when E can hold one, otherwise as
// a defect attributed to origin.
template <class E, class A>
auto from_fault(std::exception_ptr          fault,
                std::string_view            origin,
                const std::source_location& site) -> exit<E, A> {
  if constexpr (std::is_constructible_v<E, std::exception_ptr>) {
    return exit<E, A>::fail(E(std::move(fault)));
  } else {
    return exit<E, A>::die(defect{origin, std::move(fault), site});
  }
}

// Synchronous thunks cannot be interrupted midway; an interruption that
// arrived while one ran takes effect right after it.
template <class E, class A>
auto observe_interruption(const fiber_context& ctx, exit<E, A> outcome) -> exit<E, A> {
  if (ctx.interrupt_requested()) {
    return exit<E, A>::interrupt();
  }
  return outcome;
}

template <class E, class A>
void run_async(const nodes::async<E, A>&             node,
               const std::shared_ptr<fiber_context>& ctx,
               continuation<E, A>                    k) {
  const bool interruptible = static_cast<bool>(node.cancel_hook);
  auto       state         = std::make_shared<_async_detail::_async_state<E, A>>(
      ctx, std::move(k), interruptible, node.origin);

  try {
    node.subscribe(async_callback<E, A>{state}, ctx->scheduler());
  } catch (...) {
    state->resolve(from_fault<E, A>(std::current_exception(), node.origin, node.site));
  }

  if (interruptible) {
    state->arm([weak = std::weak_ptr(state), cancel = node.cancel_hook] -> void {
      auto self = weak.lock();
      if (self == nullptr || !self->claim()) {
        return;
      }
      const auto fiber = self->context()->id();
      detail::trace_cancellation(fiber, self->origin());
      try {
        cancel();
      } catch (...) {
        detail::report_cancel_fault(fiber, self->origin(), std::current_exception());
      }
      self->deliver(exit<E, A>::interrupt());
    });
  }
}

// Progress of one run of a blocking node. Exactly one of the worker and an
// interruption while queued gets to deliver the outcome.
template <class E, class A>
class _blocking_state {
 public:
  enum class phase : std::uint8_t { queued, running, finished, cancelled };

  _blocking_state(std::shared_ptr<fiber_context> ctx, continuation<E, A> k) noexcept
      : ctx_(std::move(ctx)), k_(std::move(k)) {}

  // queued -> running, on the blocking thread
  auto begin() noexcept -> bool {
    auto expected = phase::queued;
    return phase_.compare_exchange_strong(expected, phase::running, std::memory_order_acq_rel);
  }

  // queued -> cancelled, on the interrupting thread
  auto cancel_queued() noexcept -> bool {
    auto expected = phase::queued;
    return phase_.compare_exchange_strong(expected, phase::cancelled, std::memory_order_acq_rel);
  }

  void finish() noexcept {
    phase_.store(phase::finished, std::memory_order_release);
  }

  [[nodiscard]] auto running() const noexcept -> bool {
    return phase_.load(std::memory_order_acquire) == phase::running;
  }

  auto claim_cancellation() noexcept -> bool {
    return !cancel_invoked_.exchange(true, std::memory_order_acq_rel);
  }

  void deliver(exit<E, A> outcome) {
    ctx_->resume(std::move(k_), std::move(outcome));
  }

  [[nodiscard]] auto context() const noexcept -> const std::shared_ptr<fiber_context>& {
    return ctx_;
  }

  void hold(interrupt_registration registration) noexcept {
    registration_ = std::move(registration);
  }

 private:
  std::shared_ptr<fiber_context> ctx_;
  continuation<E, A>             k_;
  std::atomic<phase>             phase_{phase::queued};
  std::atomic<bool>              cancel_invoked_{false};
  interrupt_registration         registration_;
};

template <class E, class A>
void run_blocking(const nodes::blocking<A>&             node,
                  const std::shared_ptr<fiber_context>& ctx,
                  continuation<E, A>                    k) {
  auto state = std::make_shared<_blocking_state<E, A>>(ctx, std::move(k));

  state->hold(ctx->on_interrupt([weak = std::weak_ptr(state), cancel = node.cancel_thunk] -> void {
    auto self = weak.lock();
    if (self == nullptr) {
      return;
    }
    if (self->cancel_queued()) {
      // Never reached a thread: nothing to reclaim.
      self->deliver(exit<E, A>::interrupt());
      return;
    }
    if (cancel && self->running() && self->claim_cancellation()) {
      const auto fiber = self->context()->id();
      detail::trace_cancellation(fiber, "effect_blocking_cancelable");
      try {
        cancel();
      } catch (...) {
        detail::report_cancel_fault(fiber, "effect_blocking_cancelable", std::current_exception());
      }
    }
  }));

  ctx->post_blocking([state, thunk = node.thunk] -> void {
    if (!state->begin()) {
      return;
    }

    auto outcome = [&] -> exit<E, A> {
      try {
        return exit<E, A>::succeed(thunk());
      } catch (...) {
        return from_fault<E, A>(std::current_exception(), "effect_blocking",
                                std::source_location::current());
      }
    }();

    state->finish();
    state->deliver(observe_interruption(*state->context(), std::move(outcome)));
  });
}

}  // namespace _run_detail

// Runs one node against ctx and hands its outcome to k. This is the single
// dispatch point over the node variants. Nodes that suspend return at once
// and call k later from a pool thread.
template <class R, class E, class A>
void evaluate(const effect_node<R, E, A>&           eff,
              const std::shared_ptr<fiber_context>& ctx,
              const R&                              env,
              continuation<E, A>                    k) {
  using exit_type = exit<E, A>;

  if (ctx->interrupt_requested()) {
    k(exit_type::interrupt());
    return;
  }

  std::visit(
      [&](const auto& node) -> void {
        using N = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<N, nodes::success<A>>) {
          k(exit_type::succeed(node.value));
        } else if constexpr (std::is_same_v<N, nodes::failure<E>>) {
          k(exit_type::fail(node.error));
        } else if constexpr (std::is_same_v<N, nodes::total<A>>) {
          auto outcome = [&] -> exit_type {
            try {
              return exit_type::succeed(node.thunk());
            } catch (...) {
              return exit_type::die(defect{node.origin, std::current_exception(), node.site});
            }
          }();
          k(_run_detail::observe_interruption(*ctx, std::move(outcome)));
        } else if constexpr (std::is_same_v<N, nodes::attempt<A>>) {
          auto outcome = [&] -> exit_type {
            try {
              return exit_type::succeed(node.thunk());
            } catch (...) {
              return _run_detail::from_fault<E, A>(std::current_exception(), "effect",
                                                   std::source_location::current());
            }
          }();
          k(_run_detail::observe_interruption(*ctx, std::move(outcome)));
        } else if constexpr (std::is_same_v<N, nodes::function_of<R, A>>) {
          auto outcome = [&] -> exit_type {
            try {
              return exit_type::succeed(node.fn(env));
            } catch (...) {
              return exit_type::die(defect{"from_function", std::current_exception(), node.site});
            }
          }();
          k(std::move(outcome));
        } else if constexpr (std::is_same_v<N, nodes::async<E, A>>) {
          _run_detail::run_async(node, ctx, std::move(k));
        } else if constexpr (std::is_same_v<N, nodes::blocking<A>>) {
          _run_detail::run_blocking(node, ctx, std::move(k));
        } else if constexpr (std::is_same_v<N, nodes::on_blocking<R, E, A>>) {
          ctx->post_blocking([inner = node.inner, ctx, env, k = std::move(k)] mutable -> void {
            evaluate(*inner, ctx, env, std::move(k));
          });
        } else {
          static_assert(std::is_same_v<N, nodes::refine<R, E, A>>);
          node.run(ctx, env, std::move(k));
        }
      },
      eff.node());
}

}  // namespace weft
