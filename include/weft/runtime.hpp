#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "weft/config.hpp"
#include "weft/detail/diagnostics.hpp"
#include "weft/effect/exit.hpp"
#include "weft/effect/fiber.hpp"
#include "weft/effect/fiber_context.hpp"
#include "weft/effect/node.hpp"
#include "weft/effect/run.hpp"
#include "weft/execution/blocking_pool.hpp"
#include "weft/execution/thread_pool.hpp"

namespace weft {

// Owns the computation and blocking pools and starts fibers on them. Every
// fiber gets its own context; nothing reaches the pools except through one.
// Destruction drains both pools, blocking first, so work that finishes on a
// blocking thread can still resume on the computation pool. Fibers still
// suspended after the drain are interrupted, and those that stay pending are
// completed as interrupted. Callbacks that fire later are dropped.
class runtime {
 public:
  explicit runtime(runtime_config config = {});

  ~runtime();

  runtime(const runtime&)                    = delete;
  auto operator=(const runtime&) -> runtime& = delete;
  runtime(runtime&&)                         = delete;
  auto operator=(runtime&&) -> runtime&      = delete;

  // Process-wide runtime configured from the environment on first use and
  // shut down at exit.
  [[nodiscard]] static auto global() -> runtime&;

  [[nodiscard]] auto computation() noexcept -> execution::thread_pool& {
    return computation_;
  }

  [[nodiscard]] auto blocking() noexcept -> execution::blocking_pool& {
    return blocking_;
  }

  [[nodiscard]] auto config() const noexcept -> const runtime_config& {
    return config_;
  }

  template <class R, class E, class A>
  auto fork(effect_node<R, E, A> eff, R env) -> fiber<E, A> {
    auto ctx   = std::make_shared<fiber_context>(pools_, next_fiber_id());
    auto state = std::make_shared<_fiber_detail::_fiber_state<E, A>>(ctx);

    ctx->on_abandon([weak = std::weak_ptr(state)] -> void {
      if (auto self = weak.lock()) {
        self->complete(exit<E, A>::interrupt());
      }
    });
    track(ctx);
    detail::trace_fork(ctx->id(), to_string(eff.kind()));

    ctx->post([eff = std::move(eff), env = std::move(env), state] -> void {
      const auto& context = state->context;
      if (context->interrupt_requested() || !context->mark_running()) {
        state->complete(exit<E, A>::interrupt());
        return;
      }
      evaluate(eff, context, env, continuation<E, A>{[state](exit<E, A> outcome) -> void {
                 state->complete(std::move(outcome));
               }});
    });

    return fiber<E, A>{std::move(state)};
  }

  template <class E, class A>
  auto fork(effect_node<no_env, E, A> eff) -> fiber<E, A> {
    return fork(std::move(eff), no_env{});
  }

  // Runs eff to completion, blocking the calling thread. Must not be called
  // from a thread of this runtime's pools.
  template <class R, class E, class A>
  auto run_sync(effect_node<R, E, A> eff, R env) -> exit<E, A> {
    return fork(std::move(eff), std::move(env)).join();
  }

  template <class E, class A>
  auto run_sync(effect_node<no_env, E, A> eff) -> exit<E, A> {
    return fork(std::move(eff)).join();
  }

  // Fibers started here that have not finished yet
  [[nodiscard]] auto live_fibers() const -> std::size_t;

 private:
  auto next_fiber_id() noexcept -> std::uint64_t;

  void track(const std::shared_ptr<fiber_context>& ctx);

  // Interrupts, then abandons, every fiber left after the pools drained
  void release_fibers() noexcept;

  runtime_config                            config_;
  execution::thread_pool                    computation_;
  execution::blocking_pool                  blocking_;
  std::shared_ptr<pool_binding>             pools_;
  std::atomic<std::uint64_t>                fiber_ids_{0};
  mutable std::mutex                        fibers_mutex_;
  std::vector<std::weak_ptr<fiber_context>> fibers_;
  std::size_t                               prune_at_{64};
};

}  // namespace weft
