#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <source_location>
#include <system_error>
#include <type_traits>
#include <utility>

#include "weft/effect/async_callback.hpp"
#include "weft/effect/node.hpp"
#include "weft/execution/concepts.hpp"
#include "weft/execution/thread_pool.hpp"

namespace weft {

// Bridges a callback-driven operation. register_fn is called once per run,
// synchronously, with an async_callback<E, A>, and should arrange for it to be
// called once later. Only the first call counts. If register_fn throws, the
// run fails with the exception (or dies, when E cannot hold one).
//
// Without a cancel hook the run cannot be interrupted while pending: an
// interruption takes effect once the callback fires.
template <class E, class A, class Register>
  requires std::invocable<Register&, async_callback<E, A>>
[[nodiscard]] auto effect_async(Register             register_fn,
                                std::source_location site = std::source_location::current())
    -> effect_node<no_env, E, A> {
  return effect_node<no_env, E, A>{nodes::async<E, A>{
      [reg = std::move(register_fn)](async_callback<E, A>                         callback,
                                     typename nodes::async<E, A>::scheduler_type /*unused*/) mutable
          -> void { std::invoke(reg, std::move(callback)); },
      {},
      "effect_async",
      site}};
}

// Interruptible form: interrupting a pending run invokes cancel_hook once,
// and any later callback invocation is ignored.
template <class E, class A, class Register, std::invocable Cancel>
  requires std::invocable<Register&, async_callback<E, A>>
[[nodiscard]] auto effect_async(Register             register_fn,
                                Cancel               cancel_hook,
                                std::source_location site = std::source_location::current())
    -> effect_node<no_env, E, A> {
  return effect_node<no_env, E, A>{nodes::async<E, A>{
      [reg = std::move(register_fn)](async_callback<E, A>                         callback,
                                     typename nodes::async<E, A>::scheduler_type /*unused*/) mutable
          -> void { std::invoke(reg, std::move(callback)); },
      std::function<void()>{std::move(cancel_hook)},
      "effect_async",
      site}};
}

namespace _future_detail {

// Error completions as exceptions: error codes become std::system_error and
// other non-exception errors are carried in failure_error.
template <class E>
auto to_fault(E&& error) -> std::exception_ptr {
  using error_type = std::decay_t<E>;
  if constexpr (std::is_same_v<error_type, std::exception_ptr>) {
    return std::forward<E>(error);
  } else if constexpr (std::is_same_v<error_type, std::error_code>) {
    return std::make_exception_ptr(std::system_error(error));
  } else if constexpr (std::is_base_of_v<std::exception, error_type>) {
    return std::make_exception_ptr(std::forward<E>(error));
  } else {
    return std::make_exception_ptr(failure_error<error_type>(std::forward<E>(error)));
  }
}

// Owns the connected operation of one run. The receiver keeps it alive until
// completion and releases it as its last step; nothing touches the operation
// after that.
template <class Sndr, class A>
class _future_operation {
 public:
  explicit _future_operation(async_callback<std::exception_ptr, A> callback) noexcept
      : callback_(std::move(callback)) {}

  struct _receiver {
    using receiver_concept = execution::receiver_t;

    std::shared_ptr<_future_operation> self_;

    template <class... Vs>
    void set_value(Vs&&... vs) && noexcept {
      finish(exit<std::exception_ptr, A>::succeed(A{std::forward<Vs>(vs)...}));
    }

    template <class Err>
    void set_error(Err&& error) && noexcept {
      finish(exit<std::exception_ptr, A>::fail(to_fault(std::forward<Err>(error))));
    }

    void set_stopped() && noexcept {
      finish(exit<std::exception_ptr, A>::interrupt());
    }

   private:
    void finish(exit<std::exception_ptr, A> outcome) noexcept {
      auto self = std::move(self_);
      self->callback_(std::move(outcome));
      // Destroys the operation, and with it this receiver.
      auto done = std::move(self->operation_);
    }
  };

  using operation_type = execution::connect_result_t<Sndr, _receiver>;

  static void start(std::shared_ptr<_future_operation> self, Sndr&& sndr) {
    self->operation_ = std::unique_ptr<operation_type>(
        new operation_type(execution::connect(std::move(sndr), _receiver{self})));
    auto* operation = self->operation_.get();
    self.reset();
    operation->start();
  }

 private:
  async_callback<std::exception_ptr, A> callback_;
  std::unique_ptr<operation_type>       operation_;
};

}  // namespace _future_detail

// Adapts an eventual value. provider receives the computation scheduler and
// returns a sender of exactly one value; the sender is connected and started
// each time the node runs. Values succeed and errors fail as exceptions.
// A stopped completion ends the run interrupted and the fiber's status
// becomes interrupted, even though nothing requested an interruption: the
// producer gave up, and there is no value or error to report.
template <class Provider>
  requires std::invocable<Provider&, execution::thread_pool::thread_pool_scheduler>
           && execution::single_value_sender<
               std::invoke_result_t<Provider&, execution::thread_pool::thread_pool_scheduler>>
[[nodiscard]] auto from_future(Provider             provider,
                               std::source_location site = std::source_location::current()) {
  using sender_type =
      std::remove_cvref_t<std::invoke_result_t<Provider&, execution::thread_pool::thread_pool_scheduler>>;
  using value_type = std::decay_t<execution::single_value_t<sender_type>>;
  using operation  = _future_detail::_future_operation<sender_type, value_type>;

  return effect_node<no_env, std::exception_ptr, value_type>{nodes::async<std::exception_ptr, value_type>{
      [provider = std::move(provider)](
          async_callback<std::exception_ptr, value_type>   callback,
          execution::thread_pool::thread_pool_scheduler scheduler) mutable -> void {
        auto sndr = std::invoke(provider, scheduler);
        operation::start(std::make_shared<operation>(std::move(callback)), std::move(sndr));
      },
      {},
      "from_future",
      site}};
}

}  // namespace weft
