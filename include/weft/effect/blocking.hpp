#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include "weft/effect/node.hpp"

namespace weft {

// Runs thunk on the blocking pool so it cannot starve the computation pool.
// A throw becomes the failure. Interruption while the thunk runs is only
// observed after it returns.
template <std::invocable F>
[[nodiscard]] auto effect_blocking(F thunk)
    -> effect_node<no_env, std::exception_ptr, _node_detail::thunk_value_t<F>> {
  using value_type = _node_detail::thunk_value_t<F>;
  return effect_node<no_env, std::exception_ptr, value_type>{
      nodes::blocking<value_type>{_node_detail::lift_thunk(std::move(thunk)), {}}};
}

// As effect_blocking, but interrupting a running thunk invokes cancel_thunk
// once. cancel_thunk must make thunk return in finite time; the blocking
// thread is reclaimed as soon as it does.
template <std::invocable F, std::invocable Cancel>
[[nodiscard]] auto effect_blocking_cancelable(F thunk, Cancel cancel_thunk)
    -> effect_node<no_env, std::exception_ptr, _node_detail::thunk_value_t<F>> {
  using value_type = _node_detail::thunk_value_t<F>;
  return effect_node<no_env, std::exception_ptr, value_type>{nodes::blocking<value_type>{
      _node_detail::lift_thunk(std::move(thunk)), std::function<void()>{std::move(cancel_thunk)}}};
}

// Moves an existing node of any shape onto the blocking pool.
template <class R, class E, class A>
[[nodiscard]] auto blocking(effect_node<R, E, A> inner) -> effect_node<R, E, A> {
  return effect_node<R, E, A>{
      nodes::on_blocking<R, E, A>{std::make_shared<const effect_node<R, E, A>>(std::move(inner))}};
}

}  // namespace weft
