#pragma once

#include <concepts>
#include <exception>
#include <expected>
#include <functional>
#include <optional>
#include <source_location>
#include <type_traits>
#include <utility>
#include <variant>

#include "weft/effect/node.hpp"

namespace weft {

namespace _constructors_detail {

// Parameter type of a unary callable (lambda, function pointer, functor)
template <class Sig>
struct _unary_argument;

template <class Ret, class Arg>
struct _unary_argument<Ret (*)(Arg)> {
  using type = std::remove_cvref_t<Arg>;
};

template <class Ret, class C, class Arg>
struct _unary_argument<Ret (C::*)(Arg) const> {
  using type = std::remove_cvref_t<Arg>;
};

template <class Ret, class C, class Arg>
struct _unary_argument<Ret (C::*)(Arg)> {
  using type = std::remove_cvref_t<Arg>;
};

template <class Ret, class C, class Arg>
struct _unary_argument<Ret (C::*)(Arg) const noexcept> {
  using type = std::remove_cvref_t<Arg>;
};

template <class F>
struct _environment_of : _unary_argument<decltype(&F::operator())> {};

template <class Ret, class Arg>
struct _environment_of<Ret (*)(Arg)> : _unary_argument<Ret (*)(Arg)> {};

template <class R, class F>
struct _resolve_environment {
  using type = R;
};

template <class F>
struct _resolve_environment<void, F> {
  using type = typename _environment_of<std::decay_t<F>>::type;
};

}  // namespace _constructors_detail

// ---------------------------------------------------------------------------
// Values and standard conversions
// ---------------------------------------------------------------------------

// The value is already built; the node only carries it.
template <class E = never, class V>
[[nodiscard]] auto succeed(V&& value) -> effect_node<no_env, E, std::decay_t<V>> {
  return effect_node<no_env, E, std::decay_t<V>>{
      nodes::success<std::decay_t<V>>{std::forward<V>(value)}};
}

// thunk runs each time the node runs, never when it is built. Results are
// not memoized across runs.
template <class E = never, std::invocable F>
[[nodiscard]] auto succeed_lazy(F thunk,
                                std::source_location site = std::source_location::current())
    -> effect_node<no_env, E, _node_detail::thunk_value_t<F>> {
  using value_type = _node_detail::thunk_value_t<F>;
  return effect_node<no_env, E, value_type>{nodes::total<value_type>{
      _node_detail::lift_thunk(std::move(thunk)), "succeed_lazy", site}};
}

template <class A = never, class Err>
[[nodiscard]] auto fail(Err&& error) -> effect_node<no_env, std::decay_t<Err>, A> {
  return effect_node<no_env, std::decay_t<Err>, A>{
      nodes::failure<std::decay_t<Err>>{std::forward<Err>(error)}};
}

// Empty optionals fail with none_marker.
template <class A>
[[nodiscard]] auto from_option(std::optional<A> option) -> effect_node<no_env, no_such_element, A> {
  if (option.has_value()) {
    return succeed<no_such_element>(std::move(*option));
  }
  return fail<A>(none_marker);
}

// The unexpected branch is the failure.
template <class A, class E>
[[nodiscard]] auto from_either(std::expected<A, E> either) -> effect_node<no_env, E, A> {
  if (either.has_value()) {
    return succeed<E>(std::move(*either));
  }
  return fail<A>(std::move(either).error());
}

// Alternative 0 is the left (failure) branch, alternative 1 the right one.
// A valueless variant has neither; running the node dies with
// std::bad_variant_access.
template <class L, class Rt>
[[nodiscard]] auto from_either(std::variant<L, Rt>  either,
                               std::source_location site = std::source_location::current())
    -> effect_node<no_env, L, Rt> {
  if (either.index() == 0) {
    return fail<Rt>(std::get<0>(std::move(either)));
  }
  if (either.index() == 1) {
    return succeed<L>(std::get<1>(std::move(either)));
  }
  return effect_node<no_env, L, Rt>{
      nodes::total<Rt>{[] -> Rt { throw std::bad_variant_access{}; }, "from_either", site}};
}

// An already-evaluated fallible result
template <class A>
[[nodiscard]] auto from_try(std::expected<A, std::exception_ptr> result)
    -> effect_node<no_env, std::exception_ptr, A> {
  return from_either(std::move(result));
}

// A fallible computation, evaluated on every run. Whatever it throws becomes
// the failure; no other error shape is possible.
template <std::invocable F>
[[nodiscard]] auto from_try(F computation)
    -> effect_node<no_env, std::exception_ptr, _node_detail::thunk_value_t<F>> {
  using value_type = _node_detail::thunk_value_t<F>;
  return effect_node<no_env, std::exception_ptr, value_type>{
      nodes::attempt<value_type>{_node_detail::lift_thunk(std::move(computation))}};
}

// Reads the environment. R is deduced from f's parameter unless given.
// The function must not throw; a throw is reported as a defect.
template <class R = void, class F>
[[nodiscard]] auto from_function(F f, std::source_location site = std::source_location::current())
    -> effect_node<typename _constructors_detail::_resolve_environment<R, F>::type,
                   never,
                   std::decay_t<std::invoke_result_t<
                       F&,
                       const typename _constructors_detail::_resolve_environment<R, F>::type&>>> {
  using env_type   = typename _constructors_detail::_resolve_environment<R, F>::type;
  using value_type = std::decay_t<std::invoke_result_t<F&, const env_type&>>;
  return effect_node<env_type, never, value_type>{
      nodes::function_of<env_type, value_type>{std::function<value_type(const env_type&)>{
                                                   std::move(f)},
                                               site}};
}

// ---------------------------------------------------------------------------
// Synchronous side effects
// ---------------------------------------------------------------------------

// The on-ramp for arbitrary foreign code: no exception escapes, every throw
// becomes the failure.
template <std::invocable F>
[[nodiscard]] auto effect(F thunk)
    -> effect_node<no_env, std::exception_ptr, _node_detail::thunk_value_t<F>> {
  using value_type = _node_detail::thunk_value_t<F>;
  return effect_node<no_env, std::exception_ptr, value_type>{
      nodes::attempt<value_type>{_node_detail::lift_thunk(std::move(thunk))}};
}

// The caller asserts thunk cannot throw. If it does, the run dies with a
// defect naming this call site; the error channel stays empty.
template <std::invocable F>
[[nodiscard]] auto effect_total(F thunk, std::source_location site = std::source_location::current())
    -> effect_node<no_env, never, _node_detail::thunk_value_t<F>> {
  using value_type = _node_detail::thunk_value_t<F>;
  return effect_node<no_env, never, value_type>{
      nodes::total<value_type>{_node_detail::lift_thunk(std::move(thunk)), "effect_total", site}};
}

}  // namespace weft
