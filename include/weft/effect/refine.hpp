#pragma once

#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <source_location>
#include <type_traits>
#include <utility>

#include "weft/effect/exit.hpp"
#include "weft/effect/fiber_context.hpp"
#include "weft/effect/node.hpp"
#include "weft/effect/run.hpp"

namespace weft {

namespace _refine_detail {

template <class T>
struct _optional_value;

template <class T>
struct _optional_value<std::optional<T>> {
  using type = T;
};

template <class F, class E>
using narrowed_error_t =
    typename _optional_value<std::remove_cvref_t<std::invoke_result_t<F&, const E&>>>::type;

template <class E>
auto unrefined_cause(const E& error) -> std::exception_ptr {
  if constexpr (std::is_same_v<E, std::exception_ptr>) {
    return error;
  } else {
    return std::make_exception_ptr(unrefined_error<E>{error});
  }
}

template <class E2, class E1, class A, class Classify>
auto narrow(exit<E1, A> outcome, Classify& classify, const std::source_location& site)
    -> exit<E2, A> {
  if (outcome.is_success()) {
    return exit<E2, A>::succeed(std::move(outcome).value());
  }
  if (outcome.is_failure()) {
    if (auto narrowed = classify(outcome.error()); narrowed.has_value()) {
      return exit<E2, A>::fail(std::move(*narrowed));
    }
    return exit<E2, A>::die(defect{"refine_or_die", unrefined_cause(outcome.error()), site});
  }
  if (outcome.is_defect()) {
    return exit<E2, A>::die(outcome.defect());
  }
  return exit<E2, A>::interrupt();
}

}  // namespace _refine_detail

// Narrows the error channel. classify maps each error of eff to the narrower
// type, or to nullopt for errors the caller does not expect; those end the
// run as a defect naming this call site. Values, defects and interruption
// pass through.
template <class R, class E1, class A, class Classify>
  requires std::invocable<Classify&, const E1&>
[[nodiscard]] auto refine_or_die(effect_node<R, E1, A> eff,
                                 Classify              classify,
                                 std::source_location  site = std::source_location::current())
    -> effect_node<R, _refine_detail::narrowed_error_t<Classify, E1>, A> {
  using narrowed_type = _refine_detail::narrowed_error_t<Classify, E1>;

  auto inner = std::make_shared<const effect_node<R, E1, A>>(std::move(eff));
  return effect_node<R, narrowed_type, A>{nodes::refine<R, narrowed_type, A>{
      [inner, classify = std::move(classify), site](const std::shared_ptr<fiber_context>& ctx,
                                                    const R&                              env,
                                                    continuation<narrowed_type, A>        k) -> void {
        evaluate(*inner, ctx, env,
                 continuation<E1, A>{[k = std::move(k), classify, site](exit<E1, A> outcome) mutable -> void {
                   k(_refine_detail::narrow<narrowed_type>(std::move(outcome), classify, site));
                 }});
      }}};
}

// Keeps the failures of eff that are exceptions of type X (or derived from
// it) and turns every other failure into a defect.
template <class X, class R, class A>
[[nodiscard]] auto refine_to_or_die(effect_node<R, std::exception_ptr, A> eff,
                                    std::source_location site = std::source_location::current())
    -> effect_node<R, X, A> {
  return refine_or_die(
      std::move(eff),
      [](const std::exception_ptr& error) -> std::optional<X> {
        try {
          std::rethrow_exception(error);
        } catch (const X& matched) {
          return matched;
        } catch (...) {
          // Left for the defect, which keeps the original exception as cause.
          return std::nullopt;
        }
      },
      site);
}

}  // namespace weft
