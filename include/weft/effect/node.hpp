#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "weft/effect/async_callback.hpp"
#include "weft/effect/exit.hpp"
#include "weft/effect/fiber_context.hpp"
#include "weft/execution/thread_pool.hpp"

namespace weft {

template <class R, class E, class A>
class effect_node;

// The closed set of effect shapes. Adding a shape means adding a variant
// alternative here and one case to evaluate(), nothing else.
namespace nodes {

// Value built by the caller before the node was created
template <class A>
struct success {
  A value;
};

// Error built by the caller before the node was created
template <class E>
struct failure {
  E error;
};

// Deferred thunk the caller asserts cannot throw. A throw is a defect
// attributed to origin at site.
template <class A>
struct total {
  std::function<A()>   thunk;
  std::string_view     origin;
  std::source_location site;
};

// Deferred thunk whose exception becomes the typed failure
template <class A>
struct attempt {
  std::function<A()> thunk;
};

// Deferred function of the environment; never fails
template <class R, class A>
struct function_of {
  std::function<A(const R&)> fn;
  std::source_location       site;
};

// Registration with a one-shot completion callback. subscribe also receives
// the computation scheduler, where continuation work may run.
template <class E, class A>
struct async {
  using scheduler_type = execution::thread_pool::thread_pool_scheduler;

  std::function<void(async_callback<E, A>, scheduler_type)> subscribe;
  std::function<void()>                                      cancel_hook;
  std::string_view                                           origin;
  std::source_location                                       site;
};

// Thunk that occupies a blocking-pool thread for its whole duration
template <class A>
struct blocking {
  std::function<A()>    thunk;
  std::function<void()> cancel_thunk;
};

// Another node, run on the blocking pool instead of the computation pool
template <class R, class E, class A>
struct on_blocking {
  std::shared_ptr<const effect_node<R, E, A>> inner;
};

// A node with a broader error type, run and narrowed to E. The inner node's
// type is erased into run.
template <class R, class E, class A>
struct refine {
  std::function<void(const std::shared_ptr<fiber_context>&, const R&, continuation<E, A>)> run;
};

}  // namespace nodes

// Matches the alternative order of effect_node::node_type
enum class node_kind : std::uint8_t {
  success,
  failure,
  total,
  attempt,
  function_of,
  async,
  blocking,
  on_blocking,
  refine,
};

[[nodiscard]] constexpr auto to_string(node_kind kind) noexcept -> std::string_view {
  switch (kind) {
    case node_kind::success:
      return "success";
    case node_kind::failure:
      return "failure";
    case node_kind::total:
      return "total";
    case node_kind::attempt:
      return "attempt";
    case node_kind::function_of:
      return "function_of";
    case node_kind::async:
      return "async";
    case node_kind::blocking:
      return "blocking";
    case node_kind::on_blocking:
      return "on_blocking";
    case node_kind::refine:
      return "refine";
  }
  return "unknown";
}

// An immutable description of a computation that has not run yet. R is the
// environment it needs, E its typed error, A its value; none of them change
// after construction. Copies share the node. Running it is the job of
// evaluate(); building one never runs anything.
template <class R, class E, class A>
class effect_node {
 public:
  using environment_type = R;
  using error_type       = E;
  using value_type       = A;

  using node_type = std::variant<nodes::success<A>,
                                 nodes::failure<E>,
                                 nodes::total<A>,
                                 nodes::attempt<A>,
                                 nodes::function_of<R, A>,
                                 nodes::async<E, A>,
                                 nodes::blocking<A>,
                                 nodes::on_blocking<R, E, A>,
                                 nodes::refine<R, E, A>>;

  template <class Node>
    requires std::constructible_from<node_type, Node&&>
  explicit effect_node(Node&& node)
      : node_(std::make_shared<const node_type>(std::forward<Node>(node))) {}

  [[nodiscard]] auto node() const noexcept -> const node_type& {
    return *node_;
  }

  [[nodiscard]] auto kind() const noexcept -> node_kind {
    return static_cast<node_kind>(node_->index());
  }

 private:
  std::shared_ptr<const node_type> node_;
};

namespace _node_detail {

// Thunks returning void produce unit
template <class F>
using thunk_value_t = std::conditional_t<std::is_void_v<std::invoke_result_t<F&>>,
                                         unit,
                                         std::decay_t<std::invoke_result_t<F&>>>;

template <class F>
auto lift_thunk(F f) -> std::function<thunk_value_t<F>()> {
  if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
    return [f = std::move(f)] mutable -> unit {
      std::invoke(f);
      return unit{};
    };
  } else {
    return std::function<thunk_value_t<F>()>{std::move(f)};
  }
}

}  // namespace _node_detail

}  // namespace weft
