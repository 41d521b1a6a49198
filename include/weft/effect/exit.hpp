#pragma once

#include <exception>
#include <functional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace weft {

// Success type of thunks that return void
using unit = std::monostate;

// Environment of effects that need none
struct no_env {
  auto operator==(const no_env&) const noexcept -> bool = default;
};

// Error type of effects that cannot fail; it has no values
struct never {
  never() = delete;
};

// The fixed error of from_option on an empty optional. It carries no
// information; callers narrow it themselves when they need to.
struct no_such_element {
  auto operator==(const no_such_element&) const noexcept -> bool = default;
};

inline constexpr no_such_element none_marker{};

// An unrecoverable fault outside the typed error channel: a thunk that was
// declared total threw, or an error escaped a refinement. Records which
// constructor produced the node, where it was called, and the cause.
class defect {
 public:
  defect(std::string_view     origin,
         std::exception_ptr   cause,
         std::source_location site = std::source_location::current()) noexcept
      : origin_(origin), cause_(std::move(cause)), site_(site) {}

  [[nodiscard]] auto origin() const noexcept -> std::string_view {
    return origin_;
  }

  [[nodiscard]] auto cause() const noexcept -> const std::exception_ptr& {
    return cause_;
  }

  [[nodiscard]] auto site() const noexcept -> const std::source_location& {
    return site_;
  }

  // "<origin> at <file>:<line> (<function>): <cause message>"
  [[nodiscard]] auto describe() const -> std::string;

 private:
  std::string_view     origin_;
  std::exception_ptr   cause_;
  std::source_location site_;
};

// Thrown by exit::value_or_throw for a defect
class defect_error : public std::runtime_error {
 public:
  explicit defect_error(weft::defect d) : std::runtime_error(d.describe()), defect_(std::move(d)) {}

  [[nodiscard]] auto info() const noexcept -> const weft::defect& {
    return defect_;
  }

 private:
  weft::defect defect_;
};

// Thrown by exit::value_or_throw for an interrupted run
class interrupted_error : public std::runtime_error {
 public:
  interrupted_error() : std::runtime_error("effect was interrupted") {}
};

// Thrown by exit::value_or_throw for a typed failure that is not itself an
// exception
template <class E>
class failure_error : public std::runtime_error {
 public:
  explicit failure_error(E error)
      : std::runtime_error("effect failed with a typed error"), error_(std::move(error)) {}

  [[nodiscard]] auto error() const noexcept -> const E& {
    return error_;
  }

 private:
  E error_;
};

// Cause of a defect raised by refine_or_die when the error is not an
// exception itself
template <class E>
class unrefined_error : public std::runtime_error {
 public:
  explicit unrefined_error(E error)
      : std::runtime_error("error not recognized by refinement"), error_(std::move(error)) {}

  [[nodiscard]] auto error() const noexcept -> const E& {
    return error_;
  }

 private:
  E error_;
};

// Outcome of running an effect node: a value, a typed failure, a defect, or
// interruption. Exactly one is held.
template <class E, class A>
class exit {
 public:
  using error_type = E;
  using value_type = A;

  struct success_value {
    A value;
  };

  struct failure_value {
    E error;
  };

  struct interruption {};

  [[nodiscard]] static auto succeed(A value) -> exit {
    return exit{success_value{std::move(value)}};
  }

  [[nodiscard]] static auto fail(E error) -> exit {
    return exit{failure_value{std::move(error)}};
  }

  [[nodiscard]] static auto die(weft::defect d) -> exit {
    return exit{std::move(d)};
  }

  [[nodiscard]] static auto interrupt() -> exit {
    return exit{interruption{}};
  }

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return std::holds_alternative<success_value>(state_);
  }

  [[nodiscard]] auto is_failure() const noexcept -> bool {
    return std::holds_alternative<failure_value>(state_);
  }

  [[nodiscard]] auto is_defect() const noexcept -> bool {
    return std::holds_alternative<weft::defect>(state_);
  }

  [[nodiscard]] auto is_interrupted() const noexcept -> bool {
    return std::holds_alternative<interruption>(state_);
  }

  // Each accessor throws std::bad_variant_access when the exit holds
  // something else.
  [[nodiscard]] auto value() const& -> const A& {
    return std::get<success_value>(state_).value;
  }

  [[nodiscard]] auto value() && -> A {
    return std::move(std::get<success_value>(state_).value);
  }

  [[nodiscard]] auto error() const& -> const E& {
    return std::get<failure_value>(state_).error;
  }

  [[nodiscard]] auto defect() const -> const weft::defect& {
    return std::get<weft::defect>(state_);
  }

  [[nodiscard]] auto value_or_throw() && -> A {
    return std::visit(
        [](auto&& held) -> A {
          using T = std::decay_t<decltype(held)>;

          if constexpr (std::is_same_v<T, success_value>) {
            return std::move(held.value);
          } else if constexpr (std::is_same_v<T, failure_value>) {
            if constexpr (std::is_same_v<E, std::exception_ptr>) {
              std::rethrow_exception(held.error);
            } else if constexpr (std::is_base_of_v<std::exception, E>) {
              throw held.error;
            } else {
              throw failure_error<E>{std::move(held.error)};
            }
          } else if constexpr (std::is_same_v<T, weft::defect>) {
            throw defect_error{std::move(held)};
          } else {
            throw interrupted_error{};
          }
        },
        std::move(state_));
  }

  // Applies f to the typed failure, leaving the other outcomes untouched
  template <class F>
  [[nodiscard]] auto map_error(F&& f) && -> exit<std::invoke_result_t<F, E>, A> {
    using result_type = exit<std::invoke_result_t<F, E>, A>;
    return std::visit(
        [&f](auto&& held) -> result_type {
          using T = std::decay_t<decltype(held)>;

          if constexpr (std::is_same_v<T, success_value>) {
            return result_type::succeed(std::move(held.value));
          } else if constexpr (std::is_same_v<T, failure_value>) {
            return result_type::fail(std::forward<F>(f)(std::move(held.error)));
          } else if constexpr (std::is_same_v<T, weft::defect>) {
            return result_type::die(std::move(held));
          } else {
            return result_type::interrupt();
          }
        },
        std::move(state_));
  }

 private:
  using state_type = std::variant<success_value, failure_value, weft::defect, interruption>;

  template <class T>
    requires(!std::is_same_v<std::decay_t<T>, exit>)
  explicit exit(T&& held) : state_(std::forward<T>(held)) {}

  template <class, class>
  friend class exit;

  state_type state_;
};

// Receives the outcome of a run
template <class E, class A>
using continuation = std::function<void(exit<E, A>)>;

}  // namespace weft
