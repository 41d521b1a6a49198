#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

namespace weft::execution {

template <class T>
using __remove_cvref_t = std::remove_cvref_t<T>;

// Compile-time list of the values a sender completes with
template <class... Ts>
struct type_list {};

// [exec.recv], receivers
struct receiver_t {};

template <class Rcvr>
concept receiver =
    std::move_constructible<__remove_cvref_t<Rcvr>> && requires {
      typename __remove_cvref_t<Rcvr>::receiver_concept;
      requires std::same_as<typename __remove_cvref_t<Rcvr>::receiver_concept, receiver_t>;
    } && requires(__remove_cvref_t<Rcvr>&& r) {
      { std::move(r).set_stopped() } noexcept;
    };

// [exec.opstate], operation states
struct operation_state_t {};

template <class O>
concept operation_state = std::destructible<O> && std::is_object_v<O> && requires {
  typename O::operation_state_concept;
  requires std::same_as<typename O::operation_state_concept, operation_state_t>;
} && requires(O& o) {
  { o.start() } noexcept;
};

// [exec.snd], senders
struct sender_t {};

template <class Sndr>
concept sender = std::move_constructible<__remove_cvref_t<Sndr>> && requires {
  typename __remove_cvref_t<Sndr>::sender_concept;
  requires std::same_as<typename __remove_cvref_t<Sndr>::sender_concept, sender_t>;
  typename __remove_cvref_t<Sndr>::value_types;
};

template <class Sndr, class Rcvr>
concept sender_to = sender<Sndr> && receiver<Rcvr> && requires(Sndr&& sndr, Rcvr&& rcvr) {
  { std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr)) } -> operation_state;
};

struct connect_t {
  template <class Sndr, class Rcvr>
    requires sender_to<Sndr, Rcvr>
  constexpr auto operator()(Sndr&& sndr, Rcvr&& rcvr) const
      noexcept(noexcept(std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr))))
          -> decltype(std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr))) {
    return std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr));
  }
};

inline constexpr connect_t connect{};

template <class Sndr, class Rcvr>
using connect_result_t = decltype(connect(std::declval<Sndr>(), std::declval<Rcvr>()));

// [exec.sched], schedulers
struct scheduler_t {};

template <class Sch>
concept scheduler =
    std::copy_constructible<__remove_cvref_t<Sch>>
    && std::equality_comparable<__remove_cvref_t<Sch>> && requires {
         typename __remove_cvref_t<Sch>::scheduler_concept;
         requires std::same_as<typename __remove_cvref_t<Sch>::scheduler_concept, scheduler_t>;
       } && requires(Sch&& sch) {
         { std::forward<Sch>(sch).schedule() } -> sender;
       };

struct schedule_t {
  template <scheduler Sch>
  constexpr auto operator()(Sch&& sch) const noexcept(noexcept(std::forward<Sch>(sch).schedule()))
      -> decltype(std::forward<Sch>(sch).schedule()) {
    return std::forward<Sch>(sch).schedule();
  }
};

inline constexpr schedule_t schedule{};

// A sender completing with exactly one value; the shape from_future consumes
namespace _single_value_detail {

template <class TypeList>
struct _single;

template <class T>
struct _single<type_list<T>> {
  using type = T;
};

}  // namespace _single_value_detail

template <class Sndr>
concept single_value_sender =
    sender<Sndr>
    && requires { typename _single_value_detail::_single<typename __remove_cvref_t<Sndr>::value_types>::type; };

template <single_value_sender Sndr>
using single_value_t =
    typename _single_value_detail::_single<typename __remove_cvref_t<Sndr>::value_types>::type;

}  // namespace weft::execution
