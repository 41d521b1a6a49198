#include <boost/ut.hpp>
#include <weft/weft.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <latch>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Holds on to the callback handed to a registration so the test can decide
// when, and how often, to complete it.
template <class E, class A>
class callback_slot {
 public:
  void store(weft::async_callback<E, A> callback) {
    {
      std::scoped_lock lock(mutex_);
      callback_.emplace(std::move(callback));
    }
    registered_.count_down();
  }

  auto wait() -> weft::async_callback<E, A> {
    registered_.wait();
    std::scoped_lock lock(mutex_);
    return *callback_;
  }

 private:
  std::mutex                                mutex_;
  std::optional<weft::async_callback<E, A>> callback_;
  std::latch                                registered_{1};
};

}  // namespace

auto main() -> int {
  using namespace boost::ut;

  weft::runtime rt{weft::runtime_config{.computation_threads = 2}};

  "first_callback_wins"_test = [&rt] {
    auto eff = weft::effect_async<std::string, int>([](weft::async_callback<std::string, int> cb) -> void {
      cb.succeed(1);
      cb.succeed(2);
      cb.fail("too late");
    });

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_success());
    expect(outcome.value() == 1_i);
  };

  "second_callback_has_no_observable_effect"_test = [&rt] {
    callback_slot<std::string, int> slot;
    auto eff = weft::effect_async<std::string, int>(
        [&slot](weft::async_callback<std::string, int> cb) -> void { slot.store(std::move(cb)); });

    auto fib = rt.fork(eff);
    auto cb  = slot.wait();

    expect(not cb.resolved());
    cb.fail("first");
    expect(cb.resolved());

    auto outcome = fib.join();
    expect(outcome.is_failure());
    expect(outcome.error() == "first");

    cb.succeed(99);
    expect(fib.join().is_failure());
    expect(fib.join().error() == "first");
    expect(fib.status() == weft::fiber_status::failed);
  };

  "racing_callbacks_resolve_once"_test = [&rt] {
    std::atomic<int> completions{0};
    auto             eff = weft::effect_async<std::string, int>([](weft::async_callback<std::string, int> cb) -> void {
      std::jthread first{[cb] -> void { cb.succeed(1); }};
      std::jthread second{[cb] -> void { cb.succeed(2); }};
    });

    for (int i = 0; i < 20; ++i) {
      auto fib = rt.fork(eff);
      auto outcome = fib.join();
      expect(outcome.is_success());
      expect(outcome.value() == 1 or outcome.value() == 2);
      completions.fetch_add(1);
    }
    expect(completions.load() == 20_i);
  };

  "callback_from_foreign_thread"_test = [&rt] {
    auto eff = weft::effect_async<std::string, std::string>(
        [](weft::async_callback<std::string, std::string> cb) -> void {
          std::thread{[cb] -> void {
            std::this_thread::sleep_for(5ms);
            cb.succeed("from io thread");
          }}.detach();
        });

    auto outcome = rt.run_sync(eff);
    expect(outcome.value() == "from io thread");
  };

  "cancel_hook_runs_once_and_suppresses_callback"_test = [&rt] {
    std::atomic<int>                 cancels{0};
    callback_slot<std::string, int>  slot;

    auto eff = weft::effect_async<std::string, int>(
        [&slot](weft::async_callback<std::string, int> cb) -> void { slot.store(std::move(cb)); },
        [&cancels] -> void { cancels.fetch_add(1); });

    auto fib = rt.fork(eff);
    auto cb  = slot.wait();

    expect(fib.interrupt());
    auto outcome = fib.join();
    expect(outcome.is_interrupted());
    expect(fib.status() == weft::fiber_status::interrupted);
    expect(cancels.load() == 1_i);

    // Late completions and repeated interruption change nothing.
    expect(cb.resolved());
    cb.succeed(5);
    expect(not fib.interrupt());
    expect(fib.join().is_interrupted());
    expect(cancels.load() == 1_i);
  };

  "cancel_hook_not_called_after_resolution"_test = [&rt] {
    std::atomic<int> cancels{0};
    auto             eff = weft::effect_async<std::string, int>(
        [](weft::async_callback<std::string, int> cb) -> void { cb.succeed(3); },
        [&cancels] -> void { cancels.fetch_add(1); });

    auto fib = rt.fork(eff);
    expect(fib.join().value() == 3_i);
    expect(not fib.interrupt());
    expect(cancels.load() == 0_i);
  };

  "throwing_cancel_hook_still_interrupts"_test = [&rt] {
    callback_slot<std::string, int> slot;
    auto eff = weft::effect_async<std::string, int>(
        [&slot](weft::async_callback<std::string, int> cb) -> void { slot.store(std::move(cb)); },
        [] -> void { throw std::runtime_error("cancel failed"); });

    auto fib = rt.fork(eff);
    (void)slot.wait();
    expect(fib.interrupt());
    expect(fib.join().is_interrupted());
  };

  "uninterruptible_async_defers_interruption"_test = [&rt] {
    callback_slot<std::string, int> slot;
    auto eff = weft::effect_async<std::string, int>(
        [&slot](weft::async_callback<std::string, int> cb) -> void { slot.store(std::move(cb)); });

    auto fib = rt.fork(eff);
    auto cb  = slot.wait();

    expect(fib.interrupt());
    expect(not fib.join_for(30ms).has_value()) << "still waiting for the callback";
    expect(not cb.resolved());

    cb.succeed(8);
    expect(fib.join().is_interrupted());
  };

  "pending_async_does_not_hold_a_thread"_test = [] {
    weft::runtime single{weft::runtime_config{.computation_threads = 1}};

    callback_slot<std::string, int> slot;
    auto pending = single.fork(weft::effect_async<std::string, int>(
        [&slot](weft::async_callback<std::string, int> cb) -> void { slot.store(std::move(cb)); }));
    auto cb = slot.wait();

    auto other = single.run_sync(weft::succeed(5));
    expect(other.value() == 5_i);

    cb.succeed(6);
    expect(pending.join().value() == 6_i);
  };

  "registration_fault_is_failure_for_fault_errors"_test = [&rt] {
    auto eff = weft::effect_async<std::exception_ptr, int>(
        [](weft::async_callback<std::exception_ptr, int>) -> void {
          throw std::runtime_error("subscribe failed");
        });

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_failure());
    expect(throws<std::runtime_error>([&] { std::rethrow_exception(outcome.error()); }));
  };

  "registration_fault_is_defect_for_typed_errors"_test = [&rt] {
    auto eff = weft::effect_async<std::string, int>(
        [](weft::async_callback<std::string, int>) -> void { throw std::runtime_error("subscribe failed"); });

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_defect());
    expect(outcome.defect().origin() == std::string_view{"effect_async"});
  };

  "callback_after_registration_fault_is_ignored"_test = [&rt] {
    auto eff = weft::effect_async<std::exception_ptr, int>(
        [](weft::async_callback<std::exception_ptr, int> cb) -> void {
          std::thread{[cb] -> void {
            std::this_thread::sleep_for(10ms);
            cb.succeed(1);
          }}.detach();
          throw std::runtime_error("subscribe failed after scheduling");
        });

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_failure());
    std::this_thread::sleep_for(20ms);
  };

  "interrupt_before_start"_test = [] {
    weft::runtime single{weft::runtime_config{.computation_threads = 1}};

    std::latch release{1};
    auto       busy = single.fork(weft::effect([&release] -> void { release.wait(); }));

    std::atomic<int> registrations{0};
    auto             fib = single.fork(weft::effect_async<std::string, int>(
        [&registrations](weft::async_callback<std::string, int> cb) -> void {
          registrations.fetch_add(1);
          cb.succeed(1);
        }));

    expect(fib.interrupt());
    release.count_down();

    expect(fib.join().is_interrupted());
    expect(busy.join().is_success());
    expect(registrations.load() == 0_i);
  };
}
