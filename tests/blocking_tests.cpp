#include <boost/ut.hpp>
#include <weft/weft.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <latch>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

auto eventually(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2s) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return condition();
}

auto short_lived_blocking() -> weft::runtime_config {
  return weft::runtime_config{.computation_threads = 2, .blocking_keep_alive = 50ms};
}

}  // namespace

auto main() -> int {
  using namespace boost::ut;

  "effect_blocking_runs_on_blocking_pool"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    auto outcome = rt.run_sync(weft::effect_blocking([&rt] -> std::pair<bool, bool> {
      return {rt.blocking().running_in_this_thread(), rt.computation().running_in_this_thread()};
    }));

    expect(outcome.is_success());
    expect(outcome.value().first) << "thunk must run on a blocking thread";
    expect(not outcome.value().second) << "thunk must not run on a computation thread";
  };

  "blocking_moves_any_node_to_blocking_pool"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    auto on_pool = [&rt] -> std::pair<bool, bool> {
      return {rt.blocking().running_in_this_thread(), rt.computation().running_in_this_thread()};
    };

    auto plain = rt.run_sync(weft::effect(on_pool));
    expect(not plain.value().first);
    expect(plain.value().second);

    auto moved = rt.run_sync(weft::blocking(weft::effect(on_pool)));
    expect(moved.value().first);
    expect(not moved.value().second);
  };

  "blocking_keeps_node_semantics"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    auto failed = rt.run_sync(weft::blocking(weft::effect([] -> int { throw std::runtime_error("io"); })));
    expect(failed.is_failure());

    auto total = rt.run_sync(weft::blocking(weft::effect_total([] -> int { throw std::runtime_error("bug"); })));
    expect(total.is_defect());

    auto value = rt.run_sync(weft::blocking(weft::succeed(4)));
    expect(value.value() == 4_i);
  };

  "effect_blocking_fault_is_failure"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    auto outcome = rt.run_sync(weft::effect_blocking([] -> int { throw std::runtime_error("disk full"); }));
    expect(outcome.is_failure());
    expect(throws<std::runtime_error>([&] { std::rethrow_exception(outcome.error()); }));
  };

  "cancelable_interrupt_mid_execution"_test = [] {
    weft::runtime rt{short_lived_blocking()};
    const auto    baseline_threads = rt.blocking().thread_count();
    const auto    baseline_active  = rt.blocking().active_count();

    std::atomic<int>  cancels{0};
    std::atomic<bool> stop{false};
    std::latch        started{1};

    auto eff = weft::effect_blocking_cancelable(
        [&] -> int {
          started.count_down();
          while (!stop.load()) {
            std::this_thread::sleep_for(1ms);
          }
          return 7;
        },
        [&] -> void {
          cancels.fetch_add(1);
          stop.store(true);
        });

    auto fib = rt.fork(eff);
    started.wait();
    expect(rt.blocking().active_count() == baseline_active + 1);

    expect(fib.interrupt());
    auto outcome = fib.join();

    expect(outcome.is_interrupted());
    expect(fib.status() == weft::fiber_status::interrupted);
    expect(cancels.load() == 1_i);

    expect(not fib.interrupt());
    expect(cancels.load() == 1_i);

    expect(eventually([&rt, baseline_active] { return rt.blocking().active_count() == baseline_active; }));
    expect(eventually([&rt, baseline_threads] { return rt.blocking().thread_count() == baseline_threads; }))
        << "blocking thread must retire after keep-alive";
  };

  "cancel_thunk_not_called_when_thunk_completes"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    std::atomic<int> cancels{0};
    auto             fib = rt.fork(weft::effect_blocking_cancelable([] -> int { return 1; },
                                                                    [&cancels] -> void { cancels.fetch_add(1); }));

    expect(fib.join().value() == 1_i);
    expect(not fib.interrupt());
    expect(cancels.load() == 0_i);
  };

  "throwing_cancel_thunk_still_interrupts"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    std::atomic<bool> stop{false};
    std::latch        started{1};

    auto fib = rt.fork(weft::effect_blocking_cancelable(
        [&] -> void {
          started.count_down();
          while (!stop.load()) {
            std::this_thread::sleep_for(1ms);
          }
        },
        [&] -> void {
          stop.store(true);
          throw std::runtime_error("cancel failed");
        }));

    started.wait();
    expect(fib.interrupt());
    expect(fib.join().is_interrupted());
  };

  "uncancelable_interrupt_waits_for_thunk"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    std::latch started{1};
    std::latch release{1};

    auto fib = rt.fork(weft::effect_blocking([&] -> int {
      started.count_down();
      release.wait();
      return 1;
    }));

    started.wait();
    expect(fib.interrupt());
    expect(not fib.join_for(30ms).has_value()) << "thunk is still running";

    release.count_down();
    expect(fib.join().is_interrupted());
  };

  "interrupt_while_queued_skips_thunk"_test = [] {
    weft::runtime rt{weft::runtime_config{.computation_threads = 2, .blocking_max_threads = 1}};

    std::latch started{1};
    std::latch release{1};
    auto       occupant = rt.fork(weft::effect_blocking([&] -> void {
      started.count_down();
      release.wait();
    }));
    started.wait();

    std::atomic<int> calls{0};
    auto             queued = rt.fork(weft::effect_blocking([&calls] -> void { calls.fetch_add(1); }));

    // The thunk has reached the blocking pool and waits behind the occupant.
    expect(eventually([&rt] { return rt.blocking().queued_count() == 1; }));
    expect(queued.status() == weft::fiber_status::running);

    expect(queued.interrupt());
    expect(queued.join().is_interrupted());

    release.count_down();
    expect(occupant.join().is_success());
    expect(eventually([&rt] { return rt.blocking().queued_count() == 0 && rt.blocking().active_count() == 0; }));
    expect(calls.load() == 0_i);
  };

  "blocking_pool_grows_for_concurrent_thunks"_test = [] {
    weft::runtime rt{short_lived_blocking()};

    constexpr int concurrent = 4;
    std::latch    all_started{concurrent};
    std::latch    release{1};

    std::vector<weft::fiber<std::exception_ptr, weft::unit>> fibers;
    for (int i = 0; i < concurrent; ++i) {
      fibers.push_back(rt.fork(weft::effect_blocking([&] -> void {
        all_started.count_down();
        release.wait();
      })));
    }

    all_started.wait();
    expect(rt.blocking().active_count() == std::size_t{concurrent});

    release.count_down();
    for (auto& fib : fibers) {
      expect(fib.join().is_success());
    }
    expect(eventually([&rt] { return rt.blocking().thread_count() == 0; }));
  };
}
