#include <weft/weft.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

// A callback-style client, as a third-party library would expose it
class timer_service {
 public:
  void after(std::chrono::milliseconds delay, std::function<void()> fn) {
    auto cancelled = cancelled_;
    std::thread{[delay, fn = std::move(fn), cancelled] -> void {
      std::this_thread::sleep_for(delay);
      if (!cancelled->load()) {
        fn();
      }
    }}.detach();
  }

  void cancel_all() {
    cancelled_->store(true);
  }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_ = std::make_shared<std::atomic<bool>>(false);
};

auto delayed_answer(timer_service& timers, std::chrono::milliseconds delay) {
  return weft::effect_async<std::string, int>(
      [&timers, delay](weft::async_callback<std::string, int> cb) -> void {
        timers.after(delay, [cb] -> void { cb.succeed(42); });
      },
      [&timers] -> void {
        std::cout << "Cancelling pending timers" << '\n';
        timers.cancel_all();
      });
}

auto main() -> int {
  weft::runtime rt{weft::runtime_config{.computation_threads = 2}};
  timer_service timers;

  auto fast = rt.run_sync(delayed_answer(timers, 10ms));
  std::cout << "Fast timer: " << fast.value() << '\n';

  auto slow = rt.fork(delayed_answer(timers, 5s));
  std::this_thread::sleep_for(20ms);
  slow.interrupt();

  auto outcome = slow.join();
  std::cout << "Slow timer interrupted: " << std::boolalpha << outcome.is_interrupted() << '\n';

  return 0;
}
