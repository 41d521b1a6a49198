#include <weft/weft.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

auto main() -> int {
  weft::runtime rt{weft::runtime_config{.computation_threads  = 2,
                                        .blocking_max_threads = 8,
                                        .blocking_keep_alive  = 100ms}};

  // File I/O belongs on the blocking pool
  auto read_hosts = weft::effect_blocking([] -> std::string {
    std::ifstream in{"/etc/hostname"};
    std::string   line;
    std::getline(in, line);
    return line;
  });

  auto host = rt.run_sync(read_hosts);
  if (host.is_success()) {
    std::cout << "Hostname: " << host.value() << '\n';
  }

  // A long poll that can be told to stop
  std::atomic<bool> stop{false};
  auto poll = weft::effect_blocking_cancelable(
      [&stop] -> int {
        int rounds = 0;
        while (!stop.load()) {
          std::this_thread::sleep_for(5ms);
          ++rounds;
        }
        return rounds;
      },
      [&stop] -> void { stop.store(true); });

  auto poller = rt.fork(poll);
  std::this_thread::sleep_for(50ms);
  std::cout << "Blocking threads busy: " << rt.blocking().active_count() << '\n';

  poller.interrupt();
  std::cout << "Poll interrupted: " << std::boolalpha << poller.join().is_interrupted() << '\n';

  std::this_thread::sleep_for(200ms);
  std::cout << "Blocking threads after keep-alive: " << rt.blocking().thread_count() << '\n';

  return 0;
}
