#include <weft/weft.hpp>

#include <iostream>
#include <string>

auto main() -> int {
  weft::runtime rt{weft::runtime_config{.computation_threads = 2}};

  // Nothing runs until the node is handed to the runtime
  auto greeting = weft::succeed_lazy([] -> std::string {
    std::cout << "Building greeting" << '\n';
    return "Hello from weft!";
  });

  auto first  = rt.run_sync(greeting);
  auto second = rt.run_sync(greeting);

  if (first.is_success() && second.is_success()) {
    std::cout << first.value() << '\n';
    std::cout << second.value() << '\n';
  }

  return 0;
}
