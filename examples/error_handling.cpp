#include <weft/weft.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

auto parse_port(std::string text) {
  return weft::effect([text = std::move(text)] -> int {
    const int port = std::stoi(text);
    if (port <= 0 || port > 65535) {
      throw std::out_of_range("port out of range: " + text);
    }
    return port;
  });
}

// Only range errors are expected; anything else is a bug
auto checked_port(std::string text) {
  return weft::refine_to_or_die<std::out_of_range>(parse_port(std::move(text)));
}

auto main() -> int {
  weft::runtime rt{weft::runtime_config{.computation_threads = 1}};

  for (const auto* input : {"8080", "70000", "http"}) {
    auto outcome = rt.run_sync(checked_port(input));

    if (outcome.is_success()) {
      std::cout << input << " -> port " << outcome.value() << '\n';
    } else if (outcome.is_failure()) {
      std::cout << input << " -> rejected: " << outcome.error().what() << '\n';
    } else if (outcome.is_defect()) {
      std::cout << input << " -> defect: " << outcome.defect().describe() << '\n';
    }
  }

  auto lookup = rt.run_sync(weft::from_option(std::optional<int>{}));
  std::cout << "empty lookup failed: " << std::boolalpha << lookup.is_failure() << '\n';

  return 0;
}
