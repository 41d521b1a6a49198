#include <boost/ut.hpp>
#include <weft/weft.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

enum class io_error { timeout, refused };

auto classify_io(const std::string& error) -> std::optional<io_error> {
  if (error == "timeout") {
    return io_error::timeout;
  }
  if (error == "refused") {
    return io_error::refused;
  }
  return std::nullopt;
}

}  // namespace

auto main() -> int {
  using namespace boost::ut;

  weft::runtime rt{weft::runtime_config{.computation_threads = 2}};

  "matched_error_is_typed_failure"_test = [&rt] {
    auto eff = weft::refine_to_or_die<std::invalid_argument>(
        weft::effect([] -> int { throw std::invalid_argument("negative size"); }));

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_failure());
    expect(std::string_view{outcome.error().what()} == "negative size");
  };

  "derived_exception_matches_base"_test = [&rt] {
    auto eff = weft::refine_to_or_die<std::logic_error>(
        weft::effect([] -> int { throw std::out_of_range("index 9"); }));

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_failure());
    expect(std::string_view{outcome.error().what()} == "index 9");
  };

  "unmatched_error_is_defect"_test = [&rt] {
    auto eff = weft::refine_to_or_die<std::invalid_argument>(
        weft::effect([] -> int { throw std::runtime_error("socket closed"); }));

    auto fib     = rt.fork(eff);
    auto outcome = fib.join();

    expect(outcome.is_defect());
    expect(not outcome.is_failure());
    expect(outcome.defect().origin() == std::string_view{"refine_or_die"});
    expect(std::string_view{outcome.defect().site().file_name()}.ends_with("refine_tests.cpp"));
    expect(throws<std::runtime_error>([&] { std::rethrow_exception(outcome.defect().cause()); }));
    expect(fib.status() == weft::fiber_status::failed);
  };

  "success_passes_through"_test = [&rt] {
    auto eff = weft::refine_to_or_die<std::invalid_argument>(weft::effect([] -> int { return 12; }));

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_success());
    expect(outcome.value() == 12_i);
  };

  "classifier_narrows_typed_errors"_test = [&rt] {
    auto timeout = rt.run_sync(weft::refine_or_die(weft::fail<int>(std::string{"timeout"}), classify_io));
    expect(timeout.is_failure());
    expect(timeout.error() == io_error::timeout);

    auto refused = rt.run_sync(weft::refine_or_die(weft::fail<int>(std::string{"refused"}), classify_io));
    expect(refused.error() == io_error::refused);
  };

  "unmatched_typed_error_is_defect_with_original_error"_test = [&rt] {
    auto outcome = rt.run_sync(weft::refine_or_die(weft::fail<int>(std::string{"corrupt"}), classify_io));

    expect(outcome.is_defect());
    try {
      std::rethrow_exception(outcome.defect().cause());
    } catch (const weft::unrefined_error<std::string>& e) {
      expect(e.error() == "corrupt");
    } catch (const std::exception&) {
      expect(false) << "cause must carry the unrefined error";
    }
  };

  "classifier_sees_each_run"_test = [&rt] {
    int  calls = 0;
    auto eff   = weft::refine_or_die(weft::fail<int>(std::string{"timeout"}),
                                     [&calls](const std::string& error) -> std::optional<io_error> {
                                     ++calls;
                                     return classify_io(error);
                                   });

    expect(rt.run_sync(eff).is_failure());
    expect(rt.run_sync(eff).is_failure());
    expect(calls == 2_i);
  };

  "inner_defect_passes_through"_test = [&rt] {
    auto inner = weft::refine_or_die(weft::effect_total([] -> int { throw std::runtime_error("bug"); }),
                                     [](const weft::never&) -> std::optional<io_error> { return std::nullopt; });

    auto outcome = rt.run_sync(inner);
    expect(outcome.is_defect());
    expect(outcome.defect().origin() == std::string_view{"effect_total"});
  };

  "refined_node_on_blocking_pool"_test = [&rt] {
    auto eff = weft::blocking(weft::refine_to_or_die<std::invalid_argument>(
        weft::effect([&rt] -> bool { return rt.blocking().running_in_this_thread(); })));

    auto outcome = rt.run_sync(eff);
    expect(outcome.is_success());
    expect(outcome.value());
  };
}
