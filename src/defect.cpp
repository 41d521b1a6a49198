#include <exception>
#include <string>

#include "weft/effect/exit.hpp"

namespace weft {
namespace {

auto cause_message(const std::exception_ptr& cause) -> std::string {
  if (!cause) {
    return "no cause recorded";
  }
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

}  // namespace

auto defect::describe() const -> std::string {
  std::string text{origin_};
  text += " at ";
  text += site_.file_name();
  text += ':';
  text += std::to_string(site_.line());
  text += " (";
  text += site_.function_name();
  text += "): ";
  text += cause_message(cause_);
  return text;
}

}  // namespace weft
