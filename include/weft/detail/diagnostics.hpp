#pragma once

#include <cstdint>
#include <exception>
#include <string_view>

#include "weft/effect/exit.hpp"

// Logging hooks for the header-only parts of weft. They are implemented in
// the library against spdlog so that the templates never include it.
namespace weft::detail {

void trace_fork(std::uint64_t fiber, std::string_view kind) noexcept;

void trace_ignored_resolution(std::uint64_t fiber, std::string_view origin) noexcept;

void trace_cancellation(std::uint64_t fiber, std::string_view origin) noexcept;

void report_cancel_fault(std::uint64_t      fiber,
                         std::string_view   origin,
                         std::exception_ptr fault) noexcept;

void report_defect(std::uint64_t fiber, const defect& d) noexcept;

}  // namespace weft::detail
