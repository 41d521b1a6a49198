#include "weft/runtime.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <vector>
#include <thread>

#include "logger.hpp"

namespace weft {
namespace {

auto resolve_computation_threads(std::size_t requested) noexcept -> std::size_t {
  if (requested != 0) {
    return requested;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

// Runs before the pools are built so their start-up is logged at the
// requested level.
auto apply_logging(runtime_config config) -> runtime_config {
  if (config.log_level.has_value()) {
    set_log_level(*config.log_level);
  }
  return config;
}

}  // namespace

runtime::runtime(runtime_config config)
    : config_(apply_logging(std::move(config))),
      computation_(resolve_computation_threads(config_.computation_threads)),
      blocking_(config_.blocking_max_threads, config_.blocking_keep_alive),
      pools_(std::make_shared<pool_binding>(computation_, blocking_)) {
  detail::logger().debug("runtime started: {} computation threads, blocking cap {}",
                         computation_.size(),
                         config_.blocking_max_threads == 0 ? std::string{"none"}
                                                           : std::to_string(config_.blocking_max_threads));
}

runtime::~runtime() {
  blocking_.shutdown();
  computation_.shutdown();
  release_fibers();
  detail::logger().debug("runtime stopped after {} fibers", fiber_ids_.load());
}

void runtime::release_fibers() noexcept {
  std::vector<std::shared_ptr<fiber_context>> pending;
  {
    std::scoped_lock lock(fibers_mutex_);
    for (const auto& weak : fibers_) {
      if (auto ctx = weak.lock(); ctx != nullptr && !is_terminal(ctx->status())) {
        pending.push_back(std::move(ctx));
      }
    }
    fibers_.clear();
  }

  // The pools are stopped but still bound, so an interruptible run delivers
  // its outcome inline here.
  for (const auto& ctx : pending) {
    try {
      ctx->interrupt();
    } catch (const std::exception& e) {
      detail::logger().warn("fiber {}: interruption at shutdown failed: {}", ctx->id(), e.what());
    }
  }

  pools_->detach();

  for (const auto& ctx : pending) {
    try {
      ctx->abandon();
    } catch (const std::exception& e) {
      detail::logger().error("fiber {}: could not be abandoned: {}", ctx->id(), e.what());
    }
  }
}

auto runtime::global() -> runtime& {
  static runtime instance{runtime_config::from_env()};
  return instance;
}

auto runtime::live_fibers() const -> std::size_t {
  std::scoped_lock lock(fibers_mutex_);
  return static_cast<std::size_t>(std::ranges::count_if(fibers_, [](const auto& weak) -> bool {
    auto ctx = weak.lock();
    return ctx != nullptr && !is_terminal(ctx->status());
  }));
}

void runtime::track(const std::shared_ptr<fiber_context>& ctx) {
  std::scoped_lock lock(fibers_mutex_);
  if (fibers_.size() >= prune_at_) {
    std::erase_if(fibers_, [](const auto& weak) -> bool {
      auto live = weak.lock();
      return live == nullptr || is_terminal(live->status());
    });
    prune_at_ = std::max<std::size_t>(64, fibers_.size() * 2);
  }
  fibers_.push_back(ctx);
}

auto runtime::next_fiber_id() noexcept -> std::uint64_t {
  return fiber_ids_.fetch_add(1, std::memory_order_relaxed) + 1;
}

}  // namespace weft
