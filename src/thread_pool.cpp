#include "weft/execution/thread_pool.hpp"

#include <stdexcept>

#include "logger.hpp"

namespace weft::execution {
namespace {

thread_local const thread_pool* current_pool = nullptr;

}  // namespace

thread_pool::thread_pool(std::size_t num_threads, std::string name) : name_(std::move(name)) {
  if (num_threads == 0) {
    throw std::invalid_argument("Number of threads must be greater than 0");
  }

  workers_.reserve(num_threads);
  for (std::size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] -> void { worker_thread(); });
  }
  detail::logger().debug("{} pool started with {} threads", name_, num_threads);
}

thread_pool::~thread_pool() {
  shutdown();
}

auto thread_pool::submit(std::function<void()> task) -> bool {
  {
    std::scoped_lock lock(mutex_);
    if (stop_) {
      return false;
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void thread_pool::shutdown() {
  {
    std::scoped_lock lock(mutex_);
    if (stop_) {
      return;
    }
    stop_ = true;
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    // A task may shut the pool down from one of its own workers.
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
      continue;
    }
    if (worker.joinable()) {
      worker.join();
    }
  }
  detail::logger().debug("{} pool drained and stopped", name_);
}

auto thread_pool::running_in_this_thread() const noexcept -> bool {
  return current_pool == this;
}

void thread_pool::worker_thread() {
  current_pool = this;
  while (true) {
    std::function<void()> task;

    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] -> bool { return stop_ || !queue_.empty(); });

      // Queued work is drained before the worker exits.
      if (stop_ && queue_.empty()) {
        break;
      }

      task = std::move(queue_.front());
      queue_.pop();
    }

    task();
  }
  current_pool = nullptr;
}

}  // namespace weft::execution
