#include "weft/execution/blocking_pool.hpp"

#include <utility>

#include "logger.hpp"

namespace weft::execution {
namespace {

thread_local const blocking_pool* current_pool = nullptr;

}  // namespace

blocking_pool::blocking_pool(std::size_t               max_threads,
                             std::chrono::milliseconds keep_alive,
                             std::string               name)
    : max_threads_(max_threads), keep_alive_(keep_alive), name_(std::move(name)) {
  detail::logger().debug("{} pool started (max threads: {}, keep-alive: {}ms)", name_,
                         max_threads_ == 0 ? std::string{"unbounded"}
                                           : std::to_string(max_threads_),
                         keep_alive_.count());
}

blocking_pool::~blocking_pool() {
  shutdown();
}

auto blocking_pool::submit(std::function<void()> task) -> bool {
  {
    std::scoped_lock lock(mutex_);
    if (stop_) {
      return false;
    }
    queue_.push_back(std::move(task));

    // Spawn when the queued tasks outnumber the workers waiting for one.
    if (idle_ < queue_.size() && (max_threads_ == 0 || workers_.size() < max_threads_)) {
      spawn_worker_locked();
    }
  }
  cv_.notify_one();
  join_retired();
  return true;
}

void blocking_pool::shutdown() {
  std::unordered_map<std::thread::id, std::thread> workers;
  std::vector<std::thread>                          retired;
  {
    std::scoped_lock lock(mutex_);
    if (stop_) {
      return;
    }
    stop_ = true;
    workers.swap(workers_);
    retired.swap(retired_);
  }
  cv_.notify_all();

  for (auto& [id, worker] : workers) {
    if (id == std::this_thread::get_id()) {
      worker.detach();
    } else if (worker.joinable()) {
      worker.join();
    }
  }
  for (auto& worker : retired) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  detail::logger().debug("{} pool drained and stopped", name_);
}

auto blocking_pool::thread_count() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return workers_.size();
}

auto blocking_pool::active_count() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return active_;
}

auto blocking_pool::queued_count() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return queue_.size();
}

auto blocking_pool::running_in_this_thread() const noexcept -> bool {
  return current_pool == this;
}

void blocking_pool::spawn_worker_locked() {
  std::thread worker([this] -> void { worker_thread(); });
  const auto  id = worker.get_id();
  workers_.emplace(id, std::move(worker));
  detail::logger().trace("{} pool spawned a worker ({} live)", name_, workers_.size());
}

void blocking_pool::join_retired() {
  std::vector<std::thread> retired;
  {
    std::scoped_lock lock(mutex_);
    retired.swap(retired_);
  }
  for (auto& worker : retired) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void blocking_pool::worker_thread() {
  current_pool = this;
  std::unique_lock lock(mutex_);
  while (true) {
    if (!queue_.empty()) {
      auto task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
      lock.unlock();

      task();

      lock.lock();
      --active_;
      continue;
    }

    if (stop_) {
      break;
    }

    ++idle_;
    const bool woken =
        cv_.wait_for(lock, keep_alive_, [this] -> bool { return stop_ || !queue_.empty(); });
    --idle_;

    if (!woken) {
      // Idle for a full keep-alive period: retire. The handle moves to
      // retired_ so that a later submit() or shutdown() can join it.
      if (auto it = workers_.find(std::this_thread::get_id()); it != workers_.end()) {
        retired_.push_back(std::move(it->second));
        workers_.erase(it);
      }
      detail::logger().trace("{} pool retired an idle worker ({} live)", name_, workers_.size());
      break;
    }
  }
  current_pool = nullptr;
}

}  // namespace weft::execution
