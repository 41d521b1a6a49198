#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace weft::execution {

// Elastic pool for thunks that may hold a thread for an unbounded time.
//
// A task is handed to an idle worker when there is one; otherwise a new
// worker is spawned, unless max_threads (0 = unbounded) has been reached, in
// which case the task waits in the queue. Workers that stay idle for
// keep_alive retire, so the thread count falls back once a burst is over.
class blocking_pool {
 public:
  explicit blocking_pool(std::size_t               max_threads = 0,
                         std::chrono::milliseconds keep_alive  = std::chrono::seconds{60},
                         std::string               name        = "blocking");

  ~blocking_pool();

  blocking_pool(const blocking_pool&)                    = delete;
  auto operator=(const blocking_pool&) -> blocking_pool& = delete;
  blocking_pool(blocking_pool&&)                         = delete;
  auto operator=(blocking_pool&&) -> blocking_pool&      = delete;

  // Enqueues a task. Returns false once the pool has been shut down.
  [[nodiscard]] auto submit(std::function<void()> task) -> bool;

  // Stops accepting work, lets the workers finish the queue, joins them.
  void shutdown();

  // Live worker threads, busy or idle.
  [[nodiscard]] auto thread_count() const -> std::size_t;

  // Workers currently executing a task.
  [[nodiscard]] auto active_count() const -> std::size_t;

  // Tasks waiting for a worker.
  [[nodiscard]] auto queued_count() const -> std::size_t;

  [[nodiscard]] auto running_in_this_thread() const noexcept -> bool;

  [[nodiscard]] auto max_threads() const noexcept -> std::size_t {
    return max_threads_;
  }

  [[nodiscard]] auto keep_alive() const noexcept -> std::chrono::milliseconds {
    return keep_alive_;
  }

 private:
  void worker_thread();
  void spawn_worker_locked();
  void join_retired();

  std::size_t               max_threads_;
  std::chrono::milliseconds keep_alive_;
  std::string               name_;

  mutable std::mutex                                mutex_;
  std::condition_variable                           cv_;
  std::deque<std::function<void()>>                 queue_;
  std::unordered_map<std::thread::id, std::thread> workers_;
  std::vector<std::thread>                          retired_;
  std::size_t                                       idle_{0};
  std::size_t                                       active_{0};
  bool                                              stop_{false};
};

}  // namespace weft::execution
