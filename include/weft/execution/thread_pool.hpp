#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "concepts.hpp"

namespace weft::execution {

// Fixed-size pool for short, non-blocking work. Every effect node except the
// blocking ones runs here, and fibers resume here after suspension.
class thread_pool {
 public:
  explicit thread_pool(std::size_t num_threads = std::thread::hardware_concurrency(),
                       std::string name            = "computation");

  ~thread_pool();

  thread_pool(const thread_pool&)                    = delete;
  auto operator=(const thread_pool&) -> thread_pool& = delete;
  thread_pool(thread_pool&&)                         = delete;
  auto operator=(thread_pool&&) -> thread_pool&      = delete;

  class thread_pool_scheduler {
   public:
    using scheduler_concept = scheduler_t;

    explicit thread_pool_scheduler(thread_pool* pool) noexcept : pool_(pool) {}

    [[nodiscard]] auto schedule() const noexcept {
      return _schedule_sender{pool_};
    }

    auto operator==(const thread_pool_scheduler& other) const noexcept -> bool {
      return pool_ == other.pool_;
    }

   private:
    thread_pool* pool_;

    struct _schedule_sender {
      using sender_concept = sender_t;
      using value_types    = type_list<>;

      thread_pool* pool_;

      template <receiver R>
      auto connect(R&& r) const {
        return _operation<__remove_cvref_t<R>>{pool_, std::forward<R>(r)};
      }

      template <class Rcvr>
      struct _operation {
        using operation_state_concept = operation_state_t;

        thread_pool* pool_;
        Rcvr         receiver_;

        void start() & noexcept {
          // The pool must outlive the operation.
          try {
            const bool accepted = pool_->submit([this] -> void {
              try {
                std::move(receiver_).set_value();
              } catch (...) {
                std::move(receiver_).set_error(std::current_exception());
              }
            });
            if (!accepted) {
              std::move(receiver_).set_stopped();
            }
          } catch (...) {
            std::move(receiver_).set_error(std::current_exception());
          }
        }
      };
    };
  };

  [[nodiscard]] auto get_scheduler() noexcept -> thread_pool_scheduler {
    return thread_pool_scheduler{this};
  }

  // Enqueues a task. Returns false once the pool has been shut down.
  [[nodiscard]] auto submit(std::function<void()> task) -> bool;

  // Stops accepting work, runs everything already queued, joins the workers.
  void shutdown();

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return workers_.size();
  }

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto running_in_this_thread() const noexcept -> bool;

 private:
  void worker_thread();

  std::string                       name_;
  std::vector<std::thread>          workers_;
  std::queue<std::function<void()>> queue_;
  std::condition_variable           cv_;
  mutable std::mutex                mutex_;
  bool                              stop_{false};
};

static_assert(scheduler<thread_pool::thread_pool_scheduler>);

}  // namespace weft::execution
