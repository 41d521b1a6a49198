#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace weft {

class interrupt_source;
class interrupt_token;
class interrupt_registration;

namespace _interrupt_detail {

struct _state {
  std::atomic<bool>                              requested{false};
  std::mutex                                     mutex;
  std::uint64_t                                  next_id{0};
  std::map<std::uint64_t, std::function<void()>> callbacks;
};

}  // namespace _interrupt_detail

// Keeps an interruption callback registered for as long as it lives.
// Destroying it after the callback has started does not wait for it.
class interrupt_registration {
 public:
  interrupt_registration() noexcept = default;

  interrupt_registration(std::weak_ptr<_interrupt_detail::_state> state, std::uint64_t id) noexcept
      : state_(std::move(state)), id_(id) {}

  ~interrupt_registration() {
    reset();
  }

  interrupt_registration(const interrupt_registration&)                    = delete;
  auto operator=(const interrupt_registration&) -> interrupt_registration& = delete;

  interrupt_registration(interrupt_registration&& other) noexcept
      : state_(std::exchange(other.state_, {})), id_(other.id_) {}

  auto operator=(interrupt_registration&& other) noexcept -> interrupt_registration& {
    if (this != &other) {
      reset();
      state_ = std::exchange(other.state_, {});
      id_    = other.id_;
    }
    return *this;
  }

  void reset() noexcept {
    if (auto state = state_.lock()) {
      std::scoped_lock lock(state->mutex);
      state->callbacks.erase(id_);
    }
    state_.reset();
  }

 private:
  std::weak_ptr<_interrupt_detail::_state> state_;
  std::uint64_t                            id_{0};
};

class interrupt_token {
 public:
  interrupt_token() noexcept = default;

  explicit interrupt_token(std::shared_ptr<_interrupt_detail::_state> state) noexcept
      : state_(std::move(state)) {}

  [[nodiscard]] auto interrupt_requested() const noexcept -> bool {
    return state_ != nullptr && state_->requested.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto interrupt_possible() const noexcept -> bool {
    return state_ != nullptr;
  }

  // Runs callback on the interrupting thread. If interruption was already
  // requested it runs right away, on this thread, and nothing is registered.
  [[nodiscard]] auto on_interrupt(std::function<void()> callback) const -> interrupt_registration {
    if (state_ == nullptr) {
      return {};
    }
    {
      std::scoped_lock lock(state_->mutex);
      if (!state_->requested.load(std::memory_order_acquire)) {
        const auto id = state_->next_id++;
        state_->callbacks.emplace(id, std::move(callback));
        return interrupt_registration{state_, id};
      }
    }
    callback();
    return {};
  }

  friend auto operator==(const interrupt_token& lhs, const interrupt_token& rhs) noexcept -> bool {
    return lhs.state_ == rhs.state_;
  }

 private:
  std::shared_ptr<_interrupt_detail::_state> state_;
};

class interrupt_source {
 public:
  interrupt_source() : state_(std::make_shared<_interrupt_detail::_state>()) {}

  interrupt_source(const interrupt_source&)                    = delete;
  auto operator=(const interrupt_source&) -> interrupt_source& = delete;

  [[nodiscard]] auto get_token() const noexcept -> interrupt_token {
    return interrupt_token{state_};
  }

  // Returns true for the request that flipped the flag. Callbacks run on the
  // calling thread, in registration order, outside the lock. A throwing
  // callback does not stop the rest; the first exception is rethrown after
  // all of them ran.
  auto request_interrupt() -> bool {
    bool expected = false;
    if (!state_->requested.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return false;
    }

    std::map<std::uint64_t, std::function<void()>> callbacks;
    {
      std::scoped_lock lock(state_->mutex);
      callbacks.swap(state_->callbacks);
    }
    std::exception_ptr first_fault;
    for (auto& [id, callback] : callbacks) {
      try {
        callback();
      } catch (...) {
        if (!first_fault) {
          first_fault = std::current_exception();
        }
      }
    }
    if (first_fault) {
      std::rethrow_exception(first_fault);
    }
    return true;
  }

  [[nodiscard]] auto interrupt_requested() const noexcept -> bool {
    return state_->requested.load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<_interrupt_detail::_state> state_;
};

}  // namespace weft
