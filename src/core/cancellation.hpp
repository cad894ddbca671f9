#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace auto_core {

// Cooperative cancellation flag shared by every branch of one run.
// Suspension points wait on it instead of sleeping blindly.
class CancellationToken {
public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  // The first reason wins
  void cancel(const std::string &reason = "Cancelled") {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!cancelled_) {
        reason_ = reason;
      }
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  std::string reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
  }

  bool is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Wait for `duration` unless cancelled first.
  // Returns true when the full duration elapsed, false when cancelled.
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period> &duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  std::string reason_;
};

// Counting limiter for bounded fan-out (Parallel max_parallel)
class CountingSemaphore {
public:
  explicit CountingSemaphore(int permits) : permits_(permits) {}

  void acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return permits_ > 0; });
    --permits_;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++permits_;
    }
    cv_.notify_one();
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  int permits_;
};

// Scoped permit
class SemaphoreGuard {
public:
  explicit SemaphoreGuard(CountingSemaphore *sem) : sem_(sem) {
    if (sem_) {
      sem_->acquire();
    }
  }
  ~SemaphoreGuard() {
    if (sem_) {
      sem_->release();
    }
  }

  SemaphoreGuard(const SemaphoreGuard &) = delete;
  SemaphoreGuard &operator=(const SemaphoreGuard &) = delete;

private:
  CountingSemaphore *sem_;
};

} // namespace auto_core
