// Copyright 2026 The multicap Authors
// Single-resolution slot shared by several racing completion sources.

#ifndef MULTICAP_SESSION_COMPLETION_RACE_H_
#define MULTICAP_SESSION_COMPLETION_RACE_H_

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <utility>

namespace multicap {
namespace internal {

/// The first TryResolve() wins; every later call is a no-op. Waiters wake
/// once, with the winning value.
template <typename T>
class CompletionRace {
 public:
  CompletionRace() = default;

  // Non-copyable.
  CompletionRace(const CompletionRace&) = delete;
  CompletionRace& operator=(const CompletionRace&) = delete;

  /// @return true if this call resolved the race.
  bool TryResolve(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (resolved_) return false;
      value_ = std::move(value);
      resolved_ = true;
    }
    cv_.notify_all();
    return true;
  }

  /// Block until resolved and return the winning value.
  T Wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return resolved_; });
    return value_;
  }

  /// Block up to `timeout`.
  /// @return false on timeout (out_value untouched).
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout,
               T* out_value) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return resolved_; })) {
      return false;
    }
    if (out_value) *out_value = value_;
    return true;
  }

  bool IsResolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool resolved_ = false;
  T value_{};
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_SESSION_COMPLETION_RACE_H_
