// Copyright 2026 The multicap Authors

#ifndef MULTICAP_SESSION_SIGNAL_WATCHER_H_
#define MULTICAP_SESSION_SIGNAL_WATCHER_H_

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace multicap {
namespace internal {

/// Turns SIGINT/SIGTERM into a callback on an ordinary thread.
///
/// The signal handler only records the signal in a sig_atomic_t; a watcher
/// thread polls it every 50 ms. A second terminating signal bypasses the
/// graceful path and ends the process with 128 + signal number.
///
/// Only one SignalWatcher may be installed at a time.
class SignalWatcher {
 public:
  using InterruptCallback = std::function<void(int signo)>;

  SignalWatcher();
  ~SignalWatcher();

  // Non-copyable.
  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  /// Install handlers and start polling. The callback runs at most once.
  /// @return false if the handlers could not be installed.
  bool Install(InterruptCallback callback);

  /// Stop polling and restore the previous handlers. Idempotent.
  void Uninstall();

  /// Signal number received so far, or 0.
  static int PendingSignal();

  /// Clear the process-wide signal state (tests).
  static void ResetForTesting();

 private:
  void WatchLoop();

  std::mutex mutex_;
  InterruptCallback callback_;
  std::atomic<bool> running_{false};
  std::thread thread_;
  bool installed_ = false;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_SESSION_SIGNAL_WATCHER_H_
