// Copyright 2026 The multicap Authors

#include "session/signal_watcher.h"

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <utility>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

volatile std::sig_atomic_t g_signal_count = 0;
volatile std::sig_atomic_t g_last_signal = 0;

struct sigaction g_previous_int;
struct sigaction g_previous_term;

// Async-signal-safe: only sig_atomic_t stores and _exit().
void HandleTerminatingSignal(int signo) {
  g_last_signal = signo;
  g_signal_count = g_signal_count + 1;
  if (g_signal_count > 1) _exit(128 + signo);
}

}  // namespace

SignalWatcher::SignalWatcher() = default;

SignalWatcher::~SignalWatcher() { Uninstall(); }

bool SignalWatcher::Install(InterruptCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (installed_) return true;

  struct sigaction action;
  action.sa_handler = HandleTerminatingSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  if (sigaction(SIGINT, &action, &g_previous_int) != 0) {
    MULTICAP_LOG_ERROR("Failed to install SIGINT handler");
    return false;
  }
  if (sigaction(SIGTERM, &action, &g_previous_term) != 0) {
    MULTICAP_LOG_ERROR("Failed to install SIGTERM handler");
    sigaction(SIGINT, &g_previous_int, nullptr);
    return false;
  }

  callback_ = std::move(callback);
  installed_ = true;
  running_ = true;
  thread_ = std::thread(&SignalWatcher::WatchLoop, this);
  return true;
}

void SignalWatcher::Uninstall() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!installed_) return;
    installed_ = false;
  }
  running_ = false;
  if (thread_.joinable()) thread_.join();
  sigaction(SIGINT, &g_previous_int, nullptr);
  sigaction(SIGTERM, &g_previous_term, nullptr);
}

void SignalWatcher::WatchLoop() {
  while (running_) {
    if (g_signal_count > 0) {
      int signo = g_last_signal;
      MULTICAP_LOG_INFO("Received signal {}, stopping (repeat to force)",
                        signo);
      InterruptCallback callback;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = std::move(callback_);
        callback_ = nullptr;
      }
      if (callback) callback(signo);
      return;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

int SignalWatcher::PendingSignal() {
  return g_signal_count > 0 ? static_cast<int>(g_last_signal) : 0;
}

void SignalWatcher::ResetForTesting() {
  g_signal_count = 0;
  g_last_signal = 0;
}

}  // namespace internal
}  // namespace multicap
