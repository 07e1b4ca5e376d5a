// Copyright 2026 The multicap Authors
// Scripted WindowListProvider for tests.

#ifndef MULTICAP_TESTS_FAKES_FAKE_WINDOW_LIST_H_
#define MULTICAP_TESTS_FAKES_FAKE_WINDOW_LIST_H_

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "core/window_list_provider.h"

namespace multicap {
namespace testing {

class FakeWindowList : public internal::WindowListProvider {
 public:
  /// Windows front-to-back.
  void SetWindows(std::vector<internal::WindowInfo> windows) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_ = std::move(windows);
  }

  void SetAvailable(bool available) { available_ = available; }

  bool ListWindows(std::vector<internal::WindowInfo>* out_windows) override {
    ++calls_;
    if (!available_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    *out_windows = windows_;
    return true;
  }

  int calls() const { return calls_; }

  static internal::WindowInfo Window(uint64_t id, const std::string& owner,
                                     internal::Rect bounds, int layer = 0) {
    internal::WindowInfo info;
    info.id = id;
    info.owner_name = owner;
    info.bounds = bounds;
    info.layer = layer;
    return info;
  }

 private:
  std::mutex mutex_;
  std::vector<internal::WindowInfo> windows_;
  std::atomic<bool> available_{true};
  std::atomic<int> calls_{0};
};

}  // namespace testing
}  // namespace multicap

#endif  // MULTICAP_TESTS_FAKES_FAKE_WINDOW_LIST_H_
