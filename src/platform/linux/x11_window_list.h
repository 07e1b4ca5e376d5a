// Copyright 2026 The multicap Authors
// Linux window list using the EWMH stacking order.

#ifndef MULTICAP_PLATFORM_LINUX_X11_WINDOW_LIST_H_
#define MULTICAP_PLATFORM_LINUX_X11_WINDOW_LIST_H_

#include <mutex>
#include <vector>

#include "core/window_list_provider.h"

namespace multicap {
namespace internal {

/// Lists managed windows from _NET_CLIENT_LIST_STACKING on every screen.
/// Owner name comes from _NET_WM_PID (/proc/PID/comm), else WM_CLASS.
class X11WindowListProvider : public WindowListProvider {
 public:
  X11WindowListProvider();
  ~X11WindowListProvider() override;

  bool Initialize();
  bool ListWindows(std::vector<WindowInfo>* out_windows) override;

 private:
  std::mutex mutex_;      // Xlib calls on one connection
  void* display_ = nullptr;  // Display* from X11
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_PLATFORM_LINUX_X11_WINDOW_LIST_H_
