// Copyright 2026 The multicap Authors
// Window enumeration abstract interface.

#ifndef MULTICAP_CORE_WINDOW_LIST_PROVIDER_H_
#define MULTICAP_CORE_WINDOW_LIST_PROVIDER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/geometry.h"

namespace multicap {
namespace internal {

/// One on-screen window as reported by the window system.
struct WindowInfo {
  uint64_t id = 0;
  std::string owner_name;  // Owning process / application name
  Rect bounds;             // Global screen coordinates
  int layer = 0;           // 0 = normal application window
};

/// Abstract interface for platform-specific window enumeration.
class WindowListProvider {
 public:
  virtual ~WindowListProvider() = default;

  /// List on-screen windows ordered front-to-back (topmost first).
  /// @return false if the window system could not be queried.
  virtual bool ListWindows(std::vector<WindowInfo>* out_windows) = 0;

 protected:
  WindowListProvider() = default;
};

/// Factory: creates the platform-specific provider, or nullptr when the
/// window system is unavailable.
std::unique_ptr<WindowListProvider> CreatePlatformWindowListProvider();

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_WINDOW_LIST_PROVIDER_H_
