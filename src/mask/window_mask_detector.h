// Copyright 2026 The multicap Authors
// Finds on-screen windows of selected applications and the parts of them
// that are actually visible.

#ifndef MULTICAP_MASK_WINDOW_MASK_DETECTOR_H_
#define MULTICAP_MASK_WINDOW_MASK_DETECTOR_H_

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "core/geometry.h"
#include "core/window_list_provider.h"

namespace multicap {
namespace internal {

/// A window whose pixels must be hidden in the recording.
struct MaskedWindow {
  uint64_t id = 0;
  std::string owner_name;
  Rect bounds;                       // Global screen coordinates
  std::vector<Rect> visible_regions; // Disjoint, inside bounds
};

/// Matches windows by owner name (case-insensitive, exact) and computes the
/// regions not covered by any window in front of them.
class WindowMaskDetector {
 public:
  /// Does NOT take ownership of provider.
  WindowMaskDetector(WindowListProvider* provider,
                     const std::vector<std::string>& app_names);

  /// Current masked windows, front-to-back. Windows that are fully covered
  /// are omitted. Returns an empty list if the window list is unavailable.
  std::vector<MaskedWindow> DetectWindows() const;

  /// Convenience: every visible region of every detected window.
  std::vector<Rect> DetectRegions() const;

  bool has_targets() const { return !target_names_.empty(); }

 private:
  bool IsTarget(const std::string& owner_name) const;

  WindowListProvider* provider_;  // Non-owning
  std::set<std::string> target_names_;  // Lower-case
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_MASK_WINDOW_MASK_DETECTOR_H_
