// Copyright 2026 The multicap Authors

#include "mask/window_mask_detector.h"

#include <algorithm>
#include <cctype>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

std::string ToLower(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

WindowMaskDetector::WindowMaskDetector(
    WindowListProvider* provider, const std::vector<std::string>& app_names)
    : provider_(provider) {
  for (const auto& name : app_names) {
    if (!name.empty()) target_names_.insert(ToLower(name));
  }
}

bool WindowMaskDetector::IsTarget(const std::string& owner_name) const {
  return target_names_.count(ToLower(owner_name)) != 0;
}

std::vector<MaskedWindow> WindowMaskDetector::DetectWindows() const {
  std::vector<MaskedWindow> result;
  if (target_names_.empty() || !provider_) return result;

  std::vector<WindowInfo> windows;
  if (!provider_->ListWindows(&windows)) {
    MULTICAP_LOG_DEBUG("Window list unavailable; skipping mask this frame");
    return result;
  }

  // Bounds of every normal window seen so far, i.e. in front of the
  // current one.
  std::vector<Rect> in_front;
  in_front.reserve(windows.size());

  for (const auto& window : windows) {
    if (window.layer != 0) continue;
    if (window.bounds.IsEmpty()) continue;

    if (IsTarget(window.owner_name)) {
      auto visible = SubtractAll(window.bounds, in_front);
      if (!visible.empty()) {
        MaskedWindow masked;
        masked.id = window.id;
        masked.owner_name = window.owner_name;
        masked.bounds = window.bounds;
        masked.visible_regions = std::move(visible);
        result.push_back(std::move(masked));
      }
    }

    in_front.push_back(window.bounds);
  }
  return result;
}

std::vector<Rect> WindowMaskDetector::DetectRegions() const {
  std::vector<Rect> regions;
  for (const auto& window : DetectWindows()) {
    regions.insert(regions.end(), window.visible_regions.begin(),
                   window.visible_regions.end());
  }
  return regions;
}

}  // namespace internal
}  // namespace multicap
