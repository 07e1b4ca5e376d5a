// Copyright 2026 The multicap Authors

#include "mask/frame_masker.h"

#include <algorithm>
#include <cstring>

namespace multicap {
namespace internal {

void ApplyMask(VideoFrame* frame, const std::vector<Rect>& regions,
               const Rect& display_bounds) {
  if (!frame || regions.empty()) return;

  const int width = frame->width();
  const int height = frame->height();
  uint8_t* y_plane = frame->mutable_y_plane();
  uint8_t* uv_plane = frame->mutable_uv_plane();

  for (const auto& region : regions) {
    // Global -> display-local.
    int local_x = region.x - display_bounds.x;
    int local_y = region.y - display_bounds.y;

    int min_x = (std::max)(0, local_x);
    int min_y = (std::max)(0, local_y);
    int max_x = (std::min)(width, local_x + region.width);
    int max_y = (std::min)(height, local_y + region.height);
    if (min_x >= max_x || min_y >= max_y) continue;

    for (int y = min_y; y < max_y; ++y) {
      std::memset(y_plane + static_cast<ptrdiff_t>(y) * frame->y_stride() +
                      min_x,
                  kMaskLuma, static_cast<size_t>(max_x - min_x));
    }

    // Round outward so partially covered 2x2 blocks lose their colour too.
    int uv_min_x = min_x / 2;
    int uv_min_y = min_y / 2;
    int uv_max_x = (std::min)((max_x + 1) / 2, frame->chroma_width());
    int uv_max_y = (std::min)((max_y + 1) / 2, frame->chroma_height());

    for (int y = uv_min_y; y < uv_max_y; ++y) {
      std::memset(uv_plane + static_cast<ptrdiff_t>(y) * frame->uv_stride() +
                      uv_min_x * 2,
                  kMaskChroma, static_cast<size_t>(uv_max_x - uv_min_x) * 2);
    }
  }
}

}  // namespace internal
}  // namespace multicap
