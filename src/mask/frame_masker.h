// Copyright 2026 The multicap Authors

#ifndef MULTICAP_MASK_FRAME_MASKER_H_
#define MULTICAP_MASK_FRAME_MASKER_H_

#include <vector>

#include "core/geometry.h"
#include "core/video_frame.h"

namespace multicap {
namespace internal {

/// Black luma value for full-range video.
constexpr uint8_t kMaskLuma = 0;
/// Neutral (grey-free) chroma value.
constexpr uint8_t kMaskChroma = 128;

/// Paint `regions` (global screen coordinates) black in an NV12 frame that
/// shows the display at `display_bounds`.
///
/// Regions are clamped to the frame; chroma rectangles are widened to cover
/// every 2x2 block the luma rectangle touches. The caller must hold
/// exclusive access to `frame`.
void ApplyMask(VideoFrame* frame, const std::vector<Rect>& regions,
               const Rect& display_bounds);

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_MASK_FRAME_MASKER_H_
