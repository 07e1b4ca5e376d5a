// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_COLOR_CONVERT_H_
#define MULTICAP_CORE_COLOR_CONVERT_H_

#include <cstdint>
#include <memory>

#include "core/video_frame.h"

namespace multicap {
namespace internal {

/// Full-range BT.709 luma of one BGRA pixel.
uint8_t LumaFromBgr(uint8_t b, uint8_t g, uint8_t r);

/// Convert a BGRA8 image to an NV12 VideoFrame.
///
/// Chroma is averaged over each 2x2 block (edge blocks of odd-sized images
/// average only the pixels that exist). Returns nullptr on invalid input.
std::unique_ptr<VideoFrame> BgraToNv12(const uint8_t* bgra, int width,
                                       int height, int stride,
                                       int64_t pts_ns);

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_COLOR_CONVERT_H_
