// Copyright 2026 The multicap Authors

#include "core/color_convert.h"

#include <algorithm>
#include <cmath>

namespace multicap {
namespace internal {

namespace {

// BT.709 coefficients.
constexpr float kKr = 0.2126f;
constexpr float kKg = 0.7152f;
constexpr float kKb = 0.0722f;

uint8_t ClampToByte(float v) {
  v = std::round(v);
  if (v < 0.0f) return 0;
  if (v > 255.0f) return 255;
  return static_cast<uint8_t>(v);
}

}  // namespace

uint8_t LumaFromBgr(uint8_t b, uint8_t g, uint8_t r) {
  return ClampToByte(kKr * r + kKg * g + kKb * b);
}

std::unique_ptr<VideoFrame> BgraToNv12(const uint8_t* bgra, int width,
                                       int height, int stride,
                                       int64_t pts_ns) {
  if (!bgra || width <= 0 || height <= 0 || stride < width * 4) {
    return nullptr;
  }

  auto frame = VideoFrame::Create(width, height, pts_ns);
  if (!frame) return nullptr;

  uint8_t* y_plane = frame->mutable_y_plane();
  for (int y = 0; y < height; ++y) {
    const uint8_t* src = bgra + static_cast<ptrdiff_t>(y) * stride;
    uint8_t* dst = y_plane + static_cast<ptrdiff_t>(y) * frame->y_stride();
    for (int x = 0; x < width; ++x) {
      dst[x] = LumaFromBgr(src[x * 4 + 0], src[x * 4 + 1], src[x * 4 + 2]);
    }
  }

  uint8_t* uv_plane = frame->mutable_uv_plane();
  for (int cy = 0; cy < frame->chroma_height(); ++cy) {
    uint8_t* dst = uv_plane + static_cast<ptrdiff_t>(cy) * frame->uv_stride();
    for (int cx = 0; cx < frame->chroma_width(); ++cx) {
      float sum_b = 0.0f, sum_g = 0.0f, sum_r = 0.0f;
      int count = 0;
      for (int dy = 0; dy < 2; ++dy) {
        int py = cy * 2 + dy;
        if (py >= height) break;
        const uint8_t* row = bgra + static_cast<ptrdiff_t>(py) * stride;
        for (int dx = 0; dx < 2; ++dx) {
          int px = cx * 2 + dx;
          if (px >= width) break;
          sum_b += row[px * 4 + 0];
          sum_g += row[px * 4 + 1];
          sum_r += row[px * 4 + 2];
          ++count;
        }
      }
      float b = sum_b / count;
      float g = sum_g / count;
      float r = sum_r / count;
      float luma = kKr * r + kKg * g + kKb * b;
      float cb = (b - luma) / (2.0f * (1.0f - kKb)) + 128.0f;
      float cr = (r - luma) / (2.0f * (1.0f - kKr)) + 128.0f;
      dst[cx * 2 + 0] = ClampToByte(cb);
      dst[cx * 2 + 1] = ClampToByte(cr);
    }
  }
  return frame;
}

}  // namespace internal
}  // namespace multicap
