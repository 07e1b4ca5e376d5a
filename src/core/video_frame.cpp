// Copyright 2026 The multicap Authors

#include "core/video_frame.h"

#include <cstring>
#include <utility>

namespace multicap {
namespace internal {

namespace {

constexpr uint8_t kBlackLuma = 0;
constexpr uint8_t kNeutralChroma = 128;

size_t RequiredBytes(int height, int y_stride, int uv_stride) {
  return static_cast<size_t>(y_stride) * static_cast<size_t>(height) +
         static_cast<size_t>(uv_stride) * static_cast<size_t>((height + 1) / 2);
}

}  // namespace

VideoFrame::VideoFrame(int width, int height, int y_stride, int uv_stride,
                       std::vector<uint8_t> data, int64_t pts_ns)
    : width_(width),
      height_(height),
      y_stride_(y_stride),
      uv_stride_(uv_stride),
      data_(std::move(data)),
      pts_ns_(pts_ns) {}

static constexpr size_t kMaxFrameBytes = 256ULL * 1024 * 1024;  // 256 MB

// static
std::unique_ptr<VideoFrame> VideoFrame::Create(int width, int height,
                                               int64_t pts_ns) {
  if (width <= 0 || height <= 0) return nullptr;
  int y_stride = width;
  int uv_stride = ((width + 1) / 2) * 2;
  size_t total = RequiredBytes(height, y_stride, uv_stride);
  if (total > kMaxFrameBytes) return nullptr;

  std::vector<uint8_t> data(total, kNeutralChroma);
  std::memset(data.data(), kBlackLuma,
              static_cast<size_t>(y_stride) * static_cast<size_t>(height));
  return std::make_unique<VideoFrame>(width, height, y_stride, uv_stride,
                                      std::move(data), pts_ns);
}

// static
std::unique_ptr<VideoFrame> VideoFrame::CreateFromData(
    int width, int height, int y_stride, int uv_stride,
    std::vector<uint8_t> data, int64_t pts_ns) {
  if (width <= 0 || height <= 0) return nullptr;
  if (y_stride < width || uv_stride < ((width + 1) / 2) * 2) return nullptr;
  if (data.size() < RequiredBytes(height, y_stride, uv_stride)) return nullptr;
  return std::make_unique<VideoFrame>(width, height, y_stride, uv_stride,
                                      std::move(data), pts_ns);
}

std::unique_ptr<VideoFrame> VideoFrame::Clone() const {
  std::vector<uint8_t> data_copy(data_);
  return std::make_unique<VideoFrame>(width_, height_, y_stride_, uv_stride_,
                                      std::move(data_copy), pts_ns_);
}

}  // namespace internal
}  // namespace multicap
