// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_VIDEO_FRAME_H_
#define MULTICAP_CORE_VIDEO_FRAME_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace multicap {
namespace internal {

/// One captured frame in NV12 layout (full-range BT.709).
///
/// The buffer holds the luma plane (height rows of y_stride bytes) followed by
/// the interleaved CbCr plane ((height + 1) / 2 rows of uv_stride bytes).
/// Chroma is subsampled 2x2, so one CbCr pair covers a 2x2 luma block.
class VideoFrame {
 public:
  VideoFrame(int width, int height, int y_stride, int uv_stride,
             std::vector<uint8_t> data, int64_t pts_ns);
  ~VideoFrame() = default;

  // Non-copyable, movable.
  VideoFrame(const VideoFrame&) = delete;
  VideoFrame& operator=(const VideoFrame&) = delete;
  VideoFrame(VideoFrame&&) = default;
  VideoFrame& operator=(VideoFrame&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int y_stride() const { return y_stride_; }
  int uv_stride() const { return uv_stride_; }
  int chroma_width() const { return (width_ + 1) / 2; }
  int chroma_height() const { return (height_ + 1) / 2; }

  /// Presentation timestamp on the capture service's clock.
  int64_t pts_ns() const { return pts_ns_; }
  void set_pts_ns(int64_t pts_ns) { pts_ns_ = pts_ns; }

  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  const uint8_t* y_plane() const { return data_.data(); }
  const uint8_t* uv_plane() const { return data_.data() + uv_offset(); }
  uint8_t* mutable_y_plane() { return data_.data(); }
  uint8_t* mutable_uv_plane() { return data_.data() + uv_offset(); }

  /// Allocate a frame with tightly packed planes, luma 0 / chroma 128.
  static std::unique_ptr<VideoFrame> Create(int width, int height,
                                            int64_t pts_ns);

  /// Wrap existing NV12 data (takes ownership via move).
  /// Returns nullptr if `data` is too small for the given geometry.
  static std::unique_ptr<VideoFrame> CreateFromData(int width, int height,
                                                    int y_stride,
                                                    int uv_stride,
                                                    std::vector<uint8_t> data,
                                                    int64_t pts_ns);

  /// Deep copy.
  std::unique_ptr<VideoFrame> Clone() const;

 private:
  size_t uv_offset() const {
    return static_cast<size_t>(y_stride_) * static_cast<size_t>(height_);
  }

  int width_;
  int height_;
  int y_stride_;
  int uv_stride_;
  std::vector<uint8_t> data_;
  int64_t pts_ns_;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_VIDEO_FRAME_H_
