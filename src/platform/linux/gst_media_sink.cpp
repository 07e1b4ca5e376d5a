// Copyright 2026 The multicap Authors
// Linux container writer -- GStreamer appsrc pipeline implementation.
//
//   video: appsrc (NV12) -> x264enc | vaapih264enc -> h264parse -> mp4mux
//   audio: appsrc (F32LE) -> audioconvert -> avenc_aac -> aacparse -> mp4mux
//   mp4mux -> filesink

#include "core/media_sink.h"

#include <atomic>
#include <cmath>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/logger.h"

#include <gst/app/gstappsrc.h>
#include <gst/gst.h>

namespace multicap {
namespace internal {

namespace {

// Queued bytes per appsrc before IsReadyForMoreData() reports false.
constexpr int kVideoQueueFrames = 8;
constexpr guint64 kAudioQueueBytes = 1 << 20;
constexpr GstClockTime kBusPollInterval = 100 * GST_MSECOND;

std::once_flag g_gst_init_flag;

void InitGStreamer() {
  // Process-global, idempotent.
  std::call_once(g_gst_init_flag, [] { gst_init(nullptr, nullptr); });
}

bool HasElement(const char* name) {
  GstElementFactory* factory = gst_element_factory_find(name);
  if (!factory) return false;
  gst_object_unref(factory);
  return true;
}

size_t Nv12Size(int width, int height) {
  size_t chroma_w = static_cast<size_t>((width + 1) / 2);
  size_t chroma_h = static_cast<size_t>((height + 1) / 2);
  return static_cast<size_t>(width) * height + chroma_w * chroma_h * 2;
}

std::string VideoBranch(const TrackSpec& track, int index) {
  // Frame rate as a fraction with millihertz precision.
  int rate_num = static_cast<int>(std::lround(track.frame_rate * 1000.0));
  if (rate_num <= 0) rate_num = 1000;

  std::string encoder;
  int kbps = track.bitrate / 1000;
  if (track.hardware_encoder && HasElement("vaapih264enc")) {
    encoder = "vaapih264enc bitrate=" + std::to_string(kbps) +
              " keyframe-period=" +
              std::to_string(track.max_keyframe_interval) + " max-bframes=0";
  } else {
    if (track.hardware_encoder) {
      MULTICAP_LOG_WARN("vaapih264enc unavailable, using x264enc");
    }
    encoder = "x264enc bitrate=" + std::to_string(kbps) +
              " key-int-max=" + std::to_string(track.max_keyframe_interval) +
              " bframes=0 speed-preset=veryfast tune=zerolatency";
  }

  return "appsrc name=src" + std::to_string(index) +
         " is-live=true format=time ! video/x-raw,format=NV12,width=" +
         std::to_string(track.width) +
         ",height=" + std::to_string(track.height) +
         ",framerate=" + std::to_string(rate_num) + "/1000 ! " + encoder +
         " ! h264parse ! queue ! mux. ";
}

std::string AudioBranch(const TrackSpec& track, int index) {
  return "appsrc name=src" + std::to_string(index) +
         " is-live=true format=time ! audio/x-raw,format=F32LE,rate=" +
         std::to_string(track.sample_rate) +
         ",channels=" + std::to_string(track.channels) +
         ",layout=interleaved ! audioconvert ! avenc_aac bitrate=" +
         std::to_string(track.audio_bitrate) +
         " ! aacparse ! queue ! mux. ";
}

// ---------------------------------------------------------------------------
// GstMediaSink
// ---------------------------------------------------------------------------

class GstMediaSink : public MediaSink {
 public:
  explicit GstMediaSink(SinkSpec spec) : spec_(std::move(spec)) {}

  ~GstMediaSink() override {
    cancel_.store(true, std::memory_order_release);
    if (finalize_thread_.joinable()) finalize_thread_.join();
    CleanupPipeline();
  }

  bool Open(std::string* out_error) override {
    InitGStreamer();

    // Build pipeline string.
    std::string pipeline_str = "mp4mux name=mux ! filesink name=sink ";
    for (size_t i = 0; i < spec_.tracks.size(); ++i) {
      const TrackSpec& track = spec_.tracks[i];
      pipeline_str += track.kind == TrackKind::kVideo
                          ? VideoBranch(track, static_cast<int>(i))
                          : AudioBranch(track, static_cast<int>(i));
    }

    GError* error = nullptr;
    pipeline_ = gst_parse_launch(pipeline_str.c_str(), &error);
    if (!pipeline_ || error) {
      *out_error = std::string("GStreamer pipeline creation failed: ") +
                   (error ? error->message : "unknown");
      MULTICAP_LOG_ERROR("{}", *out_error);
      if (error) g_error_free(error);
      CleanupPipeline();
      return false;
    }

    GstElement* filesink = gst_bin_get_by_name(GST_BIN(pipeline_), "sink");
    if (!filesink) {
      *out_error = "failed to get filesink element from pipeline";
      CleanupPipeline();
      return false;
    }
    g_object_set(filesink, "location", spec_.path.c_str(), nullptr);
    gst_object_unref(filesink);

    for (size_t i = 0; i < spec_.tracks.size(); ++i) {
      std::string name = "src" + std::to_string(i);
      GstElement* appsrc = gst_bin_get_by_name(GST_BIN(pipeline_),
                                               name.c_str());
      if (!appsrc) {
        *out_error = "failed to get appsrc element from pipeline";
        CleanupPipeline();
        return false;
      }
      const TrackSpec& track = spec_.tracks[i];
      guint64 max_bytes =
          track.kind == TrackKind::kVideo
              ? static_cast<guint64>(Nv12Size(track.width, track.height)) *
                    kVideoQueueFrames
              : kAudioQueueBytes;
      g_object_set(appsrc, "max-bytes", max_bytes, "block", FALSE, nullptr);
      appsrcs_.push_back(appsrc);
    }

    GstStateChangeReturn ret =
        gst_element_set_state(pipeline_, GST_STATE_PLAYING);
    if (ret == GST_STATE_CHANGE_FAILURE) {
      *out_error = "failed to set GStreamer pipeline to PLAYING";
      MULTICAP_LOG_ERROR("{} ({})", *out_error, spec_.path);
      CleanupPipeline();
      return false;
    }

    MULTICAP_LOG_DEBUG("GStreamer pipeline for {}: {}", spec_.path,
                       pipeline_str);
    return true;
  }

  bool IsReadyForMoreData(int track) const override {
    GstElement* appsrc = AppSrc(track);
    if (!appsrc) return false;
    guint64 max_bytes = gst_app_src_get_max_bytes(GST_APP_SRC(appsrc));
    return gst_app_src_get_current_level_bytes(GST_APP_SRC(appsrc)) <
           max_bytes;
  }

  bool AppendVideo(int track, const VideoFrame& frame,
                   int64_t pts_ns) override {
    GstElement* appsrc = AppSrc(track);
    if (!appsrc) return false;
    const TrackSpec& spec = spec_.tracks[static_cast<size_t>(track)];

    GstBuffer* buffer = gst_buffer_new_allocate(
        nullptr, Nv12Size(frame.width(), frame.height()), nullptr);
    if (!buffer) {
      MULTICAP_LOG_ERROR("gst_buffer_new_allocate failed");
      return false;
    }

    GstMapInfo map;
    if (!gst_buffer_map(buffer, &map, GST_MAP_WRITE)) {
      gst_buffer_unref(buffer);
      return false;
    }

    // Copy plane-by-plane, row-by-row (strides may differ).
    uint8_t* dst = map.data;
    for (int row = 0; row < frame.height(); ++row) {
      std::memcpy(dst, frame.y_plane() + static_cast<ptrdiff_t>(row) *
                                             frame.y_stride(),
                  static_cast<size_t>(frame.width()));
      dst += frame.width();
    }
    const size_t uv_row = static_cast<size_t>(frame.chroma_width()) * 2;
    for (int row = 0; row < frame.chroma_height(); ++row) {
      std::memcpy(dst, frame.uv_plane() + static_cast<ptrdiff_t>(row) *
                                              frame.uv_stride(),
                  uv_row);
      dst += uv_row;
    }
    gst_buffer_unmap(buffer, &map);

    GST_BUFFER_PTS(buffer) = static_cast<GstClockTime>(pts_ns);
    GST_BUFFER_DURATION(buffer) =
        spec.frame_rate > 0
            ? static_cast<GstClockTime>(GST_SECOND / spec.frame_rate)
            : GST_CLOCK_TIME_NONE;

    return Push(appsrc, buffer);
  }

  bool AppendAudio(int track, const AudioSample& sample,
                   int64_t pts_ns) override {
    GstElement* appsrc = AppSrc(track);
    if (!appsrc || sample.data.empty()) return false;

    gsize size = sample.data.size() * sizeof(float);
    GstBuffer* buffer = gst_buffer_new_allocate(nullptr, size, nullptr);
    if (!buffer) {
      MULTICAP_LOG_ERROR("gst_buffer_new_allocate failed");
      return false;
    }
    gst_buffer_fill(buffer, 0, sample.data.data(), size);

    GST_BUFFER_PTS(buffer) = static_cast<GstClockTime>(pts_ns);
    GST_BUFFER_DURATION(buffer) =
        static_cast<GstClockTime>(sample.duration_ns());

    return Push(appsrc, buffer);
  }

  void EndTrack(int track) override {
    GstElement* appsrc = AppSrc(track);
    if (!appsrc) return;
    gst_app_src_end_of_stream(GST_APP_SRC(appsrc));
  }

  void FinalizeAsync(FinalizeCallback callback) override {
    if (!pipeline_) {
      if (callback) callback(false, "pipeline not running");
      return;
    }
    finalize_thread_ = std::thread(&GstMediaSink::FinalizeLoop, this,
                                   std::move(callback));
  }

  const std::string& path() const override { return spec_.path; }

 private:
  GstElement* AppSrc(int track) const {
    if (track < 0 || static_cast<size_t>(track) >= appsrcs_.size()) {
      return nullptr;
    }
    return appsrcs_[static_cast<size_t>(track)];
  }

  bool Push(GstElement* appsrc, GstBuffer* buffer) {
    // Push buffer to appsrc (takes ownership).
    GstFlowReturn flow_ret =
        gst_app_src_push_buffer(GST_APP_SRC(appsrc), buffer);
    if (flow_ret != GST_FLOW_OK) {
      MULTICAP_LOG_ERROR("gst_app_src_push_buffer failed: {} ({})",
                         gst_flow_get_name(flow_ret), spec_.path);
      return false;
    }
    return true;
  }

  /// Wait for EOS to reach the muxer (moov atom written) or an error.
  void FinalizeLoop(FinalizeCallback callback) {
    bool ok = false;
    std::string error_text = "finalize cancelled";

    GstBus* bus = gst_element_get_bus(pipeline_);
    while (bus && !cancel_.load(std::memory_order_acquire)) {
      GstMessage* msg = gst_bus_timed_pop_filtered(
          bus, kBusPollInterval,
          static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
      if (!msg) continue;
      if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
        GError* err = nullptr;
        gst_message_parse_error(msg, &err, nullptr);
        error_text = std::string("GStreamer pipeline error: ") +
                     (err ? err->message : "unknown");
        if (err) g_error_free(err);
      } else {
        ok = true;
        error_text.clear();
      }
      gst_message_unref(msg);
      break;
    }
    if (bus) gst_object_unref(bus);

    gst_element_set_state(pipeline_, GST_STATE_NULL);
    if (callback) callback(ok, error_text);
  }

  void CleanupPipeline() {
    for (GstElement* appsrc : appsrcs_) gst_object_unref(appsrc);
    appsrcs_.clear();
    if (pipeline_) {
      gst_element_set_state(pipeline_, GST_STATE_NULL);
      gst_object_unref(pipeline_);
      pipeline_ = nullptr;
    }
  }

  const SinkSpec spec_;

  // GStreamer objects.
  GstElement* pipeline_ = nullptr;
  std::vector<GstElement*> appsrcs_;

  std::thread finalize_thread_;
  std::atomic<bool> cancel_{false};
};

class GstMediaSinkFactory : public MediaSinkFactory {
 public:
  std::unique_ptr<MediaSink> CreateSink(const SinkSpec& spec) override {
    if (spec.path.empty() || spec.tracks.empty()) return nullptr;
    for (const auto& track : spec.tracks) {
      if (track.kind == TrackKind::kVideo &&
          (track.width <= 0 || track.height <= 0)) {
        return nullptr;
      }
    }
    return std::make_unique<GstMediaSink>(spec);
  }
};

}  // namespace

std::unique_ptr<MediaSinkFactory> CreatePlatformMediaSinkFactory() {
  return std::make_unique<GstMediaSinkFactory>();
}

}  // namespace internal
}  // namespace multicap
