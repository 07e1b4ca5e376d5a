// Copyright 2026 The multicap Authors

#include "platform/linux/x11_capture_service.h"

#if defined(__linux__)

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "core/color_convert.h"
#include "core/logger.h"
#include "platform/linux/pulse_audio_source.h"

namespace multicap {
namespace internal {

namespace {

constexpr char kX11Domain[] = "x11";
// Codes reported in the "x11" domain.
constexpr int kX11DisplayUnavailable = 1;
constexpr int kX11GrabFailed = 2;
// Consecutive failed grabs before the stream gives up.
constexpr int kMaxConsecutiveGrabFailures = 3;

int64_t MonotonicNowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// The default handler exits the process on e.g. BadMatch from XGetImage
// during a mode switch; a failed grab is reported as a stream error instead.
int IgnoreXError(Display* dpy, XErrorEvent* event) {
  char text[128] = {};
  XGetErrorText(dpy, event->error_code, text, sizeof(text));
  MULTICAP_LOG_DEBUG("X11 error {} ({})", static_cast<int>(event->error_code),
                     text);
  return 0;
}

std::once_flag g_x_init_flag;

void InitXlib() {
  std::call_once(g_x_init_flag, [] {
    XInitThreads();
    XSetErrorHandler(IgnoreXError);
  });
}

/// Convert an XImage to tightly packed BGRA.
bool XImageToBgra(XImage* ximg, std::vector<uint8_t>* out_pixels) {
  if (!ximg) return false;

  int w = ximg->width;
  int h = ximg->height;
  int stride = w * 4;
  out_pixels->resize(static_cast<size_t>(stride) * h);

  // Fast path: 32bpp little-endian with standard RGB masks (most common).
  // In-memory layout is already B G R pad.
  if (ximg->bits_per_pixel == 32 && ximg->byte_order == LSBFirst &&
      ximg->red_mask == 0xFF0000 && ximg->green_mask == 0x00FF00 &&
      ximg->blue_mask == 0x0000FF) {
    for (int y = 0; y < h; ++y) {
      const uint8_t* src = reinterpret_cast<const uint8_t*>(ximg->data) +
                           static_cast<ptrdiff_t>(y) * ximg->bytes_per_line;
      std::memcpy(out_pixels->data() + static_cast<ptrdiff_t>(y) * stride, src,
                  static_cast<size_t>(stride));
    }
  } else {
    // Generic fallback via XGetPixel.
    for (int y = 0; y < h; ++y) {
      uint8_t* dst = out_pixels->data() + static_cast<ptrdiff_t>(y) * stride;
      for (int x = 0; x < w; ++x) {
        unsigned long px = XGetPixel(ximg, x, y);
        dst[x * 4 + 0] = static_cast<uint8_t>((px >> 0) & 0xFF);
        dst[x * 4 + 1] = static_cast<uint8_t>((px >> 8) & 0xFF);
        dst[x * 4 + 2] = static_cast<uint8_t>((px >> 16) & 0xFF);
        dst[x * 4 + 3] = 0xFF;
      }
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// X11CaptureStream
// ---------------------------------------------------------------------------

class X11CaptureStream : public CaptureStream {
 public:
  X11CaptureStream(const StreamConfig& config, StreamHandler* handler)
      : config_(config), handler_(handler) {}

  ~X11CaptureStream() override {
    StreamError ignored;
    Stop(&ignored);
  }

  bool Start(StreamError* out_error) override {
    if (running_.load()) return true;

    display_ = XOpenDisplay(nullptr);
    if (!display_) {
      MULTICAP_LOG_ERROR("Failed to open X11 display");
      SetError(out_error, kX11Domain, kX11DisplayUnavailable,
               "cannot open X display");
      return false;
    }
    screen_ = static_cast<int>(config_.display.id);
    if (screen_ >= ScreenCount(display_)) {
      SetError(out_error, kX11Domain, kX11DisplayUnavailable,
               "screen no longer exists");
      CloseDisplay();
      return false;
    }

    if (config_.capture_audio && !StartAudio(out_error)) {
      StopAudio();
      CloseDisplay();
      return false;
    }

    running_.store(true, std::memory_order_release);
    video_thread_ = std::thread(&X11CaptureStream::VideoLoop, this);
    MULTICAP_LOG_INFO("Capturing screen {} ({}x{}) at {} Hz{}", screen_,
                      config_.display.width, config_.display.height,
                      config_.frame_rate,
                      config_.capture_audio ? " with audio" : "");
    return true;
  }

  bool Stop(StreamError* out_error) override {
    (void)out_error;
    running_.store(false, std::memory_order_release);
    if (video_thread_.joinable()) video_thread_.join();
    StopAudio();
    CloseDisplay();
    return true;
  }

 private:
  static void SetError(StreamError* out_error, const char* domain, int code,
                       const std::string& message) {
    if (!out_error) return;
    out_error->domain = domain;
    out_error->code = code;
    out_error->message = message;
  }

  void Emit(StreamEvent event) {
    if (handler_) handler_->OnStreamEvent(std::move(event));
  }

  void EmitError(StreamError error) {
    // First error per stream only; the session rebuilds the stream.
    if (error_reported_.exchange(true)) return;
    if (config_.error_policy) {
      Emit(config_.error_policy->Classify(std::move(error)));
    } else {
      Emit(FatalErrorEvent{std::move(error)});
    }
  }

  bool StartAudio(StreamError* out_error) {
    system_audio_ = std::make_unique<PulseAudioSource>(
        AudioSource::kSystem, config_.audio_sample_rate);
    microphone_ = std::make_unique<PulseAudioSource>(
        AudioSource::kMicrophone, config_.audio_sample_rate);
    if (!system_audio_->Open(out_error)) return false;
    if (!microphone_->Open(out_error)) return false;

    auto on_sample = [this](AudioSample sample) {
      Emit(AudioSampleEvent{std::move(sample)});
    };
    auto on_error = [this](const StreamError& error) { EmitError(error); };
    system_audio_->Start(on_sample, on_error);
    microphone_->Start(on_sample, on_error);
    return true;
  }

  void StopAudio() {
    if (system_audio_) system_audio_->Stop();
    if (microphone_) microphone_->Stop();
    system_audio_.reset();
    microphone_.reset();
  }

  void CloseDisplay() {
    if (display_) {
      XCloseDisplay(display_);
      display_ = nullptr;
    }
  }

  /// Background thread: grab -> convert -> deliver at the configured rate.
  void VideoLoop() {
    const auto interval = std::chrono::nanoseconds(
        static_cast<int64_t>(1e9 / (config_.frame_rate > 0
                                        ? config_.frame_rate
                                        : 1.0)));
    Window root = RootWindow(display_, screen_);
    int failures = 0;
    std::vector<uint8_t> bgra;
    auto next_tick = std::chrono::steady_clock::now();

    while (running_.load(std::memory_order_acquire)) {
      int64_t pts_ns = MonotonicNowNs();
      XImage* ximg =
          XGetImage(display_, root, 0, 0,
                    static_cast<unsigned>(config_.display.width),
                    static_cast<unsigned>(config_.display.height), AllPlanes,
                    ZPixmap);
      if (!ximg) {
        ++failures;
        MULTICAP_LOG_WARN("XGetImage failed on screen {} ({}/{})", screen_,
                          failures, kMaxConsecutiveGrabFailures);
        if (failures >= kMaxConsecutiveGrabFailures) {
          StreamError error;
          error.domain = kX11Domain;
          error.code = kX11GrabFailed;
          error.message = "frame grab failed";
          EmitError(error);
          return;
        }
      } else {
        failures = 0;
        bool converted = XImageToBgra(ximg, &bgra);
        int width = ximg->width;
        int height = ximg->height;
        XDestroyImage(ximg);
        if (converted) {
          auto frame =
              BgraToNv12(bgra.data(), width, height, width * 4, pts_ns);
          if (frame) Emit(VideoFrameEvent{std::move(frame)});
        }
      }

      next_tick += interval;
      auto now = std::chrono::steady_clock::now();
      if (next_tick < now) {
        next_tick = now;  // Fell behind; do not burst.
      } else {
        // Sleep in short steps so Stop() stays responsive at low rates.
        while (running_.load(std::memory_order_acquire) &&
               std::chrono::steady_clock::now() < next_tick) {
          auto remaining = next_tick - std::chrono::steady_clock::now();
          std::this_thread::sleep_for((std::min)(
              std::chrono::duration_cast<std::chrono::nanoseconds>(remaining),
              std::chrono::nanoseconds(std::chrono::milliseconds(50))));
        }
      }
    }
  }

  const StreamConfig config_;
  StreamHandler* handler_;  // Non-owning

  Display* display_ = nullptr;
  int screen_ = 0;
  std::atomic<bool> running_{false};
  std::atomic<bool> error_reported_{false};
  std::thread video_thread_;
  std::unique_ptr<PulseAudioSource> system_audio_;
  std::unique_ptr<PulseAudioSource> microphone_;
};

}  // namespace

// ---------------------------------------------------------------------------
// X11CaptureService
// ---------------------------------------------------------------------------

X11CaptureService::X11CaptureService() { InitXlib(); }
X11CaptureService::~X11CaptureService() = default;

std::vector<DisplayInfo> X11CaptureService::EnumerateDisplays() {
  std::vector<DisplayInfo> displays;
  Display* dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    MULTICAP_LOG_ERROR("Failed to open X11 display");
    return displays;
  }

  int offset_x = 0;
  for (int scr = 0; scr < ScreenCount(dpy); ++scr) {
    DisplayInfo info;
    info.id = static_cast<uint32_t>(scr);
    info.width = DisplayWidth(dpy, scr);
    info.height = DisplayHeight(dpy, scr);
    info.bounds = Rect{offset_x, 0, info.width, info.height};
    char name[64];
    std::snprintf(name, sizeof(name), "%s.%d", DisplayString(dpy), scr);
    info.name = name;
    offset_x += info.width;
    displays.push_back(info);
  }

  XCloseDisplay(dpy);
  return displays;
}

std::unique_ptr<CaptureStream> X11CaptureService::CreateStream(
    const StreamConfig& config, StreamHandler* handler) {
  if (!handler || config.display.width <= 0 || config.display.height <= 0) {
    return nullptr;
  }
  return std::make_unique<X11CaptureStream>(config, handler);
}

// Factory function.
std::unique_ptr<CaptureService> CreatePlatformCaptureService() {
  return std::make_unique<X11CaptureService>();
}

}  // namespace internal
}  // namespace multicap

#endif  // __linux__
