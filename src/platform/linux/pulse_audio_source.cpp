// Copyright 2026 The multicap Authors
// Linux audio capture -- PulseAudio Simple API implementation.

#include "platform/linux/pulse_audio_source.h"

#include <chrono>
#include <utility>
#include <vector>

#include "core/logger.h"

#include <pulse/error.h>
#include <pulse/simple.h>

namespace multicap {
namespace internal {

namespace {

constexpr char kPulseDomain[] = "pulseaudio";
constexpr char kApplicationName[] = "multicap";
constexpr char kSystemDevice[] = "@DEFAULT_MONITOR@";

int64_t MonotonicNowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace

PulseAudioSource::PulseAudioSource(AudioSource source, int sample_rate)
    : source_(source), sample_rate_(sample_rate > 0 ? sample_rate : 48000) {}

PulseAudioSource::~PulseAudioSource() {
  Stop();
  if (pa_simple_) {
    pa_simple_free(pa_simple_);
    pa_simple_ = nullptr;
  }
}

bool PulseAudioSource::Open(StreamError* out_error) {
  if (pa_simple_) return true;

  pa_sample_spec spec = {};
  spec.format = PA_SAMPLE_FLOAT32LE;
  spec.rate = static_cast<uint32_t>(sample_rate_);
  spec.channels = 1;

  // 10 ms fragments keep timestamps fine-grained.
  pa_buffer_attr attr;
  attr.maxlength = static_cast<uint32_t>(-1);
  attr.tlength = static_cast<uint32_t>(-1);
  attr.prebuf = static_cast<uint32_t>(-1);
  attr.minreq = static_cast<uint32_t>(-1);
  attr.fragsize =
      static_cast<uint32_t>(sample_rate_ / 100 * sizeof(float));

  // nullptr = PulseAudio default source (microphone)
  const char* device =
      source_ == AudioSource::kSystem ? kSystemDevice : nullptr;

  int error = 0;
  pa_simple_ = pa_simple_new(nullptr,                 // default server
                             kApplicationName,        // application name
                             PA_STREAM_RECORD,        // direction
                             device,                  // device
                             AudioSourceName(source_),  // stream name
                             &spec,                   // sample format
                             nullptr,                 // default channel map
                             &attr,                   // buffer attributes
                             &error);
  if (!pa_simple_) {
    MULTICAP_LOG_ERROR("PulseAudio connection for {} audio failed: {}",
                       AudioSourceName(source_), pa_strerror(error));
    if (out_error) {
      out_error->domain = kPulseDomain;
      out_error->code = error;
      out_error->message = pa_strerror(error);
    }
    return false;
  }

  MULTICAP_LOG_DEBUG("PulseAudio {} audio opened: {}Hz mono, device={}",
                     AudioSourceName(source_), sample_rate_,
                     device ? device : "default");
  return true;
}

bool PulseAudioSource::Start(SampleCallback on_sample,
                             ErrorCallback on_error) {
  if (!pa_simple_) return false;
  if (capturing_.load()) return true;

  on_sample_ = std::move(on_sample);
  on_error_ = std::move(on_error);
  capturing_.store(true, std::memory_order_release);
  capture_thread_ = std::thread(&PulseAudioSource::ReadLoop, this);
  return true;
}

void PulseAudioSource::Stop() {
  capturing_.store(false, std::memory_order_release);
  if (capture_thread_.joinable()) {
    capture_thread_.join();
  }
}

void PulseAudioSource::ReadLoop() {
  // Read buffer: 10ms of audio at a time.
  const size_t frames_per_read = static_cast<size_t>(sample_rate_ / 100);
  const int64_t read_duration_ns =
      static_cast<int64_t>(frames_per_read) * 1000000000LL / sample_rate_;

  while (capturing_.load(std::memory_order_acquire)) {
    AudioSample sample;
    sample.source = source_;
    sample.sample_rate = sample_rate_;
    sample.channels = 1;
    sample.data.resize(frames_per_read);

    int error = 0;
    int ret = pa_simple_read(pa_simple_, sample.data.data(),
                             sample.data.size() * sizeof(float), &error);
    if (ret < 0) {
      if (!capturing_.load(std::memory_order_acquire)) break;
      MULTICAP_LOG_ERROR("pa_simple_read ({}) failed: {}",
                         AudioSourceName(source_), pa_strerror(error));
      if (on_error_) {
        StreamError stream_error;
        stream_error.domain = kPulseDomain;
        stream_error.code = error;
        stream_error.message = pa_strerror(error);
        on_error_(stream_error);
      }
      break;
    }

    // The read returns once the last frame arrived.
    sample.pts_ns = MonotonicNowNs() - read_duration_ns;
    if (on_sample_) on_sample_(std::move(sample));
  }
}

}  // namespace internal
}  // namespace multicap
