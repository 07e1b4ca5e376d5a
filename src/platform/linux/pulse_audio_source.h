// Copyright 2026 The multicap Authors
// Linux audio capture: one PulseAudio record stream per source.

#ifndef MULTICAP_PLATFORM_LINUX_PULSE_AUDIO_SOURCE_H_
#define MULTICAP_PLATFORM_LINUX_PULSE_AUDIO_SOURCE_H_

#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "core/capture_types.h"

struct pa_simple;

namespace multicap {
namespace internal {

/// Records 32-bit float mono PCM from either the default sink monitor
/// (system audio) or the default source (microphone) on its own thread.
class PulseAudioSource {
 public:
  using SampleCallback = std::function<void(AudioSample sample)>;
  using ErrorCallback = std::function<void(const StreamError& error)>;

  PulseAudioSource(AudioSource source, int sample_rate);
  ~PulseAudioSource();

  // Non-copyable.
  PulseAudioSource(const PulseAudioSource&) = delete;
  PulseAudioSource& operator=(const PulseAudioSource&) = delete;

  /// Connect to the sound server.
  bool Open(StreamError* out_error);

  /// Start the read loop. After an error the loop reports it once and ends.
  bool Start(SampleCallback on_sample, ErrorCallback on_error);

  /// Stop and join the read loop. Idempotent.
  void Stop();

 private:
  void ReadLoop();

  const AudioSource source_;
  const int sample_rate_;

  pa_simple* pa_simple_ = nullptr;
  SampleCallback on_sample_;
  ErrorCallback on_error_;
  std::atomic<bool> capturing_{false};
  std::thread capture_thread_;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_PLATFORM_LINUX_PULSE_AUDIO_SOURCE_H_
