// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_AUDIO_DEVICE_BACKEND_H_
#define MULTICAP_CORE_AUDIO_DEVICE_BACKEND_H_

#include <functional>
#include <memory>
#include <string>

namespace multicap {
namespace internal {

/// Which default device a query or notification refers to.
enum class DeviceSide {
  kInput = 0,   // Default microphone (source)
  kOutput = 1,  // Default speakers (sink)
};

/// Descriptive metadata about an audio device.
struct AudioDeviceInfo {
  std::string id;           // Platform device id (PulseAudio name)
  std::string name;         // Human-readable description
  std::string driver;       // e.g. "module-alsa-card.c"
  std::string form_factor;  // e.g. "internal", "headset", "webcam"
};

/// Abstract interface for querying and watching default audio devices.
///
/// Linux: PulseAudio context API (server info + subscription).
class AudioDeviceBackend {
 public:
  using ChangeCallback = std::function<void(DeviceSide side)>;

  virtual ~AudioDeviceBackend() = default;

  // Non-copyable.
  AudioDeviceBackend(const AudioDeviceBackend&) = delete;
  AudioDeviceBackend& operator=(const AudioDeviceBackend&) = delete;

  /// Current default device id for one side.
  /// @return false if there is no default device or the query failed.
  virtual bool GetDefaultDeviceId(DeviceSide side, std::string* out_id) = 0;

  /// Metadata for the current default device of one side.
  virtual bool GetDefaultDeviceInfo(DeviceSide side,
                                    AudioDeviceInfo* out_info) = 0;

  /// Register for "default device may have changed" notifications.
  /// Notifications can be spurious. Only one subscription is active at a
  /// time; subscribing again replaces the callback.
  /// @return false if the notification service is unavailable.
  virtual bool Subscribe(ChangeCallback callback) = 0;

  /// Remove the subscription. No callback runs after this returns.
  virtual void Unsubscribe() = 0;

 protected:
  AudioDeviceBackend() = default;
};

/// Factory function: returns the platform-native device backend, or
/// nullptr when no sound server is reachable.
std::unique_ptr<AudioDeviceBackend> CreatePlatformAudioDeviceBackend();

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_AUDIO_DEVICE_BACKEND_H_
