// Copyright 2026 The multicap Authors

#ifndef MULTICAP_DEVICE_DEVICE_CHANGE_MONITOR_H_
#define MULTICAP_DEVICE_DEVICE_CHANGE_MONITOR_H_

#include <functional>
#include <mutex>
#include <string>

#include "core/audio_device_backend.h"

namespace multicap {
namespace internal {

/// Watches the default input and output devices and asks for a restart when
/// either one changes.
///
/// The restart request fires at most once per armed period; Arm() starts a
/// new period with a fresh snapshot. Backend notifications that leave the
/// device id unchanged are ignored.
class DeviceChangeMonitor {
 public:
  using RestartCallback = std::function<void()>;

  /// Does NOT take ownership of backend.
  DeviceChangeMonitor(AudioDeviceBackend* backend, RestartCallback on_change);
  ~DeviceChangeMonitor();

  // Non-copyable.
  DeviceChangeMonitor(const DeviceChangeMonitor&) = delete;
  DeviceChangeMonitor& operator=(const DeviceChangeMonitor&) = delete;

  /// Snapshot the current defaults and subscribe.
  /// @return false if notifications are unavailable (the session continues
  ///         without device monitoring).
  bool Start();

  /// New capture attempt: re-snapshot and clear the changed flags.
  void Arm();

  /// Unsubscribe. Idempotent.
  void Stop();

  bool input_changed() const;
  bool output_changed() const;

  /// Device ids captured by the last snapshot (empty if none).
  std::string input_device_id() const;
  std::string output_device_id() const;

 private:
  void Snapshot();
  void OnBackendNotification(DeviceSide side);

  AudioDeviceBackend* backend_;  // Non-owning
  RestartCallback on_change_;

  mutable std::mutex mutex_;
  bool running_ = false;
  bool fired_ = false;
  bool input_changed_ = false;
  bool output_changed_ = false;
  std::string input_id_;
  std::string output_id_;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_DEVICE_DEVICE_CHANGE_MONITOR_H_
