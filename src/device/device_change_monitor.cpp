// Copyright 2026 The multicap Authors

#include "device/device_change_monitor.h"

#include <utility>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

const char* SideName(DeviceSide side) {
  return side == DeviceSide::kInput ? "input" : "output";
}

}  // namespace

DeviceChangeMonitor::DeviceChangeMonitor(AudioDeviceBackend* backend,
                                         RestartCallback on_change)
    : backend_(backend), on_change_(std::move(on_change)) {}

DeviceChangeMonitor::~DeviceChangeMonitor() { Stop(); }

void DeviceChangeMonitor::Snapshot() {
  std::string input;
  std::string output;
  if (!backend_->GetDefaultDeviceId(DeviceSide::kInput, &input)) {
    input.clear();
  }
  if (!backend_->GetDefaultDeviceId(DeviceSide::kOutput, &output)) {
    output.clear();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  input_id_ = input;
  output_id_ = output;
}

bool DeviceChangeMonitor::Start() {
  if (!backend_) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return true;
  }
  Snapshot();
  if (!backend_->Subscribe(
          [this](DeviceSide side) { OnBackendNotification(side); })) {
    MULTICAP_LOG_WARN("Audio device notifications unavailable");
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = true;
  fired_ = false;
  input_changed_ = false;
  output_changed_ = false;
  MULTICAP_LOG_DEBUG("Monitoring audio devices (input '{}', output '{}')",
                     input_id_, output_id_);
  return true;
}

void DeviceChangeMonitor::Arm() {
  if (!backend_) return;
  Snapshot();
  std::lock_guard<std::mutex> lock(mutex_);
  fired_ = false;
  input_changed_ = false;
  output_changed_ = false;
}

void DeviceChangeMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  backend_->Unsubscribe();
}

void DeviceChangeMonitor::OnBackendNotification(DeviceSide side) {
  std::string current;
  if (!backend_->GetDefaultDeviceId(side, &current)) current.clear();

  bool fire = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    std::string& known = side == DeviceSide::kInput ? input_id_ : output_id_;
    if (current == known) return;

    MULTICAP_LOG_INFO("Default audio {} device changed: '{}' -> '{}'",
                      SideName(side), known, current);
    known = current;
    if (side == DeviceSide::kInput) {
      input_changed_ = true;
    } else {
      output_changed_ = true;
    }
    if (!fired_) {
      fired_ = true;
      fire = true;
    }
  }
  if (fire && on_change_) on_change_();
}

bool DeviceChangeMonitor::input_changed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return input_changed_;
}

bool DeviceChangeMonitor::output_changed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return output_changed_;
}

std::string DeviceChangeMonitor::input_device_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return input_id_;
}

std::string DeviceChangeMonitor::output_device_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return output_id_;
}

}  // namespace internal
}  // namespace multicap
