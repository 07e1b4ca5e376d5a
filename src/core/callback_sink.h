// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_CALLBACK_SINK_H_
#define MULTICAP_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "multicap/multicap.h"

namespace multicap {
namespace internal {

/// Custom spdlog sink that forwards log messages to a user-defined C callback.
///
/// Thread safety: inherits from base_sink which is guarded by Mutex.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// Set the user callback and optional userdata pointer.
  /// Passing nullptr as callback disables forwarding.
  void SetCallback(multicap_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(spdlog::sinks::base_sink<std::mutex>::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t formatted;
    spdlog::sinks::base_sink<std::mutex>::formatter_->format(msg, formatted);
    std::string text(formatted.data(), formatted.size());

    callback_(MapLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  static MultiCapLogLevel MapLevel(spdlog::level::level_enum lvl) {
    switch (lvl) {
      case spdlog::level::trace:    return kMultiCapLogTrace;
      case spdlog::level::debug:    return kMultiCapLogDebug;
      case spdlog::level::info:     return kMultiCapLogInfo;
      case spdlog::level::warn:     return kMultiCapLogWarn;
      case spdlog::level::err:      return kMultiCapLogError;
      case spdlog::level::critical: return kMultiCapLogFatal;
      case spdlog::level::off:      return kMultiCapLogFatal;
      default:                      return kMultiCapLogInfo;
    }
  }

  multicap_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_CALLBACK_SINK_H_
