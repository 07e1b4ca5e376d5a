// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_LOGGER_H_
#define MULTICAP_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "multicap/multicap.h"

namespace multicap {
namespace internal {

class CallbackSink;

/// Initialize the global multicap logger (stderr + optional callback sink).
/// Safe to call multiple times; subsequent calls are no-ops.
void InitLogger();

/// Get the global multicap spdlog logger instance.
std::shared_ptr<spdlog::logger> GetLogger();

/// Get the global callback sink (used to register/unregister user callback).
std::shared_ptr<CallbackSink> GetCallbackSink();

/// Set the global log level.
void SetLogLevel(MultiCapLogLevel level);

/// Map MultiCapLogLevel to spdlog::level::level_enum.
spdlog::level::level_enum ToSpdlogLevel(MultiCapLogLevel level);

/// Parse "trace", "debug", "info", "warn", "error" or "fatal".
/// Returns false (and leaves *out_level untouched) on unknown names.
bool ParseLogLevel(const char* name, MultiCapLogLevel* out_level);

}  // namespace internal
}  // namespace multicap

// ---------------------------------------------------------------------------
// Convenience macros (internal use only).
// ---------------------------------------------------------------------------

#define MULTICAP_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::multicap::internal::GetLogger(), __VA_ARGS__)
#define MULTICAP_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::multicap::internal::GetLogger(), __VA_ARGS__)
#define MULTICAP_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::multicap::internal::GetLogger(), __VA_ARGS__)
#define MULTICAP_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::multicap::internal::GetLogger(), __VA_ARGS__)
#define MULTICAP_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::multicap::internal::GetLogger(), __VA_ARGS__)
#define MULTICAP_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::multicap::internal::GetLogger(), __VA_ARGS__)

#endif  // MULTICAP_CORE_LOGGER_H_
