// Copyright 2026 The multicap Authors

#include "core/logger.h"

#include <cstring>
#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace multicap {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    // stdout carries the JSONL event stream, so diagnostics go to stderr.
    auto stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("multicap", sinks);

    // Default pattern: [multicap][level] message
    g_logger->set_pattern("[multicap][%l] %v");

    g_logger->set_level(spdlog::level::info);

    // Flush on warn and above.
    g_logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

void SetLogLevel(MultiCapLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(MultiCapLogLevel level) {
  switch (level) {
    case kMultiCapLogTrace: return spdlog::level::trace;
    case kMultiCapLogDebug: return spdlog::level::debug;
    case kMultiCapLogInfo:  return spdlog::level::info;
    case kMultiCapLogWarn:  return spdlog::level::warn;
    case kMultiCapLogError: return spdlog::level::err;
    case kMultiCapLogFatal: return spdlog::level::critical;
    default:                return spdlog::level::info;
  }
}

bool ParseLogLevel(const char* name, MultiCapLogLevel* out_level) {
  if (!name || !out_level) return false;
  static const struct {
    const char* name;
    MultiCapLogLevel level;
  } kLevels[] = {
      {"trace", kMultiCapLogTrace}, {"debug", kMultiCapLogDebug},
      {"info", kMultiCapLogInfo},   {"warn", kMultiCapLogWarn},
      {"error", kMultiCapLogError}, {"fatal", kMultiCapLogFatal},
  };
  for (const auto& entry : kLevels) {
    if (std::strcmp(name, entry.name) == 0) {
      *out_level = entry.level;
      return true;
    }
  }
  return false;
}

}  // namespace internal
}  // namespace multicap
