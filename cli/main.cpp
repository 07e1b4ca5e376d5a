// Copyright 2026 The multicap Authors
//
// multicap -- record every display (and system + microphone audio) to
// H.264/AAC files until a duration elapses, a signal arrives or an
// unrecoverable error occurs.

#include <iostream>
#include <memory>
#include <utility>

#include "core/audio_device_backend.h"
#include "core/capture_service.h"
#include "core/logger.h"
#include "core/media_sink.h"
#include "core/window_list_provider.h"
#include "multicap/multicap.h"
#include "session/event_output.h"
#include "session/session_config.h"
#include "session/session_orchestrator.h"

namespace mc = multicap::internal;

int main(int argc, char** argv) {
  mc::InitLogger();

  mc::SessionConfig config;
  switch (mc::ParseCommandLine(argc, argv, &config, std::cout, std::cerr)) {
    case mc::ParseOutcome::kExitSuccess:
      return kMultiCapExitSuccess;
    case mc::ParseOutcome::kExitError:
      return kMultiCapExitUsage;
    case mc::ParseOutcome::kRun:
      break;
  }
  mc::SetLogLevel(config.log_level);

  auto capture_service = mc::CreatePlatformCaptureService();
  auto sink_factory = mc::CreatePlatformMediaSinkFactory();
  if (!capture_service || !sink_factory) {
    MULTICAP_LOG_FATAL("Screen capture is not supported on this platform");
    return kMultiCapExitFailure;
  }

  // Optional services: masking and device watching degrade gracefully.
  std::unique_ptr<mc::WindowListProvider> window_list;
  if (!config.mask_apps.empty()) {
    window_list = mc::CreatePlatformWindowListProvider();
  }
  std::unique_ptr<mc::AudioDeviceBackend> device_backend;
  if (config.audio) {
    device_backend = mc::CreatePlatformAudioDeviceBackend();
  }

  mc::EventOutput events(&std::cout);

  mc::SessionDependencies deps;
  deps.capture_service = capture_service.get();
  deps.sink_factory = sink_factory.get();
  deps.window_list = window_list.get();
  deps.device_backend = device_backend.get();
  deps.events = &events;

  mc::SessionOrchestrator session(std::move(config), deps);
  return session.Run();
}
