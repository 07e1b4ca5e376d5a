// Copyright 2026 The multicap Authors

#ifndef MULTICAP_PLATFORM_LINUX_X11_CAPTURE_SERVICE_H_
#define MULTICAP_PLATFORM_LINUX_X11_CAPTURE_SERVICE_H_

#include <memory>
#include <vector>

#include "core/capture_service.h"

namespace multicap {
namespace internal {

/// Linux capture service: X11 frame grabs (XGetImage on each screen root)
/// and PulseAudio record streams.
///
/// Every X screen is one display. Screens are laid out left to right in
/// global coordinates, matching X11WindowListProvider.
class X11CaptureService : public CaptureService {
 public:
  X11CaptureService();
  ~X11CaptureService() override;

  std::vector<DisplayInfo> EnumerateDisplays() override;
  std::unique_ptr<CaptureStream> CreateStream(const StreamConfig& config,
                                              StreamHandler* handler) override;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_PLATFORM_LINUX_X11_CAPTURE_SERVICE_H_
