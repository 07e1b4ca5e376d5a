// Copyright 2026 The multicap Authors

#include "core/capture_types.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <utility>

namespace multicap {
namespace internal {

// Codes reported by the Linux backends (see platform/linux).
// x11:2         frame grabs kept failing (mode switch, screen lock)
// pulseaudio:11 PA_ERR_CONNECTIONTERMINATED, sound server restarted
// pulseaudio:12 PA_ERR_KILLED, stream killed by the server
static constexpr int kX11GrabFailed = 2;
static constexpr int kPaConnectionTerminated = 11;
static constexpr int kPaKilled = 12;

const char* AudioSourceName(AudioSource source) {
  switch (source) {
    case AudioSource::kSystem:     return "system";
    case AudioSource::kMicrophone: return "microphone";
  }
  return "unknown";
}

ErrorPolicy::ErrorPolicy() : recoverable_(DefaultRecoverable()) {}

ErrorPolicy::ErrorPolicy(std::vector<StreamErrorCode> recoverable)
    : recoverable_(std::move(recoverable)) {}

bool ErrorPolicy::IsRecoverable(const StreamError& error) const {
  StreamErrorCode key{error.domain, error.code};
  return std::find(recoverable_.begin(), recoverable_.end(), key) !=
         recoverable_.end();
}

StreamEvent ErrorPolicy::Classify(StreamError error) const {
  if (IsRecoverable(error)) {
    return RecoverableErrorEvent{std::move(error)};
  }
  return FatalErrorEvent{std::move(error)};
}

// static
std::vector<StreamErrorCode> ErrorPolicy::DefaultRecoverable() {
  return {
      {"x11", kX11GrabFailed},
      {"pulseaudio", kPaConnectionTerminated},
      {"pulseaudio", kPaKilled},
  };
}

namespace {

std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return {};
  size_t end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

// static
bool ErrorPolicy::ParseCodeList(const std::string& text,
                                std::vector<StreamErrorCode>* out) {
  if (!out) return false;
  std::vector<StreamErrorCode> parsed;

  size_t pos = 0;
  while (pos <= text.size()) {
    size_t comma = text.find(',', pos);
    if (comma == std::string::npos) comma = text.size();
    std::string item = Trim(text.substr(pos, comma - pos));
    pos = comma + 1;
    if (item.empty()) {
      if (comma == text.size()) break;
      return false;
    }

    size_t colon = item.rfind(':');
    if (colon == std::string::npos || colon == 0 ||
        colon + 1 >= item.size()) {
      return false;
    }
    std::string domain = Trim(item.substr(0, colon));
    std::string number = Trim(item.substr(colon + 1));
    if (domain.empty() || number.empty()) return false;

    char* end = nullptr;
    errno = 0;
    long code = std::strtol(number.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;

    parsed.push_back({domain, static_cast<int>(code)});
  }

  *out = std::move(parsed);
  return true;
}

}  // namespace internal
}  // namespace multicap
