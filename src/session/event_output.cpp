// Copyright 2026 The multicap Authors

#include "session/event_output.h"

#include <cmath>
#include <cstdio>

namespace multicap {
namespace internal {

EventOutput::EventOutput(std::ostream* out) : out_(out) {}

std::string EventOutput::Quote(const std::string& value) {
  std::string result;
  result.reserve(value.size() + 2);
  result += '"';
  for (char c : value) {
    switch (c) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n"; break;
      case '\r': result += "\\r"; break;
      case '\t': result += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(c)));
          result += buf;
        } else {
          result += c;
        }
    }
  }
  result += '"';
  return result;
}

std::string EventOutput::FormatNumber(double value) {
  if (!std::isfinite(value)) return "0";
  char buf[32];
  if (value == std::floor(value) && std::fabs(value) < 1e15) {
    std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(value));
  } else {
    std::snprintf(buf, sizeof(buf), "%.6g", value);
  }
  return buf;
}

void EventOutput::EmitVideoDescriptor(const VideoDescriptor& video) {
  std::string line = "{\"type\":\"video\"";
  line += ",\"file\":" + Quote(video.file);
  line += ",\"display_id\":" + std::to_string(video.display_id);
  line += ",\"width\":" + std::to_string(video.width);
  line += ",\"height\":" + std::to_string(video.height);
  line += ",\"x\":" + std::to_string(video.x);
  line += ",\"y\":" + std::to_string(video.y);
  line += ",\"frame_rate\":" + FormatNumber(video.frame_rate);
  line += "}";
  WriteLine(line);
}

void EventOutput::EmitAudioDescriptor(const AudioDescriptor& audio) {
  std::string line = "{\"type\":\"audio\"";
  line += ",\"file\":" + Quote(audio.file);
  line += ",\"sample_rate\":" + std::to_string(audio.sample_rate);
  line += ",\"channels\":" + std::to_string(audio.channels);
  line += ",\"tracks\":[";
  for (size_t i = 0; i < audio.tracks.size(); ++i) {
    if (i > 0) line += ",";
    line += "{\"name\":" + Quote(audio.tracks[i]) + "}";
  }
  line += "]";
  if (!audio.input_device.empty()) {
    line += ",\"input_device\":" + Quote(audio.input_device);
  }
  if (!audio.output_device.empty()) {
    line += ",\"output_device\":" + Quote(audio.output_device);
  }
  line += "}";
  WriteLine(line);
}

void EventOutput::EmitStop(const StopDescriptor& stop) {
  std::string line = "{\"type\":\"stop\"";
  line += ",\"reason\":" + Quote(multicap_stop_reason_name(stop.reason));
  if (stop.reason == kMultiCapStopError) {
    line += ",\"domain\":" + Quote(stop.domain);
    line += ",\"code\":" + std::to_string(stop.code);
  } else if (stop.reason == kMultiCapStopSignal) {
    line += ",\"signal\":" + std::to_string(stop.signal);
  }
  if (stop.restarts > 0) {
    line += ",\"restarts\":" + std::to_string(stop.restarts);
  }
  line += "}";
  WriteLine(line);
}

void EventOutput::WriteLine(const std::string& line) {
  if (!out_) return;
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << line << '\n';
  out_->flush();
}

}  // namespace internal
}  // namespace multicap
