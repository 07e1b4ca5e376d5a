// Copyright 2026 The multicap Authors

#include "session/session_config.h"

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool ParseDouble(const std::string& text, double* out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  *out = value;
  return true;
}

bool ParseInt(const std::string& text, int* out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  if (value < INT_MIN || value > INT_MAX) return false;
  *out = static_cast<int>(value);
  return true;
}

bool ParseBool(const std::string& text, bool* out) {
  std::string v = ToLower(text);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseAudioMode(const std::string& text, MultiCapAudioMode* out) {
  std::string v = ToLower(text);
  if (v == "separate") {
    *out = kMultiCapAudioSeparateTracks;
    return true;
  }
  if (v == "merged" || v == "stereo") {
    *out = kMultiCapAudioMergedStereo;
    return true;
  }
  return false;
}

// Comma-separated list, empty items dropped.
std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> items;
  std::stringstream stream(text);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = Trim(item);
    if (!item.empty()) items.push_back(item);
  }
  return items;
}

bool InvalidValue(const std::string& key, const std::string& value,
                  std::string* out_error) {
  *out_error = "invalid value '" + value + "' for " + key;
  return false;
}

// Long-only option ids.
enum LongOption {
  kOptNoAudio = 256,
  kOptAudio,
  kOptAudioMode,
  kOptMaxRestarts,
  kOptConfig,
  kOptVersion,
};

const struct option kLongOptions[] = {
    {"frame-rate", required_argument, nullptr, 'r'},
    {"length", required_argument, nullptr, 'l'},
    {"no-audio", no_argument, nullptr, kOptNoAudio},
    {"audio", no_argument, nullptr, kOptAudio},
    {"audio-mode", required_argument, nullptr, kOptAudioMode},
    {"mask", required_argument, nullptr, 'm'},
    {"bitrate", required_argument, nullptr, 'b'},
    {"max-restarts", required_argument, nullptr, kOptMaxRestarts},
    {"config", required_argument, nullptr, kOptConfig},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, kOptVersion},
    {nullptr, 0, nullptr, 0},
};

const char kShortOptions[] = "r:l:m:b:vh";

}  // namespace

bool ApplySetting(const std::string& raw_key, const std::string& raw_value,
                  SessionConfig* config, std::string* out_error) {
  const std::string key = ToLower(Trim(raw_key));
  const std::string value = Trim(raw_value);

  if (key == "frame_rate") {
    if (!ParseDouble(value, &config->frame_rate)) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "length") {
    if (!ParseDouble(value, &config->length_seconds)) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "audio") {
    if (!ParseBool(value, &config->audio)) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "audio_mode") {
    if (!ParseAudioMode(value, &config->audio_mode)) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "bitrate") {
    if (!ParseInt(value, &config->bitrate) || config->bitrate <= 0) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "hardware_encoder") {
    if (!ParseBool(value, &config->hardware_encoder)) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "mask") {
    for (auto& app : SplitList(value)) config->mask_apps.push_back(app);
  } else if (key == "mask_interval_ms") {
    if (!ParseInt(value, &config->mask_interval_ms) ||
        config->mask_interval_ms < 0) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "max_restarts") {
    if (!ParseInt(value, &config->max_restarts) || config->max_restarts < 0) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "restart_delay_ms") {
    if (!ParseInt(value, &config->restart_delay_ms) ||
        config->restart_delay_ms < 0) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "audio_drain_timeout_ms") {
    if (!ParseInt(value, &config->audio_drain_timeout_ms) ||
        config->audio_drain_timeout_ms <= 0) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "video_drain_timeout_ms") {
    if (!ParseInt(value, &config->video_drain_timeout_ms) ||
        config->video_drain_timeout_ms <= 0) {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "recoverable_errors") {
    std::vector<StreamErrorCode> codes;
    if (!ErrorPolicy::ParseCodeList(value, &codes)) {
      return InvalidValue(key, value, out_error);
    }
    config->recoverable_errors = std::move(codes);
  } else if (key == "on_device_change") {
    std::string v = ToLower(value);
    if (v == "restart") {
      config->on_device_change = DeviceChangePolicy::kRestart;
    } else if (v == "stop") {
      config->on_device_change = DeviceChangePolicy::kStop;
    } else {
      return InvalidValue(key, value, out_error);
    }
  } else if (key == "log_level") {
    if (!ParseLogLevel(ToLower(value).c_str(), &config->log_level)) {
      return InvalidValue(key, value, out_error);
    }
  } else {
    *out_error = "unknown setting '" + key + "'";
    return false;
  }
  return true;
}

bool LoadSettingsFile(const std::string& path, SessionConfig* config,
                      std::string* out_error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    *out_error = "cannot open settings file " + path;
    return false;
  }

  std::string line;
  int line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = Trim(line);
    if (line.empty()) continue;

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      *out_error = path + ":" + std::to_string(line_number) +
                   ": expected 'key = value'";
      return false;
    }
    std::string error;
    if (!ApplySetting(line.substr(0, eq), line.substr(eq + 1), config,
                      &error)) {
      *out_error = path + ":" + std::to_string(line_number) + ": " + error;
      return false;
    }
  }
  return true;
}

bool ValidateConfig(const SessionConfig& config, std::string* out_error) {
  if (config.output_base.empty()) {
    *out_error = "missing output base name";
    return false;
  }
  if (!(config.frame_rate > 0) || config.frame_rate > 240) {
    *out_error = "frame rate must be in (0, 240]";
    return false;
  }
  if (config.length_seconds < 0) {
    *out_error = "length must not be negative";
    return false;
  }
  return true;
}

std::string UsageText(const char* program) {
  std::string text = "Usage: ";
  text += program ? program : "multicap";
  text +=
      " [options] <output-base>\n"
      "\n"
      "Record every display to <output-base>_<id>.mp4 (or <output-base>.mp4\n"
      "with a single display) and system audio + microphone to\n"
      "<output-base>.m4a.\n"
      "\n"
      "Options:\n"
      "  -r, --frame-rate HZ     Frames per second (default 1)\n"
      "  -l, --length SECONDS    Recording length (default: until Ctrl-C)\n"
      "      --no-audio          Do not record audio\n"
      "      --audio-mode MODE   separate (two mono tracks, default) or\n"
      "                          merged (one stereo track)\n"
      "  -m, --mask APP          Black out windows of APP (repeatable)\n"
      "  -b, --bitrate BPS       Video bitrate (default 4000000)\n"
      "      --max-restarts N    Give up after N stream restarts (default 5)\n"
      "      --config FILE       Read settings from FILE first\n"
      "  -v, --verbose           Log per-frame and per-second audio activity\n"
      "  -h, --help              Show this help\n"
      "      --version           Show version\n";
  return text;
}

ParseOutcome ParseCommandLine(int argc, char** argv, SessionConfig* config,
                              std::ostream& out, std::ostream& err) {
  const char* program = argc > 0 ? argv[0] : "multicap";

  // First pass: collect options so the settings file can be applied before
  // any of them.
  std::vector<std::pair<int, std::string>> options;
  std::string config_path;

  optind = 0;  // Full re-initialization (glibc), so parsing can repeat.
  opterr = 0;
  int opt;
  while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions,
                            nullptr)) != -1) {
    switch (opt) {
      case 'h':
        out << UsageText(program);
        return ParseOutcome::kExitSuccess;
      case kOptVersion:
        out << "multicap " << multicap_version_string() << "\n";
        return ParseOutcome::kExitSuccess;
      case kOptConfig:
        config_path = optarg;
        break;
      case '?':
        if (optopt != 0 && optopt < 256) {
          err << program << ": invalid option or missing argument '-"
              << static_cast<char>(optopt) << "'\n";
        } else {
          err << program << ": invalid option '" << argv[optind - 1]
              << "'\n";
        }
        err << UsageText(program);
        return ParseOutcome::kExitError;
      default:
        options.emplace_back(opt, optarg ? optarg : "");
        break;
    }
  }

  if (!config_path.empty()) {
    std::string error;
    if (!LoadSettingsFile(config_path, config, &error)) {
      err << program << ": " << error << "\n";
      return ParseOutcome::kExitError;
    }
  }

  for (const auto& option : options) {
    std::string error;
    bool ok = true;
    switch (option.first) {
      case 'r':
        ok = ApplySetting("frame_rate", option.second, config, &error);
        break;
      case 'l':
        ok = ApplySetting("length", option.second, config, &error);
        break;
      case kOptNoAudio:
        config->audio = false;
        break;
      case kOptAudio:
        config->audio = true;
        break;
      case kOptAudioMode:
        ok = ApplySetting("audio_mode", option.second, config, &error);
        break;
      case 'm':
        config->mask_apps.push_back(option.second);
        break;
      case 'b':
        ok = ApplySetting("bitrate", option.second, config, &error);
        break;
      case kOptMaxRestarts:
        ok = ApplySetting("max_restarts", option.second, config, &error);
        break;
      case 'v':
        config->log_level = kMultiCapLogDebug;
        break;
      default:
        break;
    }
    if (!ok) {
      err << program << ": " << error << "\n";
      return ParseOutcome::kExitError;
    }
  }

  if (optind < argc) config->output_base = argv[optind++];
  if (optind < argc) {
    err << program << ": unexpected argument '" << argv[optind] << "'\n";
    return ParseOutcome::kExitError;
  }

  std::string error;
  if (!ValidateConfig(*config, &error)) {
    err << program << ": " << error << "\n" << UsageText(program);
    return ParseOutcome::kExitError;
  }
  return ParseOutcome::kRun;
}

}  // namespace internal
}  // namespace multicap
