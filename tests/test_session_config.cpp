// Copyright 2026 The multicap Authors
// Tests for: ParseCommandLine, ApplySetting, LoadSettingsFile,
//            ValidateConfig, ErrorPolicy

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "gtest/gtest.h"
#include "core/capture_types.h"
#include "session/session_config.h"

namespace multicap {
namespace internal {
namespace {

class ParseCommandLineTest : public ::testing::Test {
 protected:
  ParseOutcome Parse(std::vector<std::string> args) {
    args_ = std::move(args);
    args_.insert(args_.begin(), "multicap");
    argv_.clear();
    for (auto& arg : args_) argv_.push_back(&arg[0]);
    argv_.push_back(nullptr);
    out_.str("");
    err_.str("");
    return ParseCommandLine(static_cast<int>(args_.size()), argv_.data(),
                            &config_, out_, err_);
  }

  std::string WriteSettings(const std::string& name,
                            const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream file(path);
    file << contents;
    return path;
  }

  SessionConfig config_;
  std::vector<std::string> args_;
  std::vector<char*> argv_;
  std::ostringstream out_;
  std::ostringstream err_;
};

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------

TEST(SessionConfigTest, Defaults) {
  SessionConfig config;
  EXPECT_DOUBLE_EQ(config.frame_rate, 1.0);
  EXPECT_EQ(config.duration_ns(), 0);
  EXPECT_TRUE(config.audio);
  EXPECT_EQ(config.audio_mode, kMultiCapAudioSeparateTracks);
  EXPECT_EQ(config.bitrate, 4000000);
  EXPECT_EQ(config.max_restarts, 5);
  EXPECT_EQ(config.on_device_change, DeviceChangePolicy::kRestart);
  EXPECT_EQ(config.recoverable_errors.size(), 3u);
}

TEST(SessionConfigTest, DurationNanoseconds) {
  SessionConfig config;
  config.length_seconds = 2.5;
  EXPECT_EQ(config.duration_ns(), 2500000000LL);
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

TEST_F(ParseCommandLineTest, BaseNameOnly) {
  EXPECT_EQ(Parse({"recording"}), ParseOutcome::kRun);
  EXPECT_EQ(config_.output_base, "recording");
}

TEST_F(ParseCommandLineTest, ShortAndLongOptions) {
  EXPECT_EQ(Parse({"-r", "2", "--length", "5", "--no-audio", "-b", "8000000",
                   "out"}),
            ParseOutcome::kRun);
  EXPECT_DOUBLE_EQ(config_.frame_rate, 2.0);
  EXPECT_DOUBLE_EQ(config_.length_seconds, 5.0);
  EXPECT_FALSE(config_.audio);
  EXPECT_EQ(config_.bitrate, 8000000);
  EXPECT_EQ(config_.output_base, "out");
}

TEST_F(ParseCommandLineTest, MaskIsRepeatable) {
  EXPECT_EQ(Parse({"-m", "Slack", "--mask", "1Password", "out"}),
            ParseOutcome::kRun);
  EXPECT_EQ(config_.mask_apps,
            (std::vector<std::string>{"Slack", "1Password"}));
}

TEST_F(ParseCommandLineTest, AudioModeAndRestarts) {
  EXPECT_EQ(Parse({"--audio-mode", "merged", "--max-restarts", "9", "out"}),
            ParseOutcome::kRun);
  EXPECT_EQ(config_.audio_mode, kMultiCapAudioMergedStereo);
  EXPECT_EQ(config_.max_restarts, 9);
}

TEST_F(ParseCommandLineTest, VerboseEnablesDebugLogging) {
  EXPECT_EQ(Parse({"-v", "out"}), ParseOutcome::kRun);
  EXPECT_EQ(config_.log_level, kMultiCapLogDebug);
}

TEST_F(ParseCommandLineTest, HelpPrintsUsage) {
  EXPECT_EQ(Parse({"--help"}), ParseOutcome::kExitSuccess);
  EXPECT_NE(out_.str().find("Usage: multicap"), std::string::npos);
}

TEST_F(ParseCommandLineTest, VersionPrintsVersion) {
  EXPECT_EQ(Parse({"--version"}), ParseOutcome::kExitSuccess);
  EXPECT_NE(out_.str().find(MULTICAP_VERSION_STRING), std::string::npos);
}

TEST_F(ParseCommandLineTest, MissingBaseNameIsUsageError) {
  EXPECT_EQ(Parse({"-r", "2"}), ParseOutcome::kExitError);
  EXPECT_NE(err_.str().find("missing output base"), std::string::npos);
}

TEST_F(ParseCommandLineTest, UnknownOptionIsUsageError) {
  EXPECT_EQ(Parse({"--bogus", "out"}), ParseOutcome::kExitError);
  EXPECT_FALSE(err_.str().empty());
}

TEST_F(ParseCommandLineTest, BadFrameRateIsUsageError) {
  EXPECT_EQ(Parse({"-r", "fast", "out"}), ParseOutcome::kExitError);
  EXPECT_EQ(Parse({"-r", "0", "out"}), ParseOutcome::kExitError);
}

TEST_F(ParseCommandLineTest, NegativeLengthIsUsageError) {
  EXPECT_EQ(Parse({"-l", "-3", "out"}), ParseOutcome::kExitError);
}

TEST_F(ParseCommandLineTest, ExtraArgumentIsUsageError) {
  EXPECT_EQ(Parse({"one", "two"}), ParseOutcome::kExitError);
}

TEST_F(ParseCommandLineTest, CommandLineOverridesSettingsFile) {
  std::string path = WriteSettings("multicap_cli.conf",
                                   "# recorder settings\n"
                                   "frame_rate = 5\n"
                                   "length = 60   # one minute\n"
                                   "mask = Slack, Signal\n"
                                   "on_device_change = stop\n");
  EXPECT_EQ(Parse({"--config", path, "-r", "2", "out"}), ParseOutcome::kRun);
  EXPECT_DOUBLE_EQ(config_.frame_rate, 2.0);
  EXPECT_DOUBLE_EQ(config_.length_seconds, 60.0);
  EXPECT_EQ(config_.mask_apps, (std::vector<std::string>{"Slack", "Signal"}));
  EXPECT_EQ(config_.on_device_change, DeviceChangePolicy::kStop);
  std::remove(path.c_str());
}

TEST_F(ParseCommandLineTest, MissingSettingsFileIsUsageError) {
  EXPECT_EQ(Parse({"--config", "/nonexistent/multicap.conf", "out"}),
            ParseOutcome::kExitError);
}

TEST_F(ParseCommandLineTest, ParsingCanRepeat) {
  EXPECT_EQ(Parse({"-r", "3", "first"}), ParseOutcome::kRun);
  config_ = SessionConfig();
  EXPECT_EQ(Parse({"-r", "4", "second"}), ParseOutcome::kRun);
  EXPECT_DOUBLE_EQ(config_.frame_rate, 4.0);
  EXPECT_EQ(config_.output_base, "second");
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

TEST(ApplySettingTest, KnownKeys) {
  SessionConfig config;
  std::string error;
  EXPECT_TRUE(ApplySetting("audio", "off", &config, &error));
  EXPECT_FALSE(config.audio);
  EXPECT_TRUE(ApplySetting("hardware_encoder", "yes", &config, &error));
  EXPECT_TRUE(config.hardware_encoder);
  EXPECT_TRUE(ApplySetting("mask_interval_ms", "250", &config, &error));
  EXPECT_EQ(config.mask_interval_ms, 250);
  EXPECT_TRUE(ApplySetting("restart_delay_ms", "0", &config, &error));
  EXPECT_EQ(config.restart_delay_ms, 0);
  EXPECT_TRUE(ApplySetting("log_level", "WARN", &config, &error));
  EXPECT_EQ(config.log_level, kMultiCapLogWarn);
  EXPECT_TRUE(ApplySetting("audio_mode", "stereo", &config, &error));
  EXPECT_EQ(config.audio_mode, kMultiCapAudioMergedStereo);
}

TEST(ApplySettingTest, RecoverableErrors) {
  SessionConfig config;
  std::string error;
  ASSERT_TRUE(ApplySetting("recoverable_errors", "x11:2, pulseaudio:7",
                           &config, &error));
  ASSERT_EQ(config.recoverable_errors.size(), 2u);
  EXPECT_EQ(config.recoverable_errors[1].domain, "pulseaudio");
  EXPECT_EQ(config.recoverable_errors[1].code, 7);

  EXPECT_FALSE(ApplySetting("recoverable_errors", "x11", &config, &error));
}

TEST(ApplySettingTest, RejectsBadInput) {
  SessionConfig config;
  std::string error;
  EXPECT_FALSE(ApplySetting("frame_rat", "1", &config, &error));
  EXPECT_NE(error.find("unknown setting"), std::string::npos);
  EXPECT_FALSE(ApplySetting("bitrate", "-1", &config, &error));
  EXPECT_FALSE(ApplySetting("max_restarts", "many", &config, &error));
  EXPECT_FALSE(ApplySetting("on_device_change", "ignore", &config, &error));
  EXPECT_FALSE(ApplySetting("audio", "maybe", &config, &error));
}

TEST(LoadSettingsFileTest, ReportsLineOfError) {
  std::string path = ::testing::TempDir() + "multicap_bad.conf";
  {
    std::ofstream file(path);
    file << "frame_rate = 2\n\nnot a setting\n";
  }
  SessionConfig config;
  std::string error;
  EXPECT_FALSE(LoadSettingsFile(path, &config, &error));
  EXPECT_NE(error.find(":3:"), std::string::npos);
  std::remove(path.c_str());
}

TEST(ValidateConfigTest, FrameRateBounds) {
  SessionConfig config;
  config.output_base = "out";
  std::string error;
  EXPECT_TRUE(ValidateConfig(config, &error));
  config.frame_rate = 240;
  EXPECT_TRUE(ValidateConfig(config, &error));
  config.frame_rate = 241;
  EXPECT_FALSE(ValidateConfig(config, &error));
}

// ---------------------------------------------------------------------------
// ErrorPolicy
// ---------------------------------------------------------------------------

TEST(ErrorPolicyTest, DefaultTable) {
  ErrorPolicy policy;
  EXPECT_TRUE(policy.IsRecoverable(StreamError{"x11", 2, ""}));
  EXPECT_TRUE(policy.IsRecoverable(StreamError{"pulseaudio", 11, ""}));
  EXPECT_TRUE(policy.IsRecoverable(StreamError{"pulseaudio", 12, ""}));
  EXPECT_FALSE(policy.IsRecoverable(StreamError{"x11", 1, ""}));
  EXPECT_FALSE(policy.IsRecoverable(StreamError{"pulse", 11, ""}));
}

TEST(ErrorPolicyTest, ClassifyWrapsError) {
  ErrorPolicy policy(std::vector<StreamErrorCode>{{"custom", 5}});
  StreamEvent recoverable = policy.Classify(StreamError{"custom", 5, "m"});
  ASSERT_TRUE(std::holds_alternative<RecoverableErrorEvent>(recoverable));
  EXPECT_EQ(std::get<RecoverableErrorEvent>(recoverable).error.message, "m");

  StreamEvent fatal = policy.Classify(StreamError{"x11", 2, ""});
  EXPECT_TRUE(std::holds_alternative<FatalErrorEvent>(fatal));
}

TEST(ErrorPolicyTest, ParseCodeList) {
  std::vector<StreamErrorCode> codes;
  EXPECT_TRUE(ErrorPolicy::ParseCodeList("", &codes));
  EXPECT_TRUE(codes.empty());
  EXPECT_TRUE(ErrorPolicy::ParseCodeList(" a:1 ,b:-2", &codes));
  ASSERT_EQ(codes.size(), 2u);
  EXPECT_EQ(codes[1].code, -2);
  EXPECT_FALSE(ErrorPolicy::ParseCodeList("a:1,,b:2", &codes));
  EXPECT_FALSE(ErrorPolicy::ParseCodeList(":1", &codes));
  EXPECT_FALSE(ErrorPolicy::ParseCodeList("a:x", &codes));
}

}  // namespace
}  // namespace internal
}  // namespace multicap
