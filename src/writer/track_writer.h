// Copyright 2026 The multicap Authors
// Common lifecycle of the per-output writers: a state machine that ends in
// exactly one completion.

#ifndef MULTICAP_WRITER_TRACK_WRITER_H_
#define MULTICAP_WRITER_TRACK_WRITER_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace multicap {
namespace internal {

/// Writer lifecycle.
///
///   NotStarted --first sample--> Writing --duration / finish--> Finishing
///   Finishing --sink finalized--> Finished | Failed
///   NotStarted --finish--> Failed (no samples written)
enum class WriterState {
  kNotStarted = 0,
  kWriting = 1,
  kFinishing = 2,
  kFinished = 3,
  kFailed = 4,
};

const char* WriterStateName(WriterState state);

/// Outcome reported once by a writer.
struct WriterResult {
  bool ok = false;
  bool no_samples = false;  // Finished before any sample arrived
  std::string path;
  std::string error;
  int64_t samples_written = 0;  // Frames (video) or buffers (audio)
  int64_t samples_dropped = 0;
  double duration_seconds = 0.0;  // Last retimed timestamp written
};

/// Base for VideoTrackWriter and AudioTrackWriter.
///
/// Owns the completion slot: Complete() may be called from any thread, any
/// number of times; only the first call records a result and runs the
/// callback.
class TrackWriter {
 public:
  using CompletionCallback = std::function<void(const WriterResult& result)>;

  virtual ~TrackWriter() = default;

  // Non-copyable.
  TrackWriter(const TrackWriter&) = delete;
  TrackWriter& operator=(const TrackWriter&) = delete;

  /// Install the completion callback. If the writer already completed the
  /// callback runs immediately on the calling thread.
  void SetCompletionCallback(CompletionCallback callback);

  /// Request that every track stop accepting samples and the file be
  /// finalized. Idempotent; safe concurrently with appends.
  virtual void FinishAllTracks() = 0;

  /// Block until completion or timeout.
  /// @return true if the writer completed.
  bool WaitForCompletion(std::chrono::milliseconds timeout) const;

  bool IsComplete() const;

  /// Valid once IsComplete() is true.
  WriterResult result() const;

  const std::string& path() const { return path_; }

 protected:
  explicit TrackWriter(std::string path) : path_(std::move(path)) {}

  /// Record the outcome and fire the callback (first call only).
  void Complete(WriterResult result);

 private:
  const std::string path_;

  mutable std::mutex completion_mutex_;
  mutable std::condition_variable completion_cv_;
  bool completed_ = false;
  WriterResult result_;
  CompletionCallback callback_;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_WRITER_TRACK_WRITER_H_
