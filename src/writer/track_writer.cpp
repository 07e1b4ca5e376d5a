// Copyright 2026 The multicap Authors

#include "writer/track_writer.h"

#include <utility>

namespace multicap {
namespace internal {

const char* WriterStateName(WriterState state) {
  switch (state) {
    case WriterState::kNotStarted: return "not-started";
    case WriterState::kWriting:    return "writing";
    case WriterState::kFinishing:  return "finishing";
    case WriterState::kFinished:   return "finished";
    case WriterState::kFailed:     return "failed";
  }
  return "unknown";
}

void TrackWriter::SetCompletionCallback(CompletionCallback callback) {
  WriterResult result;
  {
    std::lock_guard<std::mutex> lock(completion_mutex_);
    if (!completed_) {
      callback_ = std::move(callback);
      return;
    }
    result = result_;
  }
  if (callback) callback(result);
}

bool TrackWriter::WaitForCompletion(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(completion_mutex_);
  return completion_cv_.wait_for(lock, timeout, [this] { return completed_; });
}

bool TrackWriter::IsComplete() const {
  std::lock_guard<std::mutex> lock(completion_mutex_);
  return completed_;
}

WriterResult TrackWriter::result() const {
  std::lock_guard<std::mutex> lock(completion_mutex_);
  return result_;
}

void TrackWriter::Complete(WriterResult result) {
  CompletionCallback callback;
  {
    std::lock_guard<std::mutex> lock(completion_mutex_);
    if (completed_) return;
    completed_ = true;
    result.path = path_;
    result_ = result;
    callback = std::move(callback_);
    callback_ = nullptr;
  }
  completion_cv_.notify_all();
  if (callback) callback(result);
}

}  // namespace internal
}  // namespace multicap
