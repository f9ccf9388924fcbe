// Repository: Reelforge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by pipeline, encoder workers,
//          sweepers and gRPC handlers, with per-thread job tagging.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_UTIL_LOGGER_HPP_
#define REELFORGE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace reelforge::util {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

const char* LogLevelName(LogLevel level);

// Logger provides thread-safe log emission with a single static mutex.
// Each call writes the full line, appends '\n' and flushes under the mutex,
// so lines from concurrent jobs never interleave mid-line.
//
// Info  -> stdout
// Debug -> stdout only when REELFORGE_DEBUG env is set
// Warn  -> stderr (degraded output, e.g. video-only)
// Error -> stderr (job failures, encoder faults)
//
// Lines emitted on a thread holding a ScopedJobTag are prefixed with
// "[<job id>] ". The sink (tests) sees the tagged line.
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // Invoked for every emitted line in addition to the stream. Pass nullptr
  // to clear.
  static void SetSink(Sink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static Sink sink_;
};

// Tags every line logged on the current thread with job_id until destroyed.
// Tags nest; the innermost wins.
class ScopedJobTag {
 public:
  explicit ScopedJobTag(std::string job_id);
  ~ScopedJobTag();

  ScopedJobTag(const ScopedJobTag&) = delete;
  ScopedJobTag& operator=(const ScopedJobTag&) = delete;

  // Tag of the calling thread, empty when none.
  static const std::string& Current();

 private:
  std::string previous_;
};

}  // namespace reelforge::util

#endif  // REELFORGE_UTIL_LOGGER_HPP_
