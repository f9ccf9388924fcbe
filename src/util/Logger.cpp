// Repository: Reelforge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by pipeline, encoder workers,
//          sweepers and gRPC handlers, with per-thread job tagging.
// Copyright (c) 2025 Reelforge

#include "reelforge/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace reelforge::util {

namespace {
thread_local std::string g_job_tag;
}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo:  return "info";
    case LogLevel::kWarn:  return "warn";
    case LogLevel::kError: return "error";
  }
  return "unknown";
}

std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("REELFORGE_DEBUG") != nullptr;
}

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(LogLevel::kDebug, line);
}

void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }

void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::Emit(LogLevel level, const std::string& line) {
  const std::string& tag = ScopedJobTag::Current();
  const std::string tagged = tag.empty() ? line : "[" + tag + "] " + line;

  std::ostream& out = (level == LogLevel::kWarn || level == LogLevel::kError) ? std::cerr
                                                                               : std::cout;
  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, tagged);
  }
  out << tagged << '\n';
  out.flush();
}

ScopedJobTag::ScopedJobTag(std::string job_id) : previous_(std::move(g_job_tag)) {
  g_job_tag = std::move(job_id);
}

ScopedJobTag::~ScopedJobTag() { g_job_tag = std::move(previous_); }

const std::string& ScopedJobTag::Current() { return g_job_tag; }

}  // namespace reelforge::util
