// Repository: Reelforge
// Component: Logger Contract Tests
// Purpose: Sink capture by level and per-thread job tagging.
// Copyright (c) 2025 Reelforge

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "reelforge/util/Logger.hpp"

namespace reelforge::util {
namespace {

class LoggerContract : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetSink([this](LogLevel level, const std::string& line) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.emplace_back(level, line);
    });
  }

  void TearDown() override { Logger::SetSink(nullptr); }

  std::vector<std::pair<LogLevel, std::string>> Lines() {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  std::mutex mutex_;
  std::vector<std::pair<LogLevel, std::string>> lines_;
};

TEST_F(LoggerContract, SinkSeesEveryLevel) {
  Logger::Info("[Test] info");
  Logger::Warn("[Test] warn");
  Logger::Error("[Test] error");

  const auto lines = Lines();
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].first, LogLevel::kInfo);
  EXPECT_EQ(lines[0].second, "[Test] info");
  EXPECT_EQ(lines[1].first, LogLevel::kWarn);
  EXPECT_EQ(lines[2].first, LogLevel::kError);
  EXPECT_STREQ(LogLevelName(lines[2].first), "error");
}

TEST_F(LoggerContract, JobTagPrefixesLinesOnItsThread) {
  {
    ScopedJobTag tag("job_1_abc");
    EXPECT_EQ(ScopedJobTag::Current(), "job_1_abc");
    Logger::Info("[Pipeline] started");

    std::thread other([] { Logger::Info("[Sweeper] tick"); });
    other.join();

    {
      ScopedJobTag inner("job_2_def");
      Logger::Warn("[Pipeline] nested");
    }
    Logger::Info("[Pipeline] restored");
  }
  EXPECT_TRUE(ScopedJobTag::Current().empty());
  Logger::Info("[Service] untagged");

  const auto lines = Lines();
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[0].second, "[job_1_abc] [Pipeline] started");
  EXPECT_EQ(lines[1].second, "[Sweeper] tick");
  EXPECT_EQ(lines[2].second, "[job_2_def] [Pipeline] nested");
  EXPECT_EQ(lines[3].second, "[job_1_abc] [Pipeline] restored");
  EXPECT_EQ(lines[4].second, "[Service] untagged");
}

TEST_F(LoggerContract, ClearedSinkStopsCapture) {
  Logger::SetSink(nullptr);
  Logger::Info("[Test] not captured");
  EXPECT_TRUE(Lines().empty());
}

}  // namespace
}  // namespace reelforge::util
