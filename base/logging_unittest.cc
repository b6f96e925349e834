// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/logging.h"

#include <sys/syscall.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace logging {

namespace {

std::vector<std::string>* g_captured = nullptr;
std::vector<std::string>* g_captured_prefixes = nullptr;

bool CaptureHandler(int severity,
                    const char* file,
                    int line,
                    size_t message_start,
                    const std::string& str) {
  g_captured->push_back(str.substr(message_start));
  g_captured_prefixes->push_back(str.substr(0, message_start));
  return true;
}

int g_evaluations = 0;

int CountEvaluation() {
  return ++g_evaluations;
}

class LoggingTest : public testing::Test {
 protected:
  void SetUp() override {
    g_captured = &captured_;
    g_captured_prefixes = &prefixes_;
    g_evaluations = 0;
    old_handler_ = GetLogMessageHandler();
    old_min_level_ = GetMinLogLevel();
    old_vlog_level_ = GetVlogLevel();
    SetLogMessageHandler(&CaptureHandler);
  }

  void TearDown() override {
    SetLogMessageHandler(old_handler_);
    SetMinLogLevel(old_min_level_);
    SetVlogLevel(old_vlog_level_);
    g_captured = nullptr;
    g_captured_prefixes = nullptr;
  }

  std::vector<std::string> captured_;
  std::vector<std::string> prefixes_;
  LogMessageHandlerFunction old_handler_;
  int old_min_level_;
  int old_vlog_level_;
};

TEST_F(LoggingTest, BasicLogging) {
  LOG(INFO) << "info " << 1;
  LOG(WARNING) << "warning";
  ASSERT_EQ(2u, captured_.size());
  EXPECT_EQ("info 1\n", captured_[0]);
  EXPECT_EQ("warning\n", captured_[1]);
}

TEST_F(LoggingTest, MessagePrefix) {
  LOG(WARNING) << "warning";
  SetVlogLevel(1);
  VLOG(1) << "verbose";
  ASSERT_EQ(2u, prefixes_.size());

  const std::string ids =
      "[" + std::to_string(getpid()) + ":" +
      std::to_string(static_cast<long>(syscall(SYS_gettid))) + ":";
  const std::string& warning = prefixes_[0];
  EXPECT_EQ(0u, warning.find(ids)) << warning;
  // MMDD/HHMMSS.uuuuuu follows the ids.
  ASSERT_GT(warning.size(), ids.size() + 19);
  EXPECT_EQ('/', warning[ids.size() + 4]);
  EXPECT_EQ('.', warning[ids.size() + 11]);
  EXPECT_EQ(':', warning[ids.size() + 18]);
  EXPECT_NE(std::string::npos,
            warning.find(":WARNING:logging_unittest.cc("))
      << warning;
  EXPECT_EQ("] ", warning.substr(warning.size() - 2));

  EXPECT_NE(std::string::npos,
            prefixes_[1].find(":VERBOSE1:logging_unittest.cc("))
      << prefixes_[1];
}

TEST_F(LoggingTest, MinLogLevelSkipsStreamEvaluation) {
  SetMinLogLevel(LOGGING_WARNING);
  LOG(INFO) << CountEvaluation();
  LOG(ERROR) << CountEvaluation();
  EXPECT_EQ(1, g_evaluations);
  EXPECT_EQ(1u, captured_.size());
}

TEST_F(LoggingTest, LogIf) {
  LOG_IF(INFO, false) << CountEvaluation();
  LOG_IF(INFO, true) << CountEvaluation();
  EXPECT_EQ(1, g_evaluations);
  EXPECT_EQ(1u, captured_.size());
}

TEST_F(LoggingTest, VlogLevel) {
  SetVlogLevel(0);
  VLOG(1) << CountEvaluation();
  EXPECT_EQ(0, g_evaluations);
  EXPECT_TRUE(captured_.empty());

  SetVlogLevel(2);
  VLOG(1) << "one";
  VLOG(2) << "two";
  VLOG(3) << "three";
  ASSERT_EQ(2u, captured_.size());
  EXPECT_EQ("one\n", captured_[0]);
  EXPECT_EQ("two\n", captured_[1]);
}

TEST_F(LoggingTest, CheckPassesSilently) {
  CHECK(true) << CountEvaluation();
  CHECK_EQ(1, 1);
  EXPECT_EQ(0, g_evaluations);
  EXPECT_TRUE(captured_.empty());
}

TEST(LoggingDeathTest, CheckFailureIsFatal) {
  EXPECT_DEATH(CHECK(false) << "boom", "boom");
}

TEST(LogSeverityNameTest, Names) {
  EXPECT_STREQ("INFO", LogSeverityName(LOGGING_INFO));
  EXPECT_STREQ("ERROR", LogSeverityName(LOGGING_ERROR));
  EXPECT_STREQ("VERBOSE", LogSeverityName(LOGGING_VERBOSE));
}

}  // namespace

}  // namespace logging
