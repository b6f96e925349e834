// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/logging.h"

#include <stdio.h>
#include <stdlib.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <string>

#include "base/synchronization/lock.h"

namespace logging {

namespace {

const char* const log_severity_names[] = {"INFO", "WARNING", "ERROR",
                                          "FATAL"};
static_assert(LOGGING_NUM_SEVERITIES == arraysize(log_severity_names),
              "Incorrect number of log_severity_names");

int g_min_log_level = 0;
int g_vlog_level = 0;

LoggingDestination g_logging_destination = LOG_DEFAULT;

// For LOGGING_ERROR and above, always print to stderr.
const int kAlwaysPrintErrorLevel = LOGGING_ERROR;

// Sees every message before the configured destinations do.
LogMessageHandlerFunction g_log_message_handler = nullptr;

// Guards |g_log_file| and |g_log_file_name|. Messages written to the same
// destination from several threads are serialized line by line.
base::Lock& GetLoggingLock() {
  static base::Lock* lock = new base::Lock;
  return *lock;
}

std::string* g_log_file_name = nullptr;
FILE* g_log_file = nullptr;

// Called by logging functions to ensure that |g_log_file| is initialized
// and can be used for writing. Returns false if the file could not be
// initialized. |g_log_file| will be nullptr in this case.
// Must be called with the logging lock held.
bool InitializeLogFileHandle() {
  if (g_log_file)
    return true;
  if (!g_log_file_name)
    return false;
  g_log_file = fopen(g_log_file_name->c_str(), "a");
  return g_log_file != nullptr;
}

void CloseFile(FILE* log) {
  fclose(log);
}

// Must be called with the logging lock held.
void CloseLogFileUnlocked() {
  if (!g_log_file)
    return;

  CloseFile(g_log_file);
  g_log_file = nullptr;
}

}  // namespace

bool InitLogging(const LoggingSettings& settings) {
  base::AutoLock guard(GetLoggingLock());

  g_logging_destination = settings.logging_dest;

  // ignore file options unless logging to file is set.
  if ((g_logging_destination & LOG_TO_FILE) == 0)
    return true;

  // Calling InitLogging twice or after some log call has already opened the
  // default log file will re-initialize to the new options.
  CloseLogFileUnlocked();

  if (!settings.log_file_path) {
    g_logging_destination |= LOG_TO_STDERR;
    return false;
  }

  if (!g_log_file_name)
    g_log_file_name = new std::string();
  *g_log_file_name = settings.log_file_path;

  if (!InitializeLogFileHandle()) {
    g_logging_destination |= LOG_TO_STDERR;
    return false;
  }
  return true;
}

void SetMinLogLevel(int level) {
  g_min_log_level = std::min(LOGGING_FATAL, level);
}

int GetMinLogLevel() {
  return g_min_log_level;
}

bool ShouldCreateLogMessage(int severity) {
  if (severity < g_min_log_level)
    return false;

  // Return true here unless we know ~LogMessage won't do anything.
  return g_logging_destination != LOG_NONE || g_log_message_handler ||
         severity >= kAlwaysPrintErrorLevel;
}

void SetVlogLevel(int level) {
  g_vlog_level = level;
}

int GetVlogLevel() {
  // VLOG output is additionally bounded by the min log level, which is
  // negative for verbose output.
  return std::max(g_vlog_level, -g_min_log_level);
}

void SetLogMessageHandler(LogMessageHandlerFunction handler) {
  g_log_message_handler = handler;
}

LogMessageHandlerFunction GetLogMessageHandler() {
  return g_log_message_handler;
}

const char* LogSeverityName(LogSeverity severity) {
  if (severity >= 0 && severity < LOGGING_NUM_SEVERITIES)
    return log_severity_names[severity];
  return "VERBOSE";
}

LogMessage::LogMessage(const char* file, int line, LogSeverity severity)
    : severity_(severity), file_(file), line_(line) {
  Init(file, line);
}

LogMessage::~LogMessage() {
  stream_ << std::endl;
  std::string str_newline(stream_.str());

  // Give any log message handler first dibs on the message.
  if (g_log_message_handler &&
      g_log_message_handler(severity_, file_, line_, message_start_,
                            str_newline)) {
    // The handler took care of it, no further processing.
    return;
  }

  {
    base::AutoLock guard(GetLoggingLock());

    if ((g_logging_destination & LOG_TO_STDERR) != 0 ||
        severity_ >= kAlwaysPrintErrorLevel) {
      ignore_result(fwrite(str_newline.data(), str_newline.size(), 1, stderr));
      fflush(stderr);
    }

    if ((g_logging_destination & LOG_TO_FILE) != 0 &&
        InitializeLogFileHandle()) {
      ignore_result(
          fwrite(str_newline.data(), str_newline.size(), 1, g_log_file));
      fflush(g_log_file);
    }
  }

  if (severity_ == LOGGING_FATAL) {
    // Crash the process.
    abort();
  }
}

// writes the common header info to the stream
void LogMessage::Init(const char* file, int line) {
  std::string filename(file);
  size_t last_slash_pos = filename.find_last_of("\\/");
  if (last_slash_pos != std::string::npos)
    filename.erase(0, last_slash_pos + 1);

  stream_ << '[';
  stream_ << getpid() << ':';
  stream_ << static_cast<long>(syscall(SYS_gettid)) << ':';

  timeval tv;
  gettimeofday(&tv, nullptr);
  time_t t = tv.tv_sec;
  struct tm local_time;
  localtime_r(&t, &local_time);
  struct tm* tm_time = &local_time;
  stream_ << std::setfill('0')
          << std::setw(2) << 1 + tm_time->tm_mon
          << std::setw(2) << tm_time->tm_mday
          << '/'
          << std::setw(2) << tm_time->tm_hour
          << std::setw(2) << tm_time->tm_min
          << std::setw(2) << tm_time->tm_sec
          << '.'
          << std::setw(6) << tv.tv_usec
          << ':';
  stream_ << std::setfill(' ');

  if (severity_ >= 0)
    stream_ << LogSeverityName(severity_);
  else
    stream_ << "VERBOSE" << -severity_;

  stream_ << ":" << filename << "(" << line << ")] ";
  message_start_ = stream_.str().length();
}

}  // namespace logging
