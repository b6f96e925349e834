// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BASE_LOGGING_H_
#define BASE_LOGGING_H_

#include <stddef.h>
#include <stdint.h>

#include <sstream>
#include <string>

#include "base/base_export.h"
#include "base/macros.h"

// Instructions
// ------------
//
// Make a bunch of macros for logging.  The way to log things is to stream
// things to LOG(<a particular severity level>).  E.g.,
//
//   LOG(INFO) << "Found " << num_cookies << " cookies";
//
// You can also do conditional logging:
//
//   LOG_IF(INFO, num_cookies > 10) << "Got lots of cookies";
//
// The CHECK(condition) macro is active in both debug and release builds and
// performs a LOG(FATAL) when the condition does not hold.
//
// There are also "debug mode" logging macros like the ones above:
//
//   DLOG(INFO) << "Found cookies";
//
// All "debug mode" logging is compiled away to nothing for non-debug mode
// compiles.
//
// We also have
//
//   VLOG(1) << "I'm printed when you run the program with --v=1 or more";
//
// These always log at the INFO log level (when they log at all). The
// verbosity threshold is set with SetVlogLevel(); trustpin_verify wires it
// to the --v switch.
//
// Every message is prefixed with
//
//   [pid:tid:MMDD/HHMMSS.uuuuuu:SEVERITY:file(line)]
//
// The supported severity levels for macros that allow you to specify one
// are (in increasing order of severity) INFO, WARNING, ERROR, and FATAL.
//
// Very important: logging a message at the FATAL severity level causes
// the program to terminate (after the message is logged).

namespace logging {

// A bitmask of potential logging destinations.
using LoggingDestination = uint32_t;

enum : uint32_t {
  LOG_NONE = 0,
  LOG_TO_FILE = 1 << 0,
  LOG_TO_STDERR = 1 << 2,

  LOG_TO_ALL = LOG_TO_FILE | LOG_TO_STDERR,

  LOG_DEFAULT = LOG_TO_STDERR,
};

struct BASE_EXPORT LoggingSettings {
  // Equivalent to logging destination enum, but allows for multiple
  // destinations.
  uint32_t logging_dest = LOG_DEFAULT;

  // Has an effect only when LOG_TO_FILE is set in |logging_dest|. The file
  // is appended to.
  const char* log_file_path = nullptr;
};

// Sets the log file name and other global logging state. Returns false if
// LOG_TO_FILE was requested and the file could not be opened; logging then
// falls back to stderr.
BASE_EXPORT bool InitLogging(const LoggingSettings& settings);

// Sets the log level. Anything at or above this level will be written to the
// log destinations. Anything below this level will be silently ignored. The
// log level defaults to 0 (everything is logged up to level INFO) if this
// function is not called.
BASE_EXPORT void SetMinLogLevel(int level);

// Gets the current log level.
BASE_EXPORT int GetMinLogLevel();

// Used by LOG_IS_ON to lazy-evaluate stream arguments.
BASE_EXPORT bool ShouldCreateLogMessage(int severity);

// Sets and gets the maximum VLOG level that is emitted. Defaults to 0, which
// disables all VLOG output.
BASE_EXPORT void SetVlogLevel(int level);
BASE_EXPORT int GetVlogLevel();

// Sets the Log Message Handler that gets passed every log message before
// it's sent to other log destinations (if any).
// Returns true to signal that it handled the message and the message
// should not be sent to other log destinations.
typedef bool (*LogMessageHandlerFunction)(int severity,
                                          const char* file,
                                          int line,
                                          size_t message_start,
                                          const std::string& str);
BASE_EXPORT void SetLogMessageHandler(LogMessageHandlerFunction handler);
BASE_EXPORT LogMessageHandlerFunction GetLogMessageHandler();

using LogSeverity = int;
constexpr LogSeverity LOGGING_VERBOSE = -1;  // This is level 1 verbosity
// Note: the log severities are used to index into the array of names,
// see log_severity_names.
constexpr LogSeverity LOGGING_INFO = 0;
constexpr LogSeverity LOGGING_WARNING = 1;
constexpr LogSeverity LOGGING_ERROR = 2;
constexpr LogSeverity LOGGING_FATAL = 3;
constexpr LogSeverity LOGGING_NUM_SEVERITIES = 4;

#if defined(NDEBUG) && !defined(DCHECK_ALWAYS_ON)
#define DCHECK_IS_ON() 0
#else
#define DCHECK_IS_ON() 1
#endif

// LOGGING_DCHECK is LOGGING_FATAL when DCHECKs are enabled.
constexpr LogSeverity LOGGING_DCHECK = LOGGING_FATAL;

// Returns the printable name of |severity|, "VERBOSE" for negative values.
BASE_EXPORT const char* LogSeverityName(LogSeverity severity);

// A few definitions of macros that don't generate much code. These are used
// by LOG() and LOG_IF, etc. Since these are used all over our code, it's
// better to have compact code for these operations.
#define COMPACT_GOOGLE_LOG_INFO \
  ::logging::LogMessage(__FILE__, __LINE__, ::logging::LOGGING_INFO)
#define COMPACT_GOOGLE_LOG_WARNING \
  ::logging::LogMessage(__FILE__, __LINE__, ::logging::LOGGING_WARNING)
#define COMPACT_GOOGLE_LOG_ERROR \
  ::logging::LogMessage(__FILE__, __LINE__, ::logging::LOGGING_ERROR)
#define COMPACT_GOOGLE_LOG_FATAL \
  ::logging::LogMessage(__FILE__, __LINE__, ::logging::LOGGING_FATAL)
#define COMPACT_GOOGLE_LOG_DCHECK \
  ::logging::LogMessage(__FILE__, __LINE__, ::logging::LOGGING_DCHECK)

// As special cases, we can assume that LOG_IS_ON(FATAL) always holds. Also,
// LOG_IS_ON(DFATAL) always holds in debug mode. In particular, CHECK()s will
// always fire if they fail.
#define LOG_IS_ON(severity) \
  (::logging::ShouldCreateLogMessage(::logging::LOGGING_##severity))

#define VLOG_IS_ON(verboselevel) ((verboselevel) <= ::logging::GetVlogLevel())

// Helper macro which avoids evaluating the arguments to a stream if
// the condition doesn't hold. Condition is evaluated once and only once.
#define LAZY_STREAM(stream, condition) \
  !(condition) ? (void)0 : ::logging::LogMessageVoidify() & (stream)

#define LOG_STREAM(severity) COMPACT_GOOGLE_LOG_##severity.stream()

#define LOG(severity) LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity))
#define LOG_IF(severity, condition) \
  LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity) && (condition))

// The VLOG macros log with negative verbosities.
#define VLOG_STREAM(verbose_level) \
  ::logging::LogMessage(__FILE__, __LINE__, -(verbose_level)).stream()

#define VLOG(verbose_level) \
  LAZY_STREAM(VLOG_STREAM(verbose_level), VLOG_IS_ON(verbose_level))

#define VLOG_IF(verbose_level, condition) \
  LAZY_STREAM(VLOG_STREAM(verbose_level), \
              VLOG_IS_ON(verbose_level) && (condition))

// CHECK dies with a fatal error if condition is not true. It is *not*
// controlled by NDEBUG, so the check will be executed regardless of
// compilation mode.
#define CHECK(condition)                                           \
  LAZY_STREAM(LOG_STREAM(FATAL), UNLIKELY_CHECK_FAILED(condition)) \
      << "Check failed: " #condition ". "

#define CHECK_EQ(val1, val2) CHECK((val1) == (val2))
#define CHECK_NE(val1, val2) CHECK((val1) != (val2))
#define CHECK_LE(val1, val2) CHECK((val1) <= (val2))
#define CHECK_LT(val1, val2) CHECK((val1) < (val2))
#define CHECK_GE(val1, val2) CHECK((val1) >= (val2))
#define CHECK_GT(val1, val2) CHECK((val1) > (val2))

#define UNLIKELY_CHECK_FAILED(condition) __builtin_expect(!(condition), 0)

#if DCHECK_IS_ON()

#define DLOG(severity) LOG(severity)
#define DLOG_IF(severity, condition) LOG_IF(severity, condition)
#define DVLOG(verboselevel) VLOG(verboselevel)
#define DVLOG_IF(verboselevel, condition) VLOG_IF(verboselevel, condition)

#define DCHECK(condition)                                           \
  LAZY_STREAM(LOG_STREAM(DCHECK), UNLIKELY_CHECK_FAILED(condition)) \
      << "Check failed: " #condition ". "

#else  // DCHECK_IS_ON()

// The stream is never evaluated but still type-checks the operands, so
// variables only used in debug logging do not trigger unused warnings.
#define DLOG(severity) LAZY_STREAM(LOG_STREAM(severity), false)
#define DLOG_IF(severity, condition) \
  LAZY_STREAM(LOG_STREAM(severity), false) << !(condition)
#define DVLOG(verboselevel) LAZY_STREAM(VLOG_STREAM(verboselevel), false)
#define DVLOG_IF(verboselevel, condition) \
  LAZY_STREAM(VLOG_STREAM(verboselevel), false) << !(condition)

#define DCHECK(condition) \
  LAZY_STREAM(LOG_STREAM(DCHECK), false) << !(condition)

#endif  // DCHECK_IS_ON()

#define DCHECK_EQ(val1, val2) DCHECK((val1) == (val2))
#define DCHECK_NE(val1, val2) DCHECK((val1) != (val2))
#define DCHECK_LE(val1, val2) DCHECK((val1) <= (val2))
#define DCHECK_LT(val1, val2) DCHECK((val1) < (val2))
#define DCHECK_GE(val1, val2) DCHECK((val1) >= (val2))
#define DCHECK_GT(val1, val2) DCHECK((val1) > (val2))

#define NOTREACHED() DCHECK(false)

// This class more or less represents a particular log message.  You
// create an instance of LogMessage and then stream stuff to it.
// When you finish streaming to it, ~LogMessage is called and the
// full message gets streamed to the appropriate destination.
//
// You shouldn't actually use LogMessage's constructor to log things,
// though.  You should use the LOG() macro (and variants thereof)
// above.
class BASE_EXPORT LogMessage {
 public:
  // Used for LOG(severity).
  LogMessage(const char* file, int line, LogSeverity severity);
  ~LogMessage();

  std::ostream& stream() { return stream_; }

  LogSeverity severity() const { return severity_; }
  std::string str() const { return stream_.str(); }

 private:
  void Init(const char* file, int line);

  const LogSeverity severity_;
  std::ostringstream stream_;
  size_t message_start_;  // Offset of the start of the message (past prefix
                          // info).
  // The file and line information passed in to the constructor.
  const char* const file_;
  const int line_;

  DISALLOW_COPY_AND_ASSIGN(LogMessage);
};

// This class is used to explicitly ignore values in the conditional
// logging macros.  This avoids compiler warnings like "value computed
// is not used" and "statement has no effect".
class LogMessageVoidify {
 public:
  LogMessageVoidify() = default;
  // This has to be an operator with a precedence lower than << but
  // higher than ?:
  void operator&(std::ostream&) {}
};

}  // namespace logging

#endif  // BASE_LOGGING_H_
