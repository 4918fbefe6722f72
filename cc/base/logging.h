//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#ifndef DIFFPRIV_BASE_LOGGING_H_
#define DIFFPRIV_BASE_LOGGING_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"

#define DIFFPRIV_INTERNAL_LOGGING_INFO \
  ::diffpriv::base::logging_internal::LogMessage(__FILE__, __LINE__)
#define DIFFPRIV_INTERNAL_LOGGING_WARNING            \
  ::diffpriv::base::logging_internal::LogMessage( \
      __FILE__, __LINE__, absl::LogSeverity::kWarning)
#define DIFFPRIV_INTERNAL_LOGGING_ERROR              \
  ::diffpriv::base::logging_internal::LogMessage( \
      __FILE__, __LINE__, absl::LogSeverity::kError)
#define DIFFPRIV_INTERNAL_LOGGING_FATAL \
  ::diffpriv::base::logging_internal::LogMessageFatal(__FILE__, __LINE__)

#ifdef NDEBUG
#define DIFFPRIV_INTERNAL_LOGGING_DFATAL DIFFPRIV_INTERNAL_LOGGING_ERROR
#else
#define DIFFPRIV_INTERNAL_LOGGING_DFATAL DIFFPRIV_INTERNAL_LOGGING_FATAL
#endif

// Creates a message and writes it to stderr.
//
// LOG(severity) returns a stream object that can be written to with the <<
// operator. Log messages are emitted with terminating newlines.
// Example:
//   LOG(INFO) << "Spent " << epsilon << " of the privacy budget";
//
// severity: one of INFO WARNING ERROR FATAL DFATAL. The FATAL severity will
//           terminate the program after the log is emitted.
#define LOG(severity) DIFFPRIV_INTERNAL_LOGGING_##severity.stream()

// A command to LOG only if a condition is true. If the condition is false,
// nothing is logged.
#define LOG_IF(severity, condition)                                \
  !(condition)                                                     \
      ? (void)0                                                    \
      : ::diffpriv::base::logging_internal::LogMessageVoidify() & \
            DIFFPRIV_INTERNAL_LOGGING_##severity.stream()

// A LOG command with an associated verbosity level. The verbosity threshold
// may be configured at runtime with set_vlog_level.
//
// VLOG statements are logged at INFO severity if they are logged at all.
#define VLOG(level) \
  LOG_IF(INFO, (level) <= ::diffpriv::base::get_vlog_level())

// Terminates the program with a fatal error if the specified condition is
// false.
#define CHECK(condition) \
  LOG_IF(FATAL, !(condition)) << ("Check failed: " #condition " ")

namespace diffpriv {
namespace base {

// Formats a value for a failing CHECK_XX statement.
template <typename T>
inline void MakeCheckOpValueString(std::ostream *os, const T &v) {
  (*os) << v;
}

template <>
void MakeCheckOpValueString(std::ostream *os, const std::nullptr_t &v);

// Builds "expr (V1 vs. V2)" for a failing CHECK_XX statement.
class CheckOpMessageBuilder {
 public:
  explicit CheckOpMessageBuilder(const char *exprtext);

  std::ostream *ForVar1() { return &stream_; }
  // Writes " vs. " before returning the stream for the second argument.
  std::ostream *ForVar2();
  // The stream is finished with an added ")".
  std::unique_ptr<std::string> NewString();

 private:
  std::ostringstream stream_;
};

template <typename T1, typename T2>
std::unique_ptr<std::string> MakeCheckOpString(const T1 &v1, const T2 &v2,
                                               const char *exprtext) {
  CheckOpMessageBuilder comb(exprtext);
  MakeCheckOpValueString(comb.ForVar1(), v1);
  MakeCheckOpValueString(comb.ForVar2(), v2);
  return comb.NewString();
}

#define DIFFPRIV_DEFINE_CHECK_OP_IMPL(name, op)                    \
  template <typename T1, typename T2>                              \
  inline std::unique_ptr<std::string> name##Impl(                  \
      const T1 &v1, const T2 &v2, const char *exprtext) {          \
    if (v1 op v2) return nullptr;                                  \
    return MakeCheckOpString(v1, v2, exprtext);                    \
  }                                                                \
  inline std::unique_ptr<std::string> name##Impl(int v1, int v2,   \
                                                 const char *exprtext) { \
    return name##Impl<int, int>(v1, v2, exprtext);                 \
  }

DIFFPRIV_DEFINE_CHECK_OP_IMPL(Check_EQ, ==)
DIFFPRIV_DEFINE_CHECK_OP_IMPL(Check_NE, !=)
DIFFPRIV_DEFINE_CHECK_OP_IMPL(Check_LE, <=)
DIFFPRIV_DEFINE_CHECK_OP_IMPL(Check_LT, <)
DIFFPRIV_DEFINE_CHECK_OP_IMPL(Check_GE, >=)
DIFFPRIV_DEFINE_CHECK_OP_IMPL(Check_GT, >)
#undef DIFFPRIV_DEFINE_CHECK_OP_IMPL

// Compares val1 and val2 with op, and produces a LOG(FATAL) if false.
#define DIFFPRIV_INTERNAL_CHECK_OP(name, op, val1, val2)                 \
  while (std::unique_ptr<std::string> _result =                          \
             ::diffpriv::base::name##Impl((val1), (val2),                \
                                          #val1 " " #op " " #val2))      \
  ::diffpriv::base::logging_internal::LogMessageFatal(__FILE__, __LINE__, \
                                                      *_result)          \
      .stream()

#define CHECK_EQ(val1, val2) \
  DIFFPRIV_INTERNAL_CHECK_OP(Check_EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) \
  DIFFPRIV_INTERNAL_CHECK_OP(Check_NE, !=, val1, val2)
#define CHECK_LE(val1, val2) \
  DIFFPRIV_INTERNAL_CHECK_OP(Check_LE, <=, val1, val2)
#define CHECK_LT(val1, val2) \
  DIFFPRIV_INTERNAL_CHECK_OP(Check_LT, <, val1, val2)
#define CHECK_GE(val1, val2) \
  DIFFPRIV_INTERNAL_CHECK_OP(Check_GE, >=, val1, val2)
#define CHECK_GT(val1, val2) \
  DIFFPRIV_INTERNAL_CHECK_OP(Check_GT, >, val1, val2)

#define DCHECK(c) CHECK(c)
#define DCHECK_EQ(a, b) CHECK_EQ(a, b)
#define DCHECK_NE(a, b) CHECK_NE(a, b)
#define DCHECK_LE(a, b) CHECK_LE(a, b)
#define DCHECK_LT(a, b) CHECK_LT(a, b)
#define DCHECK_GE(a, b) CHECK_GE(a, b)
#define DCHECK_GT(a, b) CHECK_GT(a, b)

// Verbosity threshold for VLOG. A VLOG command with a level greater than
// this is ignored. Defaults to 0.
int get_vlog_level();
void set_vlog_level(int level);

namespace logging_internal {

// Class representing a log message created by a log macro.
class LogMessage {
 public:
  // Constructs a new message with INFO severity.
  LogMessage(const char *file, int line);

  // Constructs a new message with the specified severity.
  LogMessage(const char *file, int line, absl::LogSeverity severity);

  // Constructs a log message with additional text that is provided by CHECK
  // macros.  Severity is implicitly FATAL.
  LogMessage(const char *file, int line, const std::string &result);

  // The destructor flushes the message.
  ~LogMessage();

  LogMessage(const LogMessage &) = delete;
  void operator=(const LogMessage &) = delete;

  std::ostream &stream() { return stream_; }

 protected:
  void Flush();

 private:
  std::ostringstream stream_;
  const absl::LogSeverity severity_;
};

// Turns an ostream into void to satisfy the ternary operator in LOG_IF.
// operator& is used because it has precedence lower than << but higher than :?
class LogMessageVoidify {
 public:
  void operator&(const std::ostream &) {}
};

// Identical to LogMessage(..., FATAL), but marks the destructor noreturn.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char *file, int line)
      : LogMessage(file, line, absl::LogSeverity::kFatal) {}

  LogMessageFatal(const char *file, int line, const std::string &result)
      : LogMessage(file, line, result) {}

  ABSL_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

}  // namespace logging_internal

}  // namespace base
}  // namespace diffpriv

#endif  // DIFFPRIV_BASE_LOGGING_H_
