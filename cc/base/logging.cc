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

#include "base/logging.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <string>

#include "absl/base/attributes.h"

namespace diffpriv {
namespace base {
namespace {

// Only VLOG with level equal to or below this level is logged.
ABSL_CONST_INIT int vlog_level = 0;

const char *GetBasename(const char *file_path) {
  const char *slash = strrchr(file_path, '/');
  return slash ? slash + 1 : file_path;
}

}  // namespace

int get_vlog_level() { return vlog_level; }

void set_vlog_level(int level) { vlog_level = level; }

CheckOpMessageBuilder::CheckOpMessageBuilder(const char *exprtext) {
  stream_ << exprtext << " (";
}

std::ostream *CheckOpMessageBuilder::ForVar2() {
  stream_ << " vs. ";
  return &stream_;
}

std::unique_ptr<std::string> CheckOpMessageBuilder::NewString() {
  stream_ << ")";
  return std::make_unique<std::string>(stream_.str());
}

template <>
void MakeCheckOpValueString(std::ostream *os, const std::nullptr_t &v) {
  (*os) << "nullptr";
}

namespace logging_internal {

LogMessage::LogMessage(const char *file, int line)
    : LogMessage(file, line, absl::LogSeverity::kInfo) {}

LogMessage::LogMessage(const char *file, int line, const std::string &result)
    : LogMessage(file, line, absl::LogSeverity::kFatal) {
  stream() << "Check failed: " << result << " ";
}

static constexpr const char *kLogSeverityNames[4] = {"INFO", "WARNING",
                                                     "ERROR", "FATAL"};

LogMessage::LogMessage(const char *file, int line, absl::LogSeverity severity)
    : severity_(severity) {
  // Prefix: local date/time, severity level, filename and line number.
  struct timespec time_stamp;
  clock_gettime(CLOCK_REALTIME, &time_stamp);
  struct tm local_time;
  localtime_r(&time_stamp.tv_sec, &local_time);

  constexpr int kTimeMessageSize = 22;
  char buffer[kTimeMessageSize];
  strftime(buffer, kTimeMessageSize, "%Y-%m-%d %H:%M:%S  ", &local_time);
  stream() << buffer << kLogSeverityNames[static_cast<int>(severity)] << "  "
           << GetBasename(file) << " : " << line << " : ";
}

LogMessage::~LogMessage() {
  Flush();
  if (severity_ == absl::LogSeverity::kFatal) {
    abort();
  }
}

void LogMessage::Flush() {
  const std::string message_text = stream_.str();
  fprintf(stderr, "%s\n", message_text.c_str());
  fflush(stderr);
  stream_.str("");
}

LogMessageFatal::~LogMessageFatal() {
  Flush();
  abort();
}

}  // namespace logging_internal

}  // namespace base
}  // namespace diffpriv
