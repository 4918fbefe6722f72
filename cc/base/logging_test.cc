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

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace diffpriv {
namespace base {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

// Restores the VLOG threshold when a test ends.
class ScopedVlogLevel {
 public:
  explicit ScopedVlogLevel(int level) : previous_(get_vlog_level()) {
    set_vlog_level(level);
  }
  ~ScopedVlogLevel() { set_vlog_level(previous_); }

 private:
  int previous_;
};

int CountingValue(int* evaluations) {
  ++*evaluations;
  return *evaluations;
}

TEST(LoggingTest, VlogIsOffByDefault) {
  EXPECT_EQ(get_vlog_level(), 0);
  int evaluations = 0;
  ::testing::internal::CaptureStderr();
  VLOG(1) << "spent " << CountingValue(&evaluations);
  EXPECT_THAT(::testing::internal::GetCapturedStderr(), IsEmpty());
  EXPECT_EQ(evaluations, 0);
}

TEST(LoggingTest, VlogFollowsThreshold) {
  ScopedVlogLevel verbose(2);
  int evaluations = 0;
  ::testing::internal::CaptureStderr();
  VLOG(2) << "spent epsilon " << CountingValue(&evaluations);
  VLOG(3) << "too verbose " << CountingValue(&evaluations);
  const std::string output = ::testing::internal::GetCapturedStderr();
  EXPECT_THAT(output, HasSubstr("INFO"));
  EXPECT_THAT(output, HasSubstr("spent epsilon 1"));
  EXPECT_THAT(output, ::testing::Not(HasSubstr("too verbose")));
  EXPECT_EQ(evaluations, 1);
}

TEST(LoggingTest, WarningGoesToStderrWithPrefix) {
  ::testing::internal::CaptureStderr();
  LOG(WARNING) << "Bounds have not been specified";
  const std::string output = ::testing::internal::GetCapturedStderr();
  EXPECT_THAT(output, HasSubstr("WARNING  logging_test.cc : "));
  EXPECT_THAT(output, HasSubstr("Bounds have not been specified\n"));
}

TEST(LoggingTest, LogIfSkipsFalseCondition) {
  ::testing::internal::CaptureStderr();
  LOG_IF(ERROR, false) << "not logged";
  LOG_IF(ERROR, true) << "logged";
  const std::string output = ::testing::internal::GetCapturedStderr();
  EXPECT_THAT(output, ::testing::Not(HasSubstr("not logged")));
  EXPECT_THAT(output, HasSubstr("ERROR"));
}

TEST(LoggingDeathTest, CheckFailureAborts) {
  EXPECT_DEATH(CHECK(1 > 2) << "epsilon", "Check failed: 1 > 2 epsilon");
}

TEST(LoggingDeathTest, CheckOpShowsBothValues) {
  const int index = 3;
  const int size = 3;
  EXPECT_DEATH(CHECK_LT(index, size), "index < size \\(3 vs. 3\\)");
}

TEST(LoggingTest, PassingChecksDoNothing) {
  ::testing::internal::CaptureStderr();
  CHECK(true);
  CHECK_EQ(2, 2);
  DCHECK_LE(1, 2);
  EXPECT_THAT(::testing::internal::GetCapturedStderr(), IsEmpty());
}

}  // namespace
}  // namespace base
}  // namespace diffpriv
