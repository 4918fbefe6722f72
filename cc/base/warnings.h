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

#ifndef DIFFPRIV_BASE_WARNINGS_H_
#define DIFFPRIV_BASE_WARNINGS_H_

#include <string>

#include "absl/strings/string_view.h"

namespace diffpriv {
namespace base {

// Non-fatal advisories raised by the estimators. Warnings never change control
// flow; callers are free to ignore them.
enum class WarningType {
  // A bound or range was derived from the data itself and therefore leaks
  // information about it.
  kPrivacyLeak,
  // A parameter is accepted for API compatibility but has no effect.
  kCompatibility,
};

std::string WarningTypeName(WarningType type);

// Receives every warning emitted through Warn() while registered.
class WarningObserver {
 public:
  virtual ~WarningObserver() = default;
  virtual void OnWarning(WarningType type, absl::string_view message) = 0;
};

// Logs the warning with LOG(WARNING) and forwards it to the registered
// observers, most recently registered first.
void Warn(WarningType type, absl::string_view message);

// Registers `observer` for the lifetime of this object. Observers must be
// destroyed in the reverse order of their creation.
//
// Example:
//   RecordingObserver observer;
//   ScopedWarningObserver scope(&observer);
//   mean->Result(data);  // warnings are delivered to `observer`
class ScopedWarningObserver {
 public:
  explicit ScopedWarningObserver(WarningObserver* observer);
  ~ScopedWarningObserver();

  ScopedWarningObserver(const ScopedWarningObserver&) = delete;
  ScopedWarningObserver& operator=(const ScopedWarningObserver&) = delete;

 private:
  WarningObserver* observer_;
};

}  // namespace base
}  // namespace diffpriv

#endif  // DIFFPRIV_BASE_WARNINGS_H_
