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

#include "base/warnings.h"

#include <iterator>
#include <string>
#include <vector>

#include "absl/base/const_init.h"
#include "absl/synchronization/mutex.h"
#include "base/logging.h"

namespace diffpriv {
namespace base {
namespace {

ABSL_CONST_INIT absl::Mutex observers_mutex(absl::kConstInit);

std::vector<WarningObserver*>& Observers() {
  static auto* kObservers = new std::vector<WarningObserver*>();
  return *kObservers;
}

}  // namespace

std::string WarningTypeName(WarningType type) {
  switch (type) {
    case WarningType::kPrivacyLeak:
      return "PrivacyLeakWarning";
    case WarningType::kCompatibility:
      return "DiffprivCompatibilityWarning";
  }
  return "Warning";
}

void Warn(WarningType type, absl::string_view message) {
  LOG(WARNING) << WarningTypeName(type) << ": " << message;
  std::vector<WarningObserver*> observers;
  {
    absl::MutexLock lock(&observers_mutex);
    observers.assign(Observers().rbegin(), Observers().rend());
  }
  for (WarningObserver* observer : observers) {
    observer->OnWarning(type, message);
  }
}

ScopedWarningObserver::ScopedWarningObserver(WarningObserver* observer)
    : observer_(observer) {
  CHECK(observer_ != nullptr);
  absl::MutexLock lock(&observers_mutex);
  Observers().push_back(observer_);
}

ScopedWarningObserver::~ScopedWarningObserver() {
  absl::MutexLock lock(&observers_mutex);
  std::vector<WarningObserver*>& observers = Observers();
  DCHECK(!observers.empty() && observers.back() == observer_)
      << "Warning observers must be released in reverse order.";
  for (auto it = observers.rbegin(); it != observers.rend(); ++it) {
    if (*it == observer_) {
      observers.erase(std::next(it).base());
      break;
    }
  }
}

}  // namespace base
}  // namespace diffpriv
