// Copyright 2020 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef DIFFPRIV_ACCOUNTING_COMMON_COMMON_H_
#define DIFFPRIV_ACCOUNTING_COMMON_COMMON_H_

#include <ostream>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace diffpriv {
namespace accounting {

// Representation of the differential privacy parameters of a mechanism, or of
// a cumulative spend.
struct EpsilonDelta {
  double epsilon = 0;
  double delta = 0;

  // Epsilon must be finite and non-negative, delta must be in [0, 1].
  absl::Status Validate() const;
};

bool operator==(const EpsilonDelta& a, const EpsilonDelta& b);
std::ostream& operator<<(std::ostream& os, const EpsilonDelta& spend);

// Range and precision of a bisection.
struct BinarySearchParameters {
  double lower_bound;
  double upper_bound;
  // Absolute width of the final search interval.
  double tolerance = 1e-7;
};

// Inverses a monotone function. Specifically, computes x such that f(x) is no
// more than value, when such x exists. It is guaranteed that the returned x is
// within search_parameters.tolerance of the smallest (for monotonically
// decreasing f) or the largest (for monotonically increasing f) such x. When no
// such x exists within the given range, returns NotFoundError.
absl::StatusOr<double> InverseMonotoneFunction(
    absl::FunctionRef<absl::StatusOr<double>(double x)> func, double value,
    BinarySearchParameters search_parameters, bool increasing = false);

}  // namespace accounting
}  // namespace diffpriv

#endif  // DIFFPRIV_ACCOUNTING_COMMON_COMMON_H_
