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

#include "accounting/common/common.h"

#include <cmath>
#include <ostream>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "base/status_macros.h"

namespace diffpriv {
namespace accounting {

absl::Status EpsilonDelta::Validate() const {
  if (!(epsilon >= 0) || !std::isfinite(epsilon)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Epsilon must be finite and non-negative, but is %g.", epsilon));
  }
  if (!(delta >= 0 && delta <= 1)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Delta must be in [0, 1], but is %g.", delta));
  }
  return absl::OkStatus();
}

bool operator==(const EpsilonDelta& a, const EpsilonDelta& b) {
  return a.epsilon == b.epsilon && a.delta == b.delta;
}

std::ostream& operator<<(std::ostream& os, const EpsilonDelta& spend) {
  return os << "(epsilon=" << spend.epsilon << ", delta=" << spend.delta
            << ")";
}

absl::StatusOr<double> InverseMonotoneFunction(
    const absl::FunctionRef<absl::StatusOr<double>(double x)> func,
    const double value, const BinarySearchParameters search_parameters,
    const bool increasing) {
  double lower_x = search_parameters.lower_bound;
  double upper_x = search_parameters.upper_bound;
  if (!std::isfinite(lower_x) || !std::isfinite(upper_x) ||
      lower_x > upper_x) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Search range must be finite and non-empty, but is [%g, %g].",
        lower_x, upper_x));
  }
  if (!(search_parameters.tolerance > 0)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Search tolerance must be positive, but is %g.",
        search_parameters.tolerance));
  }

  ASSIGN_OR_RETURN(const double min_value,
                   func(increasing ? lower_x : upper_x));
  if (min_value > value) {
    return absl::NotFoundError(absl::StrFormat(
        "Cannot find x in range (%lf, %lf) whose value is at most %lf.",
        lower_x, upper_x, value));
  }

  // For increasing f the solution lies above x while f(x) <= value, for
  // decreasing f while f(x) > value.
  auto solution_above = [value, increasing](double func_value) {
    return increasing ? func_value <= value : func_value > value;
  };
  while (upper_x - lower_x > search_parameters.tolerance) {
    const double mid_x = lower_x + (upper_x - lower_x) / 2;
    // The interval cannot shrink below adjacent doubles.
    if (mid_x <= lower_x || mid_x >= upper_x) break;
    ASSIGN_OR_RETURN(const double func_value, func(mid_x));
    if (solution_above(func_value)) {
      lower_x = mid_x;
    } else {
      upper_x = mid_x;
    }
  }

  return increasing ? lower_x : upper_x;
}

}  // namespace accounting
}  // namespace diffpriv
