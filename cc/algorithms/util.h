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

#ifndef DIFFPRIV_ALGORITHMS_UTIL_H_
#define DIFFPRIV_ALGORITHMS_UTIL_H_

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "base/logging.h"
#include "base/status_macros.h"

namespace diffpriv {

// Epsilon used by the estimators when the caller does not set one.
inline constexpr double kDefaultEpsilon = 1.0;

// Return 1 if n > 0, -1 if n < 0, and 0 if n == 0.
template <typename T>
T sign(T n) {
  if (n > 0) return 1;
  if (n < 0) return -1;
  return 0;
}

template <typename T>
inline const T& Clamp(const T& low, const T& high, const T& value) {
  // Prevents errors in ordering the arguments.
  DCHECK(!(high < low));
  if (high < value) return high;
  if (value < low) return low;
  return value;
}

// Transform vector into a pretty std::string.
template <typename T>
std::string VectorToString(const std::vector<T>& v) {
  return absl::StrCat("[", absl::StrJoin(v, ", "), "]");
}

// The functions below provide a common and consistent way for validating
// arguments and formatting error messages.

// Returns absl::OkStatus() if the value of optional `opt` if it is set.
// Otherwise, will return an `error_code` error that includes `name` in the
// error message.
absl::Status ValidateIsSet(
    std::optional<double> opt, absl::string_view name,
    absl::StatusCode error_code = absl::StatusCode::kInvalidArgument);

// Returns absl::OkStatus() if the value of optional `opt` if it is set and
// non-negative. Otherwise, will return an `error_code` error status that
// includes `name` in the error message.
absl::Status ValidateIsNonNegative(
    std::optional<double> opt, absl::string_view name,
    absl::StatusCode error_code = absl::StatusCode::kInvalidArgument);

// Returns absl::OkStatus() if the value of optional `opt` if it is set and
// finite. Otherwise, will return an `error_code` error status that includes
// `name` in the error message.
absl::Status ValidateIsFinite(
    std::optional<double> opt, absl::string_view name,
    absl::StatusCode error_code = absl::StatusCode::kInvalidArgument);

// Returns absl::OkStatus() if the value of optional `opt` if it is set, finite,
// and positive. Otherwise, will return an `error_code` error status that
// includes `name` in the error message.
absl::Status ValidateIsFiniteAndPositive(
    std::optional<double> opt, absl::string_view name,
    absl::StatusCode error_code = absl::StatusCode::kInvalidArgument);

// Returns absl::OkStatus() if the value of optional `opt` if it is set, finite,
// and non-negative. Otherwise, will return an `error_code` error status that
// includes `name` in the error message.
absl::Status ValidateIsFiniteAndNonNegative(
    std::optional<double> opt, absl::string_view name,
    absl::StatusCode error_code = absl::StatusCode::kInvalidArgument);

// Returns absl::OkStatus() if the value of optional `opt` if it is set and
// within the inclusive (i.e., closed) interval [`lower_bound`, `upper_bound`].
// Otherwise, will return an `error_code` error status that includes `name` in
// the error message.
absl::Status ValidateIsInInclusiveInterval(
    std::optional<double> opt, double lower_bound, double upper_bound,
    absl::string_view name,
    absl::StatusCode error_code = absl::StatusCode::kInvalidArgument);

// Returns absl::OkStatus() if the value of optional `opt` if it is set and
// within the interval between `lower_bound` and `upper_bound`, including
// `lower_bound` and/or `upper_bound` if `include_lower` or `include_upper` are
// true, respectively. Otherwise, will return an `error_code` error status that
// includes `name` in the error message.
absl::Status ValidateIsInInterval(
    std::optional<double> opt, double lower_bound, double upper_bound,
    bool include_lower, bool include_upper, absl::string_view name,
    absl::StatusCode error_code = absl::StatusCode::kInvalidArgument);

// Methods for semantical and consistent validation of common parameters.

// Epsilon must be finite and positive.
absl::Status ValidateEpsilon(std::optional<double> epsilon);
// Delta must be in [0, 1).
absl::Status ValidateDelta(std::optional<double> delta);
// Sensitivity must be finite and non-negative.
absl::Status ValidateSensitivity(std::optional<double> sensitivity);
// Each quantile must be in [0, 1].
absl::Status ValidateQuantiles(const std::vector<double>& quantiles);

// Bounds must be both set or both unset, finite, and with lower < upper.
template <typename T>
absl::Status ValidateBounds(std::optional<T> lower, std::optional<T> upper) {
  if (!lower.has_value() && !upper.has_value()) {
    return absl::OkStatus();
  }
  if (lower.has_value() != upper.has_value()) {
    return absl::InvalidArgumentError(
        "Lower and upper bounds must either both be set or both be unset.");
  }
  RETURN_IF_ERROR(ValidateIsFinite(lower.value(), "Lower bound"));
  RETURN_IF_ERROR(ValidateIsFinite(upper.value(), "Upper bound"));
  if (lower.value() > upper.value()) {
    return absl::InvalidArgumentError(
        "Lower bound cannot be greater than upper bound.");
  }
  if (lower.value() == upper.value()) {
    return absl::InvalidArgumentError(
        "Lower bound cannot be equal to upper bound.");
  }
  return absl::OkStatus();
}

}  // namespace diffpriv

#endif  // DIFFPRIV_ALGORITHMS_UTIL_H_
