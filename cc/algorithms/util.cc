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


#include "algorithms/util.h"

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "base/status_macros.h"

namespace diffpriv {

absl::Status ValidateIsSet(std::optional<double> opt, absl::string_view name,
                           absl::StatusCode error_code) {
  if (!opt.has_value()) {
    return absl::InvalidArgumentError(absl::StrCat(name, " must be set."));
  }
  double d = opt.value();
  if (std::isnan(d)) {
    return absl::Status(
        error_code,
        absl::StrCat(name, " must be a valid numeric value, but is ", d, "."));
  }
  return absl::OkStatus();
}

absl::Status ValidateIsNonNegative(std::optional<double> opt,
                                   absl::string_view name,
                                   absl::StatusCode error_code) {
  RETURN_IF_ERROR(ValidateIsSet(opt, name, error_code));
  double d = opt.value();
  if (d < 0) {
    return absl::Status(
        error_code,
        absl::StrCat(name, " must be non-negative, but is ", d, "."));
  }
  return absl::OkStatus();
}

absl::Status ValidateIsFinite(std::optional<double> opt, absl::string_view name,
                              absl::StatusCode error_code) {
  RETURN_IF_ERROR(ValidateIsSet(opt, name, error_code));
  double d = opt.value();
  if (!std::isfinite(d)) {
    return absl::Status(error_code,
                        absl::StrCat(name, " must be finite, but is ", d, "."));
  }
  return absl::OkStatus();
}

absl::Status ValidateIsFiniteAndPositive(std::optional<double> opt,
                                         absl::string_view name,
                                         absl::StatusCode error_code) {
  RETURN_IF_ERROR(ValidateIsSet(opt, name, error_code));
  double d = opt.value();
  if (d <= 0 || !std::isfinite(d)) {
    return absl::Status(
        error_code,
        absl::StrCat(name, " must be finite and positive, but is ", d, "."));
  }
  return absl::OkStatus();
}

absl::Status ValidateIsFiniteAndNonNegative(std::optional<double> opt,
                                            absl::string_view name,
                                            absl::StatusCode error_code) {
  RETURN_IF_ERROR(ValidateIsSet(opt, name, error_code));
  double d = opt.value();
  if (d < 0 || !std::isfinite(d)) {
    return absl::Status(
        error_code,
        absl::StrCat(name, " must be finite and non-negative, but is ", d,
                     "."));
  }
  return absl::OkStatus();
}

absl::Status ValidateIsInInclusiveInterval(std::optional<double> opt,
                                           double lower_bound,
                                           double upper_bound,
                                           absl::string_view name,
                                           absl::StatusCode error_code) {
  return ValidateIsInInterval(opt, lower_bound, upper_bound, true, true, name,
                              error_code);
}

absl::Status ValidateIsInInterval(std::optional<double> opt, double lower_bound,
                                  double upper_bound, bool include_lower,
                                  bool include_upper, absl::string_view name,
                                  absl::StatusCode error_code) {
  RETURN_IF_ERROR(ValidateIsSet(opt, name, error_code));
  double d = opt.value();

  if (lower_bound == upper_bound && upper_bound == d &&
      (include_lower || include_upper)) {
    return absl::OkStatus();
  }
  bool d_is_outside_lower_bound =
      include_lower ? d < lower_bound : d <= lower_bound;
  bool d_is_outside_upper_bound =
      include_upper ? d > upper_bound : d >= upper_bound;
  if (d_is_outside_lower_bound || d_is_outside_upper_bound) {
    std::string left_bracket = include_lower ? "[" : "(";
    std::string right_bracket = include_upper ? "]" : ")";
    std::string inclusivity = " ";
    if (include_lower && include_upper) {
      inclusivity = " inclusive ";
    } else if (!include_lower && !include_upper) {
      inclusivity = " exclusive ";
    }

    return absl::Status(
        error_code,
        absl::StrCat(name, " must be in the", inclusivity, "interval ",
                     left_bracket, lower_bound, ",", upper_bound, right_bracket,
                     ", but is ", d, "."));
  }
  return absl::OkStatus();
}

absl::Status ValidateEpsilon(std::optional<double> epsilon) {
  return ValidateIsFiniteAndPositive(epsilon, "Epsilon");
}

absl::Status ValidateDelta(std::optional<double> delta) {
  return ValidateIsInInterval(delta, 0, 1, /*include_lower=*/true,
                              /*include_upper=*/false, "Delta");
}

absl::Status ValidateSensitivity(std::optional<double> sensitivity) {
  return ValidateIsFiniteAndNonNegative(sensitivity, "Sensitivity");
}

absl::Status ValidateQuantiles(const std::vector<double>& quantiles) {
  if (quantiles.empty()) {
    return absl::InvalidArgumentError("At least one quantile must be set.");
  }
  for (double q : quantiles) {
    RETURN_IF_ERROR(ValidateIsInInclusiveInterval(q, 0, 1, "Quantile"));
  }
  return absl::OkStatus();
}

}  // namespace diffpriv
