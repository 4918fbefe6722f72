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

#include "algorithms/exponential-mechanism.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "algorithms/rand.h"
#include "algorithms/util.h"
#include "base/logging.h"
#include "base/status_macros.h"

namespace diffpriv {

absl::StatusOr<ExponentialMechanism> ExponentialMechanism::Builder::Build()
    const {
  RETURN_IF_ERROR(ValidateEpsilon(epsilon_));
  if (delta_ != 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Delta must be 0 for the exponential mechanism, but is %g.", delta_));
  }
  RETURN_IF_ERROR(ValidateIsFiniteAndPositive(sensitivity_, "Sensitivity"));
  if (utility_.empty()) {
    return absl::InvalidArgumentError("Utility must be set and non-empty.");
  }
  for (double u : utility_) {
    RETURN_IF_ERROR(ValidateIsFinite(u, "Utility"));
  }

  std::vector<double> measure(utility_.size(), 1.0);
  if (measure_.has_value()) {
    if (measure_->size() != utility_.size()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Measure must have the same length as utility (", utility_.size(),
          "), but has length ", measure_->size(), "."));
    }
    measure = *measure_;
    bool any_positive = false;
    for (double m : measure) {
      RETURN_IF_ERROR(ValidateIsFiniteAndNonNegative(m, "Measure"));
      any_positive |= m > 0;
    }
    if (!any_positive) {
      return absl::InvalidArgumentError(
          "Measure must have at least one positive entry.");
    }
  }
  if (!candidates_.empty() && candidates_.size() != utility_.size()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Candidates must have the same length as utility (", utility_.size(),
        "), but has length ", candidates_.size(), "."));
  }

  // Work with log-weights, shifted so the largest is 0, so that very negative
  // utilities neither underflow nor overflow.
  const double scale = *epsilon_ / ((monotonic_ ? 1 : 2) * *sensitivity_);
  RETURN_IF_ERROR(ValidateIsFinite(scale, "Epsilon / sensitivity"));
  std::vector<double> log_weights(utility_.size());
  double max_log_weight = -std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < utility_.size(); ++i) {
    if (measure[i] > 0) {
      log_weights[i] = scale * utility_[i] + std::log(measure[i]);
      RETURN_IF_ERROR(
          ValidateIsFinite(log_weights[i], "Epsilon * utility / sensitivity"));
    } else {
      log_weights[i] = -std::numeric_limits<double>::infinity();
    }
    max_log_weight = std::max(max_log_weight, log_weights[i]);
  }
  std::vector<double> probabilities(utility_.size());
  double total = 0;
  for (size_t i = 0; i < utility_.size(); ++i) {
    probabilities[i] = std::exp(log_weights[i] - max_log_weight);
    total += probabilities[i];
  }
  for (double& p : probabilities) {
    p /= total;
  }
  VLOG(2) << "Exponential mechanism over " << probabilities.size()
          << " cells: " << VectorToString(probabilities);

  return ExponentialMechanism(*epsilon_, *sensitivity_, monotonic_,
                              std::move(probabilities), candidates_,
                              random_source_);
}

ExponentialMechanism::ExponentialMechanism(
    double epsilon, double sensitivity, bool monotonic,
    std::vector<double> probabilities, std::vector<std::string> candidates,
    RandomSource* random_source)
    : epsilon_(epsilon),
      sensitivity_(sensitivity),
      monotonic_(monotonic),
      probabilities_(std::move(probabilities)),
      candidates_(std::move(candidates)),
      random_source_(random_source != nullptr ? random_source
                                              : DefaultRandomSource()) {}

int64_t ExponentialMechanism::Randomise() const {
  const double r = random_source_->UniformDouble();
  double cumulative = 0;
  int64_t last_selectable = -1;
  for (size_t i = 0; i < probabilities_.size(); ++i) {
    if (probabilities_[i] == 0) continue;
    last_selectable = i;
    cumulative += probabilities_[i];
    if (r < cumulative) {
      return i;
    }
  }
  // Rounding can leave the cumulative sum just below 1.
  DCHECK_GE(last_selectable, 0);
  return last_selectable;
}

absl::StatusOr<std::string> ExponentialMechanism::RandomiseCandidate() const {
  if (candidates_.empty()) {
    return absl::FailedPreconditionError(
        "Candidates must be set to select a candidate.");
  }
  return candidates_[Randomise()];
}

}  // namespace diffpriv
