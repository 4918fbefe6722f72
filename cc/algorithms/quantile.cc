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

#include "algorithms/quantile.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

#include "Eigen/Core"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "accounting/budget_accountant.h"
#include "algorithms/array-statistics.h"
#include "algorithms/exponential-mechanism.h"
#include "algorithms/util.h"
#include "base/logging.h"
#include "base/status_macros.h"
#include "base/warnings.h"

namespace diffpriv {
namespace {

constexpr char kBoundsLeakWarning[] =
    "Bounds have not been specified and will be calculated on the data "
    "provided. This will result in additional privacy leakage. To ensure "
    "differential privacy and no additional privacy leakage, specify bounds "
    "for the data.";

constexpr char kAxisWarning[] =
    "Quantiles are computed over the flattened data. The axis and keep_dims "
    "parameters are ignored.";

}  // namespace

absl::StatusOr<std::unique_ptr<Quantile>> Quantile::Builder::Build() const {
  RETURN_IF_ERROR(ValidateEpsilon(epsilon_));
  RETURN_IF_ERROR(ValidateQuantiles(quantiles_));
  RETURN_IF_ERROR(ValidateBounds(lower_, upper_));
  if (axis_.has_value() || keep_dims_) {
    base::Warn(base::WarningType::kCompatibility, kAxisWarning);
  }
  return std::unique_ptr<Quantile>(new Quantile(
      epsilon_, quantiles_, lower_, upper_, accountant_, random_source_));
}

Quantile::Quantile(double epsilon, std::vector<double> quantiles,
                   std::optional<double> lower, std::optional<double> upper,
                   accounting::BudgetAccountant* accountant,
                   RandomSource* random_source)
    : epsilon_(epsilon),
      quantiles_(std::move(quantiles)),
      lower_(lower),
      upper_(upper),
      accountant_(accountant),
      random_source_(random_source != nullptr ? random_source
                                              : DefaultRandomSource()) {}

absl::StatusOr<std::vector<double>> Quantile::Result(
    const Eigen::ArrayXXd& data) const {
  return Result(std::vector<double>(data.data(), data.data() + data.size()));
}

absl::StatusOr<std::vector<double>> Quantile::Result(
    const std::vector<double>& data) const {
  double lower;
  double upper;
  if (lower_.has_value()) {
    lower = *lower_;
    upper = *upper_;
  } else {
    if (data.empty()) {
      return absl::InvalidArgumentError(
          "Data must not be empty when no bounds are set.");
    }
    base::Warn(base::WarningType::kPrivacyLeak, kBoundsLeakWarning);
    lower = std::numeric_limits<double>::infinity();
    upper = -std::numeric_limits<double>::infinity();
    for (double value : data) {
      if (!std::isnan(value)) {
        lower = std::min(lower, value);
        upper = std::max(upper, value);
      }
    }
    if (lower > upper) {
      // Only NaN values, the result is NaN whatever the bounds.
      lower = 0;
      upper = 0;
    }
    if (lower == upper) {
      upper = lower + kMinimumDerivedRange;
    }
  }

  accounting::BudgetAccountant* accountant =
      accounting::BudgetAccountant::LoadDefault(accountant_);
  RETURN_IF_ERROR(accountant->Check(epsilon_));

  if (std::any_of(data.begin(), data.end(),
                  [](double value) { return std::isnan(value); })) {
    return std::vector<double>(quantiles_.size(),
                               std::numeric_limits<double>::quiet_NaN());
  }

  std::vector<double> sorted;
  sorted.reserve(data.size() + 2);
  for (double value : data) {
    sorted.push_back(Clamp(lower, upper, value));
  }
  sorted.push_back(lower);
  sorted.push_back(upper);
  std::sort(sorted.begin(), sorted.end());

  const double epsilon_per_quantile = epsilon_ / quantiles_.size();
  std::vector<double> results;
  results.reserve(quantiles_.size());
  for (double quantile : quantiles_) {
    ASSIGN_OR_RETURN(double result,
                     SortedQuantile(sorted, quantile, epsilon_per_quantile));
    results.push_back(result);
  }
  RETURN_IF_ERROR(accountant->Spend(epsilon_));
  return results;
}

absl::StatusOr<double> Quantile::SortedQuantile(
    const std::vector<double>& sorted, double quantile,
    double epsilon) const {
  // `sorted` holds k data points plus both bounds.
  const int64_t k = static_cast<int64_t>(sorted.size()) - 2;
  std::vector<double> utility(k + 1);
  std::vector<double> measure(k + 1);
  for (int64_t i = 0; i <= k; ++i) {
    utility[i] = -std::abs(i - quantile * k);
    measure[i] = sorted[i + 1] - sorted[i];
  }

  ASSIGN_OR_RETURN(ExponentialMechanism mechanism,
                   ExponentialMechanism::Builder()
                       .SetEpsilon(epsilon)
                       .SetSensitivity(1)
                       .SetMonotonic(false)
                       .SetUtility(std::move(utility))
                       .SetMeasure(std::move(measure))
                       .SetRandomSource(random_source_)
                       .Build());
  const int64_t index = mechanism.Randomise();
  DCHECK_LT(index, k + 1);
  const double gap = sorted[index + 1] - sorted[index];
  return sorted[index] + random_source_->UniformDouble() * gap;
}

}  // namespace diffpriv
