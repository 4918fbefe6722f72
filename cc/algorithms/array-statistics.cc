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

#include "algorithms/array-statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "Eigen/Core"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "accounting/budget_accountant.h"
#include "algorithms/numerical-mechanisms.h"
#include "algorithms/util.h"
#include "base/status_macros.h"
#include "base/warnings.h"

namespace diffpriv {
namespace {

constexpr char kRangeLeakWarning[] =
    "Range parameter has not been specified, so falling back to determining "
    "range from the data. This will result in additional privacy leakage. To "
    "ensure differential privacy with no additional privacy loss, specify the "
    "range of each value of the result.";

}  // namespace

Eigen::ArrayXXd ArrayStatistic::ToCells(const Eigen::ArrayXXd& data) const {
  if (!options_.axis.has_value()) {
    Eigen::ArrayXXd cells(data.size(), 1);
    cells.col(0) = data.reshaped();
    return cells;
  }
  if (*options_.axis == 0) {
    return data;
  }
  return data.transpose();
}

Eigen::ArrayXXd ArrayStatistic::ToResultShape(
    const Eigen::ArrayXd& values) const {
  if (options_.axis.has_value() && *options_.axis == 0 && options_.keep_dims) {
    return values.transpose();
  }
  return values;
}

absl::StatusOr<Eigen::ArrayXd> ArrayStatistic::CellRanges(
    const Eigen::ArrayXXd& cells) const {
  const Eigen::Index num_cells = cells.cols();
  if (options_.range.has_value()) {
    return Eigen::ArrayXd(
        Eigen::ArrayXd::Constant(num_cells, *options_.range));
  }
  if (options_.lower.has_value()) {
    return Eigen::ArrayXd(Eigen::ArrayXd::Constant(
        num_cells, *options_.upper - *options_.lower));
  }
  if (options_.ranges.has_value()) {
    const Eigen::ArrayXXd result_shape =
        ToResultShape(Eigen::ArrayXd::Zero(num_cells));
    if (options_.ranges->rows() != result_shape.rows() ||
        options_.ranges->cols() != result_shape.cols()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Shape of ranges (%d x %d) must match the shape of the result "
          "(%d x %d).",
          options_.ranges->rows(), options_.ranges->cols(),
          result_shape.rows(), result_shape.cols()));
    }
    return Eigen::ArrayXd(options_.ranges->reshaped());
  }

  base::Warn(base::WarningType::kPrivacyLeak, kRangeLeakWarning);
  Eigen::ArrayXd ranges(num_cells);
  for (Eigen::Index j = 0; j < num_cells; ++j) {
    const auto cell = cells.col(j);
    // A NaN cell yields NaN whatever its range.
    ranges(j) = cell.isNaN().any()
                    ? kMinimumDerivedRange
                    : std::max(cell.maxCoeff() - cell.minCoeff(),
                               kMinimumDerivedRange);
  }
  return ranges;
}

absl::StatusOr<Eigen::ArrayXXd> ArrayStatistic::Result(
    const Eigen::ArrayXXd& data) const {
  if (data.size() == 0) {
    return absl::InvalidArgumentError("Data must not be empty.");
  }

  Eigen::ArrayXXd clipped = data;
  if (options_.lower.has_value()) {
    const double lower = *options_.lower;
    const double upper = *options_.upper;
    clipped = data.unaryExpr([lower, upper](double x) {
      return std::isnan(x) ? x : Clamp(lower, upper, x);
    });
  }
  const Eigen::ArrayXXd cells = ToCells(clipped);
  RETURN_IF_ERROR(ValidateCount(cells.rows()));
  ASSIGN_OR_RETURN(const Eigen::ArrayXd ranges, CellRanges(cells));

  accounting::BudgetAccountant* accountant =
      accounting::BudgetAccountant::LoadDefault(options_.accountant);
  RETURN_IF_ERROR(accountant->Check(options_.epsilon));
  ASSIGN_OR_RETURN(const Eigen::ArrayXd noised, NoiseCells(cells, ranges));
  RETURN_IF_ERROR(accountant->Spend(options_.epsilon));

  return PostProcess(ToResultShape(noised));
}

absl::StatusOr<Eigen::ArrayXd> Mean::NoiseCells(
    const Eigen::ArrayXXd& cells, const Eigen::ArrayXd& ranges) const {
  const double count = cells.rows();
  Eigen::ArrayXd noised(cells.cols());
  for (Eigen::Index j = 0; j < cells.cols(); ++j) {
    ASSIGN_OR_RETURN(LaplaceMechanism mechanism,
                     LaplaceMechanism::Builder()
                         .SetEpsilon(GetEpsilon())
                         .SetSensitivity(ranges(j) / count)
                         .SetRandomSource(random_source())
                         .Build());
    noised(j) = mechanism.AddNoise(cells.col(j).mean());
  }
  return noised;
}

absl::Status Variance::ValidateCount(int count) const {
  if (ddof_ >= count) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Ddof must be less than the number of values reduced (%d), but is %d.",
        count, ddof_));
  }
  return absl::OkStatus();
}

absl::StatusOr<Eigen::ArrayXd> Variance::NoiseCells(
    const Eigen::ArrayXXd& cells, const Eigen::ArrayXd& ranges) const {
  const double count = cells.rows();
  Eigen::ArrayXd noised(cells.cols());
  for (Eigen::Index j = 0; j < cells.cols(); ++j) {
    const auto cell = cells.col(j);
    const double variance =
        (cell - cell.mean()).square().sum() / (count - ddof_);
    const double sensitivity =
        (ranges(j) / count) * (ranges(j) / count) * (count - 1);
    ASSIGN_OR_RETURN(LaplaceBoundedDomainMechanism mechanism,
                     LaplaceBoundedDomainMechanism::Builder()
                         .SetEpsilon(GetEpsilon())
                         .SetSensitivity(sensitivity)
                         .SetBounds(0, std::numeric_limits<double>::infinity())
                         .SetRandomSource(random_source())
                         .Build());
    noised(j) = mechanism.AddNoise(variance);
  }
  return noised;
}

Eigen::ArrayXXd StandardDeviation::PostProcess(Eigen::ArrayXXd result) const {
  return result.sqrt();
}

}  // namespace diffpriv
