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

#ifndef DIFFPRIV_ALGORITHMS_ARRAY_STATISTICS_H_
#define DIFFPRIV_ALGORITHMS_ARRAY_STATISTICS_H_

#include <memory>
#include <optional>
#include <utility>

#include "Eigen/Core"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "accounting/budget_accountant.h"
#include "algorithms/rand.h"
#include "algorithms/util.h"
#include "base/status_macros.h"

namespace diffpriv {

// Smallest range derived from the data. Keeps the sensitivity positive when
// every reduced value is equal.
inline constexpr double kMinimumDerivedRange = 1e-5;

// Configuration shared by the array statistics. Filled in by the builders.
struct ArrayStatisticOptions {
  double epsilon = kDefaultEpsilon;
  // Range of every value of the result.
  std::optional<double> range;
  // Range of each value of the result. Must have the shape of the result.
  std::optional<Eigen::ArrayXXd> ranges;
  // Clipping bounds. When set, upper - lower is used as the range.
  std::optional<double> lower;
  std::optional<double> upper;
  // Unset reduces over all values.
  std::optional<int> axis;
  bool keep_dims = false;
  // Resolved with BudgetAccountant::LoadDefault() on every Result() call.
  accounting::BudgetAccountant* accountant = nullptr;
  RandomSource* random_source = nullptr;
};

// Differentially private reduction of a two-dimensional array, either over all
// values or along one axis. One-dimensional data is an n x 1 column.
//
// The shape of the result follows the usual reduction rules:
//   - no axis:  1 x 1
//   - axis 0:   cols x 1, or 1 x cols with keep_dims
//   - axis 1:   rows x 1
//
// Every value of the result is noised independently. A call to Result() checks
// the accountant before any noise is drawn and spends epsilon once, after all
// values were noised. Values computed from NaN inputs are NaN.
//
// Instances are not thread safe.
class ArrayStatistic {
 public:
  virtual ~ArrayStatistic() = default;

  ArrayStatistic(const ArrayStatistic&) = delete;
  ArrayStatistic& operator=(const ArrayStatistic&) = delete;

  absl::StatusOr<Eigen::ArrayXXd> Result(const Eigen::ArrayXXd& data) const;

  double GetEpsilon() const { return options_.epsilon; }
  std::optional<int> GetAxis() const { return options_.axis; }

 protected:
  explicit ArrayStatistic(ArrayStatisticOptions options)
      : options_(std::move(options)) {}

  // Checks that a reduction over `count` values is well defined.
  virtual absl::Status ValidateCount(int count) const {
    return absl::OkStatus();
  }

  // Returns one noised value per column of `cells`. `ranges` holds the range
  // of each column.
  virtual absl::StatusOr<Eigen::ArrayXd> NoiseCells(
      const Eigen::ArrayXXd& cells, const Eigen::ArrayXd& ranges) const = 0;

  // Deterministic transform of the noised result. Spends no budget.
  virtual Eigen::ArrayXXd PostProcess(Eigen::ArrayXXd result) const {
    return result;
  }

  RandomSource* random_source() const { return options_.random_source; }

 private:
  // Lays out `data` so that each column holds the values of one result cell.
  Eigen::ArrayXXd ToCells(const Eigen::ArrayXXd& data) const;

  // Reshapes one value per cell into the shape of the result.
  Eigen::ArrayXXd ToResultShape(const Eigen::ArrayXd& values) const;

  // Range of each cell, derived from the data when none was configured.
  absl::StatusOr<Eigen::ArrayXd> CellRanges(
      const Eigen::ArrayXXd& cells) const;

  ArrayStatisticOptions options_;
};

// Builder shared by the array statistics.
template <class Algorithm, class Builder>
class ArrayStatisticBuilder {
 public:
  virtual ~ArrayStatisticBuilder() = default;

  absl::StatusOr<std::unique_ptr<Algorithm>> Build() {
    RETURN_IF_ERROR(ValidateEpsilon(options_.epsilon));
    if (options_.axis.has_value() && *options_.axis != 0 &&
        *options_.axis != 1) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Axis must be 0 or 1 for two-dimensional data, but is ",
          *options_.axis, "."));
    }
    RETURN_IF_ERROR(ValidateBounds(options_.lower, options_.upper));
    const bool has_bounds = options_.lower.has_value();
    const bool has_range =
        options_.range.has_value() || options_.ranges.has_value();
    if (has_bounds && has_range) {
      return absl::InvalidArgumentError(
          "Either the range or the bounds can be set, but not both.");
    }
    if (options_.range.has_value()) {
      RETURN_IF_ERROR(ValidateIsFiniteAndPositive(options_.range, "Range"));
    }
    if (options_.ranges.has_value()) {
      for (double range : options_.ranges->reshaped()) {
        RETURN_IF_ERROR(ValidateIsFiniteAndPositive(range, "Range"));
      }
    }
    return BuildAlgorithm();
  }

  Builder& SetEpsilon(double epsilon) {
    options_.epsilon = epsilon;
    return *static_cast<Builder*>(this);
  }

  // Range of every value of the result. Replaces ranges set with SetRanges.
  Builder& SetRange(double range) {
    options_.range = range;
    options_.ranges.reset();
    return *static_cast<Builder*>(this);
  }

  // Range of each value of the result, in the shape of the result.
  Builder& SetRanges(Eigen::ArrayXXd ranges) {
    options_.ranges = std::move(ranges);
    options_.range.reset();
    return *static_cast<Builder*>(this);
  }

  // Clips the data to [lower, upper] and uses upper - lower as the range.
  Builder& SetBounds(double lower, double upper) {
    options_.lower = lower;
    options_.upper = upper;
    return *static_cast<Builder*>(this);
  }

  Builder& SetAxis(int axis) {
    options_.axis = axis;
    return *static_cast<Builder*>(this);
  }

  Builder& SetKeepDims(bool keep_dims) {
    options_.keep_dims = keep_dims;
    return *static_cast<Builder*>(this);
  }

  // Not owned.
  Builder& SetAccountant(accounting::BudgetAccountant* accountant) {
    options_.accountant = accountant;
    return *static_cast<Builder*>(this);
  }

  // Not owned.
  Builder& SetRandomSource(RandomSource* random_source) {
    options_.random_source = random_source;
    return *static_cast<Builder*>(this);
  }

 protected:
  const ArrayStatisticOptions& GetOptions() const { return options_; }

  virtual absl::StatusOr<std::unique_ptr<Algorithm>> BuildAlgorithm() = 0;

 private:
  ArrayStatisticOptions options_;
};

// Mean with Laplace noise of sensitivity range / n, where n is the number of
// values reduced into each cell.
class Mean : public ArrayStatistic {
 public:
  class Builder : public ArrayStatisticBuilder<Mean, Builder> {
   protected:
    absl::StatusOr<std::unique_ptr<Mean>> BuildAlgorithm() override {
      return std::unique_ptr<Mean>(new Mean(GetOptions()));
    }
  };

 protected:
  absl::StatusOr<Eigen::ArrayXd> NoiseCells(
      const Eigen::ArrayXXd& cells,
      const Eigen::ArrayXd& ranges) const override;

 private:
  explicit Mean(ArrayStatisticOptions options)
      : ArrayStatistic(std::move(options)) {}
};

// Variance with (range / n)^2 * (n - 1) sensitivity, noised with the bounded
// Laplace mechanism on [0, +inf) so the result is never negative. `ddof` is
// subtracted from n in the divisor of the variance only.
class Variance : public ArrayStatistic {
 public:
  class Builder : public ArrayStatisticBuilder<Variance, Builder> {
   public:
    Builder& SetDdof(int ddof) {
      ddof_ = ddof;
      return *this;
    }

   protected:
    absl::StatusOr<std::unique_ptr<Variance>> BuildAlgorithm() override {
      RETURN_IF_ERROR(ValidateIsNonNegative(ddof_, "Ddof"));
      return std::unique_ptr<Variance>(new Variance(GetOptions(), ddof_));
    }

   private:
    int ddof_ = 0;
  };

  int GetDdof() const { return ddof_; }

 protected:
  Variance(ArrayStatisticOptions options, int ddof)
      : ArrayStatistic(std::move(options)), ddof_(ddof) {}

  absl::Status ValidateCount(int count) const override;

  absl::StatusOr<Eigen::ArrayXd> NoiseCells(
      const Eigen::ArrayXXd& cells,
      const Eigen::ArrayXd& ranges) const override;

 private:
  int ddof_;
};

// Square root of the differentially private variance.
class StandardDeviation : public Variance {
 public:
  class Builder : public ArrayStatisticBuilder<StandardDeviation, Builder> {
   public:
    Builder& SetDdof(int ddof) {
      ddof_ = ddof;
      return *this;
    }

   protected:
    absl::StatusOr<std::unique_ptr<StandardDeviation>> BuildAlgorithm()
        override {
      RETURN_IF_ERROR(ValidateIsNonNegative(ddof_, "Ddof"));
      return std::unique_ptr<StandardDeviation>(
          new StandardDeviation(GetOptions(), ddof_));
    }

   private:
    int ddof_ = 0;
  };

 protected:
  Eigen::ArrayXXd PostProcess(Eigen::ArrayXXd result) const override;

 private:
  StandardDeviation(ArrayStatisticOptions options, int ddof)
      : Variance(std::move(options), ddof) {}
};

}  // namespace diffpriv

#endif  // DIFFPRIV_ALGORITHMS_ARRAY_STATISTICS_H_
