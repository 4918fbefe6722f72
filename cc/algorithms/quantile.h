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

#ifndef DIFFPRIV_ALGORITHMS_QUANTILE_H_
#define DIFFPRIV_ALGORITHMS_QUANTILE_H_

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "Eigen/Core"
#include "absl/status/statusor.h"
#include "accounting/budget_accountant.h"
#include "algorithms/rand.h"
#include "algorithms/util.h"

namespace diffpriv {

// Calculates differentially private quantiles of a set of values with the
// exponential mechanism, following Smith, "Privacy-preserving statistical
// estimation with optimal convergence rates", STOC 2011.
//
// The values are clipped to the bounds, the bounds are added as the outermost
// values and everything is sorted. The k + 1 gaps between consecutive values
// are the cells of an exponential mechanism with sensitivity 1, where gap i
// has the width of the gap as its measure and -|i - q * k| as its utility. The
// result is drawn uniformly from the selected gap.
//
// Several quantiles can be requested at once. Each gets an equal share of
// epsilon and the accountant is charged epsilon once per Result() call.
// Arrays are always flattened. Instances are not thread safe.
class Quantile {
 public:
  class Builder {
   public:
    Builder& SetEpsilon(double epsilon) {
      epsilon_ = epsilon;
      return *this;
    }

    // Replaces the quantiles set before.
    Builder& SetQuantile(double quantile) {
      quantiles_ = {quantile};
      return *this;
    }

    Builder& SetQuantiles(std::vector<double> quantiles) {
      quantiles_ = std::move(quantiles);
      return *this;
    }

    // Without bounds the smallest and largest values of the data are used,
    // which leaks privacy.
    Builder& SetBounds(double lower, double upper) {
      lower_ = lower;
      upper_ = upper;
      return *this;
    }

    // Accepted for compatibility with the other statistics. Quantiles are
    // always computed over the flattened data, so these only warn.
    Builder& SetAxis(int axis) {
      axis_ = axis;
      return *this;
    }
    Builder& SetKeepDims(bool keep_dims) {
      keep_dims_ = keep_dims;
      return *this;
    }

    // Not owned.
    Builder& SetAccountant(accounting::BudgetAccountant* accountant) {
      accountant_ = accountant;
      return *this;
    }

    // Not owned.
    Builder& SetRandomSource(RandomSource* random_source) {
      random_source_ = random_source;
      return *this;
    }

    absl::StatusOr<std::unique_ptr<Quantile>> Build() const;

   private:
    double epsilon_ = kDefaultEpsilon;
    std::vector<double> quantiles_;
    std::optional<double> lower_;
    std::optional<double> upper_;
    std::optional<int> axis_;
    bool keep_dims_ = false;
    accounting::BudgetAccountant* accountant_ = nullptr;
    RandomSource* random_source_ = nullptr;
  };

  Quantile(const Quantile&) = delete;
  Quantile& operator=(const Quantile&) = delete;

  // Returns one value per requested quantile, in the order they were set.
  // Every value is NaN if the data contains NaN, in which case no budget is
  // spent.
  absl::StatusOr<std::vector<double>> Result(
      const std::vector<double>& data) const;

  template <typename Iterator>
  absl::StatusOr<std::vector<double>> Result(Iterator begin,
                                             Iterator end) const {
    return Result(std::vector<double>(begin, end));
  }

  absl::StatusOr<std::vector<double>> Result(
      const Eigen::ArrayXXd& data) const;

  double GetEpsilon() const { return epsilon_; }
  const std::vector<double>& GetQuantiles() const { return quantiles_; }

 private:
  Quantile(double epsilon, std::vector<double> quantiles,
           std::optional<double> lower, std::optional<double> upper,
           accounting::BudgetAccountant* accountant,
           RandomSource* random_source);

  // Single quantile of `sorted`, which holds the clipped data with both bounds
  // added, in ascending order.
  absl::StatusOr<double> SortedQuantile(const std::vector<double>& sorted,
                                        double quantile,
                                        double epsilon) const;

  double epsilon_;
  std::vector<double> quantiles_;
  std::optional<double> lower_;
  std::optional<double> upper_;
  accounting::BudgetAccountant* accountant_;
  RandomSource* random_source_;
};

}  // namespace diffpriv

#endif  // DIFFPRIV_ALGORITHMS_QUANTILE_H_
