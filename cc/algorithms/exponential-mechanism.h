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

#ifndef DIFFPRIV_ALGORITHMS_EXPONENTIAL_MECHANISM_H_
#define DIFFPRIV_ALGORITHMS_EXPONENTIAL_MECHANISM_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "algorithms/rand.h"

namespace diffpriv {

// Selects one of a finite set of cells, where cell i is chosen with
// probability proportional to
//
//   measure[i] * exp(epsilon * utility[i] / (2 * sensitivity))
//
// as described by McSherry and Talwar, "Mechanism Design via Differential
// Privacy", 2007. When the utility is monotonic (adding a record moves every
// utility in the same direction) the factor of 2 is dropped.
//
// The measure is an optional non-negative weight per cell, for instance the
// width of the interval a cell stands for when selecting from a partitioned
// continuous range. Cells of measure 0 are never selected.
//
// The selection probabilities are computed once by the builder.
class ExponentialMechanism {
 public:
  class Builder {
   public:
    Builder& SetEpsilon(double epsilon) {
      epsilon_ = epsilon;
      return *this;
    }

    // Must be 0 if set.
    Builder& SetDelta(double delta) {
      delta_ = delta;
      return *this;
    }

    Builder& SetSensitivity(double sensitivity) {
      sensitivity_ = sensitivity;
      return *this;
    }

    Builder& SetUtility(std::vector<double> utility) {
      utility_ = std::move(utility);
      return *this;
    }

    // Defaults to 1 for every cell.
    Builder& SetMeasure(std::vector<double> measure) {
      measure_ = std::move(measure);
      return *this;
    }

    Builder& SetMonotonic(bool monotonic) {
      monotonic_ = monotonic;
      return *this;
    }

    // Optional labels, one per utility entry, returned by
    // RandomiseCandidate().
    Builder& SetCandidates(std::vector<std::string> candidates) {
      candidates_ = std::move(candidates);
      return *this;
    }

    // Not owned.
    Builder& SetRandomSource(RandomSource* random_source) {
      random_source_ = random_source;
      return *this;
    }

    absl::StatusOr<ExponentialMechanism> Build() const;

   private:
    std::optional<double> epsilon_;
    double delta_ = 0;
    std::optional<double> sensitivity_;
    std::vector<double> utility_;
    std::optional<std::vector<double>> measure_;
    bool monotonic_ = false;
    std::vector<std::string> candidates_;
    RandomSource* random_source_ = nullptr;
  };

  // Returns the index of the selected cell.
  int64_t Randomise() const;

  // Returns the label of the selected cell. Fails if no candidates were set.
  absl::StatusOr<std::string> RandomiseCandidate() const;

  // Normalised selection probability of each cell.
  const std::vector<double>& GetProbabilities() const {
    return probabilities_;
  }

  double GetEpsilon() const { return epsilon_; }
  double GetSensitivity() const { return sensitivity_; }
  bool IsMonotonic() const { return monotonic_; }

 private:
  ExponentialMechanism(double epsilon, double sensitivity, bool monotonic,
                       std::vector<double> probabilities,
                       std::vector<std::string> candidates,
                       RandomSource* random_source);

  double epsilon_;
  double sensitivity_;
  bool monotonic_;
  std::vector<double> probabilities_;
  std::vector<std::string> candidates_;
  RandomSource* random_source_;
};

}  // namespace diffpriv

#endif  // DIFFPRIV_ALGORITHMS_EXPONENTIAL_MECHANISM_H_
