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

#ifndef DIFFPRIV_ALGORITHMS_NUMERICAL_MECHANISMS_H_
#define DIFFPRIV_ALGORITHMS_NUMERICAL_MECHANISMS_H_

#include <optional>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "algorithms/rand.h"
#include "proto/confidence-interval.pb.h"

// Mechanisms that add differentially private noise to a numerical value.
// Rather than sampling directly from a distribution, these classes take the
// differential privacy parameters (epsilon, delta, sensitivity) and calibrate
// the distribution from them.
//
// Mechanisms are immutable. They are created by their nested Builder, which
// validates the whole configuration, so a mechanism that exists is always
// usable. AddNoise() draws from the RandomSource given to the builder, or from
// DefaultRandomSource() when none was given.
namespace diffpriv {

// Provides differential privacy by adding Laplace noise of scale
// sensitivity / epsilon. This is a pure epsilon mechanism: delta must be 0.
class LaplaceMechanism {
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

    // Not owned.
    Builder& SetRandomSource(RandomSource* random_source) {
      random_source_ = random_source;
      return *this;
    }

    absl::StatusOr<LaplaceMechanism> Build() const;

   private:
    std::optional<double> epsilon_;
    double delta_ = 0;
    std::optional<double> sensitivity_;
    RandomSource* random_source_ = nullptr;
  };

  // Returns `value` plus Laplace noise.
  double AddNoise(double value) const;

  // Returns the confidence interval of the specified confidence level of the
  // noise that AddNoise() would add, centered on `noised_result`.
  // If the returned value is <x,y>, then the noise added has a confidence_level
  // chance of being in the domain [x,y].
  absl::StatusOr<ConfidenceInterval> NoiseConfidenceInterval(
      double confidence_level, double noised_result = 0) const;

  double GetEpsilon() const { return epsilon_; }
  double GetDelta() const { return 0; }
  double GetSensitivity() const { return sensitivity_; }

  // Returns the diversity (scale) of the underlying laplace distribution.
  double GetDiversity() const { return diversity_; }

  double GetVariance() const { return 2 * diversity_ * diversity_; }

  // Returns the probability that the noise added is no greater than x.
  double Cdf(double x) const;

 private:
  LaplaceMechanism(double epsilon, double sensitivity,
                   RandomSource* random_source);

  double epsilon_;
  double sensitivity_;
  double diversity_;
  RandomSource* random_source_;
};

// Laplace mechanism whose output always lies in [lower, upper], following
// Holohan et al., "The Bounded Laplace Mechanism in Differential Privacy",
// 2018. The noise is a Laplace distribution truncated to the domain, with a
// scale calibrated so that the truncation preserves (epsilon, delta)-DP.
//
// `upper` may be +infinity, giving a domain bounded below only.
class LaplaceBoundedDomainMechanism {
 public:
  class Builder {
   public:
    Builder& SetEpsilon(double epsilon) {
      epsilon_ = epsilon;
      return *this;
    }

    Builder& SetDelta(double delta) {
      delta_ = delta;
      return *this;
    }

    Builder& SetSensitivity(double sensitivity) {
      sensitivity_ = sensitivity;
      return *this;
    }

    Builder& SetBounds(double lower, double upper) {
      lower_ = lower;
      upper_ = upper;
      return *this;
    }

    // Not owned.
    Builder& SetRandomSource(RandomSource* random_source) {
      random_source_ = random_source;
      return *this;
    }

    // Validates the configuration and solves for the effective scale. Returns
    // InternalError if the calibration does not converge.
    absl::StatusOr<LaplaceBoundedDomainMechanism> Build() const;

   private:
    std::optional<double> epsilon_;
    double delta_ = 0;
    std::optional<double> sensitivity_;
    std::optional<double> lower_;
    std::optional<double> upper_;
    RandomSource* random_source_ = nullptr;
  };

  // Returns a noised version of `value`, in [lower, upper]. Values outside the
  // domain are first clamped into it. NaN is returned unchanged.
  double AddNoise(double value) const;

  double GetEpsilon() const { return epsilon_; }
  double GetDelta() const { return delta_; }
  double GetSensitivity() const { return sensitivity_; }
  double GetLower() const { return lower_; }
  double GetUpper() const { return upper_; }

  // Scale of the truncated Laplace distribution.
  double GetEffectiveScale() const { return scale_; }

  // Epsilon of an untruncated Laplace mechanism with the same scale. Only
  // defined for pure mechanisms (delta == 0).
  std::optional<double> GetEffectiveEpsilon() const;

 private:
  LaplaceBoundedDomainMechanism(double epsilon, double delta,
                                double sensitivity, double lower, double upper,
                                double scale, RandomSource* random_source);

  double epsilon_;
  double delta_;
  double sensitivity_;
  double lower_;
  double upper_;
  double scale_;
  RandomSource* random_source_;
};

// The closed set of mechanisms that add noise to a single value.
using NoiseMechanism =
    std::variant<LaplaceMechanism, LaplaceBoundedDomainMechanism>;

// Adds noise to `value` with whichever mechanism `mechanism` holds.
double AddNoise(const NoiseMechanism& mechanism, double value);

namespace internal {

// Solves the bounded Laplace calibration for the scale b' with
// b' = sensitivity / (epsilon - ln(delta_c(b')) - ln(1 - delta)), where
// delta_c is the probability mass correction of truncating to a domain of
// width `domain`. `domain` may be infinite.
absl::StatusOr<double> BoundedLaplaceScale(double epsilon, double delta,
                                           double sensitivity, double domain);

}  // namespace internal
}  // namespace diffpriv

#endif  // DIFFPRIV_ALGORITHMS_NUMERICAL_MECHANISMS_H_
