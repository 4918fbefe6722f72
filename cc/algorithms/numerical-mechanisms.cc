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

#include "algorithms/numerical-mechanisms.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "accounting/common/common.h"
#include "algorithms/rand.h"
#include "algorithms/util.h"
#include "base/logging.h"
#include "base/status_macros.h"
#include "boost/math/distributions/laplace.hpp"
#include "proto/confidence-interval.pb.h"

namespace diffpriv {
namespace {

// Out of range arguments yield NaN or infinity instead of throwing.
using NoThrowPolicy = boost::math::policies::policy<
    boost::math::policies::domain_error<
        boost::math::policies::errno_on_error>,
    boost::math::policies::overflow_error<
        boost::math::policies::errno_on_error>>;
using LaplaceDistribution =
    boost::math::laplace_distribution<double, NoThrowPolicy>;

// The maximum allowable probability that the noise will overflow.
const double kMaxOverflowProbability = std::pow(2.0, -64);

// Relative accuracy of the bounded Laplace scale.
constexpr double kScaleRelativeTolerance = 1e-12;

// Cdf of a centered Laplace distribution of scale `b` > 0.
double LaplaceCdf(double b, double x) {
  if (std::isinf(x)) {
    return x > 0 ? 1 : 0;
  }
  return boost::math::cdf(LaplaceDistribution(0, b), x);
}

RandomSource* SourceOrDefault(RandomSource* random_source) {
  return random_source != nullptr ? random_source : DefaultRandomSource();
}

}  // namespace

absl::StatusOr<LaplaceMechanism> LaplaceMechanism::Builder::Build() const {
  RETURN_IF_ERROR(ValidateEpsilon(epsilon_));
  RETURN_IF_ERROR(ValidateSensitivity(sensitivity_));
  if (delta_ != 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Delta must be 0 for the Laplace mechanism, but is %g.", delta_));
  }
  // Check that generated noise is not likely to overflow.
  const double diversity = *sensitivity_ / *epsilon_;
  if (diversity > 0) {
    const double overflow_probability =
        2 * LaplaceCdf(diversity, std::numeric_limits<double>::lowest());
    if (!std::isfinite(diversity) ||
        overflow_probability >= kMaxOverflowProbability) {
      return absl::InvalidArgumentError("Sensitivity is too high.");
    }
  }
  return LaplaceMechanism(*epsilon_, *sensitivity_, random_source_);
}

LaplaceMechanism::LaplaceMechanism(double epsilon, double sensitivity,
                                   RandomSource* random_source)
    : epsilon_(epsilon),
      sensitivity_(sensitivity),
      diversity_(sensitivity / epsilon),
      random_source_(SourceOrDefault(random_source)) {}

double LaplaceMechanism::AddNoise(double value) const {
  if (diversity_ == 0) {
    return value;
  }
  // u is uniform on (-0.5, 0.5]; |u| = 0.5 would give infinite noise.
  double u;
  do {
    u = 0.5 - random_source_->UniformDouble();
  } while (1 - 2 * std::fabs(u) == 0);
  return value - diversity_ * sign(u) * std::log(1 - 2 * std::fabs(u));
}

absl::StatusOr<ConfidenceInterval> LaplaceMechanism::NoiseConfidenceInterval(
    double confidence_level, double noised_result) const {
  RETURN_IF_ERROR(ValidateIsInInterval(confidence_level, 0, 1,
                                       /*include_lower=*/false,
                                       /*include_upper=*/false,
                                       "Confidence level"));
  // bound is negative as log(x) with 0 < x < 1 is negative.
  const double bound = diversity_ * std::log(1.0 - confidence_level);
  ConfidenceInterval result;
  result.set_lower_bound(noised_result + bound);
  result.set_upper_bound(noised_result - bound);
  result.set_confidence_level(confidence_level);
  return result;
}

double LaplaceMechanism::Cdf(double x) const {
  if (diversity_ == 0) {
    return x >= 0 ? 1 : 0;
  }
  return LaplaceCdf(diversity_, x);
}

namespace internal {

absl::StatusOr<double> BoundedLaplaceScale(double epsilon, double delta,
                                           double sensitivity, double domain) {
  if (sensitivity == 0) {
    return 0.0;
  }
  // Probability mass correction for truncating to a domain of width `domain`.
  auto delta_c = [sensitivity, domain](double b) {
    return (2 - std::exp(-sensitivity / b) -
            std::exp(-(domain - sensitivity) / b)) /
           (1 - std::exp(-domain / b));
  };
  auto f = [&](double b) -> absl::StatusOr<double> {
    const double correction = delta_c(b);
    const double denominator =
        epsilon - std::log(correction) - std::log(1 - delta);
    if (!(correction > 0) || !(denominator > 0)) {
      return absl::InternalError(absl::StrFormat(
          "Bounded Laplace calibration is undefined at scale %g.", b));
    }
    return sensitivity / denominator;
  };

  // f is decreasing and f(left) >= left, so f(b) - b has a single root in
  // [left, f(left)]. The upper end is widened by the tolerance so rounding in
  // f cannot leave the root outside the search interval.
  const double left = sensitivity / (epsilon - std::log(1 - delta));
  ASSIGN_OR_RETURN(const double right, f(left));
  if (!std::isfinite(right)) {
    return absl::InternalError("Bounded Laplace calibration diverged.");
  }

  accounting::BinarySearchParameters search_parameters = {
      .lower_bound = left,
      .upper_bound = std::max(left, right) * (1 + kScaleRelativeTolerance),
      .tolerance = kScaleRelativeTolerance * left};
  absl::StatusOr<double> scale = accounting::InverseMonotoneFunction(
      [&f](double b) -> absl::StatusOr<double> {
        ASSIGN_OR_RETURN(const double fb, f(b));
        return fb - b;
      },
      /*value=*/0, search_parameters, /*increasing=*/false);
  if (!scale.ok()) {
    return absl::InternalError(absl::StrCat(
        "Failed to calibrate the bounded Laplace scale: ",
        scale.status().message()));
  }
  VLOG(2) << "Bounded Laplace scale " << *scale << " for epsilon " << epsilon
          << ", delta " << delta << ", sensitivity " << sensitivity
          << ", domain " << domain;
  return scale;
}

}  // namespace internal

absl::StatusOr<LaplaceBoundedDomainMechanism>
LaplaceBoundedDomainMechanism::Builder::Build() const {
  RETURN_IF_ERROR(ValidateEpsilon(epsilon_));
  RETURN_IF_ERROR(ValidateDelta(delta_));
  RETURN_IF_ERROR(ValidateSensitivity(sensitivity_));
  if (!lower_.has_value() || !upper_.has_value()) {
    return absl::InvalidArgumentError(
        "Bounds must be set for the bounded Laplace mechanism.");
  }
  RETURN_IF_ERROR(ValidateIsFinite(lower_, "Lower bound"));
  RETURN_IF_ERROR(ValidateIsSet(upper_, "Upper bound"));
  if (std::isinf(*upper_) && *upper_ < 0) {
    return absl::InvalidArgumentError(
        "Upper bound must be finite or +infinity.");
  }
  if (!(*lower_ < *upper_)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Lower bound must be strictly less than upper bound, but got [%g, %g].",
        *lower_, *upper_));
  }

  ASSIGN_OR_RETURN(const double scale,
                   internal::BoundedLaplaceScale(*epsilon_, delta_,
                                                 *sensitivity_,
                                                 *upper_ - *lower_));
  return LaplaceBoundedDomainMechanism(*epsilon_, delta_, *sensitivity_,
                                       *lower_, *upper_, scale,
                                       random_source_);
}

LaplaceBoundedDomainMechanism::LaplaceBoundedDomainMechanism(
    double epsilon, double delta, double sensitivity, double lower,
    double upper, double scale, RandomSource* random_source)
    : epsilon_(epsilon),
      delta_(delta),
      sensitivity_(sensitivity),
      lower_(lower),
      upper_(upper),
      scale_(scale),
      random_source_(SourceOrDefault(random_source)) {}

double LaplaceBoundedDomainMechanism::AddNoise(double value) const {
  if (std::isnan(value)) {
    return value;
  }
  value = Clamp(lower_, upper_, value);
  if (scale_ == 0) {
    return value;
  }

  // Inverse transform sampling of the Laplace distribution centered on value
  // and truncated to [lower, upper].
  const LaplaceDistribution laplace(0, scale_);
  const double cdf_lower = LaplaceCdf(scale_, lower_ - value);
  const double cdf_upper = LaplaceCdf(scale_, upper_ - value);
  double noised;
  do {
    const double p = cdf_lower + random_source_->UniformDouble() *
                                     (cdf_upper - cdf_lower);
    noised = value + boost::math::quantile(laplace, p);
  } while (std::isnan(noised) ||
           noised == std::numeric_limits<double>::infinity());
  // Rounding can push the sample marginally outside the domain.
  return Clamp(lower_, upper_, noised);
}

std::optional<double> LaplaceBoundedDomainMechanism::GetEffectiveEpsilon()
    const {
  if (delta_ > 0) {
    return std::nullopt;
  }
  if (scale_ == 0) {
    return std::numeric_limits<double>::infinity();
  }
  return sensitivity_ / scale_;
}

double AddNoise(const NoiseMechanism& mechanism, double value) {
  return std::visit(
      [value](const auto& concrete) { return concrete.AddNoise(value); },
      mechanism);
}

}  // namespace diffpriv
