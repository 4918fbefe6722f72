// Copyright 2020 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "accounting/budget_accountant.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "accounting/common/common.h"
#include "base/logging.h"
#include "base/status_macros.h"

namespace diffpriv {
namespace accounting {
namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

// Not thread safe, like the accountants it holds.
std::vector<BudgetAccountant*>& DefaultStack() {
  static auto* kStack = new std::vector<BudgetAccountant*>();
  return *kStack;
}

bool IsWithinCap(double spent, double cap) {
  return spent <= cap || spent - cap <= kBudgetRelativeTolerance * cap;
}

// 1 - prod(1 - delta_i), accumulated from the smallest term to limit rounding.
double ComposeDeltas(std::vector<double> deltas) {
  std::sort(deltas.begin(), deltas.end());
  double total = 0;
  for (double delta : deltas) {
    total += delta - total * delta;
  }
  return total;
}

}  // namespace

bool IsBudgetError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kResourceExhausted;
}

BudgetAccountant::BudgetAccountant(double epsilon, double delta, double slack,
                                   BudgetAccountant* parent)
    : epsilon_(epsilon),
      delta_(delta),
      slack_(slack),
      min_epsilon_(std::isinf(epsilon) ? 0 : epsilon * 1e-14),
      parent_(parent) {}

absl::StatusOr<std::unique_ptr<BudgetAccountant>> BudgetAccountant::Create(
    double epsilon, double delta, double slack, BudgetAccountant* parent) {
  if (!(epsilon >= 0)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Epsilon budget must be non-negative, but is %g.", epsilon));
  }
  if (!(delta >= 0 && delta <= 1)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Delta budget must be in [0, 1], but is %g.", delta));
  }
  if (epsilon == 0 && delta == 0) {
    return absl::InvalidArgumentError(
        "Epsilon and delta budgets cannot both be zero.");
  }
  if (!(slack >= 0 && slack <= delta)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Slack must be in [0, delta] = [0, %g], but is %g.", delta, slack));
  }
  return std::unique_ptr<BudgetAccountant>(
      new BudgetAccountant(epsilon, delta, slack, parent));
}

EpsilonDelta BudgetAccountant::ComposedTotal(
    const std::vector<EpsilonDelta>& spends) const {
  double epsilon_sum = 0;
  double epsilon_exp_sum = 0;
  double epsilon_sq_sum = 0;
  std::vector<double> deltas = {slack_};
  for (const EpsilonDelta& spend : spends) {
    epsilon_sum += spend.epsilon;
    epsilon_exp_sum += (1 - std::exp(-spend.epsilon)) * spend.epsilon /
                       (1 + std::exp(-spend.epsilon));
    epsilon_sq_sum += spend.epsilon * spend.epsilon;
    deltas.push_back(spend.delta);
  }
  EpsilonDelta total{epsilon_sum, ComposeDeltas(std::move(deltas))};
  if (slack_ == 0) {
    return total;
  }

  // Theorem 3.4 of Kairouz, Oh and Viswanath, "The Composition Theorem for
  // Differential Privacy", in its two closed forms.
  const double epsilon_drv =
      epsilon_exp_sum + std::sqrt(2 * epsilon_sq_sum * std::log(1 / slack_));
  const double epsilon_kov =
      epsilon_exp_sum +
      std::sqrt(2 * epsilon_sq_sum *
                std::log(std::exp(1.0) + std::sqrt(epsilon_sq_sum) / slack_));
  total.epsilon = std::min({epsilon_sum, epsilon_drv, epsilon_kov});
  return total;
}

EpsilonDelta BudgetAccountant::Total() const {
  return ComposedTotal(spent_budget_);
}

absl::Status BudgetAccountant::CheckLocal(double epsilon, double delta) const {
  if (std::isinf(epsilon_) && delta_ == 1) {
    return absl::OkStatus();
  }
  if (epsilon > 0 && epsilon < min_epsilon_) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Epsilon must be at least %g if non-zero, but is %g.", min_epsilon_,
        epsilon));
  }

  std::vector<EpsilonDelta> spends = spent_budget_;
  spends.push_back({epsilon, delta});
  const EpsilonDelta total = ComposedTotal(spends);
  if (IsWithinCap(total.epsilon, epsilon_) &&
      IsWithinCap(total.delta, delta_)) {
    return absl::OkStatus();
  }

  const EpsilonDelta spent = Total();
  return absl::ResourceExhaustedError(absl::StrFormat(
      "Privacy spend of (%g, %g) not permissible; will exceed remaining "
      "privacy budget. Use BudgetAccountant::Remaining() to check remaining "
      "budget. Current spend is (%g, %g) of a budget of (%g, %g).",
      epsilon, delta, spent.epsilon, spent.delta, epsilon_, delta_));
}

absl::Status BudgetAccountant::Check(double epsilon, double delta) const {
  RETURN_IF_ERROR((EpsilonDelta{epsilon, delta}.Validate()));
  for (const BudgetAccountant* accountant = this; accountant != nullptr;
       accountant = accountant->parent_) {
    RETURN_IF_ERROR(accountant->CheckLocal(epsilon, delta));
  }
  return absl::OkStatus();
}

absl::Status BudgetAccountant::Spend(double epsilon, double delta) {
  RETURN_IF_ERROR(Check(epsilon, delta));
  for (BudgetAccountant* accountant = this; accountant != nullptr;
       accountant = accountant->parent_) {
    accountant->spent_budget_.push_back({epsilon, delta});
  }
  VLOG(1) << "Spent (" << epsilon << ", " << delta << "); total is now "
          << Total() << " of (" << epsilon_ << ", " << delta_ << ").";
  return absl::OkStatus();
}

absl::StatusOr<EpsilonDelta> BudgetAccountant::Remaining(int k) const {
  if (k < 1) {
    return absl::InvalidArgumentError(
        absl::StrFormat("k must be at least 1, but is %d.", k));
  }

  const EpsilonDelta spent = Total();
  double delta = 1.0;
  if (spent.delta < 1.0) {
    delta = 1 - std::pow((1 - delta_) / (1 - spent.delta), 1.0 / k);
  }
  delta = std::max(delta, 0.0);

  if (std::isinf(epsilon_)) {
    return EpsilonDelta{kInfinity, delta};
  }

  // Total epsilon after spending x another k times grows with x.
  auto total_after = [this, k](double x) -> absl::StatusOr<double> {
    std::vector<EpsilonDelta> spends = spent_budget_;
    spends.insert(spends.end(), k, EpsilonDelta{x, 0});
    return ComposedTotal(spends).epsilon;
  };
  BinarySearchParameters search_parameters = {
      .lower_bound = 0,
      .upper_bound = epsilon_,
      .tolerance = std::max(epsilon_ * kBudgetRelativeTolerance,
                            std::numeric_limits<double>::min())};
  absl::StatusOr<double> epsilon = InverseMonotoneFunction(
      total_after, epsilon_, search_parameters, /*increasing=*/true);
  if (absl::IsNotFound(epsilon.status())) {
    return EpsilonDelta{0, delta};
  }
  RETURN_IF_ERROR(epsilon.status());
  return EpsilonDelta{*epsilon, delta};
}

BudgetAccountant* BudgetAccountant::LoadDefault(BudgetAccountant* accountant) {
  if (accountant != nullptr) {
    return accountant;
  }
  std::vector<BudgetAccountant*>& stack = DefaultStack();
  if (!stack.empty()) {
    return stack.back();
  }
  static auto* kFallback = new BudgetAccountant();
  return kFallback;
}

ScopedDefaultAccountant::ScopedDefaultAccountant(BudgetAccountant* accountant)
    : accountant_(accountant) {
  CHECK(accountant_ != nullptr);
  DefaultStack().push_back(accountant_);
}

ScopedDefaultAccountant::~ScopedDefaultAccountant() {
  std::vector<BudgetAccountant*>& stack = DefaultStack();
  DCHECK(!stack.empty() && stack.back() == accountant_)
      << "Default accountant scopes must be released in reverse order.";
  if (!stack.empty()) {
    stack.pop_back();
  }
}

}  // namespace accounting
}  // namespace diffpriv
