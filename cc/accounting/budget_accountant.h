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

#ifndef DIFFPRIV_ACCOUNTING_BUDGET_ACCOUNTANT_H_
#define DIFFPRIV_ACCOUNTING_BUDGET_ACCOUNTANT_H_

#include <limits>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "accounting/common/common.h"

namespace diffpriv {
namespace accounting {

// Relative tolerance applied when comparing a spend against the budget cap, so
// that splitting a budget evenly never fails on floating point rounding.
inline constexpr double kBudgetRelativeTolerance = 1e-12;

// Returns true if `status` reports that a spend would exceed a privacy budget.
bool IsBudgetError(const absl::Status& status);

// Ledger of the privacy budget spent by a sequence of queries.
//
// Every spend is recorded as an (epsilon, delta) pair. Total() composes them
// either additively (slack = 0) or with the advanced composition theorem of
// Kairouz, Oh and Viswanath when a positive slack is configured. A spend that
// would make Total() exceed the cap is rejected with a ResourceExhausted error
// and leaves the ledger unchanged.
//
// An accountant may have a parent. Every spend is also charged to the parent
// and, transitively, to all of its ancestors; a spend is accepted only if every
// accountant on the chain can afford it. Parents must outlive their children.
//
// Estimators resolve the accountant to charge with LoadDefault(): an
// explicitly configured accountant wins, then the innermost
// ScopedDefaultAccountant, then a process-wide unlimited accountant created on
// first use.
//
// This class is not thread safe, and neither is the default accountant scope.
// Callers that query concurrently must use one accountant per thread or
// serialize access externally.
class BudgetAccountant {
 public:
  // Creates an accountant with an unlimited budget: epsilon = +inf, delta = 1.
  BudgetAccountant() = default;

  // Creates an accountant capped at (`epsilon`, `delta`). `slack` in
  // [0, `delta`] selects advanced composition when positive. `parent`, if not
  // null, is charged with every spend.
  static absl::StatusOr<std::unique_ptr<BudgetAccountant>> Create(
      double epsilon, double delta = 1.0, double slack = 0.0,
      BudgetAccountant* parent = nullptr);

  BudgetAccountant(const BudgetAccountant&) = delete;
  BudgetAccountant& operator=(const BudgetAccountant&) = delete;

  // Returns OK if (`epsilon`, `delta`) can be spent on this accountant and all
  // its ancestors. Returns InvalidArgument for malformed parameters and
  // ResourceExhausted if the cap would be exceeded. Never mutates the ledger.
  absl::Status Check(double epsilon, double delta = 0) const;

  // Checks and then records the spend here and on every ancestor.
  absl::Status Spend(double epsilon, double delta = 0);

  // Composed cumulative spend.
  EpsilonDelta Total() const;

  // Largest (epsilon, delta) that can still be spent `k` more times in equal
  // parts without exceeding the cap.
  absl::StatusOr<EpsilonDelta> Remaining(int k = 1) const;

  const std::vector<EpsilonDelta>& spent_budget() const {
    return spent_budget_;
  }
  double epsilon() const { return epsilon_; }
  double delta() const { return delta_; }
  double slack() const { return slack_; }
  BudgetAccountant* parent() const { return parent_; }

  // Returns `accountant` if it is not null. Otherwise returns the innermost
  // scoped default accountant, or the lazily created process-wide unlimited
  // accountant when no scope is active.
  static BudgetAccountant* LoadDefault(BudgetAccountant* accountant = nullptr);

 private:
  BudgetAccountant(double epsilon, double delta, double slack,
                   BudgetAccountant* parent);

  // Checks this accountant only, ignoring ancestors.
  absl::Status CheckLocal(double epsilon, double delta) const;

  EpsilonDelta ComposedTotal(const std::vector<EpsilonDelta>& spends) const;

  double epsilon_ = std::numeric_limits<double>::infinity();
  double delta_ = 1.0;
  double slack_ = 0.0;
  // Smallest non-zero epsilon this accountant accepts.
  double min_epsilon_ = 0.0;
  BudgetAccountant* parent_ = nullptr;
  std::vector<EpsilonDelta> spent_budget_;
};

// Makes `accountant` the default for the lifetime of this object. Scopes nest;
// destroying one restores the previously active default, on every exit path.
//
// Example:
//   BudgetAccountant accountant;
//   {
//     ScopedDefaultAccountant scope(&accountant);
//     ASSIGN_OR_RETURN(auto mean, Mean::Builder().SetRange(1).Build());
//     mean->Result(data);  // charged to `accountant`
//   }
class ScopedDefaultAccountant {
 public:
  explicit ScopedDefaultAccountant(BudgetAccountant* accountant);
  ~ScopedDefaultAccountant();

  ScopedDefaultAccountant(const ScopedDefaultAccountant&) = delete;
  ScopedDefaultAccountant& operator=(const ScopedDefaultAccountant&) = delete;

 private:
  BudgetAccountant* accountant_;
};

}  // namespace accounting
}  // namespace diffpriv

#endif  // DIFFPRIV_ACCOUNTING_BUDGET_ACCOUNTANT_H_
