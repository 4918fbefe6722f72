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

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>

#include "Eigen/Core"
#include "base/testing/status_matchers.h"
#include "base/testing/warning_recorder.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/statusor.h"
#include "accounting/budget_accountant.h"
#include "algorithms/rand.h"
#include "base/warnings.h"

namespace diffpriv {
namespace {

using ::diffpriv::accounting::BudgetAccountant;
using ::diffpriv::accounting::ScopedDefaultAccountant;
using ::diffpriv::base::WarningType;
using ::diffpriv::base::testing::StatusIs;
using ::diffpriv::base::testing::WarningRecorder;
using ::testing::HasSubstr;

// Large enough that the noise is negligible next to the tolerances below.
constexpr double kLargeEpsilon = 1e4;

Eigen::ArrayXXd UniformData(int rows, int cols, uint64_t seed) {
  SeededRandomSource source(seed);
  Eigen::ArrayXXd data(rows, cols);
  for (Eigen::Index i = 0; i < data.size(); ++i) {
    data(i) = source.UniformDouble();
  }
  return data;
}

std::unique_ptr<BudgetAccountant> MakeAccountant(double epsilon) {
  absl::StatusOr<std::unique_ptr<BudgetAccountant>> accountant =
      BudgetAccountant::Create(epsilon, 0);
  EXPECT_OK(accountant);
  return std::move(accountant).value();
}

TEST(MeanTest, ConvergesForLargeEpsilon) {
  BudgetAccountant accountant;
  const Eigen::ArrayXXd data = UniformData(1000, 1, 1);
  absl::StatusOr<std::unique_ptr<Mean>> mean = Mean::Builder()
                                                   .SetEpsilon(kLargeEpsilon)
                                                   .SetRange(1)
                                                   .SetAccountant(&accountant)
                                                   .Build();
  ASSERT_OK(mean);
  absl::StatusOr<Eigen::ArrayXXd> result = (*mean)->Result(data);
  ASSERT_OK(result);
  ASSERT_EQ(result->rows(), 1);
  ASSERT_EQ(result->cols(), 1);
  EXPECT_NEAR((*result)(0, 0), data.mean(), 1e-4);
}

TEST(MeanTest, DefaultEpsilonIsOne) {
  absl::StatusOr<std::unique_ptr<Mean>> mean =
      Mean::Builder().SetRange(1).Build();
  ASSERT_OK(mean);
  EXPECT_EQ((*mean)->GetEpsilon(), 1.0);
  EXPECT_EQ((*mean)->GetAxis(), std::nullopt);
}

TEST(MeanTest, ResultShapeFollowsAxis) {
  BudgetAccountant accountant;
  const Eigen::ArrayXXd data = UniformData(3, 4, 2);
  auto build = [&accountant](int axis, bool keep_dims) {
    return Mean::Builder()
        .SetEpsilon(kLargeEpsilon)
        .SetRange(1)
        .SetAxis(axis)
        .SetKeepDims(keep_dims)
        .SetAccountant(&accountant)
        .Build();
  };

  absl::StatusOr<std::unique_ptr<Mean>> columns = build(0, false);
  ASSERT_OK(columns);
  absl::StatusOr<Eigen::ArrayXXd> column_means = (*columns)->Result(data);
  ASSERT_OK(column_means);
  ASSERT_EQ(column_means->rows(), 4);
  ASSERT_EQ(column_means->cols(), 1);
  for (int j = 0; j < 4; ++j) {
    EXPECT_NEAR((*column_means)(j, 0), data.col(j).mean(), 1e-3);
  }

  absl::StatusOr<std::unique_ptr<Mean>> kept = build(0, true);
  ASSERT_OK(kept);
  absl::StatusOr<Eigen::ArrayXXd> kept_means = (*kept)->Result(data);
  ASSERT_OK(kept_means);
  EXPECT_EQ(kept_means->rows(), 1);
  EXPECT_EQ(kept_means->cols(), 4);

  absl::StatusOr<std::unique_ptr<Mean>> rows = build(1, false);
  ASSERT_OK(rows);
  absl::StatusOr<Eigen::ArrayXXd> row_means = (*rows)->Result(data);
  ASSERT_OK(row_means);
  ASSERT_EQ(row_means->rows(), 3);
  ASSERT_EQ(row_means->cols(), 1);
  for (int i = 0; i < 3; ++i) {
    EXPECT_NEAR((*row_means)(i, 0), data.row(i).mean(), 1e-3);
  }
}

TEST(MeanTest, RangesMustMatchResultShape) {
  std::unique_ptr<BudgetAccountant> accountant = MakeAccountant(10);
  absl::StatusOr<std::unique_ptr<Mean>> mean =
      Mean::Builder()
          .SetRanges(Eigen::ArrayXXd::Ones(3, 1))
          .SetAxis(0)
          .SetAccountant(accountant.get())
          .Build();
  ASSERT_OK(mean);
  EXPECT_THAT((*mean)->Result(UniformData(5, 4, 3)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Shape of ranges")));
  EXPECT_EQ(accountant->Total().epsilon, 0);

  // One range per column.
  EXPECT_OK((*mean)->Result(UniformData(5, 3, 4)));
  EXPECT_EQ(accountant->Total().epsilon, 1);
}

TEST(MeanTest, PerCellRangesScaleNoise) {
  BudgetAccountant accountant;
  Eigen::ArrayXXd ranges(2, 1);
  ranges << 1, 1e6;
  absl::StatusOr<std::unique_ptr<Mean>> mean = Mean::Builder()
                                                   .SetEpsilon(1)
                                                   .SetRanges(ranges)
                                                   .SetAxis(0)
                                                   .SetAccountant(&accountant)
                                                   .Build();
  ASSERT_OK(mean);
  const Eigen::ArrayXXd data = Eigen::ArrayXXd::Zero(100, 2);
  double first_deviation = 0;
  double second_deviation = 0;
  for (int i = 0; i < 20; ++i) {
    absl::StatusOr<Eigen::ArrayXXd> result = (*mean)->Result(data);
    ASSERT_OK(result);
    first_deviation += std::abs((*result)(0, 0));
    second_deviation += std::abs((*result)(1, 0));
  }
  EXPECT_LT(first_deviation, second_deviation);
}

TEST(MeanTest, BuilderRejectsInvalidRanges) {
  EXPECT_THAT(Mean::Builder().SetRange(0).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Range must be finite and positive")));
  EXPECT_THAT(Mean::Builder().SetRange(-1).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument));
  Eigen::ArrayXXd ranges(2, 1);
  ranges << 1, 0;
  EXPECT_THAT(Mean::Builder().SetRanges(ranges).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Range must be finite and positive")));
}

TEST(MeanTest, BuilderRejectsInvalidBounds) {
  EXPECT_THAT(Mean::Builder().SetBounds(1, 0).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Lower bound cannot be greater")));
  EXPECT_THAT(Mean::Builder().SetBounds(1, 1).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Lower bound cannot be equal")));
  EXPECT_THAT(Mean::Builder().SetBounds(0, 1).SetRange(1).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not both")));
}

TEST(MeanTest, BuilderRejectsInvalidParameters) {
  EXPECT_THAT(Mean::Builder().SetEpsilon(0).SetRange(1).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Epsilon must be finite and positive")));
  EXPECT_THAT(Mean::Builder().SetAxis(2).SetRange(1).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Axis must be 0 or 1")));
}

TEST(MeanTest, BoundsClipData) {
  BudgetAccountant accountant;
  Eigen::ArrayXXd data(3, 1);
  data << -10, 0.5, 10;
  absl::StatusOr<std::unique_ptr<Mean>> mean = Mean::Builder()
                                                   .SetEpsilon(kLargeEpsilon)
                                                   .SetBounds(0, 1)
                                                   .SetAccountant(&accountant)
                                                   .Build();
  ASSERT_OK(mean);
  absl::StatusOr<Eigen::ArrayXXd> result = (*mean)->Result(data);
  ASSERT_OK(result);
  EXPECT_NEAR((*result)(0, 0), 0.5, 1e-3);
}

TEST(MeanTest, MissingRangeWarnsAndStillReturns) {
  WarningRecorder warnings;
  BudgetAccountant accountant;
  absl::StatusOr<std::unique_ptr<Mean>> mean =
      Mean::Builder().SetAccountant(&accountant).Build();
  ASSERT_OK(mean);
  absl::StatusOr<Eigen::ArrayXXd> result =
      (*mean)->Result(UniformData(10, 1, 5));
  ASSERT_OK(result);
  EXPECT_TRUE(std::isfinite((*result)(0, 0)));
  EXPECT_EQ(warnings.Count(WarningType::kPrivacyLeak), 1);
}

TEST(MeanTest, ConstantDataWithoutRangeStillReturns) {
  WarningRecorder warnings;
  BudgetAccountant accountant;
  absl::StatusOr<std::unique_ptr<Mean>> mean =
      Mean::Builder().SetAccountant(&accountant).Build();
  ASSERT_OK(mean);
  EXPECT_OK((*mean)->Result(Eigen::ArrayXXd::Constant(4, 2, 3.0)));
  EXPECT_EQ(warnings.Count(WarningType::kPrivacyLeak), 1);
}

TEST(MeanTest, EmptyDataFails) {
  BudgetAccountant accountant;
  absl::StatusOr<std::unique_ptr<Mean>> mean =
      Mean::Builder().SetRange(1).SetAccountant(&accountant).Build();
  ASSERT_OK(mean);
  EXPECT_THAT((*mean)->Result(Eigen::ArrayXXd(0, 1)),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_TRUE(accountant.spent_budget().empty());
}

TEST(MeanTest, NanPropagates) {
  BudgetAccountant accountant;
  Eigen::ArrayXXd data = UniformData(4, 2, 6);
  data(1, 1) = std::numeric_limits<double>::quiet_NaN();
  absl::StatusOr<std::unique_ptr<Mean>> mean = Mean::Builder()
                                                   .SetRange(1)
                                                   .SetAxis(0)
                                                   .SetAccountant(&accountant)
                                                   .Build();
  ASSERT_OK(mean);
  absl::StatusOr<Eigen::ArrayXXd> result = (*mean)->Result(data);
  ASSERT_OK(result);
  EXPECT_FALSE(std::isnan((*result)(0, 0)));
  EXPECT_TRUE(std::isnan((*result)(1, 0)));
}

TEST(MeanTest, SpendsEpsilonOncePerCall) {
  std::unique_ptr<BudgetAccountant> accountant = MakeAccountant(1.5);
  absl::StatusOr<std::unique_ptr<Mean>> mean =
      Mean::Builder()
          .SetEpsilon(1)
          .SetRange(1)
          .SetAxis(0)
          .SetAccountant(accountant.get())
          .Build();
  ASSERT_OK(mean);
  const Eigen::ArrayXXd data = UniformData(100, 5, 7);

  ASSERT_OK((*mean)->Result(data));
  EXPECT_EQ(accountant->Total().epsilon, 1);
  EXPECT_EQ(accountant->Total().delta, 0);

  absl::Status second = (*mean)->Result(data).status();
  EXPECT_THAT(second, StatusIs(absl::StatusCode::kResourceExhausted));
  EXPECT_TRUE(accounting::IsBudgetError(second));
  EXPECT_EQ(accountant->Total().epsilon, 1);
}

TEST(MeanTest, ChargesScopedDefaultAccountant) {
  std::unique_ptr<BudgetAccountant> accountant = MakeAccountant(1.5);
  absl::StatusOr<std::unique_ptr<Mean>> mean =
      Mean::Builder().SetEpsilon(1).SetRange(1).Build();
  ASSERT_OK(mean);
  const Eigen::ArrayXXd data = UniformData(100, 1, 8);

  ScopedDefaultAccountant scope(accountant.get());
  ASSERT_OK((*mean)->Result(data));
  EXPECT_EQ(accountant->Total().epsilon, 1);
  EXPECT_THAT((*mean)->Result(data),
              StatusIs(absl::StatusCode::kResourceExhausted));
  EXPECT_EQ(accountant->Total().epsilon, 1);
}

TEST(VarianceTest, ConvergesForLargeEpsilon) {
  BudgetAccountant accountant;
  const Eigen::ArrayXXd data = UniformData(1000, 1, 9);
  const double mean = data.mean();
  const double sum_squares = (data - mean).square().sum();

  absl::StatusOr<std::unique_ptr<Variance>> variance =
      Variance::Builder()
          .SetEpsilon(kLargeEpsilon)
          .SetRange(1)
          .SetAccountant(&accountant)
          .Build();
  ASSERT_OK(variance);
  absl::StatusOr<Eigen::ArrayXXd> result = (*variance)->Result(data);
  ASSERT_OK(result);
  EXPECT_NEAR((*result)(0, 0), sum_squares / 1000, 1e-4);

  absl::StatusOr<std::unique_ptr<Variance>> sample_variance =
      Variance::Builder()
          .SetEpsilon(kLargeEpsilon)
          .SetRange(1)
          .SetDdof(1)
          .SetAccountant(&accountant)
          .Build();
  ASSERT_OK(sample_variance);
  EXPECT_EQ((*sample_variance)->GetDdof(), 1);
  result = (*sample_variance)->Result(data);
  ASSERT_OK(result);
  EXPECT_NEAR((*result)(0, 0), sum_squares / 999, 1e-4);
}

TEST(VarianceTest, IsNeverNegative) {
  BudgetAccountant accountant;
  SeededRandomSource source(10);
  absl::StatusOr<std::unique_ptr<Variance>> variance =
      Variance::Builder()
          .SetEpsilon(0.1)
          .SetRange(1)
          .SetAccountant(&accountant)
          .SetRandomSource(&source)
          .Build();
  ASSERT_OK(variance);
  const Eigen::ArrayXXd data = Eigen::ArrayXXd::Constant(5, 1, 0.5);
  for (int i = 0; i < 100; ++i) {
    absl::StatusOr<Eigen::ArrayXXd> result = (*variance)->Result(data);
    ASSERT_OK(result);
    EXPECT_GE((*result)(0, 0), 0);
  }
}

TEST(VarianceTest, ResultShapeFollowsAxis) {
  BudgetAccountant accountant;
  const Eigen::ArrayXXd data = UniformData(50, 3, 11);
  absl::StatusOr<std::unique_ptr<Variance>> variance =
      Variance::Builder()
          .SetEpsilon(kLargeEpsilon)
          .SetRange(1)
          .SetAxis(0)
          .SetAccountant(&accountant)
          .Build();
  ASSERT_OK(variance);
  absl::StatusOr<Eigen::ArrayXXd> result = (*variance)->Result(data);
  ASSERT_OK(result);
  ASSERT_EQ(result->rows(), 3);
  ASSERT_EQ(result->cols(), 1);
  for (int j = 0; j < 3; ++j) {
    const double expected =
        (data.col(j) - data.col(j).mean()).square().sum() / 50;
    EXPECT_NEAR((*result)(j, 0), expected, 1e-3);
  }
}

TEST(VarianceTest, DdofMustBeSmallerThanCount) {
  std::unique_ptr<BudgetAccountant> accountant = MakeAccountant(10);
  absl::StatusOr<std::unique_ptr<Variance>> variance =
      Variance::Builder()
          .SetRange(1)
          .SetDdof(3)
          .SetAccountant(accountant.get())
          .Build();
  ASSERT_OK(variance);
  EXPECT_THAT((*variance)->Result(UniformData(3, 1, 12)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Ddof must be less than")));
  EXPECT_EQ(accountant->Total().epsilon, 0);
  EXPECT_THAT(Variance::Builder().SetRange(1).SetDdof(-1).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Ddof must be non-negative")));
}

TEST(VarianceTest, BuilderRejectsInvalidBounds) {
  EXPECT_THAT(Variance::Builder().SetBounds(2, -2).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Lower bound cannot be greater")));
}

TEST(VarianceTest, MissingRangeWarns) {
  WarningRecorder warnings;
  BudgetAccountant accountant;
  absl::StatusOr<std::unique_ptr<Variance>> variance =
      Variance::Builder().SetAccountant(&accountant).Build();
  ASSERT_OK(variance);
  EXPECT_OK((*variance)->Result(UniformData(20, 2, 13)));
  EXPECT_EQ(warnings.Count(WarningType::kPrivacyLeak), 1);
}

TEST(VarianceTest, NanPropagates) {
  BudgetAccountant accountant;
  Eigen::ArrayXXd data = UniformData(4, 1, 14);
  data(2, 0) = std::numeric_limits<double>::quiet_NaN();
  absl::StatusOr<std::unique_ptr<Variance>> variance =
      Variance::Builder().SetRange(1).SetAccountant(&accountant).Build();
  ASSERT_OK(variance);
  absl::StatusOr<Eigen::ArrayXXd> result = (*variance)->Result(data);
  ASSERT_OK(result);
  EXPECT_TRUE(std::isnan((*result)(0, 0)));
}

TEST(StandardDeviationTest, IsSquareRootOfVariance) {
  BudgetAccountant accountant;
  SeededRandomSource variance_source(15);
  SeededRandomSource deviation_source(15);
  const Eigen::ArrayXXd data = UniformData(30, 2, 16);

  absl::StatusOr<std::unique_ptr<Variance>> variance =
      Variance::Builder()
          .SetRange(1)
          .SetAxis(0)
          .SetAccountant(&accountant)
          .SetRandomSource(&variance_source)
          .Build();
  absl::StatusOr<std::unique_ptr<StandardDeviation>> deviation =
      StandardDeviation::Builder()
          .SetRange(1)
          .SetAxis(0)
          .SetAccountant(&accountant)
          .SetRandomSource(&deviation_source)
          .Build();
  ASSERT_OK(variance);
  ASSERT_OK(deviation);

  absl::StatusOr<Eigen::ArrayXXd> variance_result = (*variance)->Result(data);
  absl::StatusOr<Eigen::ArrayXXd> deviation_result =
      (*deviation)->Result(data);
  ASSERT_OK(variance_result);
  ASSERT_OK(deviation_result);
  ASSERT_EQ(deviation_result->rows(), 2);
  for (int j = 0; j < 2; ++j) {
    EXPECT_DOUBLE_EQ((*deviation_result)(j, 0),
                     std::sqrt((*variance_result)(j, 0)));
  }
}

TEST(StandardDeviationTest, SpendsLikeVariance) {
  std::unique_ptr<BudgetAccountant> accountant = MakeAccountant(1);
  absl::StatusOr<std::unique_ptr<StandardDeviation>> deviation =
      StandardDeviation::Builder()
          .SetEpsilon(0.5)
          .SetRange(1)
          .SetDdof(1)
          .SetAccountant(accountant.get())
          .Build();
  ASSERT_OK(deviation);
  EXPECT_EQ((*deviation)->GetDdof(), 1);
  const Eigen::ArrayXXd data = UniformData(100, 1, 17);
  ASSERT_OK((*deviation)->Result(data));
  ASSERT_OK((*deviation)->Result(data));
  EXPECT_EQ(accountant->Total().epsilon, 1);
  EXPECT_THAT((*deviation)->Result(data),
              StatusIs(absl::StatusCode::kResourceExhausted));
}

TEST(StandardDeviationTest, ConvergesForLargeEpsilon) {
  BudgetAccountant accountant;
  const Eigen::ArrayXXd data = UniformData(1000, 1, 18);
  const double expected =
      std::sqrt((data - data.mean()).square().sum() / 1000);
  absl::StatusOr<std::unique_ptr<StandardDeviation>> deviation =
      StandardDeviation::Builder()
          .SetEpsilon(kLargeEpsilon)
          .SetBounds(0, 1)
          .SetAccountant(&accountant)
          .Build();
  ASSERT_OK(deviation);
  absl::StatusOr<Eigen::ArrayXXd> result = (*deviation)->Result(data);
  ASSERT_OK(result);
  EXPECT_NEAR((*result)(0, 0), expected, 1e-3);
}

}  // namespace
}  // namespace diffpriv
