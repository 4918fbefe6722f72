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

#ifndef DIFFPRIV_ALGORITHMS_TRANSFORMS_H_
#define DIFFPRIV_ALGORITHMS_TRANSFORMS_H_

#include "algorithms/numerical-mechanisms.h"

namespace diffpriv {

// A deterministic function applied to the output of a mechanism. Any function
// of a differentially private output is itself differentially private at the
// same budget, so post-processing never spends budget.
class PostProcessor {
 public:
  virtual ~PostProcessor() = default;

  virtual double PostTransform(double value) const = 0;
};

// Rounds to the nearest integer, halfway cases to the even neighbour.
class RoundedInteger : public PostProcessor {
 public:
  double PostTransform(double value) const override;
};

// Adds noise to `value` with `mechanism` and post-processes the result.
double RandomiseWithPostProcessing(const NoiseMechanism& mechanism,
                                   const PostProcessor& post_processor,
                                   double value);

}  // namespace diffpriv

#endif  // DIFFPRIV_ALGORITHMS_TRANSFORMS_H_
