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

#ifndef DIFFPRIV_ALGORITHMS_RAND_H_
#define DIFFPRIV_ALGORITHMS_RAND_H_

#include <cstdint>
#include <limits>
#include <random>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace diffpriv {

// Generates a double-valued random number of Uniform[0, 1) from the secure
// generator. This has the same distribution as generating a uniform real r in
// (0, 1) and then returning the largest double value less than or equal to r.
double UniformDouble();

// Geometric returns a number randomly picked from a geometric distribution of
// parameter 0.5. Will not exceed 1025.
uint64_t Geometric();

// Uniform random bit generator backed by OpenSSL's RAND_bytes. Thread safe.
class SecureURBG {
 public:
  using result_type = uint64_t;
  static SecureURBG& GetInstance();

  static constexpr result_type(min)() {
    return (std::numeric_limits<result_type>::min)();
  }
  static constexpr result_type(max)() {
    return (std::numeric_limits<result_type>::max)();
  }
  result_type operator()() ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  SecureURBG() { buffer_ = new uint8_t[kBufferSize]; }
  ~SecureURBG() { delete[] buffer_; }
  // Refresh the cache with new random bytes.
  void RefreshBuffer() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  static constexpr int kBufferSize = 65536;
  // The current index in the cache.
  int current_index_ ABSL_GUARDED_BY(mutex_) = kBufferSize;
  uint8_t* buffer_ ABSL_GUARDED_BY(mutex_);
  absl::Mutex mutex_;
};

// Source of uniform variates consumed by the mechanisms. Mechanisms hold a
// non-owning pointer, so a source must outlive every mechanism built with it.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Returns a uniform double in [0, 1).
  virtual double UniformDouble() = 0;
};

// Draws from SecureURBG. Shareable between threads.
class SecureRandomSource : public RandomSource {
 public:
  double UniformDouble() override;
};

// Deterministic source for reproducible tests. Not thread safe.
class SeededRandomSource : public RandomSource {
 public:
  explicit SeededRandomSource(uint64_t seed) : generator_(seed) {}

  double UniformDouble() override;

  // Restarts the stream as if the source had just been constructed with
  // `seed`.
  void Reseed(uint64_t seed) { generator_.seed(seed); }

 private:
  std::mt19937_64 generator_;
};

// Returns the process-wide secure source used when no source is configured.
RandomSource* DefaultRandomSource();

}  // namespace diffpriv

#endif  // DIFFPRIV_ALGORITHMS_RAND_H_
