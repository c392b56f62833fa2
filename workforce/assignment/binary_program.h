// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef WORKFORCE_ASSIGNMENT_BINARY_PROGRAM_H_
#define WORKFORCE_ASSIGNMENT_BINARY_PROGRAM_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"

namespace workforce {

// A 0-1 packing program:
//
//   maximize    sum_j c_j * x_j
//   subject to  sum_j a_ij * x_j <= b_i   for every constraint i,
//               x_j in {0, 1},
//
// with all of c, a and b non-negative integers. Setting every variable to 0 is
// therefore always feasible.
class BinaryProgram {
 public:
  struct Term {
    int variable;
    int64_t coefficient;
  };

  BinaryProgram() = default;

  // Adds a variable with the given objective coefficient and returns its
  // index. Indices are consecutive, starting at 0.
  int AddVariable(int64_t objective_coefficient);

  // Adds an empty constraint with the given upper bound and returns its index.
  int AddConstraint(int64_t upper_bound);

  // Sets the coefficient of 'variable' in 'constraint', replacing the previous
  // one if any.
  void SetCoefficient(int constraint, int variable, int64_t coefficient);

  int num_variables() const { return objective_.size(); }
  int num_constraints() const { return upper_bounds_.size(); }

  int64_t objective_coefficient(int variable) const {
    return objective_[variable];
  }
  int64_t upper_bound(int constraint) const {
    return upper_bounds_[constraint];
  }
  const std::vector<Term>& terms(int constraint) const {
    return rows_[constraint];
  }

  // Returns an error if a coefficient or a bound is negative.
  absl::Status Validate() const;

  // Value of the objective for the 0-1 vector 'values'.
  int64_t ObjectiveValue(const std::vector<bool>& values) const;

  // Returns true if 'values' satisfies every constraint.
  bool IsFeasible(const std::vector<bool>& values) const;

 private:
  std::vector<int64_t> objective_;
  std::vector<int64_t> upper_bounds_;
  std::vector<std::vector<Term>> rows_;

  // (constraint, variable) -> position of the term in rows_[constraint].
  absl::flat_hash_map<std::pair<int, int>, int> term_index_;
};

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_BINARY_PROGRAM_H_
