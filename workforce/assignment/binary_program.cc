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

#include "workforce/assignment/binary_program.h"

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "workforce/base/logging.h"
#include "workforce/base/status_builder.h"

namespace workforce {

int BinaryProgram::AddVariable(int64_t objective_coefficient) {
  objective_.push_back(objective_coefficient);
  return objective_.size() - 1;
}

int BinaryProgram::AddConstraint(int64_t upper_bound) {
  upper_bounds_.push_back(upper_bound);
  rows_.emplace_back();
  return upper_bounds_.size() - 1;
}

void BinaryProgram::SetCoefficient(int constraint, int variable,
                                   int64_t coefficient) {
  DCHECK_GE(constraint, 0);
  DCHECK_LT(constraint, num_constraints());
  DCHECK_GE(variable, 0);
  DCHECK_LT(variable, num_variables());
  const auto [it, inserted] =
      term_index_.try_emplace({constraint, variable}, rows_[constraint].size());
  if (inserted) {
    rows_[constraint].push_back({variable, coefficient});
  } else {
    rows_[constraint][it->second].coefficient = coefficient;
  }
}

absl::Status BinaryProgram::Validate() const {
  for (int j = 0; j < num_variables(); ++j) {
    if (objective_[j] < 0) {
      return InvalidArgumentErrorBuilder()
             << "Variable " << j << " has a negative objective coefficient "
             << objective_[j];
    }
  }
  for (int i = 0; i < num_constraints(); ++i) {
    if (upper_bounds_[i] < 0) {
      return InvalidArgumentErrorBuilder()
             << "Constraint " << i << " has a negative upper bound "
             << upper_bounds_[i];
    }
    for (const Term& term : rows_[i]) {
      if (term.coefficient < 0) {
        return InvalidArgumentErrorBuilder()
               << "Constraint " << i << " has a negative coefficient "
               << term.coefficient << " for variable " << term.variable;
      }
    }
  }
  return absl::OkStatus();
}

int64_t BinaryProgram::ObjectiveValue(
    const std::vector<bool>& values) const {
  DCHECK_EQ(values.size(), num_variables());
  int64_t value = 0;
  for (int j = 0; j < num_variables(); ++j) {
    if (values[j]) value += objective_[j];
  }
  return value;
}

bool BinaryProgram::IsFeasible(const std::vector<bool>& values) const {
  DCHECK_EQ(values.size(), num_variables());
  for (int i = 0; i < num_constraints(); ++i) {
    int64_t activity = 0;
    for (const Term& term : rows_[i]) {
      if (values[term.variable]) activity += term.coefficient;
    }
    if (activity > upper_bounds_[i]) return false;
  }
  return true;
}

}  // namespace workforce
