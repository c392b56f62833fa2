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

#ifndef WORKFORCE_ASSIGNMENT_BINARY_PROGRAM_SOLVER_H_
#define WORKFORCE_ASSIGNMENT_BINARY_PROGRAM_SOLVER_H_

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "workforce/assignment/binary_program.h"
#include "workforce/assignment/task_assignment.pb.h"

namespace workforce {

struct SolverLimits {
  absl::Duration time_limit = absl::InfiniteDuration();
  int64_t max_num_branches = std::numeric_limits<int64_t>::max();
  bool log_search_progress = false;
};

// Reads the limits from the solver fields of 'params'.
SolverLimits SolverLimitsFromParameters(const AssignmentParameters& params);

// Narrow interface between the exact assignment algorithm and the engine
// solving its binary programs, so that backends can be swapped.
class BinaryProgramSolver {
 public:
  // Same meaning as the statuses of a MIP solver.
  enum ResultStatus {
    // Optimal solution found, and proven optimal.
    OPTIMAL,
    // Feasible solution found, but optimality not proven (a limit was hit).
    FEASIBLE,
    // Proven infeasible.
    INFEASIBLE,
    // Something went wrong inside the solver.
    ABNORMAL,
    // The program was rejected by Validate().
    MODEL_INVALID,
    // Solve() was not called or did not start.
    NOT_SOLVED,
  };

  // Which limit stopped the search, if any.
  enum class StopReason { kNone, kTimeLimit, kBranchLimit };

  struct Solution {
    ResultStatus status = NOT_SOLVED;
    StopReason stop_reason = StopReason::kNone;
    // One value per variable, 0.0 or 1.0 for the backends shipped here.
    std::vector<double> variable_values;
    int64_t objective_value = 0;
    int64_t num_branches = 0;
    absl::Duration wall_time;
  };

  virtual ~BinaryProgramSolver() = default;

  virtual Solution Solve(const BinaryProgram& program,
                         const SolverLimits& limits) = 0;

  virtual std::string name() const = 0;
};

std::string ResultStatusName(BinaryProgramSolver::ResultStatus status);

// Returns a new solver of the given type.
absl::StatusOr<std::unique_ptr<BinaryProgramSolver>> MakeBinaryProgramSolver(
    AssignmentParameters::SolverType type);

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_BINARY_PROGRAM_SOLVER_H_
