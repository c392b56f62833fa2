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

#include "workforce/assignment/binary_program_solver.h"

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "ortools/linear_solver/linear_solver.h"
#include "workforce/assignment/branch_and_bound_solver.h"
#include "workforce/assignment/mip_solver.h"
#include "workforce/assignment/task_assignment.pb.h"
#include "workforce/base/status_builder.h"

namespace workforce {

SolverLimits SolverLimitsFromParameters(const AssignmentParameters& params) {
  SolverLimits limits;
  // absl::Seconds() maps the default infinite value to InfiniteDuration().
  limits.time_limit = absl::Seconds(params.max_time_in_seconds());
  limits.max_num_branches = params.max_num_branches();
  limits.log_search_progress = params.log_search_progress();
  return limits;
}

std::string ResultStatusName(BinaryProgramSolver::ResultStatus status) {
  switch (status) {
    case BinaryProgramSolver::OPTIMAL:
      return "OPTIMAL";
    case BinaryProgramSolver::FEASIBLE:
      return "FEASIBLE";
    case BinaryProgramSolver::INFEASIBLE:
      return "INFEASIBLE";
    case BinaryProgramSolver::ABNORMAL:
      return "ABNORMAL";
    case BinaryProgramSolver::MODEL_INVALID:
      return "MODEL_INVALID";
    case BinaryProgramSolver::NOT_SOLVED:
      return "NOT_SOLVED";
  }
  return "UNKNOWN";
}

absl::StatusOr<std::unique_ptr<BinaryProgramSolver>> MakeBinaryProgramSolver(
    AssignmentParameters::SolverType type) {
  using operations_research::MPSolver;
  MPSolver::OptimizationProblemType problem_type;
  switch (type) {
    case AssignmentParameters::SAT_INTEGER_PROGRAMMING:
      problem_type = MPSolver::SAT_INTEGER_PROGRAMMING;
      break;
    case AssignmentParameters::SCIP_MIXED_INTEGER_PROGRAMMING:
      problem_type = MPSolver::SCIP_MIXED_INTEGER_PROGRAMMING;
      break;
    case AssignmentParameters::BRANCH_AND_BOUND:
      return std::make_unique<BranchAndBoundSolver>();
    default:
      return InvalidArgumentErrorBuilder() << "Unknown solver type " << type;
  }
  if (!MPSolver::SupportsProblemType(problem_type)) {
    return UnimplementedErrorBuilder()
           << "Solver type "
           << AssignmentParameters::SolverType_Name(type)
           << " is not linked into this binary";
  }
  return std::make_unique<MipSolver>(problem_type);
}

}  // namespace workforce
