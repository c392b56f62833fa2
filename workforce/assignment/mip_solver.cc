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


#include "workforce/assignment/mip_solver.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "ortools/linear_solver/linear_solver.h"
#include "workforce/assignment/binary_program.h"
#include "workforce/assignment/binary_program_solver.h"
#include "workforce/base/logging.h"
#include "workforce/base/timer.h"

namespace workforce {

using operations_research::MPConstraint;
using operations_research::MPObjective;
using operations_research::MPSolver;
using operations_research::MPVariable;

std::string MipSolver::name() const {
  switch (problem_type_) {
    case MPSolver::SAT_INTEGER_PROGRAMMING:
      return "mip_sat";
    case MPSolver::SCIP_MIXED_INTEGER_PROGRAMMING:
      return "mip_scip";
    default:
      return "mip";
  }
}

BinaryProgramSolver::Solution MipSolver::Solve(const BinaryProgram& program,
                                               const SolverLimits& limits) {
  Solution solution;
  if (const absl::Status status = program.Validate(); !status.ok()) {
    LOG(ERROR) << "Invalid program: " << status;
    solution.status = MODEL_INVALID;
    return solution;
  }
  // MPSolver reads a zero time limit as "no limit".
  if (limits.time_limit <= absl::ZeroDuration()) {
    solution.status = NOT_SOLVED;
    solution.stop_reason = StopReason::kTimeLimit;
    return solution;
  }

  WallTimer timer;
  timer.Start();
  MPSolver solver("task assignment block", problem_type_);
  if (limits.log_search_progress) {
    solver.EnableOutput();
  } else {
    solver.SuppressOutput();
  }
  MPObjective* const objective = solver.MutableObjective();
  objective->SetMaximization();

  const int num_variables = program.num_variables();
  std::vector<MPVariable*> vars(num_variables, nullptr);
  for (int j = 0; j < num_variables; ++j) {
    vars[j] = solver.MakeBoolVar("");
    objective->SetCoefficient(vars[j], program.objective_coefficient(j));
  }
  for (int i = 0; i < program.num_constraints(); ++i) {
    MPConstraint* const constraint = solver.MakeRowConstraint(
        0.0, static_cast<double>(program.upper_bound(i)));
    for (const BinaryProgram::Term& term : program.terms(i)) {
      constraint->SetCoefficient(vars[term.variable], term.coefficient);
    }
  }
  if (limits.time_limit != absl::InfiniteDuration()) {
    // set_time_limit takes milliseconds as a unit.
    solver.set_time_limit(
        std::max<int64_t>(1, absl::ToInt64Milliseconds(limits.time_limit)));
  }

  const MPSolver::ResultStatus solve_status = solver.Solve();
  solution.wall_time = timer.GetDuration();
  switch (solve_status) {
    case MPSolver::OPTIMAL:
      solution.status = OPTIMAL;
      break;
    case MPSolver::FEASIBLE:
      solution.status = FEASIBLE;
      solution.stop_reason = StopReason::kTimeLimit;
      break;
    case MPSolver::INFEASIBLE:
      LOG(ERROR) << "Did not find solution. Problem is infeasible.";
      solution.status = INFEASIBLE;
      return solution;
    case MPSolver::MODEL_INVALID:
      solution.status = MODEL_INVALID;
      return solution;
    case MPSolver::NOT_SOLVED:
      solution.status = NOT_SOLVED;
      if (limits.time_limit != absl::InfiniteDuration()) {
        solution.stop_reason = StopReason::kTimeLimit;
      }
      return solution;
    default:
      LOG(ERROR) << "Solving resulted in an error.";
      solution.status = ABNORMAL;
      return solution;
  }

  std::vector<bool> values(num_variables);
  solution.variable_values.assign(num_variables, 0.0);
  for (int j = 0; j < num_variables; ++j) {
    values[j] = vars[j]->solution_value() > 0.5;
    if (values[j]) solution.variable_values[j] = 1.0;
  }
  if (!program.IsFeasible(values)) {
    LOG(ERROR) << name() << " returned a solution violating a constraint.";
    solution.status = ABNORMAL;
    return solution;
  }
  solution.objective_value = program.ObjectiveValue(values);
  VLOG(1) << name() << ": " << num_variables << " variables, objective "
          << solution.objective_value << ", " << solution.wall_time;
  return solution;
}

}  // namespace workforce
