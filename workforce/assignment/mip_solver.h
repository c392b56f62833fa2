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


#ifndef WORKFORCE_ASSIGNMENT_MIP_SOLVER_H_
#define WORKFORCE_ASSIGNMENT_MIP_SOLVER_H_

#include <string>

#include "ortools/linear_solver/linear_solver.h"
#include "workforce/assignment/binary_program.h"
#include "workforce/assignment/binary_program_solver.h"

namespace workforce {

// Solves a binary program with an MPSolver backend (CP-SAT or SCIP). The
// program is passed as is: one boolean variable per variable, one row per
// constraint, maximization.
//
// Only the time limit is forwarded to the backend; max_num_branches is
// ignored. A solution stopped by the time limit is reported as FEASIBLE
// with StopReason::kTimeLimit, or NOT_SOLVED when no solution was found.
class MipSolver : public BinaryProgramSolver {
 public:
  explicit MipSolver(
      operations_research::MPSolver::OptimizationProblemType problem_type)
      : problem_type_(problem_type) {}

  // This type is neither copyable nor movable.
  MipSolver(const MipSolver&) = delete;
  MipSolver& operator=(const MipSolver&) = delete;

  Solution Solve(const BinaryProgram& program,
                 const SolverLimits& limits) override;

  std::string name() const override;

 private:
  const operations_research::MPSolver::OptimizationProblemType problem_type_;
};

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_MIP_SOLVER_H_
