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

#ifndef WORKFORCE_ASSIGNMENT_BRANCH_AND_BOUND_SOLVER_H_
#define WORKFORCE_ASSIGNMENT_BRANCH_AND_BOUND_SOLVER_H_

#include <string>

#include "workforce/assignment/binary_program.h"
#include "workforce/assignment/binary_program_solver.h"

namespace workforce {

// Depth-first branch and bound for 0-1 packing programs, built for programs
// made of "choice" constraints (all coefficients 1, bound 1, e.g. a task is
// given to at most one worker) and knapsack-like capacity constraints.
//
// Each variable belongs to one choice group: the first choice constraint that
// contains it, or a group of its own when it is in none. The search fixes the
// groups one at a time, by decreasing best objective coefficient; a branch
// either sets one fitting variable of the group to 1 (tightest fit first) or
// sets the whole group to 0.
//
// A node is pruned when its objective plus an upper bound of what the open
// groups can add does not beat the best solution found. The bound is the
// minimum of:
//  - the sum over the open groups of their best fitting objective coefficient;
//  - the sum over the capacity constraints of a 0-1 knapsack bound over the
//    open variables the constraint owns (each variable is owned by its first
//    constraint outside its group). The knapsack is solved exactly by dynamic
//    programming when the remaining capacity is small, and bounded by the
//    Dantzig / Martello-Toth linear relaxation otherwise.
//
// Capacity constraints that are interchangeable (same bound, and variables
// that pairwise share their objective, coefficient and choice constraints)
// describe identical workers. At each branching step, only one of the
// interchangeable constraints with the same current activity is tried.
class BranchAndBoundSolver : public BinaryProgramSolver {
 public:
  BranchAndBoundSolver() = default;

  // This type is neither copyable nor movable.
  BranchAndBoundSolver(const BranchAndBoundSolver&) = delete;
  BranchAndBoundSolver& operator=(const BranchAndBoundSolver&) = delete;

  Solution Solve(const BinaryProgram& program,
                 const SolverLimits& limits) override;

  std::string name() const override { return "branch_and_bound"; }
};

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_BRANCH_AND_BOUND_SOLVER_H_
