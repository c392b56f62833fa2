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

#include "workforce/assignment/exact_assignment.h"

#include <cstdint>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/civil_time.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/binary_program.h"
#include "workforce/assignment/binary_program_solver.h"
#include "workforce/assignment/capacity_ledger.h"
#include "workforce/assignment/greedy_assignment.h"
#include "workforce/assignment/task_assignment.pb.h"
#include "workforce/assignment/task_groups.h"
#include "workforce/base/logging.h"
#include "workforce/base/status_builder.h"
#include "workforce/base/status_macros.h"

namespace workforce {
namespace {

// The program of one (date, position key) block. variable(k, l) is the
// variable of the k-th task of the block and the l-th eligible worker.
class BlockProgram {
 public:
  BlockProgram(absl::Span<const Task> tasks, absl::Span<const int> task_indices,
               int num_workers, int daily_capacity)
      : num_workers_(num_workers) {
    const int num_tasks = task_indices.size();
    std::vector<int> task_constraints(num_tasks);
    for (int k = 0; k < num_tasks; ++k) {
      task_constraints[k] = program_.AddConstraint(1);
      const int duration = tasks[task_indices[k]].duration;
      for (int l = 0; l < num_workers; ++l) {
        const int x = program_.AddVariable(duration);
        DCHECK_EQ(x, variable(k, l));
        program_.SetCoefficient(task_constraints[k], x, 1);
      }
    }
    for (int l = 0; l < num_workers; ++l) {
      const int capacity_constraint = program_.AddConstraint(daily_capacity);
      for (int k = 0; k < num_tasks; ++k) {
        program_.SetCoefficient(capacity_constraint, variable(k, l),
                                tasks[task_indices[k]].duration);
      }
    }
  }

  const BinaryProgram& program() const { return program_; }
  int variable(int task, int worker) const {
    return task * num_workers_ + worker;
  }

 private:
  const int num_workers_;
  BinaryProgram program_;
};

absl::Status SolverFailure(const BinaryProgramSolver::Solution& solution,
                           const TaskGroupKey& block) {
  switch (solution.stop_reason) {
    case BinaryProgramSolver::StopReason::kTimeLimit:
      return absl::DeadlineExceededError(absl::StrCat(
          "Time limit reached before proving optimality for date ",
          absl::FormatCivilTime(block.first), ", position ", block.second));
    case BinaryProgramSolver::StopReason::kBranchLimit:
      return absl::ResourceExhaustedError(absl::StrCat(
          "Branch limit reached before proving optimality for date ",
          absl::FormatCivilTime(block.first), ", position ", block.second));
    case BinaryProgramSolver::StopReason::kNone:
      break;
  }
  return InternalErrorBuilder()
         << "Solver status " << ResultStatusName(solution.status)
         << " for date " << block.first << ", position " << block.second;
}

}  // namespace

absl::StatusOr<StrategyResult> AssignOptimal(
    absl::Span<const Task> tasks, absl::Span<const Worker> workers,
    int daily_capacity, const AssignmentParameters& params) {
  if (daily_capacity < 0) {
    return InvalidArgumentErrorBuilder()
           << "Negative daily capacity " << daily_capacity;
  }
  ASSIGN_OR_RETURN(std::unique_ptr<BinaryProgramSolver> solver,
                   MakeBinaryProgramSolver(params.solver_type()));
  const SolverLimits limits = SolverLimitsFromParameters(params);
  const absl::Time deadline = absl::Now() + limits.time_limit;
  int64_t num_branches = 0;

  StrategyResult result{{}, {}, CapacityLedger(daily_capacity)};
  const auto workers_by_position = GroupWorkersByPosition(workers);
  for (const auto& [block, task_indices] : GroupTasksByDateAndPosition(tasks)) {
    const auto eligible = workers_by_position.find(block.second);
    if (eligible == workers_by_position.end()) {
      for (const int t : task_indices) {
        result.unassigned_tasks.push_back(tasks[t]);
      }
      continue;
    }
    const std::vector<int>& worker_indices = eligible->second;
    const BlockProgram block_program(tasks, task_indices,
                                     worker_indices.size(), daily_capacity);

    SolverLimits block_limits = limits;
    block_limits.time_limit = deadline - absl::Now();
    block_limits.max_num_branches = limits.max_num_branches - num_branches;
    const BinaryProgramSolver::Solution solution =
        solver->Solve(block_program.program(), block_limits);
    num_branches += solution.num_branches;
    VLOG(1) << "Block (" << block.first << ", " << block.second << "): "
            << task_indices.size() << " tasks, " << worker_indices.size()
            << " workers, " << ResultStatusName(solution.status)
            << ", objective " << solution.objective_value;
    if (solution.status != BinaryProgramSolver::OPTIMAL) {
      LOG(WARNING) << solver->name() << " stopped with status "
                   << ResultStatusName(solution.status) << " after "
                   << solution.num_branches << " branches.";
      return SolverFailure(solution, block);
    }

    for (int k = 0; k < task_indices.size(); ++k) {
      const Task& task = tasks[task_indices[k]];
      int num_selected = 0;
      for (int l = 0; l < worker_indices.size(); ++l) {
        if (solution.variable_values[block_program.variable(k, l)] <= 0.5) {
          continue;
        }
        ++num_selected;
        result.assignments.push_back({task.id, workers[worker_indices[l]].id,
                                      task.date, task.duration});
      }
      if (num_selected > 1) {
        return InternalErrorBuilder()
               << "Task " << task.id << " was given to " << num_selected
               << " workers";
      }
      if (num_selected == 0) result.unassigned_tasks.push_back(task);
    }
  }

  result.ledger =
      CapacityLedger::FromAssignments(result.assignments, daily_capacity);
  if (!result.ledger.CheckConsistency()) {
    return InternalErrorBuilder()
           << "The solver solution exceeds the daily capacity";
  }
  return result;
}

}  // namespace workforce
