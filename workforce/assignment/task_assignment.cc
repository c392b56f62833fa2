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

#include "workforce/assignment/task_assignment.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_kpis.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/exact_assignment.h"
#include "workforce/assignment/greedy_assignment.h"
#include "workforce/assignment/task_assignment.pb.h"
#include "workforce/base/logging.h"
#include "workforce/base/status_builder.h"
#include "workforce/base/status_macros.h"

namespace workforce {

absl::StatusOr<AssignmentStrategy> ParseAssignmentStrategy(
    absl::string_view name) {
  if (name == "lp") return AssignmentStrategy::kExact;
  if (name == "greedy") return AssignmentStrategy::kGreedy;
  return InvalidArgumentErrorBuilder()
         << "Invalid strategy '" << name << "', expected 'lp' or 'greedy'";
}

std::string AssignmentStrategyName(AssignmentStrategy strategy) {
  switch (strategy) {
    case AssignmentStrategy::kExact:
      return "lp";
    case AssignmentStrategy::kGreedy:
      return "greedy";
  }
  return "unknown";
}

AssignmentStrategy StrategyFromProto(AssignmentParameters::Strategy strategy) {
  return strategy == AssignmentParameters::GREEDY ? AssignmentStrategy::kGreedy
                                                  : AssignmentStrategy::kExact;
}

absl::StatusOr<AssignmentResult> Assign(absl::Span<const Task> tasks,
                                        absl::Span<const Worker> workers,
                                        AssignmentStrategy strategy,
                                        const AssignmentParameters& params) {
  RETURN_IF_ERROR(ValidateTasks(tasks));
  RETURN_IF_ERROR(ValidateWorkers(workers));
  const int daily_capacity = params.daily_capacity();
  if (daily_capacity < 0) {
    return InvalidArgumentErrorBuilder()
           << "Negative daily capacity " << daily_capacity;
  }

  StrategyResult run;
  switch (strategy) {
    case AssignmentStrategy::kExact: {
      ASSIGN_OR_RETURN(run,
                       AssignOptimal(tasks, workers, daily_capacity, params));
      break;
    }
    case AssignmentStrategy::kGreedy:
      run = AssignGreedy(tasks, workers, daily_capacity);
      break;
  }

  AssignmentResult result;
  result.kpis = ComputeKpis(run.assignments, run.unassigned_tasks, run.ledger,
                            workers, daily_capacity);
  result.summary.assigned_count = run.assignments.size();
  result.summary.unassigned_count = run.unassigned_tasks.size();
  for (const Task& task : run.unassigned_tasks) {
    result.summary.unassigned_task_ids.push_back(task.id);
  }
  absl::flat_hash_set<PositionId> positions;
  for (const Worker& worker : workers) positions.insert(worker.position_key());
  result.summary.num_worker_positions = positions.size();
  result.assignments = std::move(run.assignments);
  VLOG(1) << AssignmentStrategyName(strategy) << ": "
          << result.kpis.DebugString();
  return result;
}

absl::StatusOr<AssignmentResult> Assign(absl::Span<const Task> tasks,
                                        absl::Span<const Worker> workers,
                                        const AssignmentParameters& params) {
  return Assign(tasks, workers, StrategyFromProto(params.strategy()), params);
}

absl::StatusOr<AssignmentResult> CreateAssignments(
    absl::Span<const Task> tasks, absl::Span<const Worker> workers,
    absl::string_view strategy_name, const AssignmentParameters& params) {
  ASSIGN_OR_RETURN(const AssignmentStrategy strategy,
                   ParseAssignmentStrategy(strategy_name));
  return Assign(tasks, workers, strategy, params);
}

bool IsSolverFailure(const absl::Status& status) {
  return absl::IsDeadlineExceeded(status) ||
         absl::IsResourceExhausted(status) || absl::IsInternal(status);
}

}  // namespace workforce
