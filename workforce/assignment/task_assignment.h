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

#ifndef WORKFORCE_ASSIGNMENT_TASK_ASSIGNMENT_H_
#define WORKFORCE_ASSIGNMENT_TASK_ASSIGNMENT_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_kpis.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/task_assignment.pb.h"

// Entry point of the engine: validates the input, runs one of the two
// assignment strategies, and packages the assignments with their indicators.
//
// Example:
//   ASSIGN_OR_RETURN(const AssignmentResult result,
//                    CreateAssignments(tasks, workers, "greedy"));
//   LOG(INFO) << result.kpis.DebugString();

namespace workforce {

enum class AssignmentStrategy {
  // Binary integer program solved to optimality. Selected by "lp".
  kExact,
  // Least-loaded-first heuristic. Selected by "greedy".
  kGreedy,
};

// Parses "lp" or "greedy". Any other name is an InvalidArgument error.
absl::StatusOr<AssignmentStrategy> ParseAssignmentStrategy(
    absl::string_view name);

std::string AssignmentStrategyName(AssignmentStrategy strategy);

AssignmentStrategy StrategyFromProto(AssignmentParameters::Strategy strategy);

struct AssignmentSummary {
  int assigned_count = 0;
  int unassigned_count = 0;
  std::vector<TaskId> unassigned_task_ids;
  // Number of distinct position keys among the workers, the shared "no
  // position" key included.
  int num_worker_positions = 0;
};

struct AssignmentResult {
  std::vector<Assignment> assignments;
  KpiReport kpis;
  AssignmentSummary summary;
};

// Runs 'strategy' with the capacity and the solver limits of 'params'.
// params.strategy() is ignored.
//
// Returns InvalidArgument for invalid tasks or workers (see ValidateTasks()
// and ValidateWorkers()) or a negative capacity. The exact strategy can also
// fail on solver limits or solver errors; see AssignOptimal().
absl::StatusOr<AssignmentResult> Assign(
    absl::Span<const Task> tasks, absl::Span<const Worker> workers,
    AssignmentStrategy strategy,
    const AssignmentParameters& params = AssignmentParameters());

// Same as above, with the strategy given by params.strategy().
absl::StatusOr<AssignmentResult> Assign(absl::Span<const Task> tasks,
                                        absl::Span<const Worker> workers,
                                        const AssignmentParameters& params);

// Same as Assign(), with the strategy given by its name. The name is checked
// before anything else.
absl::StatusOr<AssignmentResult> CreateAssignments(
    absl::Span<const Task> tasks, absl::Span<const Worker> workers,
    absl::string_view strategy_name = "lp",
    const AssignmentParameters& params = AssignmentParameters());

// Returns true for the errors of the exact solver, as opposed to input errors.
bool IsSolverFailure(const absl::Status& status);

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_TASK_ASSIGNMENT_H_
