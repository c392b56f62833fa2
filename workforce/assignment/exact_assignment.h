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

#ifndef WORKFORCE_ASSIGNMENT_EXACT_ASSIGNMENT_H_
#define WORKFORCE_ASSIGNMENT_EXACT_ASSIGNMENT_H_

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/greedy_assignment.h"
#include "workforce/assignment/task_assignment.pb.h"

namespace workforce {

// Maximizes the total number of assigned hours.
//
// The problem is written as a binary program with one variable x(t, w) per
// task t and worker w of the same position key:
//
//   maximize    sum_{t, w} duration(t) * x(t, w)
//   subject to  sum_w x(t, w) <= 1                        for every task t,
//               sum_t duration(t) * x(t, w) <= capacity   for every worker w
//                                                         and every date,
//               x(t, w) in {0, 1}.
//
// Constraints only link tasks of the same date and position key, so one
// program is built and solved per (date, position key) block. Tasks of a
// position no worker holds never reach the solver and are left unassigned.
//
// The backend is params.solver_type(), an MPSolver running CP-SAT by default.
// The call fails rather than return a partial result when the solver does not
// prove optimality: DEADLINE_EXCEEDED when params.max_time_in_seconds() is
// reached, RESOURCE_EXHAUSTED when params.max_num_branches() is reached
// (BRANCH_AND_BOUND only), and INTERNAL for any other solver outcome or an
// inconsistent solution. Both limits apply to the whole call.
// params.daily_capacity() is not read; the capacity is the 'daily_capacity'
// argument, and a negative one is INVALID_ARGUMENT.
absl::StatusOr<StrategyResult> AssignOptimal(
    absl::Span<const Task> tasks, absl::Span<const Worker> workers,
    int daily_capacity = kDefaultDailyCapacity,
    const AssignmentParameters& params = AssignmentParameters());

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_EXACT_ASSIGNMENT_H_
