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

#ifndef WORKFORCE_ASSIGNMENT_GREEDY_ASSIGNMENT_H_
#define WORKFORCE_ASSIGNMENT_GREEDY_ASSIGNMENT_H_

#include <vector>

#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/capacity_ledger.h"

namespace workforce {

// What an assignment strategy hands over to the KPI computation: the tasks it
// placed, the tasks it could not place, and the ledger of committed hours.
// Every input task appears exactly once, either through an assignment or in
// unassigned_tasks.
struct StrategyResult {
  std::vector<Assignment> assignments;
  std::vector<Task> unassigned_tasks;
  CapacityLedger ledger;
};

// Least-loaded-first heuristic.
//
// Tasks are handled one (date, position key) group at a time. Within a group,
// tasks are taken by increasing duration (equal durations keep their input
// order), and each task goes to the eligible worker with the lowest load on
// that date among those that still have room for it. When several workers
// have the same lowest load, the first one in 'workers' is chosen; callers
// should not rely on this tie-breaking. A task for which no worker has room
// stays unassigned.
//
// Never fails, and is deterministic for a given input order.
StrategyResult AssignGreedy(absl::Span<const Task> tasks,
                            absl::Span<const Worker> workers,
                            int daily_capacity = kDefaultDailyCapacity);

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_GREEDY_ASSIGNMENT_H_
