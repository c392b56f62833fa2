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

#ifndef WORKFORCE_ASSIGNMENT_TASK_GROUPS_H_
#define WORKFORCE_ASSIGNMENT_TASK_GROUPS_H_

#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"

namespace workforce {

// Tasks only compete with the tasks of the same date and the same position
// key, so both algorithms work one (date, position key) group at a time.
using TaskGroupKey = std::pair<absl::CivilDay, PositionId>;

// Maps each (date, position key) to the indices in 'tasks' of its tasks, in
// input order. Groups are ordered by date, then by position key.
absl::btree_map<TaskGroupKey, std::vector<int>> GroupTasksByDateAndPosition(
    absl::Span<const Task> tasks);

// Maps each position key to the indices in 'workers' of the workers holding
// it, in roster order.
absl::btree_map<PositionId, std::vector<int>> GroupWorkersByPosition(
    absl::Span<const Worker> workers);

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_TASK_GROUPS_H_
