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

#include "workforce/assignment/task_groups.h"

#include <vector>

#include "absl/container/btree_map.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"

namespace workforce {

absl::btree_map<TaskGroupKey, std::vector<int>> GroupTasksByDateAndPosition(
    absl::Span<const Task> tasks) {
  absl::btree_map<TaskGroupKey, std::vector<int>> groups;
  for (int i = 0; i < tasks.size(); ++i) {
    groups[{tasks[i].date, tasks[i].position_key()}].push_back(i);
  }
  return groups;
}

absl::btree_map<PositionId, std::vector<int>> GroupWorkersByPosition(
    absl::Span<const Worker> workers) {
  absl::btree_map<PositionId, std::vector<int>> groups;
  for (int i = 0; i < workers.size(); ++i) {
    groups[workers[i].position_key()].push_back(i);
  }
  return groups;
}

}  // namespace workforce
