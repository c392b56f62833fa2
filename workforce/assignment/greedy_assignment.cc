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

#include "workforce/assignment/greedy_assignment.h"

#include <algorithm>
#include <vector>

#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/capacity_ledger.h"
#include "workforce/assignment/task_groups.h"
#include "workforce/base/logging.h"

namespace workforce {

StrategyResult AssignGreedy(absl::Span<const Task> tasks,
                            absl::Span<const Worker> workers,
                            int daily_capacity) {
  StrategyResult result{{}, {}, CapacityLedger(daily_capacity)};
  CapacityLedger& ledger = result.ledger;
  const auto workers_by_position = GroupWorkersByPosition(workers);

  for (const auto& [key, task_indices] : GroupTasksByDateAndPosition(tasks)) {
    const auto& [date, position] = key;
    const auto eligible = workers_by_position.find(position);
    if (eligible == workers_by_position.end()) {
      VLOG(1) << "No worker for position " << position << " on " << date
              << ", " << task_indices.size() << " tasks left unassigned.";
      for (const int t : task_indices) {
        result.unassigned_tasks.push_back(tasks[t]);
      }
      continue;
    }

    std::vector<int> order = task_indices;
    std::stable_sort(order.begin(), order.end(), [&tasks](int a, int b) {
      return tasks[a].duration < tasks[b].duration;
    });

    for (const int t : order) {
      const Task& task = tasks[t];
      const Worker* best_worker = nullptr;
      int best_load = 0;
      for (const int w : eligible->second) {
        const Worker& worker = workers[w];
        const int load = ledger.Load(worker.id, date);
        if (load + task.duration > daily_capacity) continue;
        if (best_worker == nullptr || load < best_load) {
          best_worker = &worker;
          best_load = load;
        }
      }
      if (best_worker == nullptr) {
        result.unassigned_tasks.push_back(task);
        continue;
      }
      CHECK(ledger.Commit(best_worker->id, date, task.duration));
      result.assignments.push_back(
          {task.id, best_worker->id, date, task.duration});
    }
    VLOG(2) << "Group (" << date << ", " << position << "): "
            << task_indices.size() << " tasks, "
            << eligible->second.size() << " workers.";
  }
  return result;
}

}  // namespace workforce
