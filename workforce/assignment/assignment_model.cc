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

#include "workforce/assignment/assignment_model.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"
#include "workforce/base/status_builder.h"

namespace workforce {

absl::Status ValidateTasks(absl::Span<const Task> tasks) {
  absl::flat_hash_set<TaskId> seen;
  seen.reserve(tasks.size());
  for (const Task& task : tasks) {
    if (task.duration <= 0) {
      return InvalidArgumentErrorBuilder()
             << "Task " << task.id << " has a non-positive duration ("
             << task.duration << ").";
    }
    if (task.position == kNoPosition) {
      return InvalidArgumentErrorBuilder()
             << "Task " << task.id << " uses the reserved position id "
             << kNoPosition;
    }
    if (!seen.insert(task.id).second) {
      return InvalidArgumentErrorBuilder() << "Duplicate task id " << task.id;
    }
  }
  return absl::OkStatus();
}

absl::Status ValidateWorkers(absl::Span<const Worker> workers) {
  absl::flat_hash_set<WorkerId> seen;
  seen.reserve(workers.size());
  for (const Worker& worker : workers) {
    if (worker.position == kNoPosition) {
      return InvalidArgumentErrorBuilder()
             << "Worker " << worker.id << " uses the reserved position id "
             << kNoPosition;
    }
    if (!seen.insert(worker.id).second) {
      return InvalidArgumentErrorBuilder()
             << "Duplicate worker id " << worker.id;
    }
  }
  return absl::OkStatus();
}

int64_t TotalDuration(absl::Span<const Task> tasks) {
  int64_t total = 0;
  for (const Task& task : tasks) total += task.duration;
  return total;
}

int64_t TotalHours(absl::Span<const Assignment> assignments) {
  int64_t total = 0;
  for (const Assignment& assignment : assignments) total += assignment.hours;
  return total;
}

void TaskAssignmentProblem::AddPosition(PositionId id, absl::string_view name) {
  positions_.push_back({id, std::string(name)});
}

bool TaskAssignmentProblem::HasPosition(PositionId id) const {
  return std::any_of(positions_.begin(), positions_.end(),
                     [id](const Position& p) { return p.id == id; });
}

std::string TaskAssignmentProblem::PositionName(PositionId id) const {
  if (id == kNoPosition) return std::string(kNoPositionName);
  for (const Position& position : positions_) {
    if (position.id == id) return position.name;
  }
  return "";
}

std::vector<Task> TaskAssignmentProblem::TasksInPeriod(
    absl::CivilDay start, absl::CivilDay end) const {
  std::vector<Task> result;
  for (const Task& task : tasks_) {
    if (start <= task.date && task.date <= end) {
      result.push_back(task);
    }
  }
  return result;
}

std::optional<absl::CivilDay> TaskAssignmentProblem::FirstTaskDate() const {
  if (tasks_.empty()) return std::nullopt;
  return std::min_element(tasks_.begin(), tasks_.end(),
                          [](const Task& a, const Task& b) {
                            return a.date < b.date;
                          })
      ->date;
}

std::optional<absl::CivilDay> TaskAssignmentProblem::LastTaskDate() const {
  if (tasks_.empty()) return std::nullopt;
  return std::max_element(tasks_.begin(), tasks_.end(),
                          [](const Task& a, const Task& b) {
                            return a.date < b.date;
                          })
      ->date;
}

}  // namespace workforce
