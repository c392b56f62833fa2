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

#ifndef WORKFORCE_ASSIGNMENT_ASSIGNMENT_MODEL_H_
#define WORKFORCE_ASSIGNMENT_ASSIGNMENT_MODEL_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"

// Representation of the task assignment problem.
//
// A task t has a duration d_t (in hours), a date and an optional required
// position. A worker w has an optional position. A task may only be given to a
// worker of the same position; a missing position on either side is treated
// as one more position, kNoPosition, shared by all tasks and workers that have
// none. No worker may be committed more than a fixed number of hours per day,
// and a task is always given whole to a single worker on its own date.

namespace workforce {

using PositionId = int64_t;
using WorkerId = int64_t;
using TaskId = int64_t;

// Number of hours a worker can take on a day when nothing else is specified.
inline constexpr int kDefaultDailyCapacity = 8;

// Matching key of the tasks and workers without a position.
inline constexpr PositionId kNoPosition = -1;

// Display name of kNoPosition.
inline constexpr absl::string_view kNoPositionName = "Unassigned";

struct Position {
  PositionId id = 0;
  std::string name;
};

struct Worker {
  WorkerId id = 0;
  std::string name;
  std::optional<PositionId> position;

  // The key used to match the worker with tasks.
  PositionId position_key() const { return position.value_or(kNoPosition); }
};

struct Task {
  TaskId id = 0;
  std::optional<PositionId> position;
  int duration = 0;
  absl::CivilDay date;

  PositionId position_key() const { return position.value_or(kNoPosition); }
};

// A task given to a worker. The engine never splits tasks, so 'hours' is
// always the duration of the task and 'work_date' its date.
struct Assignment {
  TaskId task_id = 0;
  WorkerId worker_id = 0;
  absl::CivilDay work_date;
  int hours = 0;

  bool operator==(const Assignment& other) const {
    return task_id == other.task_id && worker_id == other.worker_id &&
           work_date == other.work_date && hours == other.hours;
  }
};

// Returns an error if a task has a non-positive duration or uses kNoPosition
// as an explicit position, or if two tasks share the same id.
absl::Status ValidateTasks(absl::Span<const Task> tasks);

// Returns an error if a worker uses kNoPosition as an explicit position, or if
// two workers share the same id.
absl::Status ValidateWorkers(absl::Span<const Worker> workers);

// Sum of the durations of 'tasks'.
int64_t TotalDuration(absl::Span<const Task> tasks);

// Sum of the hours of 'assignments'.
int64_t TotalHours(absl::Span<const Assignment> assignments);

// The data of a planning period, as handed over by the data layer. The engine
// itself only consumes the task and worker lists.
class TaskAssignmentProblem {
 public:
  TaskAssignmentProblem() = default;

  void AddPosition(PositionId id, absl::string_view name);
  void AddWorker(Worker worker) { workers_.push_back(std::move(worker)); }
  void AddTask(Task task) { tasks_.push_back(std::move(task)); }

  const std::vector<Position>& positions() const { return positions_; }
  const std::vector<Worker>& workers() const { return workers_; }
  const std::vector<Task>& tasks() const { return tasks_; }

  bool HasPosition(PositionId id) const;

  // Returns the name of the position, kNoPositionName for kNoPosition, and an
  // empty string for an unknown id.
  std::string PositionName(PositionId id) const;

  // Returns the tasks whose date lies in [start, end], bounds included, in the
  // order they were added. Returns nothing when end < start.
  std::vector<Task> TasksInPeriod(absl::CivilDay start,
                                  absl::CivilDay end) const;

  // Earliest and latest task dates. Both are nullopt when there is no task.
  std::optional<absl::CivilDay> FirstTaskDate() const;
  std::optional<absl::CivilDay> LastTaskDate() const;

 private:
  std::vector<Position> positions_;
  std::vector<Worker> workers_;
  std::vector<Task> tasks_;
};

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_ASSIGNMENT_MODEL_H_
