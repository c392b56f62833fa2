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

#include "workforce/assignment/task_assignment_io.h"

#include <optional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "workforce/assignment/assignment_kpis.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/task_assignment.h"
#include "workforce/assignment/task_assignment.pb.h"
#include "workforce/base/file.h"
#include "workforce/base/status_builder.h"
#include "workforce/base/status_macros.h"

namespace workforce {

absl::StatusOr<absl::CivilDay> ParseDate(absl::string_view text) {
  absl::CivilDay day;
  if (!absl::ParseCivilTime(text, &day)) {
    return InvalidArgumentErrorBuilder()
           << "Invalid date '" << text << "', expected YYYY-MM-DD";
  }
  return day;
}

std::string FormatDate(absl::CivilDay day) {
  return absl::FormatCivilTime(day);
}

absl::StatusOr<TaskAssignmentProblem> ProblemFromProto(
    const TaskAssignmentProblemProto& proto) {
  TaskAssignmentProblem problem;
  absl::flat_hash_set<PositionId> position_ids;
  for (const PositionProto& position : proto.positions()) {
    if (position.id() == kNoPosition) {
      return InvalidArgumentErrorBuilder()
             << "Position id " << kNoPosition << " is reserved";
    }
    if (!position_ids.insert(position.id()).second) {
      return InvalidArgumentErrorBuilder()
             << "Duplicate position id " << position.id();
    }
    problem.AddPosition(position.id(), position.name());
  }

  for (const WorkerProto& worker_proto : proto.workers()) {
    Worker worker{worker_proto.id(), worker_proto.name(), std::nullopt};
    if (worker_proto.has_position_id()) {
      if (!position_ids.contains(worker_proto.position_id())) {
        return InvalidArgumentErrorBuilder()
               << "Worker " << worker.id << " refers to unknown position "
               << worker_proto.position_id();
      }
      worker.position = worker_proto.position_id();
    }
    problem.AddWorker(std::move(worker));
  }

  for (const TaskProto& task_proto : proto.tasks()) {
    Task task;
    task.id = task_proto.id();
    task.duration = task_proto.duration();
    if (task_proto.has_position_id()) {
      if (!position_ids.contains(task_proto.position_id())) {
        return InvalidArgumentErrorBuilder()
               << "Task " << task.id << " refers to unknown position "
               << task_proto.position_id();
      }
      task.position = task_proto.position_id();
    }
    ASSIGN_OR_RETURN(task.date, ParseDate(task_proto.date()));
    problem.AddTask(std::move(task));
  }

  RETURN_IF_ERROR(ValidateTasks(problem.tasks()));
  RETURN_IF_ERROR(ValidateWorkers(problem.workers()));
  return problem;
}

TaskAssignmentProblemProto ProblemToProto(
    const TaskAssignmentProblem& problem) {
  TaskAssignmentProblemProto proto;
  for (const Position& position : problem.positions()) {
    PositionProto* position_proto = proto.add_positions();
    position_proto->set_id(position.id);
    position_proto->set_name(position.name);
  }
  for (const Worker& worker : problem.workers()) {
    WorkerProto* worker_proto = proto.add_workers();
    worker_proto->set_id(worker.id);
    worker_proto->set_name(worker.name);
    if (worker.position.has_value()) {
      worker_proto->set_position_id(*worker.position);
    }
  }
  for (const Task& task : problem.tasks()) {
    TaskProto* task_proto = proto.add_tasks();
    task_proto->set_id(task.id);
    if (task.position.has_value()) task_proto->set_position_id(*task.position);
    task_proto->set_duration(task.duration);
    task_proto->set_date(FormatDate(task.date));
  }
  return proto;
}

absl::StatusOr<TaskAssignmentProblem> ReadProblem(absl::string_view filename,
                                                  bool binary) {
  TaskAssignmentProblemProto proto;
  if (binary) {
    RETURN_IF_ERROR(file::GetBinaryProto(filename, &proto));
  } else {
    RETURN_IF_ERROR(file::GetTextProto(filename, &proto));
  }
  return ProblemFromProto(proto);
}

TaskAssignmentResponseProto ResultToProto(const AssignmentResult& result) {
  TaskAssignmentResponseProto response;
  for (const Assignment& assignment : result.assignments) {
    AssignmentProto* assignment_proto = response.add_assignments();
    assignment_proto->set_task_id(assignment.task_id);
    assignment_proto->set_worker_id(assignment.worker_id);
    assignment_proto->set_work_date(FormatDate(assignment.work_date));
    assignment_proto->set_hours(assignment.hours);
  }

  const KpiReport& kpis = result.kpis;
  KpiReportProto* kpis_proto = response.mutable_kpis();
  kpis_proto->set_total_workers(kpis.total_workers);
  kpis_proto->set_total_tasks(kpis.total_tasks);
  kpis_proto->set_assigned_count(kpis.assigned_count);
  kpis_proto->set_unassigned_count(kpis.unassigned_count);
  kpis_proto->set_total_assigned_hours(kpis.total_assigned_hours);
  kpis_proto->set_unassigned_hours(kpis.unassigned_hours);
  kpis_proto->set_num_days(kpis.num_days);
  kpis_proto->set_utilization_rate(kpis.utilization_rate);
  kpis_proto->set_max_worker_load(kpis.max_worker_load);
  kpis_proto->set_gini_coefficient(kpis.gini_coefficient);

  AssignmentSummaryProto* summary = response.mutable_summary();
  summary->set_assigned_count(result.summary.assigned_count);
  summary->set_unassigned_count(result.summary.unassigned_count);
  for (const TaskId id : result.summary.unassigned_task_ids) {
    summary->add_unassigned_task_ids(id);
  }
  summary->set_num_worker_positions(result.summary.num_worker_positions);
  return response;
}

absl::Status WriteResponse(const TaskAssignmentResponseProto& response,
                           absl::string_view filename, bool binary) {
  if (binary) return file::SetBinaryProto(filename, response);
  return file::SetTextProto(filename, response);
}

}  // namespace workforce
