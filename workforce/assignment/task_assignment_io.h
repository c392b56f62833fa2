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

#ifndef WORKFORCE_ASSIGNMENT_TASK_ASSIGNMENT_IO_H_
#define WORKFORCE_ASSIGNMENT_TASK_ASSIGNMENT_IO_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/task_assignment.h"
#include "workforce/assignment/task_assignment.pb.h"

namespace workforce {

// Parses a date formatted as YYYY-MM-DD.
absl::StatusOr<absl::CivilDay> ParseDate(absl::string_view text);

// Formats a date as YYYY-MM-DD.
std::string FormatDate(absl::CivilDay day);

// Converts and checks a problem proto. Returns InvalidArgument for duplicate
// ids, references to unknown positions, malformed dates or non-positive
// durations.
absl::StatusOr<TaskAssignmentProblem> ProblemFromProto(
    const TaskAssignmentProblemProto& proto);

TaskAssignmentProblemProto ProblemToProto(const TaskAssignmentProblem& problem);

// Reads a TaskAssignmentProblemProto, in binary format if 'binary' is true and
// in text format otherwise.
absl::StatusOr<TaskAssignmentProblem> ReadProblem(absl::string_view filename,
                                                  bool binary);

TaskAssignmentResponseProto ResultToProto(const AssignmentResult& result);

absl::Status WriteResponse(const TaskAssignmentResponseProto& response,
                           absl::string_view filename, bool binary);

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_TASK_ASSIGNMENT_IO_H_
