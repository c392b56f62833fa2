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

// Reads a task assignment problem, assigns its tasks and writes the result.
//
// Example:
//   task_assignment_solve --input=problem.textproto --strategy=greedy \
//     --start_date=2025-03-03 --end_date=2025-03-07 --output=result.textproto

#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "google/protobuf/text_format.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/task_assignment.h"
#include "workforce/assignment/task_assignment.pb.h"
#include "workforce/assignment/task_assignment_io.h"
#include "workforce/base/init_workforce.h"
#include "workforce/base/logging.h"
#include "workforce/base/status_builder.h"
#include "workforce/base/status_macros.h"
#include "workforce/base/timer.h"

ABSL_FLAG(std::string, input, "", "REQUIRED: Input file name.");
ABSL_FLAG(std::string, input_fmt, "proto",
          "Input file format: 'proto' for a text TaskAssignmentProblemProto, "
          "'proto_bin' for a binary one.");
ABSL_FLAG(std::string, strategy, "",
          "Assignment strategy, 'lp' or 'greedy'. When empty, the strategy "
          "of --params is used.");
ABSL_FLAG(std::string, params, "",
          "AssignmentParameters in text format. The other flags take "
          "precedence.");
ABSL_FLAG(int, daily_capacity, -1,
          "Maximum number of hours per worker and day. Negative values keep "
          "the capacity of --params.");
ABSL_FLAG(std::string, start_date, "",
          "First day of the period, as YYYY-MM-DD. When empty, all the tasks "
          "are assigned.");
ABSL_FLAG(std::string, end_date, "",
          "Last day of the period, as YYYY-MM-DD. Defaults to --start_date.");
ABSL_FLAG(std::string, output, "", "Output file name for the result.");
ABSL_FLAG(std::string, output_fmt, "proto",
          "Output file format, 'proto' or 'proto_bin'.");
ABSL_FLAG(bool, compare_strategies, false,
          "Run both strategies and log their indicators side by side.");

namespace workforce {
namespace {

absl::StatusOr<bool> IsBinaryFormat(absl::string_view format_name) {
  if (absl::EqualsIgnoreCase(format_name, "proto")) return false;
  if (absl::EqualsIgnoreCase(format_name, "proto_bin")) return true;
  return InvalidArgumentErrorBuilder()
         << "Unsupported file format: " << format_name;
}

absl::StatusOr<AssignmentParameters> ParametersFromFlags() {
  AssignmentParameters params;
  const std::string& params_text = absl::GetFlag(FLAGS_params);
  if (!google::protobuf::TextFormat::ParseFromString(params_text, &params)) {
    return InvalidArgumentErrorBuilder()
           << "Could not parse --params: " << params_text;
  }
  const std::string& strategy_name = absl::GetFlag(FLAGS_strategy);
  if (!strategy_name.empty()) {
    ASSIGN_OR_RETURN(const AssignmentStrategy strategy,
                     ParseAssignmentStrategy(strategy_name));
    params.set_strategy(strategy == AssignmentStrategy::kGreedy
                            ? AssignmentParameters::GREEDY
                            : AssignmentParameters::LP);
  }
  if (absl::GetFlag(FLAGS_daily_capacity) >= 0) {
    params.set_daily_capacity(absl::GetFlag(FLAGS_daily_capacity));
  }
  return params;
}

absl::StatusOr<std::vector<Task>> TasksFromFlags(
    const TaskAssignmentProblem& problem) {
  const std::string& start_text = absl::GetFlag(FLAGS_start_date);
  if (start_text.empty()) return problem.tasks();
  ASSIGN_OR_RETURN(const absl::CivilDay start, ParseDate(start_text));
  absl::CivilDay end = start;
  if (const std::string& end_text = absl::GetFlag(FLAGS_end_date);
      !end_text.empty()) {
    ASSIGN_OR_RETURN(end, ParseDate(end_text));
  }
  return problem.TasksInPeriod(start, end);
}

void LogResult(absl::string_view name, const AssignmentResult& result,
               const WallTimer& timer) {
  LOG(INFO) << name << ": " << result.kpis.DebugString() << ", "
            << absl::ToInt64Microseconds(timer.GetDuration()) << "e-6 s";
}

absl::StatusOr<AssignmentResult> RunStrategy(
    const std::vector<Task>& tasks, const std::vector<Worker>& workers,
    AssignmentStrategy strategy, const AssignmentParameters& params) {
  WallTimer timer;
  timer.Start();
  ASSIGN_OR_RETURN(AssignmentResult result,
                   Assign(tasks, workers, strategy, params));
  timer.Stop();
  LogResult(AssignmentStrategyName(strategy), result, timer);
  return result;
}

absl::Status Run() {
  const std::string& input = absl::GetFlag(FLAGS_input);
  if (input.empty()) {
    return InvalidArgumentErrorBuilder() << "--input is required";
  }
  ASSIGN_OR_RETURN(const bool binary_input,
                   IsBinaryFormat(absl::GetFlag(FLAGS_input_fmt)));
  ASSIGN_OR_RETURN(const AssignmentParameters params, ParametersFromFlags());
  ASSIGN_OR_RETURN(const TaskAssignmentProblem problem,
                   ReadProblem(input, binary_input));
  ASSIGN_OR_RETURN(const std::vector<Task> tasks, TasksFromFlags(problem));
  LOG(INFO) << input << ": " << problem.positions().size() << " positions, "
            << problem.workers().size() << " workers, " << tasks.size()
            << " tasks in the period.";

  const AssignmentStrategy strategy = StrategyFromProto(params.strategy());
  if (absl::GetFlag(FLAGS_compare_strategies)) {
    const AssignmentStrategy other = strategy == AssignmentStrategy::kExact
                                         ? AssignmentStrategy::kGreedy
                                         : AssignmentStrategy::kExact;
    // The result of the other strategy is only logged.
    RETURN_IF_ERROR(
        RunStrategy(tasks, problem.workers(), other, params).status());
  }
  ASSIGN_OR_RETURN(const AssignmentResult result,
                   RunStrategy(tasks, problem.workers(), strategy, params));
  if (!result.summary.unassigned_task_ids.empty()) {
    LOG(INFO) << result.summary.unassigned_task_ids.size()
              << " tasks could not be assigned.";
  }

  const std::string& output = absl::GetFlag(FLAGS_output);
  if (output.empty()) return absl::OkStatus();
  ASSIGN_OR_RETURN(const bool binary_output,
                   IsBinaryFormat(absl::GetFlag(FLAGS_output_fmt)));
  return WriteResponse(ResultToProto(result), output, binary_output);
}

}  // namespace
}  // namespace workforce

int main(int argc, char** argv) {
  workforce::InitWorkforce(argv[0], &argc, &argv);
  const absl::Status status = workforce::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
