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

#include "workforce/assignment/task_assignment.h"

#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/civil_time.h"
#include "gtest/gtest.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/task_assignment.pb.h"
#include "workforce/base/gmock.h"

namespace workforce {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;
using ::testing::status::StatusIs;

const absl::CivilDay kMonday(2025, 3, 3);

class TaskAssignmentTest : public ::testing::TestWithParam<const char*> {};

TEST_P(TaskAssignmentTest, TwoWorkersTwoLongTasks) {
  const std::vector<Task> tasks = {{1, 1, 8, kMonday}, {2, 1, 6, kMonday}};
  const std::vector<Worker> workers = {{10, "Ann", 1}, {11, "Bob", 1}};
  ASSERT_OK_AND_ASSIGN(const AssignmentResult result,
                       CreateAssignments(tasks, workers, GetParam()));
  ASSERT_EQ(result.assignments.size(), 2);
  EXPECT_NE(result.assignments[0].worker_id, result.assignments[1].worker_id);
  EXPECT_EQ(result.kpis.unassigned_hours, 0);
  EXPECT_EQ(result.kpis.total_assigned_hours, 14);
  EXPECT_EQ(result.kpis.max_worker_load, 8);
}

TEST_P(TaskAssignmentTest, PositionWithoutWorkers) {
  const std::vector<Task> tasks = {{1, 2, 3, kMonday}, {2, 2, 4, kMonday}};
  const std::vector<Worker> workers = {{10, "Ann", 1}};
  ASSERT_OK_AND_ASSIGN(const AssignmentResult result,
                       CreateAssignments(tasks, workers, GetParam()));
  EXPECT_THAT(result.assignments, IsEmpty());
  EXPECT_EQ(result.kpis.total_assigned_hours, 0);
  EXPECT_EQ(result.kpis.unassigned_hours, 7);
  EXPECT_THAT(result.summary.unassigned_task_ids,
              UnorderedElementsAre(1, 2));
}

TEST_P(TaskAssignmentTest, OneWorkerFiveTasks) {
  std::vector<Task> tasks;
  for (int i = 0; i < 5; ++i) tasks.push_back({i, 1, 3, kMonday});
  ASSERT_OK_AND_ASSIGN(const AssignmentResult result,
                       CreateAssignments(tasks, {{10, "Ann", 1}}, GetParam()));
  EXPECT_EQ(result.assignments.size(), 2);
  EXPECT_EQ(result.kpis.total_assigned_hours, 6);
  EXPECT_EQ(result.kpis.unassigned_hours, 9);
  EXPECT_GT(result.kpis.unassigned_hours, 0);
  EXPECT_EQ(result.summary.assigned_count, 2);
  EXPECT_EQ(result.summary.unassigned_count, 3);
}

TEST_P(TaskAssignmentTest, NoTasks) {
  const std::vector<Worker> workers = {{10, "Ann", 1}, {11, "Bob", 2}};
  ASSERT_OK_AND_ASSIGN(const AssignmentResult result,
                       CreateAssignments({}, workers, GetParam()));
  EXPECT_THAT(result.assignments, IsEmpty());
  EXPECT_EQ(result.kpis.total_tasks, 0);
  EXPECT_EQ(result.kpis.total_assigned_hours, 0);
  EXPECT_EQ(result.kpis.unassigned_hours, 0);
  EXPECT_EQ(result.kpis.utilization_rate, 0.0);
  EXPECT_EQ(result.kpis.max_worker_load, 0);
  EXPECT_EQ(result.kpis.gini_coefficient, 0.0);
  EXPECT_EQ(result.summary.assigned_count, 0);
  EXPECT_EQ(result.summary.unassigned_count, 0);
  EXPECT_EQ(result.summary.num_worker_positions, 2);
}

TEST_P(TaskAssignmentTest, SingleShortTask) {
  const std::vector<Task> tasks = {{1, std::nullopt, 2, kMonday}};
  const std::vector<Worker> workers = {{10, "Ann", std::nullopt}};
  ASSERT_OK_AND_ASSIGN(const AssignmentResult result,
                       CreateAssignments(tasks, workers, GetParam()));
  EXPECT_THAT(result.assignments, ElementsAre(Assignment{1, 10, kMonday, 2}));
  EXPECT_EQ(result.kpis.total_assigned_hours, 2);
  EXPECT_EQ(result.kpis.num_days, 1);
  EXPECT_DOUBLE_EQ(result.kpis.utilization_rate, 0.25);
  EXPECT_EQ(result.summary.num_worker_positions, 1);
}

TEST_P(TaskAssignmentTest, ZeroCapacityAssignsNothing) {
  const std::vector<Task> tasks = {{1, 1, 2, kMonday}};
  AssignmentParameters params;
  params.set_daily_capacity(0);
  ASSERT_OK_AND_ASSIGN(
      const AssignmentResult result,
      CreateAssignments(tasks, {{10, "Ann", 1}}, GetParam(), params));
  EXPECT_THAT(result.assignments, IsEmpty());
  EXPECT_THAT(result.summary.unassigned_task_ids, ElementsAre(1));
}

TEST_P(TaskAssignmentTest, InvalidInputs) {
  const std::vector<Worker> workers = {{10, "Ann", 1}};
  EXPECT_THAT(CreateAssignments({{1, 1, 0, kMonday}}, workers, GetParam()),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(CreateAssignments({{1, 1, 2, kMonday}, {1, 1, 3, kMonday}},
                                workers, GetParam()),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(CreateAssignments({}, {{10, "Ann", 1}, {10, "Bob", 1}},
                                GetParam()),
              StatusIs(absl::StatusCode::kInvalidArgument));
  AssignmentParameters params;
  params.set_daily_capacity(-1);
  EXPECT_THAT(CreateAssignments({}, workers, GetParam(), params),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_P(TaskAssignmentTest, ReservedPositionIdIsRejected) {
  // An explicit position -1 would share a group with the position-less
  // workers.
  EXPECT_THAT(CreateAssignments({{1, kNoPosition, 4, kMonday}},
                                {{10, "Ann", std::nullopt}}, GetParam()),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(CreateAssignments({{1, std::nullopt, 4, kMonday}},
                                {{10, "Ann", kNoPosition}}, GetParam()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, TaskAssignmentTest,
                         ::testing::Values("lp", "greedy"));

TEST(TaskAssignmentStrategyTest, Parse) {
  EXPECT_THAT(ParseAssignmentStrategy("lp"),
              ::testing::status::IsOkAndHolds(AssignmentStrategy::kExact));
  EXPECT_THAT(ParseAssignmentStrategy("greedy"),
              ::testing::status::IsOkAndHolds(AssignmentStrategy::kGreedy));
  EXPECT_THAT(ParseAssignmentStrategy("LP"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseAssignmentStrategy(""),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(AssignmentStrategyName(AssignmentStrategy::kExact), "lp");
  EXPECT_EQ(AssignmentStrategyName(AssignmentStrategy::kGreedy), "greedy");
}

TEST(TaskAssignmentStrategyTest, UnknownStrategyIsRejectedFirst) {
  // The invalid task would be reported by any strategy.
  EXPECT_THAT(CreateAssignments({{1, 1, 0, kMonday}}, {}, "simplex"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       ::testing::HasSubstr("strategy")));
}

TEST(TaskAssignmentStrategyTest, DefaultIsExact) {
  // Only the exact strategy places the 7-hour task.
  const std::vector<Task> tasks = {{1, 1, 7, kMonday}, {2, 1, 2, kMonday}};
  const std::vector<Worker> workers = {{10, "Ann", 1}};
  ASSERT_OK_AND_ASSIGN(const AssignmentResult by_default,
                       CreateAssignments(tasks, workers));
  EXPECT_EQ(by_default.kpis.total_assigned_hours, 7);

  AssignmentParameters params;
  params.set_strategy(AssignmentParameters::GREEDY);
  ASSERT_OK_AND_ASSIGN(const AssignmentResult greedy,
                       Assign(tasks, workers, params));
  EXPECT_EQ(greedy.kpis.total_assigned_hours, 2);
}

TEST(TaskAssignmentStrategyTest, SolverFailures) {
  const std::vector<Task> tasks = {{1, 1, 5, kMonday}, {2, 1, 3, kMonday}};
  AssignmentParameters params;
  params.set_max_time_in_seconds(0.0);
  const auto result =
      Assign(tasks, {{10, "Ann", 1}}, AssignmentStrategy::kExact, params);
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kDeadlineExceeded));
  EXPECT_TRUE(IsSolverFailure(result.status()));

  // The limits do not apply to the greedy strategy.
  EXPECT_OK(
      Assign(tasks, {{10, "Ann", 1}}, AssignmentStrategy::kGreedy, params));
  EXPECT_FALSE(IsSolverFailure(absl::InvalidArgumentError("bad input")));
  EXPECT_TRUE(IsSolverFailure(absl::ResourceExhaustedError("branches")));
}

}  // namespace
}  // namespace workforce
