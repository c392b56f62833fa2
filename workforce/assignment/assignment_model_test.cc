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

#include <vector>

#include "absl/status/status.h"
#include "absl/time/civil_time.h"
#include "gtest/gtest.h"
#include "workforce/base/gmock.h"

namespace workforce {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::status::StatusIs;

Task MakeTask(TaskId id, int duration, absl::CivilDay date) {
  return Task{id, std::nullopt, duration, date};
}

TEST(AssignmentModelTest, PositionKeyDefaultsToNoPosition) {
  Worker worker{1, "Ann", std::nullopt};
  EXPECT_EQ(worker.position_key(), kNoPosition);
  worker.position = 4;
  EXPECT_EQ(worker.position_key(), 4);

  Task task = MakeTask(1, 2, absl::CivilDay(2025, 3, 3));
  EXPECT_EQ(task.position_key(), kNoPosition);
  task.position = 4;
  EXPECT_EQ(task.position_key(), worker.position_key());
}

TEST(AssignmentModelTest, ValidateTasks) {
  const absl::CivilDay day(2025, 3, 3);
  EXPECT_OK(ValidateTasks({MakeTask(1, 2, day), MakeTask(2, 8, day)}));
  EXPECT_OK(ValidateTasks({}));
  EXPECT_THAT(ValidateTasks({MakeTask(1, 0, day)}),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ValidateTasks({MakeTask(1, -3, day)}),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ValidateTasks({MakeTask(1, 2, day), MakeTask(1, 3, day)}),
              StatusIs(absl::StatusCode::kInvalidArgument));
  Task reserved = MakeTask(1, 2, day);
  reserved.position = kNoPosition;
  EXPECT_THAT(ValidateTasks({reserved}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("reserved position")));
}

TEST(AssignmentModelTest, ValidateWorkers) {
  EXPECT_OK(ValidateWorkers({{1, "Ann", 3}, {2, "Bob", std::nullopt}}));
  EXPECT_THAT(ValidateWorkers({{1, "Ann", 3}, {1, "Bob", std::nullopt}}),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ValidateWorkers({{1, "Ann", kNoPosition}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("reserved position")));
}

TEST(AssignmentModelTest, Totals) {
  const absl::CivilDay day(2025, 3, 3);
  EXPECT_EQ(TotalDuration({MakeTask(1, 2, day), MakeTask(2, 5, day)}), 7);
  EXPECT_EQ(TotalDuration({}), 0);
  EXPECT_EQ(TotalHours({{1, 10, day, 2}, {2, 10, day, 3}}), 5);
}

TEST(TaskAssignmentProblemTest, TasksInPeriodIncludesBounds) {
  TaskAssignmentProblem problem;
  problem.AddTask(MakeTask(1, 2, absl::CivilDay(2025, 3, 2)));
  problem.AddTask(MakeTask(2, 2, absl::CivilDay(2025, 3, 5)));
  problem.AddTask(MakeTask(3, 2, absl::CivilDay(2025, 3, 3)));
  problem.AddTask(MakeTask(4, 2, absl::CivilDay(2025, 3, 6)));

  EXPECT_THAT(problem.TasksInPeriod(absl::CivilDay(2025, 3, 3),
                                    absl::CivilDay(2025, 3, 5)),
              ElementsAre(Field(&Task::id, 2), Field(&Task::id, 3)));
  EXPECT_THAT(problem.TasksInPeriod(absl::CivilDay(2025, 3, 6),
                                    absl::CivilDay(2025, 3, 6)),
              ElementsAre(Field(&Task::id, 4)));
  EXPECT_TRUE(problem
                  .TasksInPeriod(absl::CivilDay(2025, 3, 6),
                                 absl::CivilDay(2025, 3, 2))
                  .empty());
  EXPECT_EQ(problem.FirstTaskDate(), absl::CivilDay(2025, 3, 2));
  EXPECT_EQ(problem.LastTaskDate(), absl::CivilDay(2025, 3, 6));
}

TEST(TaskAssignmentProblemTest, EmptyProblem) {
  const TaskAssignmentProblem problem;
  EXPECT_FALSE(problem.FirstTaskDate().has_value());
  EXPECT_FALSE(problem.LastTaskDate().has_value());
  EXPECT_TRUE(problem.TasksInPeriod(absl::CivilDay(2025, 1, 1),
                                    absl::CivilDay(2025, 12, 31))
                  .empty());
}

TEST(TaskAssignmentProblemTest, PositionNames) {
  TaskAssignmentProblem problem;
  problem.AddPosition(1, "Picker");
  problem.AddPosition(2, "Packer");
  EXPECT_TRUE(problem.HasPosition(2));
  EXPECT_FALSE(problem.HasPosition(3));
  EXPECT_EQ(problem.PositionName(1), "Picker");
  EXPECT_EQ(problem.PositionName(kNoPosition), "Unassigned");
  EXPECT_EQ(problem.PositionName(3), "");
}

}  // namespace
}  // namespace workforce
