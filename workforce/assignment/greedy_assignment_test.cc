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

#include <optional>
#include <random>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/time/civil_time.h"
#include "benchmark/benchmark.h"
#include "gtest/gtest.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/base/gmock.h"

namespace workforce {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

const absl::CivilDay kMonday(2025, 3, 3);
const absl::CivilDay kTuesday(2025, 3, 4);

TEST(GreedyAssignmentTest, EmptyInput) {
  const StrategyResult result = AssignGreedy({}, {{1, "Ann", 1}});
  EXPECT_THAT(result.assignments, IsEmpty());
  EXPECT_THAT(result.unassigned_tasks, IsEmpty());
  EXPECT_TRUE(result.ledger.empty());
}

TEST(GreedyAssignmentTest, ShortestTasksFirst) {
  // Five 3-hour tasks and a single worker: only two fit in 8 hours.
  std::vector<Task> tasks;
  for (int i = 0; i < 5; ++i) tasks.push_back({i, 1, 3, kMonday});
  const StrategyResult result = AssignGreedy(tasks, {{10, "Ann", 1}}, 8);
  EXPECT_EQ(result.assignments.size(), 2);
  EXPECT_EQ(result.unassigned_tasks.size(), 3);
  EXPECT_EQ(result.ledger.Load(10, kMonday), 6);
  // Equal durations keep their input order.
  EXPECT_THAT(result.assignments,
              ElementsAre(Field(&Assignment::task_id, 0),
                          Field(&Assignment::task_id, 1)));
}

TEST(GreedyAssignmentTest, SmallTaskCanBlockLargerOne) {
  // The 2-hour task is placed first and leaves no room for the 7-hour one.
  const std::vector<Task> tasks = {{1, 1, 7, kMonday}, {2, 1, 2, kMonday}};
  const StrategyResult result = AssignGreedy(tasks, {{10, "Ann", 1}}, 8);
  EXPECT_THAT(result.assignments,
              ElementsAre(Assignment{2, 10, kMonday, 2}));
  EXPECT_THAT(result.unassigned_tasks, ElementsAre(Field(&Task::id, 1)));
}

TEST(GreedyAssignmentTest, LeastLoadedWorkerFirst) {
  const std::vector<Task> tasks = {
      {1, 1, 2, kMonday}, {2, 1, 3, kMonday}, {3, 1, 4, kMonday}};
  const std::vector<Worker> workers = {{10, "Ann", 1}, {11, "Bob", 1}};
  const StrategyResult result = AssignGreedy(tasks, workers, 8);
  // Task 1 goes to Ann (tie, roster order), task 2 to Bob (empty), task 3 to
  // Ann (2 hours against 3).
  EXPECT_THAT(result.assignments,
              ElementsAre(Assignment{1, 10, kMonday, 2},
                          Assignment{2, 11, kMonday, 3},
                          Assignment{3, 10, kMonday, 4}));
  EXPECT_THAT(result.unassigned_tasks, IsEmpty());
}

TEST(GreedyAssignmentTest, SkipsWorkersWithoutRoom) {
  const std::vector<Task> tasks = {{1, 1, 1, kMonday}, {2, 1, 8, kMonday}};
  const std::vector<Worker> workers = {{10, "Ann", 1}, {11, "Bob", 1}};
  const StrategyResult result = AssignGreedy(tasks, workers, 8);
  EXPECT_THAT(result.assignments,
              ElementsAre(Assignment{1, 10, kMonday, 1},
                          Assignment{2, 11, kMonday, 8}));
}

TEST(GreedyAssignmentTest, PositionsAreMatched) {
  const std::vector<Task> tasks = {{1, 1, 4, kMonday},
                                   {2, 2, 4, kMonday},
                                   {3, std::nullopt, 4, kMonday},
                                   {4, 3, 4, kMonday}};
  const std::vector<Worker> workers = {
      {10, "Ann", 1}, {11, "Bob", 2}, {12, "Cid", std::nullopt}};
  const StrategyResult result = AssignGreedy(tasks, workers, 8);
  EXPECT_THAT(result.assignments,
              UnorderedElementsAre(Assignment{1, 10, kMonday, 4},
                                   Assignment{2, 11, kMonday, 4},
                                   Assignment{3, 12, kMonday, 4}));
  // Nobody holds position 3.
  EXPECT_THAT(result.unassigned_tasks, ElementsAre(Field(&Task::id, 4)));
}

TEST(GreedyAssignmentTest, CapacityIsPerDay) {
  const std::vector<Task> tasks = {{1, 1, 8, kMonday}, {2, 1, 8, kTuesday}};
  const StrategyResult result = AssignGreedy(tasks, {{10, "Ann", 1}}, 8);
  EXPECT_EQ(result.assignments.size(), 2);
  EXPECT_EQ(result.ledger.NumDays(), 2);
  EXPECT_EQ(result.ledger.WorkerTotal(10), 16);
}

TEST(GreedyAssignmentTest, ZeroCapacity) {
  const std::vector<Task> tasks = {{1, 1, 1, kMonday}, {2, 1, 2, kMonday}};
  const StrategyResult result = AssignGreedy(tasks, {{10, "Ann", 1}}, 0);
  EXPECT_THAT(result.assignments, IsEmpty());
  EXPECT_EQ(result.unassigned_tasks.size(), 2);
  EXPECT_TRUE(result.ledger.empty());
}

std::vector<Task> RandomTasks(int num_tasks, int num_positions, int num_days,
                              std::mt19937& random) {
  std::uniform_int_distribution<int> duration(1, 8);
  std::uniform_int_distribution<int> position(0, num_positions - 1);
  std::uniform_int_distribution<int> day(0, num_days - 1);
  std::vector<Task> tasks;
  for (int i = 0; i < num_tasks; ++i) {
    tasks.push_back({i, position(random), duration(random),
                     absl::CivilDay(2025, 3, 3) + day(random)});
  }
  return tasks;
}

std::vector<Worker> RandomWorkers(int num_workers, int num_positions,
                                  std::mt19937& random) {
  std::uniform_int_distribution<int> position(0, num_positions - 1);
  std::vector<Worker> workers;
  for (int i = 0; i < num_workers; ++i) {
    workers.push_back({1000 + i, "", position(random)});
  }
  return workers;
}

TEST(GreedyAssignmentTest, RandomInstancesKeepInvariants) {
  std::mt19937 random(12345);
  for (int instance = 0; instance < 20; ++instance) {
    const std::vector<Task> tasks = RandomTasks(60, 3, 3, random);
    const std::vector<Worker> workers = RandomWorkers(6, 4, random);
    const StrategyResult result = AssignGreedy(tasks, workers, 8);

    EXPECT_EQ(result.assignments.size() + result.unassigned_tasks.size(),
              tasks.size());
    absl::flat_hash_map<TaskId, const Task*> task_by_id;
    for (const Task& task : tasks) task_by_id[task.id] = &task;
    absl::flat_hash_map<WorkerId, const Worker*> worker_by_id;
    for (const Worker& worker : workers) worker_by_id[worker.id] = &worker;
    for (const Assignment& assignment : result.assignments) {
      const Task& task = *task_by_id.at(assignment.task_id);
      EXPECT_EQ(assignment.hours, task.duration);
      EXPECT_EQ(assignment.work_date, task.date);
      EXPECT_EQ(worker_by_id.at(assignment.worker_id)->position_key(),
                task.position_key());
      EXPECT_TRUE(task_by_id.erase(assignment.task_id));
    }
    for (const Task& task : result.unassigned_tasks) {
      EXPECT_TRUE(task_by_id.erase(task.id));
    }
    EXPECT_TRUE(task_by_id.empty());
    EXPECT_TRUE(result.ledger.CheckConsistency());
  }
}

void BM_AssignGreedy(benchmark::State& state) {
  std::mt19937 random(0);
  const std::vector<Task> tasks = RandomTasks(state.range(0), 5, 5, random);
  const std::vector<Worker> workers =
      RandomWorkers(state.range(0) / 4, 5, random);
  for (auto s : state) {
    benchmark::DoNotOptimize(AssignGreedy(tasks, workers));
  }
}

BENCHMARK(BM_AssignGreedy)->Arg(1 << 8)->Arg(1 << 12);

}  // namespace
}  // namespace workforce
