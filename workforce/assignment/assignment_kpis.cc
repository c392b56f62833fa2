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

#include "workforce/assignment/assignment_kpis.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/capacity_ledger.h"

namespace workforce {

std::string KpiReport::DebugString() const {
  return absl::StrFormat(
      "workers: %d, tasks: %d (assigned %d, unassigned %d), hours: %d "
      "(unassigned %d), days: %d, utilization: %.3f, max load: %d, gini: "
      "%.3f",
      total_workers, total_tasks, assigned_count, unassigned_count,
      total_assigned_hours, unassigned_hours, num_days, utilization_rate,
      max_worker_load, gini_coefficient);
}

double RoundToThousandths(double value) {
  return std::round(value * 1000.0) / 1000.0;
}

double GiniCoefficient(std::vector<int64_t> values) {
  const int64_t n = values.size();
  if (n < 2) return 0.0;
  std::sort(values.begin(), values.end());
  int64_t sum = 0;
  int64_t weighted_sum = 0;
  for (int64_t i = 0; i < n; ++i) {
    sum += values[i];
    weighted_sum += (i + 1) * values[i];
  }
  if (sum == 0) return 0.0;
  // Exact for equal values: 2 * sum_i i * v = (n + 1) * sum v.
  const int64_t numerator = 2 * weighted_sum - (n + 1) * sum;
  return static_cast<double>(numerator) / (static_cast<double>(n) * sum);
}

KpiReport ComputeKpis(absl::Span<const Assignment> assignments,
                      absl::Span<const Task> unassigned_tasks,
                      const CapacityLedger& ledger,
                      absl::Span<const Worker> workers, int daily_capacity) {
  KpiReport report;
  report.total_workers = workers.size();
  report.assigned_count = assignments.size();
  report.unassigned_count = unassigned_tasks.size();
  report.total_tasks = report.assigned_count + report.unassigned_count;
  report.total_assigned_hours = TotalHours(assignments);
  report.unassigned_hours = TotalDuration(unassigned_tasks);
  report.num_days = ledger.NumDays();

  const int64_t max_possible_hours = std::max<int64_t>(
      1, static_cast<int64_t>(report.total_workers) * daily_capacity *
             std::max(1, report.num_days));
  report.utilization_rate = RoundToThousandths(
      static_cast<double>(report.total_assigned_hours) / max_possible_hours);
  report.max_worker_load = ledger.MaxLoad();

  std::vector<int64_t> worker_loads;
  worker_loads.reserve(workers.size());
  for (const Worker& worker : workers) {
    worker_loads.push_back(ledger.WorkerTotal(worker.id));
  }
  report.gini_coefficient =
      RoundToThousandths(GiniCoefficient(std::move(worker_loads)));
  return report;
}

}  // namespace workforce
