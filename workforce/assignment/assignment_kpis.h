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

#ifndef WORKFORCE_ASSIGNMENT_ASSIGNMENT_KPIS_H_
#define WORKFORCE_ASSIGNMENT_ASSIGNMENT_KPIS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/assignment/capacity_ledger.h"

namespace workforce {

struct KpiReport {
  int total_workers = 0;
  int total_tasks = 0;
  int assigned_count = 0;
  int unassigned_count = 0;
  int64_t total_assigned_hours = 0;
  int64_t unassigned_hours = 0;
  // Number of distinct dates in the ledger. Counted as 1 in the utilization
  // rate when the ledger is empty.
  int num_days = 0;
  // total_assigned_hours / (total_workers * daily_capacity * num_days),
  // rounded to 3 decimals.
  double utilization_rate = 0.0;
  // Largest load of a worker on a single day.
  int max_worker_load = 0;
  // Gini coefficient of the total load of each worker, rounded to 3 decimals.
  double gini_coefficient = 0.0;

  std::string DebugString() const;
};

// Computes the indicators of a run. Never fails: degenerate inputs (no
// worker, no task, zero capacity) give zero rates.
KpiReport ComputeKpis(absl::Span<const Assignment> assignments,
                      absl::Span<const Task> unassigned_tasks,
                      const CapacityLedger& ledger,
                      absl::Span<const Worker> workers,
                      int daily_capacity = kDefaultDailyCapacity);

// Gini coefficient of 'values', in [0, 1). Returns 0 for fewer than 2 values,
// for a zero sum, and whenever all values are equal.
double GiniCoefficient(std::vector<int64_t> values);

// Rounds half away from zero to 3 decimals.
double RoundToThousandths(double value);

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_ASSIGNMENT_KPIS_H_
