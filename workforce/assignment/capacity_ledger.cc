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

#include "workforce/assignment/capacity_ledger.h"

#include <algorithm>
#include <cstdint>

#include "absl/container/btree_set.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"
#include "workforce/base/logging.h"

namespace workforce {

CapacityLedger CapacityLedger::FromAssignments(
    absl::Span<const Assignment> assignments, int daily_capacity) {
  CapacityLedger ledger(daily_capacity);
  for (const Assignment& assignment : assignments) {
    ledger.hours_[{assignment.worker_id, assignment.work_date}] +=
        assignment.hours;
  }
  return ledger;
}

int CapacityLedger::Load(WorkerId worker, absl::CivilDay day) const {
  const auto it = hours_.find({worker, day});
  return it == hours_.end() ? 0 : it->second;
}

bool CapacityLedger::Commit(WorkerId worker, absl::CivilDay day, int hours) {
  DCHECK_GE(hours, 0);
  int& load = hours_[{worker, day}];
  if (load + hours > daily_capacity_) {
    if (load == 0) hours_.erase({worker, day});
    return false;
  }
  load += hours;
  return true;
}

int CapacityLedger::NumDays() const {
  absl::btree_set<absl::CivilDay> days;
  for (const auto& [key, hours] : hours_) days.insert(key.second);
  return static_cast<int>(days.size());
}

int CapacityLedger::MaxLoad() const {
  int max_load = 0;
  for (const auto& [key, hours] : hours_) max_load = std::max(max_load, hours);
  return max_load;
}

int64_t CapacityLedger::WorkerTotal(WorkerId worker) const {
  int64_t total = 0;
  // Entries are sorted by worker first, so the days of 'worker' are
  // contiguous.
  for (auto it = hours_.lower_bound({worker, absl::CivilDay::min()});
       it != hours_.end() && it->first.first == worker; ++it) {
    total += it->second;
  }
  return total;
}

int64_t CapacityLedger::TotalHours() const {
  int64_t total = 0;
  for (const auto& [key, hours] : hours_) total += hours;
  return total;
}

bool CapacityLedger::CheckConsistency() const {
  bool is_ok = true;
  for (const auto& [key, hours] : hours_) {
    if (hours < 0 || hours > daily_capacity_) {
      LOG(ERROR) << "Worker " << key.first << " has " << hours << " hours on "
                 << key.second << ", while the daily capacity is "
                 << daily_capacity_;
      is_ok = false;
    }
  }
  return is_ok;
}

}  // namespace workforce
