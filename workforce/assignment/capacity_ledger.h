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

#ifndef WORKFORCE_ASSIGNMENT_CAPACITY_LEDGER_H_
#define WORKFORCE_ASSIGNMENT_CAPACITY_LEDGER_H_

#include <cstdint>
#include <utility>

#include "absl/container/btree_map.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"
#include "workforce/assignment/assignment_model.h"

namespace workforce {

// CapacityLedger does the bookkeeping of the hours committed to each worker on
// each day during one run of an assignment algorithm.
// The state of a CapacityLedger is the map
//   (worker, day) -> hours committed,
// with the invariant 0 <= hours <= daily_capacity() for every entry. Only the
// (worker, day) pairs that received at least one commitment have an entry.
//
// A ledger belongs to a single run: it is built by the algorithm, handed over
// to the KPI computation, and then dropped.
class CapacityLedger {
 public:
  using Key = std::pair<WorkerId, absl::CivilDay>;

  explicit CapacityLedger(int daily_capacity = kDefaultDailyCapacity)
      : daily_capacity_(daily_capacity) {}

  // Rebuilds a ledger by summing the hours of 'assignments'. Does not check
  // the capacity; see CheckConsistency().
  static CapacityLedger FromAssignments(
      absl::Span<const Assignment> assignments, int daily_capacity);

  int daily_capacity() const { return daily_capacity_; }

  // Returns the hours committed to 'worker' on 'day', 0 if none.
  int Load(WorkerId worker, absl::CivilDay day) const;

  // Returns true if 'hours' more hours fit in the day of 'worker'.
  bool HasRoom(WorkerId worker, absl::CivilDay day, int hours) const {
    return Load(worker, day) + hours <= daily_capacity_;
  }

  // Adds 'hours' to the day of 'worker'. Returns false, leaving the ledger
  // unchanged, when they do not fit.
  bool Commit(WorkerId worker, absl::CivilDay day, int hours);

  // All the entries, ordered by worker then day.
  const absl::btree_map<Key, int>& entries() const { return hours_; }

  bool empty() const { return hours_.empty(); }

  // Number of distinct days having at least one entry.
  int NumDays() const;

  // Largest single (worker, day) entry, 0 when the ledger is empty.
  int MaxLoad() const;

  // Sum of the entries of 'worker' over all days.
  int64_t WorkerTotal(WorkerId worker) const;

  // Sum of all the entries.
  int64_t TotalHours() const;

  // Returns true if every entry is within [0, daily_capacity()]. Logs the
  // offending entries otherwise.
  bool CheckConsistency() const;

 private:
  int daily_capacity_;
  absl::btree_map<Key, int> hours_;
};

}  // namespace workforce

#endif  // WORKFORCE_ASSIGNMENT_CAPACITY_LEDGER_H_
