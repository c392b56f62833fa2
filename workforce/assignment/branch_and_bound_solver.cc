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

#include "workforce/assignment/branch_and_bound_solver.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "workforce/assignment/binary_program.h"
#include "workforce/assignment/binary_program_solver.h"
#include "workforce/base/logging.h"
#include "workforce/base/timer.h"

namespace workforce {
namespace {

// Remaining capacities up to this value are handled by dynamic programming.
constexpr int64_t kMaxDynamicProgrammingCapacity = 4096;

constexpr int64_t kInt64Max = std::numeric_limits<int64_t>::max();

// Both arguments are non-negative.
bool WillProductOverflow(int64_t value_1, int64_t value_2) {
  if (value_1 == 0 || value_2 == 0) return false;
  return value_1 > kInt64Max / value_2;
}

// Returns an upper bound of (numerator_1 * numerator_2) / denominator.
int64_t UpperBoundOfRatio(int64_t numerator_1, int64_t numerator_2,
                          int64_t denominator) {
  DCHECK_GT(denominator, 0);
  if (!WillProductOverflow(numerator_1, numerator_2)) {
    // Round to zero.
    return numerator_1 * numerator_2 / denominator;
  }
  const double ratio =
      (static_cast<double>(numerator_1) * static_cast<double>(numerator_2)) /
      static_cast<double>(denominator);
  // Round near.
  return static_cast<int64_t>(std::floor(ratio + 0.5));
}

struct KnapsackItem {
  int64_t weight;
  int64_t profit;
};

class BranchAndBoundSearch {
 public:
  BranchAndBoundSearch(const BinaryProgram& program,
                       const SolverLimits& limits);

  // Runs the search until optimality is proven or a limit is reached.
  void Run();

  const std::vector<bool>& best_values() const { return best_values_; }
  int64_t best_objective() const { return best_objective_; }
  int64_t num_branches() const { return num_branches_; }
  BinaryProgramSolver::StopReason stop_reason() const { return stop_reason_; }

 private:
  struct ColumnEntry {
    int constraint;
    int64_t coefficient;
  };

  void BuildColumns();
  void BuildGroups();
  void BuildOwners();
  void BuildTwinClasses();

  // Returns true if setting 'variable' to 1 keeps every constraint satisfied.
  bool Fits(int variable) const;

  // Smallest capacity left over by 'variable' in its capacity constraints.
  int64_t Slack(int variable) const;

  // Sets 'variable' to 1 (delta = 1) or back to 0 (delta = -1).
  void Fix(int variable, int delta);

  // Upper bound of the objective the groups from 'depth' on can still add.
  // Stops refining as soon as objective + bound cannot beat the incumbent.
  int64_t OpenGroupsBound(int depth, int64_t objective);

  // Bound of the 0-1 knapsack over items_ with the given capacity.
  int64_t KnapsackBound(int64_t capacity);

  // Returns false when the branch budget is spent.
  bool CountBranch();
  bool ShouldStop();

  void Search(int depth, int64_t objective);

  const BinaryProgram& program_;
  const SolverLimits& limits_;
  const absl::Time deadline_;

  std::vector<std::vector<ColumnEntry>> columns_;
  std::vector<bool> is_choice_constraint_;

  // Groups in branching order, and the position of its group for each
  // variable.
  std::vector<std::vector<int>> groups_;
  std::vector<int> group_of_;
  std::vector<int> group_constraint_of_;

  // Owner constraint of each variable (-1 if none), its coefficient there,
  // and the variables owned by each constraint.
  std::vector<int> owner_of_;
  std::vector<int64_t> owner_coefficient_;
  std::vector<std::vector<int>> owned_;

  // Symmetry data. twin_constraint_of_[j] is the capacity constraint of j if
  // that constraint has at least one interchangeable sibling, -1 otherwise.
  std::vector<int> twin_class_;
  std::vector<int> twin_constraint_of_;
  std::vector<int> signature_of_;

  std::vector<int64_t> activity_;
  std::vector<bool> values_;
  std::vector<bool> best_values_;
  int64_t best_objective_ = 0;
  int64_t num_branches_ = 0;
  int num_solutions_ = 0;
  BinaryProgramSolver::StopReason stop_reason_ =
      BinaryProgramSolver::StopReason::kNone;

  // Scratch buffers of OpenGroupsBound().
  std::vector<bool> fits_;
  std::vector<KnapsackItem> items_;
  std::vector<int64_t> table_;
};

BranchAndBoundSearch::BranchAndBoundSearch(const BinaryProgram& program,
                                           const SolverLimits& limits)
    : program_(program),
      limits_(limits),
      deadline_(absl::Now() + limits.time_limit),
      activity_(program.num_constraints(), 0),
      values_(program.num_variables(), false),
      best_values_(program.num_variables(), false),
      fits_(program.num_variables(), false) {
  BuildColumns();
  BuildGroups();
  BuildOwners();
  BuildTwinClasses();
}

void BranchAndBoundSearch::BuildColumns() {
  const int num_constraints = program_.num_constraints();
  columns_.assign(program_.num_variables(), {});
  is_choice_constraint_.assign(num_constraints, false);
  for (int i = 0; i < num_constraints; ++i) {
    const auto& terms = program_.terms(i);
    bool is_choice = !terms.empty() && program_.upper_bound(i) == 1;
    for (const BinaryProgram::Term& term : terms) {
      columns_[term.variable].push_back({i, term.coefficient});
      if (term.coefficient != 1) is_choice = false;
    }
    is_choice_constraint_[i] = is_choice;
  }
}

void BranchAndBoundSearch::BuildGroups() {
  const int num_variables = program_.num_variables();
  std::vector<int> group_of_constraint(program_.num_constraints(), -1);
  std::vector<std::vector<int>> groups;
  std::vector<int> constraint_of_group;
  group_constraint_of_.assign(num_variables, -1);
  for (int j = 0; j < num_variables; ++j) {
    int group = -1;
    for (const ColumnEntry& entry : columns_[j]) {
      if (!is_choice_constraint_[entry.constraint]) continue;
      group_constraint_of_[j] = entry.constraint;
      if (group_of_constraint[entry.constraint] == -1) {
        group_of_constraint[entry.constraint] = groups.size();
        groups.emplace_back();
      }
      group = group_of_constraint[entry.constraint];
      break;
    }
    if (group == -1) {
      group = groups.size();
      groups.emplace_back();
    }
    groups[group].push_back(j);
  }

  std::vector<int64_t> best_coefficient(groups.size(), 0);
  std::vector<int> order(groups.size());
  for (int g = 0; g < groups.size(); ++g) {
    order[g] = g;
    for (const int j : groups[g]) {
      best_coefficient[g] =
          std::max(best_coefficient[g], program_.objective_coefficient(j));
    }
  }
  std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
    return best_coefficient[a] > best_coefficient[b];
  });

  groups_.clear();
  group_of_.assign(num_variables, -1);
  for (const int g : order) {
    for (const int j : groups[g]) group_of_[j] = groups_.size();
    groups_.push_back(std::move(groups[g]));
  }
}

void BranchAndBoundSearch::BuildOwners() {
  const int num_variables = program_.num_variables();
  owner_of_.assign(num_variables, -1);
  owner_coefficient_.assign(num_variables, 0);
  owned_.assign(program_.num_constraints(), {});
  for (int j = 0; j < num_variables; ++j) {
    for (const ColumnEntry& entry : columns_[j]) {
      if (entry.constraint == group_constraint_of_[j]) continue;
      owner_of_[j] = entry.constraint;
      owner_coefficient_[j] = entry.coefficient;
      owned_[entry.constraint].push_back(j);
      break;
    }
  }
}

void BranchAndBoundSearch::BuildTwinClasses() {
  using VariableSignature = std::tuple<std::vector<int>, int64_t, int64_t>;
  using ConstraintSignature = std::pair<int64_t, std::vector<int>>;
  const int num_constraints = program_.num_constraints();
  absl::flat_hash_map<VariableSignature, int> signature_ids;
  absl::flat_hash_map<ConstraintSignature, int> class_ids;
  std::vector<int> class_sizes;
  twin_class_.assign(num_constraints, -1);
  signature_of_.assign(program_.num_variables(), -1);

  for (int i = 0; i < num_constraints; ++i) {
    if (is_choice_constraint_[i] || program_.terms(i).empty()) continue;
    // Only constraints whose variables are otherwise in choice constraints
    // alone can be swapped without touching the rest of the program.
    bool swappable = true;
    std::vector<int> signatures;
    for (const BinaryProgram::Term& term : program_.terms(i)) {
      std::vector<int> choices;
      for (const ColumnEntry& entry : columns_[term.variable]) {
        if (entry.constraint == i) continue;
        if (!is_choice_constraint_[entry.constraint]) {
          swappable = false;
          break;
        }
        choices.push_back(entry.constraint);
      }
      if (!swappable) break;
      const VariableSignature key(
          std::move(choices), program_.objective_coefficient(term.variable),
          term.coefficient);
      const auto [it, inserted] =
          signature_ids.try_emplace(key, signature_ids.size());
      signature_of_[term.variable] = it->second;
      signatures.push_back(it->second);
    }
    if (!swappable) continue;
    std::sort(signatures.begin(), signatures.end());
    const auto [it, inserted] = class_ids.try_emplace(
        ConstraintSignature(program_.upper_bound(i), std::move(signatures)),
        class_ids.size());
    if (inserted) class_sizes.push_back(0);
    twin_class_[i] = it->second;
    ++class_sizes[it->second];
  }

  twin_constraint_of_.assign(program_.num_variables(), -1);
  int num_twin_constraints = 0;
  for (int i = 0; i < num_constraints; ++i) {
    if (twin_class_[i] == -1 || class_sizes[twin_class_[i]] < 2) continue;
    ++num_twin_constraints;
    for (const BinaryProgram::Term& term : program_.terms(i)) {
      twin_constraint_of_[term.variable] = i;
    }
  }
  VLOG(2) << "Branch and bound: " << groups_.size() << " groups, "
          << num_twin_constraints << " interchangeable constraints.";
}

bool BranchAndBoundSearch::Fits(int variable) const {
  for (const ColumnEntry& entry : columns_[variable]) {
    if (activity_[entry.constraint] + entry.coefficient >
        program_.upper_bound(entry.constraint)) {
      return false;
    }
  }
  return true;
}

int64_t BranchAndBoundSearch::Slack(int variable) const {
  int64_t slack = kInt64Max;
  for (const ColumnEntry& entry : columns_[variable]) {
    if (is_choice_constraint_[entry.constraint]) continue;
    slack = std::min(slack, program_.upper_bound(entry.constraint) -
                                activity_[entry.constraint] -
                                entry.coefficient);
  }
  return slack;
}

void BranchAndBoundSearch::Fix(int variable, int delta) {
  for (const ColumnEntry& entry : columns_[variable]) {
    activity_[entry.constraint] += delta * entry.coefficient;
  }
  values_[variable] = delta > 0;
}

int64_t BranchAndBoundSearch::KnapsackBound(int64_t capacity) {
  int64_t bound = 0;
  int64_t total_weight = 0;
  int num_items = 0;
  for (const KnapsackItem& item : items_) {
    if (item.weight == 0) {
      bound += item.profit;
    } else {
      items_[num_items++] = item;
      total_weight += item.weight;
    }
  }
  items_.resize(num_items);
  if (total_weight <= capacity) {
    for (const KnapsackItem& item : items_) bound += item.profit;
    return bound;
  }

  if (capacity <= kMaxDynamicProgrammingCapacity) {
    table_.assign(capacity + 1, 0);
    for (const KnapsackItem& item : items_) {
      for (int64_t c = capacity; c >= item.weight; --c) {
        table_[c] = std::max(table_[c], table_[c - item.weight] + item.profit);
      }
    }
    return bound + table_[capacity];
  }

  std::sort(items_.begin(), items_.end(),
            [](const KnapsackItem& a, const KnapsackItem& b) {
              return static_cast<double>(a.profit) / a.weight >
                     static_cast<double>(b.profit) / b.weight;
            });
  int64_t remaining = capacity;
  for (const KnapsackItem& item : items_) {
    if (item.weight <= remaining) {
      remaining -= item.weight;
      bound += item.profit;
    } else {
      bound += UpperBoundOfRatio(remaining, item.profit, item.weight);
      break;
    }
  }
  return bound;
}

int64_t BranchAndBoundSearch::OpenGroupsBound(int depth, int64_t objective) {
  int64_t choice_bound = 0;
  int64_t unowned_bound = 0;
  for (int g = depth; g < groups_.size(); ++g) {
    int64_t best = 0;
    int64_t best_unowned = 0;
    for (const int j : groups_[g]) {
      fits_[j] = Fits(j);
      if (!fits_[j]) continue;
      const int64_t coefficient = program_.objective_coefficient(j);
      best = std::max(best, coefficient);
      if (owner_of_[j] == -1) {
        best_unowned = std::max(best_unowned, coefficient);
      }
    }
    choice_bound += best;
    unowned_bound += best_unowned;
  }
  if (objective + choice_bound <= best_objective_) return choice_bound;

  int64_t capacity_bound = unowned_bound;
  for (int i = 0; i < program_.num_constraints(); ++i) {
    if (owned_[i].empty()) continue;
    items_.clear();
    for (const int j : owned_[i]) {
      if (group_of_[j] < depth || !fits_[j]) continue;
      items_.push_back(
          {owner_coefficient_[j], program_.objective_coefficient(j)});
    }
    if (items_.empty()) continue;
    capacity_bound += KnapsackBound(program_.upper_bound(i) - activity_[i]);
    if (capacity_bound >= choice_bound) return choice_bound;
  }
  return capacity_bound;
}

bool BranchAndBoundSearch::CountBranch() {
  if (num_branches_ >= limits_.max_num_branches) {
    stop_reason_ = BinaryProgramSolver::StopReason::kBranchLimit;
    return false;
  }
  ++num_branches_;
  return true;
}

bool BranchAndBoundSearch::ShouldStop() {
  if (stop_reason_ != BinaryProgramSolver::StopReason::kNone) return true;
  if (absl::Now() >= deadline_) {
    stop_reason_ = BinaryProgramSolver::StopReason::kTimeLimit;
    return true;
  }
  return false;
}

void BranchAndBoundSearch::Search(int depth, int64_t objective) {
  if (ShouldStop()) return;
  if (depth == groups_.size()) {
    if (objective > best_objective_) {
      best_objective_ = objective;
      best_values_ = values_;
      ++num_solutions_;
      LOG_IF(INFO, limits_.log_search_progress)
          << "Solution #" << num_solutions_ << ", objective "
          << best_objective_ << ", branches " << num_branches_;
    }
    return;
  }
  const int64_t bound = OpenGroupsBound(depth, objective);
  if (objective + bound <= best_objective_) return;

  std::vector<int> candidates;
  for (const int j : groups_[depth]) {
    if (Fits(j)) candidates.push_back(j);
  }
  std::stable_sort(candidates.begin(), candidates.end(), [this](int a, int b) {
    const int64_t coefficient_a = program_.objective_coefficient(a);
    const int64_t coefficient_b = program_.objective_coefficient(b);
    if (coefficient_a != coefficient_b) return coefficient_a > coefficient_b;
    return Slack(a) < Slack(b);
  });

  absl::flat_hash_set<std::tuple<int, int64_t, int>> tried_twins;
  for (const int j : candidates) {
    // Identical workers with the same load lead to mirrored subtrees.
    const int twin = twin_constraint_of_[j];
    if (twin != -1 &&
        !tried_twins
             .insert(std::make_tuple(twin_class_[twin], activity_[twin],
                                     signature_of_[j]))
             .second) {
      continue;
    }
    if (!CountBranch()) return;
    Fix(j, 1);
    Search(depth + 1, objective + program_.objective_coefficient(j));
    Fix(j, -1);
    if (stop_reason_ != BinaryProgramSolver::StopReason::kNone) return;
    if (objective + bound <= best_objective_) return;
  }
  if (!CountBranch()) return;
  Search(depth + 1, objective);
}

void BranchAndBoundSearch::Run() { Search(0, 0); }

}  // namespace

BinaryProgramSolver::Solution BranchAndBoundSolver::Solve(
    const BinaryProgram& program, const SolverLimits& limits) {
  Solution solution;
  WallTimer timer;
  timer.Start();
  if (const absl::Status status = program.Validate(); !status.ok()) {
    LOG(WARNING) << "Invalid binary program: " << status;
    solution.status = MODEL_INVALID;
    return solution;
  }

  BranchAndBoundSearch search(program, limits);
  search.Run();

  const std::vector<bool>& values = search.best_values();
  if (!program.IsFeasible(values) ||
      program.ObjectiveValue(values) != search.best_objective()) {
    LOG(ERROR) << "Branch and bound returned an inconsistent solution.";
    solution.status = ABNORMAL;
    return solution;
  }
  solution.stop_reason = search.stop_reason();
  solution.status =
      solution.stop_reason == StopReason::kNone ? OPTIMAL : FEASIBLE;
  solution.variable_values.assign(values.begin(), values.end());
  solution.objective_value = search.best_objective();
  solution.num_branches = search.num_branches();
  timer.Stop();
  solution.wall_time = timer.GetDuration();
  VLOG(1) << "Branch and bound: " << ResultStatusName(solution.status)
          << ", objective " << solution.objective_value << ", "
          << solution.num_branches << " branches, " << solution.wall_time;
  return solution;
}

}  // namespace workforce
