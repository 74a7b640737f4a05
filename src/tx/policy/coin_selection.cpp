#include "policy/coin_selection.hpp"

#include <algorithm>
#include <tuple>

namespace txforge::policy {

namespace {

using primitives::Amount;
using primitives::SpendableOutput;

bool OutpointLess(const SpendableOutput& a, const SpendableOutput& b) {
  return std::tie(a.outpoint.txid, a.outpoint.index) <
         std::tie(b.outpoint.txid, b.outpoint.index);
}

bool LargestFirst(const SpendableOutput& a, const SpendableOutput& b) {
  if (a.amount != b.amount) return a.amount > b.amount;
  if (a.block_daa_score != b.block_daa_score) return a.block_daa_score < b.block_daa_score;
  return OutpointLess(a, b);
}

bool SmallestFirst(const SpendableOutput& a, const SpendableOutput& b) {
  if (a.amount != b.amount) return a.amount < b.amount;
  if (a.block_daa_score != b.block_daa_score) return a.block_daa_score < b.block_daa_score;
  return OutpointLess(a, b);
}

bool OldestFirst(const SpendableOutput& a, const SpendableOutput& b) {
  if (a.block_daa_score != b.block_daa_score) return a.block_daa_score < b.block_daa_score;
  if (a.amount != b.amount) return a.amount > b.amount;
  return OutpointLess(a, b);
}

bool NewestFirst(const SpendableOutput& a, const SpendableOutput& b) {
  if (a.block_daa_score != b.block_daa_score) return a.block_daa_score > b.block_daa_score;
  if (a.amount != b.amount) return a.amount > b.amount;
  return OutpointLess(a, b);
}

// Sweeps the oldest, smallest outputs first so the wallet consolidates
// dust while it pays.
bool Consolidating(const SpendableOutput& a, const SpendableOutput& b) {
  if (a.block_daa_score != b.block_daa_score) return a.block_daa_score < b.block_daa_score;
  if (a.amount != b.amount) return a.amount < b.amount;
  return OutpointLess(a, b);
}

}  // namespace

Amount SelectionTarget::RequiredFor(std::size_t input_count) const {
  Amount per_input = primitives::kMaxSompi;
  if (!primitives::CheckedMul(per_input_reserve, input_count, &per_input)) {
    per_input = primitives::kMaxSompi;
  }
  return primitives::SaturatingAdd(primitives::SaturatingAdd(outputs_total, fixed_reserve),
                                   per_input);
}

std::vector<SpendableOutput> OrderCandidates(std::vector<SpendableOutput> candidates,
                                             CoinSelectionMode mode,
                                             bool prefer_consolidation) {
  switch (mode) {
    case CoinSelectionMode::kAuto:
      std::stable_sort(candidates.begin(), candidates.end(),
                       prefer_consolidation ? Consolidating : LargestFirst);
      break;
    case CoinSelectionMode::kLargestFirst:
      std::stable_sort(candidates.begin(), candidates.end(), LargestFirst);
      break;
    case CoinSelectionMode::kSmallestFirst:
      std::stable_sort(candidates.begin(), candidates.end(), SmallestFirst);
      break;
    case CoinSelectionMode::kOldestFirst:
      std::stable_sort(candidates.begin(), candidates.end(), OldestFirst);
      break;
    case CoinSelectionMode::kNewestFirst:
      std::stable_sort(candidates.begin(), candidates.end(), NewestFirst);
      break;
  }
  return candidates;
}

CoinSelector::CoinSelector(std::vector<SpendableOutput> candidates, CoinSelectionMode mode,
                           bool prefer_consolidation, std::size_t max_inputs)
    : mode_(mode),
      max_inputs_(std::max<std::size_t>(1, max_inputs)),
      ordered_(OrderCandidates(std::move(candidates), mode, prefer_consolidation)) {}

void CoinSelector::Walk(SelectionPlan* plan, const SelectionTarget& target) const {
  std::size_t next = plan->selected.size();
  plan->truncated_by_cap = false;
  while (plan->selected_amount < target.RequiredFor(plan->selected.size())) {
    if (next >= ordered_.size()) {
      break;
    }
    if (plan->selected.size() >= max_inputs_) {
      plan->truncated_by_cap = true;
      break;
    }
    const auto& coin = ordered_[next++];
    plan->selected.push_back(coin);
    plan->selected_amount = primitives::SaturatingAdd(plan->selected_amount, coin.amount);
  }
  plan->required_target = target.RequiredFor(plan->selected.size());
}

SelectionPlan CoinSelector::Select(const SelectionTarget& target) const {
  SelectionPlan plan;
  plan.mode = mode_;
  plan.total_candidates = ordered_.size();
  Walk(&plan, target);
  return plan;
}

bool CoinSelector::Extend(SelectionPlan* plan, const SelectionTarget& target) {
  if (extended_ || plan == nullptr) {
    return false;
  }
  extended_ = true;
  plan->extended = true;
  Walk(plan, target);
  return true;
}

}  // namespace txforge::policy
