#pragma once

#include <cstddef>
#include <vector>

#include "policy/policy_config.hpp"
#include "primitives/amount.hpp"
#include "primitives/transaction.hpp"

namespace txforge::policy {

// Amount a selection must cover. The per-input part grows with every
// input added, so the requirement depends on the input count.
struct SelectionTarget {
  primitives::Amount outputs_total{0};
  primitives::Amount fixed_reserve{0};
  primitives::Amount per_input_reserve{0};

  // Saturates at kMaxSompi so an impossible target is never met.
  primitives::Amount RequiredFor(std::size_t input_count) const;
};

struct SelectionPlan {
  CoinSelectionMode mode{CoinSelectionMode::kAuto};
  std::vector<primitives::SpendableOutput> selected;
  primitives::Amount selected_amount{0};
  primitives::Amount required_target{0};
  bool truncated_by_cap{false};
  bool extended{false};
  std::size_t total_candidates{0};

  bool Covered() const { return selected_amount >= required_target; }
};

// Orders candidates for |mode|. The order is total: equal primary and
// secondary keys fall back to the outpoint so results are reproducible.
std::vector<primitives::SpendableOutput> OrderCandidates(
    std::vector<primitives::SpendableOutput> candidates, CoinSelectionMode mode,
    bool prefer_consolidation);

// Greedy selector over one ordered candidate set. A selector serves one
// build: Select may be called any number of times, Extend at most once.
class CoinSelector {
 public:
  CoinSelector(std::vector<primitives::SpendableOutput> candidates, CoinSelectionMode mode,
               bool prefer_consolidation, std::size_t max_inputs);

  SelectionPlan Select(const SelectionTarget& target) const;

  // Continues |plan| in the same order towards a larger target, still
  // bounded by the cap. Returns false when the selector was already
  // extended; the plan is left untouched in that case.
  bool Extend(SelectionPlan* plan, const SelectionTarget& target);

  const std::vector<primitives::SpendableOutput>& ordered() const { return ordered_; }
  CoinSelectionMode mode() const { return mode_; }
  std::size_t max_inputs() const { return max_inputs_; }

 private:
  void Walk(SelectionPlan* plan, const SelectionTarget& target) const;

  CoinSelectionMode mode_;
  std::size_t max_inputs_;
  std::vector<primitives::SpendableOutput> ordered_;
  bool extended_{false};
};

}  // namespace txforge::policy
