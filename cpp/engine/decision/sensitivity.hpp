/*
===============================================================================
Decision: Weight Sensitivity Sweep
File: cpp/engine/decision/sensitivity.hpp
===============================================================================
*/

#pragma once

#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ktda {

// One (criterion, factor) perturbation and the winner it produces.
struct SensitivityRecord final {
  std::string criterion;
  std::size_t criterion_index = 0;
  double factor = 1.0;
  double weight = 0.0;          // perturbed weight of `criterion`
  std::size_t best_index = 0;   // 0-based
  bool changed = false;         // winner differs from the unperturbed table

  std::size_t best_display() const noexcept { return best_index + 1; }
};

struct SensitivityReport final {
  std::size_t baseline_best = 0;
  std::vector<SensitivityRecord> records;  // criteria outer, factors inner

  std::size_t changed_count() const noexcept {
    std::size_t n = 0;
    for (const auto& r : records) n += r.changed ? 1u : 0u;
    return n;
  }

  bool stable() const noexcept { return changed_count() == 0; }
};

// Multiply one criterion weight at a time by each factor and re-select the
// best alternative on a transient table. The source table is only read.
// Propagates kNoRankableAlternative from best_alternative().
SensitivityReport analyze_weight_sensitivity(const DecisionTable& table,
                                             const SensitivitySettings& settings = SensitivitySettings{});

}  // namespace ktda
