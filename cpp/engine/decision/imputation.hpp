#pragma once
/*
================================================================================
Decision: Missing-Score Imputation (nearest donor row)
FILE: cpp/engine/decision/imputation.hpp

Purpose:
  - Fill the missing scores of an alternative with the scores of the most
    similar other alternative (the "donor").
  - Similarity is a Euclidean distance over the positions known in BOTH rows.

Contract:
  - distance() skips any position where either row is missing. Rows with no
    jointly known position are at distance 0: no evidence of dissimilarity,
    not identity.
  - Donor search: every other row, scanned in index order; strict '<' so the
    lowest index wins ties; the query row never donates to itself.
  - Under DonorPolicy::RequireComplete only fully known rows donate and the
    absence of one is ErrorCode::kNoCompleteRow. Under LeastIncomplete the
    candidates are the other rows with the fewest missing cells.
  - The synthesized row starts as a copy of the donor, then every cell the
    query knows is written back. Rows without missing scores pass through.
  - The source table is never modified.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/score.hpp"

#include <cstddef>
#include <vector>

namespace ktda {

bool has_missing(const ScoreRow& row) noexcept;

std::size_t count_missing(const ScoreRow& row) noexcept;

// Missing-tolerant Euclidean distance. Throws kShape on length mismatch.
double distance(const ScoreRow& x, const ScoreRow& y);

// Nearest other alternative whose row has no missing scores.
// Throws kOutOfRange for a bad query and kNoCompleteRow when no row qualifies.
std::size_t closest_complete_row(const DecisionTable& table, std::size_t query_index);

std::size_t closest_donor_row(const DecisionTable& table, std::size_t query_index, DonorPolicy policy);

// Per-row record of what impute_with_trace() did.
struct RowImputation final {
  std::size_t row = 0;
  std::size_t donor = 0;
  std::size_t filled = 0;         // cells taken from the donor
  std::size_t still_missing = 0;  // cells missing in both rows
};

struct ImputationResult final {
  DecisionTable table;
  std::vector<RowImputation> rows;  // only rows that had missing scores

  bool complete() const noexcept {
    for (const auto& r : rows) {
      if (r.still_missing != 0) return false;
    }
    return true;
  }
};

// Never fails on cells left missing; those are logged (WARN) and reported.
ImputationResult impute_with_trace(const DecisionTable& table,
                                   const ImputationSettings& settings = ImputationSettings{});

// Same search, but the result is guaranteed fully known:
// throws kIncompleteImputation otherwise.
DecisionTable impute(const DecisionTable& table,
                     const ImputationSettings& settings = ImputationSettings{});

}  // namespace ktda
