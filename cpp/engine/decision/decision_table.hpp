#pragma once
/*
================================================================================
Decision: Decision Table (Kepner-Tregoe weighted scoring)
FILE: cpp/engine/decision/decision_table.hpp

Purpose:
  - Hold criteria, weights, alternatives and the score matrix of one
    decision analysis.
  - Compute weighted scores, totals, the best alternative and a full ranking.
  - Derive new tables (normalized, reweighted, rescored) without ever
    touching the source.

Hardening:
  - Shape is validated once at construction; a table that exists is
    consistent (weights == criteria, every row == criteria).
  - Weights must be finite. Scores must be finite or kMissing.
  - Index arguments are range checked (ErrorCode::kOutOfRange).
  - Missing scores propagate into weighted scores and totals (NaN in, NaN out).
================================================================================
*/

#include "engine/decision/score.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ktda {

inline constexpr double kDefaultMaxScore = 10.0;

class DecisionTable final {
 public:
  // Throws ktda::Error(kShape) on any length mismatch and
  // ktda::Error(kInvalidArgument) on non-finite weights or infinite scores.
  DecisionTable(std::vector<std::string> criteria,
                std::vector<double> weights,
                std::vector<std::string> alternatives,
                std::vector<ScoreRow> scores);

  const std::vector<std::string>& criteria() const noexcept { return criteria_; }
  const std::vector<double>& weights() const noexcept { return weights_; }
  const std::vector<std::string>& alternatives() const noexcept { return alternatives_; }
  const std::vector<ScoreRow>& scores() const noexcept { return scores_; }

  std::size_t criterion_count() const noexcept { return criteria_.size(); }
  std::size_t alternative_count() const noexcept { return alternatives_.size(); }

  // Raw score of alternative a on criterion c (may be kMissing).
  double score(std::size_t a, std::size_t c) const;

  // weights[c] * scores[a][c].
  double weighted_score(std::size_t a, std::size_t c) const;

  // Sum of weighted scores of alternative a; kMissing if any cell is missing.
  double total_weighted_score(std::size_t a) const;

  std::vector<double> total_weighted_scores() const;

  // Index of the highest known total. Ties go to the lowest index; missing
  // totals never win. Throws kNoRankableAlternative when no total is known.
  std::size_t best_alternative() const;

  // All indices, best first. Alternatives with a missing total follow the
  // ranked ones in index order.
  std::vector<std::size_t> ranking() const;

  bool is_complete() const noexcept;
  std::size_t missing_count() const noexcept;

  // Weights rescaled to total 100, scores divided by max_score.
  // Throws kDegenerateWeights when the weights sum to zero and
  // kInvalidArgument when max_score is not finite and positive.
  DecisionTable normalized(double max_score = kDefaultMaxScore) const;

  DecisionTable with_weights(std::vector<double> weights) const;
  DecisionTable with_scores(std::vector<ScoreRow> scores) const;

 private:
  void validate_shape_() const;
  void check_alternative_(std::size_t a) const;
  void check_criterion_(std::size_t c) const;

  std::vector<std::string> criteria_;
  std::vector<double> weights_;
  std::vector<std::string> alternatives_;
  std::vector<ScoreRow> scores_;
};

}  // namespace ktda
