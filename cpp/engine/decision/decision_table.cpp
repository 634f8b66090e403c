/*
================================================================================
Decision: Decision Table Implementation
FILE: cpp/engine/decision/decision_table.cpp
================================================================================
*/

#include "engine/decision/decision_table.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace ktda {

DecisionTable::DecisionTable(std::vector<std::string> criteria,
                             std::vector<double> weights,
                             std::vector<std::string> alternatives,
                             std::vector<ScoreRow> scores)
    : criteria_(std::move(criteria)),
      weights_(std::move(weights)),
      alternatives_(std::move(alternatives)),
      scores_(std::move(scores)) {
  validate_shape_();
}

void DecisionTable::validate_shape_() const {
  if (weights_.size() != criteria_.size()) {
    std::ostringstream oss;
    oss << "weights has " << weights_.size() << " entries, criteria has " << criteria_.size();
    KTDA_THROW(ErrorCode::kShape, oss.str());
  }
  if (scores_.size() != alternatives_.size()) {
    std::ostringstream oss;
    oss << "scores has " << scores_.size() << " rows, alternatives has " << alternatives_.size();
    KTDA_THROW(ErrorCode::kShape, oss.str());
  }

  for (std::size_t c = 0; c < weights_.size(); ++c) {
    if (!std::isfinite(weights_[c])) {
      KTDA_THROW(ErrorCode::kInvalidArgument, "weight of criterion '" + criteria_[c] + "' is not finite");
    }
  }

  for (std::size_t a = 0; a < scores_.size(); ++a) {
    const ScoreRow& row = scores_[a];
    if (row.size() != criteria_.size()) {
      std::ostringstream oss;
      oss << "score row of '" << alternatives_[a] << "' has " << row.size()
          << " cells, expected " << criteria_.size();
      KTDA_THROW(ErrorCode::kShape, oss.str());
    }
    for (double x : row) {
      // NaN is the missing marker; only +/-inf is rejected.
      if (std::isinf(x)) {
        KTDA_THROW(ErrorCode::kInvalidArgument, "score row of '" + alternatives_[a] + "' holds an infinite value");
      }
    }
  }
}

void DecisionTable::check_alternative_(std::size_t a) const {
  if (a >= alternatives_.size()) {
    std::ostringstream oss;
    oss << "alternative index " << a << " out of range [0," << alternatives_.size() << ")";
    KTDA_THROW(ErrorCode::kOutOfRange, oss.str());
  }
}

void DecisionTable::check_criterion_(std::size_t c) const {
  if (c >= criteria_.size()) {
    std::ostringstream oss;
    oss << "criterion index " << c << " out of range [0," << criteria_.size() << ")";
    KTDA_THROW(ErrorCode::kOutOfRange, oss.str());
  }
}

double DecisionTable::score(std::size_t a, std::size_t c) const {
  check_alternative_(a);
  check_criterion_(c);
  return scores_[a][c];
}

double DecisionTable::weighted_score(std::size_t a, std::size_t c) const {
  check_alternative_(a);
  check_criterion_(c);
  return weights_[c] * scores_[a][c];
}

double DecisionTable::total_weighted_score(std::size_t a) const {
  check_alternative_(a);
  double total = 0.0;
  for (std::size_t c = 0; c < criteria_.size(); ++c) {
    total += weights_[c] * scores_[a][c];
  }
  return total;
}

std::vector<double> DecisionTable::total_weighted_scores() const {
  std::vector<double> out;
  out.reserve(alternatives_.size());
  for (std::size_t a = 0; a < alternatives_.size(); ++a) {
    out.push_back(total_weighted_score(a));
  }
  return out;
}

std::size_t DecisionTable::best_alternative() const {
  bool found = false;
  std::size_t best = 0;
  double best_total = 0.0;

  for (std::size_t a = 0; a < alternatives_.size(); ++a) {
    const double t = total_weighted_score(a);
    if (is_missing(t)) continue;
    // Strict '>' keeps the first index on ties.
    if (!found || t > best_total) {
      found = true;
      best = a;
      best_total = t;
    }
  }

  if (!found) {
    KTDA_THROW(ErrorCode::kNoRankableAlternative,
               "no alternative has a known total weighted score (impute missing scores first)");
  }
  return best;
}

std::vector<std::size_t> DecisionTable::ranking() const {
  const std::vector<double> totals = total_weighted_scores();

  std::vector<std::size_t> known;
  std::vector<std::size_t> unknown;
  for (std::size_t a = 0; a < totals.size(); ++a) {
    if (is_missing(totals[a])) unknown.push_back(a);
    else known.push_back(a);
  }

  std::stable_sort(known.begin(), known.end(),
                   [&totals](std::size_t x, std::size_t y) { return totals[x] > totals[y]; });

  known.insert(known.end(), unknown.begin(), unknown.end());
  return known;
}

bool DecisionTable::is_complete() const noexcept {
  return missing_count() == 0;
}

std::size_t DecisionTable::missing_count() const noexcept {
  std::size_t n = 0;
  for (const ScoreRow& row : scores_) {
    n += static_cast<std::size_t>(std::count_if(row.begin(), row.end(), [](double x) { return is_missing(x); }));
  }
  return n;
}

DecisionTable DecisionTable::normalized(double max_score) const {
  KTDA_ENSURE(std::isfinite(max_score) && max_score > 0.0, ErrorCode::kInvalidArgument,
              "max_score must be finite and > 0");

  // Rescale by the largest magnitude first so huge finite weights cannot
  // overflow the sum or the share computation.
  double scale = 0.0;
  for (double w : weights_) scale = std::max(scale, std::fabs(w));
  KTDA_ENSURE(scale != 0.0, ErrorCode::kDegenerateWeights,
              "cannot normalize weights that sum to zero");

  double scaled_sum = 0.0;
  for (double w : weights_) scaled_sum += w / scale;
  KTDA_ENSURE(scaled_sum != 0.0, ErrorCode::kDegenerateWeights,
              "cannot normalize weights that sum to zero");

  std::vector<double> new_weights;
  new_weights.reserve(weights_.size());
  for (double w : weights_) {
    const double share = (w / scale) / scaled_sum * 100.0;
    KTDA_ENSURE(std::isfinite(share), ErrorCode::kDegenerateWeights,
                "weight sum is too close to zero to normalize");
    new_weights.push_back(share);
  }

  std::vector<ScoreRow> new_scores;
  new_scores.reserve(scores_.size());
  for (std::size_t a = 0; a < scores_.size(); ++a) {
    ScoreRow r;
    r.reserve(scores_[a].size());
    for (double x : scores_[a]) {
      const double q = x / max_score;  // missing stays missing
      if (std::isinf(q)) {
        KTDA_THROW(ErrorCode::kInvalidArgument,
                   "score of '" + alternatives_[a] + "' overflows when divided by max_score");
      }
      r.push_back(q);
    }
    new_scores.push_back(std::move(r));
  }

  std::ostringstream oss;
  oss << "normalized table: " << weights_.size() << " weights -> 100, max_score " << max_score;
  log(LogLevel::INFO, oss.str());

  return DecisionTable(criteria_, std::move(new_weights), alternatives_, std::move(new_scores));
}

DecisionTable DecisionTable::with_weights(std::vector<double> weights) const {
  return DecisionTable(criteria_, std::move(weights), alternatives_, scores_);
}

DecisionTable DecisionTable::with_scores(std::vector<ScoreRow> scores) const {
  return DecisionTable(criteria_, weights_, alternatives_, std::move(scores));
}

}  // namespace ktda
