#include "engine/decision/imputation.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace ktda {

namespace {

// Index of the row among `candidates` nearest to `query`; first minimum wins.
std::size_t nearest_of(const DecisionTable& table,
                       const std::vector<std::size_t>& candidates,
                       const ScoreRow& query) {
  std::size_t best = candidates.front();
  double best_d = std::numeric_limits<double>::infinity();
  for (std::size_t i : candidates) {
    const double d = distance(table.scores()[i], query);
    if (d < best_d) {
      best = i;
      best_d = d;
    }
  }
  return best;
}

void check_query(const DecisionTable& table, std::size_t query_index) {
  if (query_index >= table.alternative_count()) {
    std::ostringstream oss;
    oss << "query index " << query_index << " out of range [0," << table.alternative_count() << ")";
    KTDA_THROW(ErrorCode::kOutOfRange, oss.str());
  }
}

}  // namespace

bool has_missing(const ScoreRow& row) noexcept {
  return std::any_of(row.begin(), row.end(), [](double x) { return is_missing(x); });
}

std::size_t count_missing(const ScoreRow& row) noexcept {
  return static_cast<std::size_t>(std::count_if(row.begin(), row.end(), [](double x) { return is_missing(x); }));
}

double distance(const ScoreRow& x, const ScoreRow& y) {
  if (x.size() != y.size()) {
    std::ostringstream oss;
    oss << "distance between rows of length " << x.size() << " and " << y.size();
    KTDA_THROW(ErrorCode::kShape, oss.str());
  }

  double sum_sq = 0.0;
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (is_missing(x[i]) || is_missing(y[i])) continue;
    const double diff = x[i] - y[i];
    sum_sq += diff * diff;
  }
  return std::sqrt(sum_sq);
}

std::size_t closest_complete_row(const DecisionTable& table, std::size_t query_index) {
  check_query(table, query_index);

  std::vector<std::size_t> candidates;
  for (std::size_t i = 0; i < table.alternative_count(); ++i) {
    if (i == query_index) continue;
    if (has_missing(table.scores()[i])) continue;
    candidates.push_back(i);
  }

  if (candidates.empty()) {
    KTDA_THROW(ErrorCode::kNoCompleteRow,
               "no alternative other than '" + table.alternatives()[query_index] +
                   "' has a complete score row to donate from");
  }
  return nearest_of(table, candidates, table.scores()[query_index]);
}

std::size_t closest_donor_row(const DecisionTable& table, std::size_t query_index, DonorPolicy policy) {
  if (policy == DonorPolicy::RequireComplete) {
    return closest_complete_row(table, query_index);
  }

  check_query(table, query_index);

  std::size_t fewest = std::numeric_limits<std::size_t>::max();
  for (std::size_t i = 0; i < table.alternative_count(); ++i) {
    if (i == query_index) continue;
    fewest = std::min(fewest, count_missing(table.scores()[i]));
  }

  std::vector<std::size_t> candidates;
  for (std::size_t i = 0; i < table.alternative_count(); ++i) {
    if (i == query_index) continue;
    if (count_missing(table.scores()[i]) == fewest) candidates.push_back(i);
  }

  if (candidates.empty()) {
    KTDA_THROW(ErrorCode::kNoCompleteRow,
               "'" + table.alternatives()[query_index] + "' is the only alternative; nothing to donate from");
  }
  if (fewest > 0) {
    std::ostringstream oss;
    oss << "no complete donor for '" << table.alternatives()[query_index]
        << "'; using rows with " << fewest << " missing score(s)";
    log(LogLevel::WARN, oss.str());
  }
  return nearest_of(table, candidates, table.scores()[query_index]);
}

ImputationResult impute_with_trace(const DecisionTable& table, const ImputationSettings& settings) {
  settings.validate_or_throw();

  std::vector<ScoreRow> new_scores;
  new_scores.reserve(table.alternative_count());
  std::vector<RowImputation> trace;

  for (std::size_t i = 0; i < table.alternative_count(); ++i) {
    const ScoreRow& query = table.scores()[i];
    if (!has_missing(query)) {
      new_scores.push_back(query);
      continue;
    }

    RowImputation rec;
    rec.row = i;
    rec.donor = closest_donor_row(table, i, settings.donor_policy);

    ScoreRow filled = table.scores()[rec.donor];
    for (std::size_t k = 0; k < query.size(); ++k) {
      if (!is_missing(query[k])) {
        filled[k] = query[k];
      } else if (is_missing(filled[k])) {
        ++rec.still_missing;
      } else {
        ++rec.filled;
      }
    }

    std::ostringstream oss;
    oss << "impute '" << table.alternatives()[i] << "' from '" << table.alternatives()[rec.donor]
        << "': filled " << rec.filled << ", still missing " << rec.still_missing;
    log(rec.still_missing ? LogLevel::WARN : LogLevel::DEBUG, oss.str());

    new_scores.push_back(std::move(filled));
    trace.push_back(rec);
  }

  {
    std::ostringstream oss;
    oss << "imputed table: " << trace.size() << " of " << table.alternative_count() << " rows synthesized";
    log(LogLevel::INFO, oss.str());
  }

  return ImputationResult{table.with_scores(std::move(new_scores)), std::move(trace)};
}

DecisionTable impute(const DecisionTable& table, const ImputationSettings& settings) {
  ImputationResult res = impute_with_trace(table, settings);
  for (const RowImputation& r : res.rows) {
    if (r.still_missing != 0) {
      std::ostringstream oss;
      oss << "'" << table.alternatives()[r.row] << "' keeps " << r.still_missing
          << " missing score(s) after borrowing from '" << table.alternatives()[r.donor] << "'";
      KTDA_THROW(ErrorCode::kIncompleteImputation, oss.str());
    }
  }
  return std::move(res.table);
}

}  // namespace ktda
