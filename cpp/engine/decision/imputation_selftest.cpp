/*
  Imputation Selftest

  Checks the missing-tolerant distance, donor search (ties, self, incomplete
  rows), row synthesis, donor policies and the untouched-source contract.

  Usage:
      ./imputation_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/imputation.hpp"
#include "engine/decision/score.hpp"

namespace ktda {
namespace {

using namespace ktda::selftest;

const std::vector<std::string> kCarCriteria{"Safety", "Cost", "Comfort", "Resale Value", "Prestige"};
const std::vector<double> kCarWeights{10, 8, 5, 6, 2};

DecisionTable make_sparse_car_table() {
  return DecisionTable(kCarCriteria, kCarWeights,
                       {"Lexus RX 350", "Audi A6", "Toyota Prius", "Lexus RX 460", "Honda Civic"},
                       {{8, 7, 9, 8, 6},
                        {9, 3, 6, 6, 10},
                        {5, 10, 3, 6, 2},
                        {kMissing, kMissing, 10, kMissing, 7},
                        {kMissing, kMissing, kMissing, kMissing, 1}});
}

bool same_row(const ScoreRow& a, const ScoreRow& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (is_missing(a[i]) != is_missing(b[i])) return false;
    if (!is_missing(a[i]) && a[i] != b[i]) return false;
  }
  return true;
}

void test_missing_predicates() {
  expect_true(is_missing(kMissing), "kMissing is missing");
  expect_true(!is_missing(0.0), "zero is a measurement");
  expect_true(!(kMissing == kMissing), "missing never compares equal");
  expect_true(has_missing({1, kMissing, 3}), "has_missing finds a gap");
  expect_true(!has_missing({1, 2, 3}), "has_missing on a complete row");
  expect_true(!has_missing({}), "empty row has nothing missing");
  expect_eq_size(count_missing({kMissing, 2, kMissing}), 2, "count_missing");
}

void test_distance() {
  const ScoreRow x{kMissing, kMissing, 10, kMissing, 7};
  const ScoreRow y{9, 3, 6, 6, 10};
  const ScoreRow z{8, 7, 9, 8, 6};

  expect_near(distance(x, y), 5.0, "distance uses only jointly known positions");
  expect_near(distance(x, y), distance(y, x), "distance is symmetric (gappy)");
  expect_near(distance(y, z), distance(z, y), "distance is symmetric (complete)");
  expect_near(distance(y, y), 0.0, "distance to self is zero");
  expect_near(distance(y, z), std::sqrt(1.0 + 16.0 + 9.0 + 4.0 + 16.0), "plain Euclidean when complete");

  const ScoreRow a{1, kMissing};
  const ScoreRow b{kMissing, 5};
  expect_near(distance(a, b), 0.0, "no shared evidence gives distance zero");

  expect_error([&] { (void)distance(ScoreRow{1, 2}, ScoreRow{1, 2, 3}); }, ErrorCode::kShape,
               "distance rejects rows of different length");
}

void test_closest_complete_row() {
  const DecisionTable t = make_sparse_car_table();
  expect_eq_size(closest_complete_row(t, 3), 0, "Lexus RX 460 is nearest to Lexus RX 350");
  expect_eq_size(closest_complete_row(t, 4), 2, "Honda Civic is nearest to Toyota Prius");
  expect_eq_size(closest_complete_row(t, 0), 1, "complete rows can query too, never themselves");

  const DecisionTable tie({"a", "b"}, {1, 1}, {"q", "first", "second"}, {{kMissing, 5}, {1, 4}, {2, 6}});
  expect_eq_size(closest_complete_row(tie, 0), 1, "equidistant donors: lowest index wins");

  const DecisionTable skip({"a", "b", "c"}, {1, 1, 1}, {"q", "gappy-twin", "far"},
                           {{kMissing, 5, 5}, {kMissing, 5, 5}, {0, 0, 0}});
  expect_eq_size(closest_complete_row(skip, 0), 2, "rows with gaps never donate under RequireComplete");

  expect_error([&] { (void)closest_complete_row(t, 5); }, ErrorCode::kOutOfRange, "bad query index");
}

void test_impute_scenario() {
  const DecisionTable t({"c1", "c2", "c3", "c4", "c5"}, {1, 1, 1, 1, 1},
                        {"donor", "other", "query"},
                        {{9, 3, 6, 6, 10}, {1, 1, 1, 1, 1}, {kMissing, kMissing, 10, kMissing, 7}});

  const DecisionTable out = impute(t);
  expect_true(same_row(out.scores()[2], ScoreRow{9, 3, 10, 6, 7}), "query row takes donor cells only where unknown");
  expect_true(same_row(out.scores()[0], t.scores()[0]), "complete rows pass through");
  expect_true(same_row(out.scores()[1], t.scores()[1]), "complete rows pass through (2)");
  expect_true(has_missing(t.scores()[2]), "source table untouched");
  expect_true(out.criteria() == t.criteria() && out.alternatives() == t.alternatives() && out.weights() == t.weights(),
              "names and weights carried over");
}

void test_single_missing_cell() {
  const DecisionTable t({"a", "b", "c"}, {1, 2, 3}, {"near", "query", "far"},
                        {{7, 2, 4}, {kMissing, 2, 3}, {1, 9, 9}});
  const DecisionTable out = impute(t);
  expect_near(out.score(1, 0), 7.0, "single gap filled from the nearest complete row");
  expect_near(out.score(1, 1), 2.0, "known cell kept (b)");
  expect_near(out.score(1, 2), 3.0, "known cell kept (c)");
}

void test_idempotent_on_complete_table() {
  const DecisionTable t(kCarCriteria, kCarWeights, {"x", "y"}, {{1, 2, 3, 4, 5}, {5, 4, 3, 2, 1}});
  const DecisionTable out = impute(t);
  bool same = out.scores().size() == t.scores().size();
  for (std::size_t i = 0; same && i < t.scores().size(); ++i) same = same_row(out.scores()[i], t.scores()[i]);
  expect_true(same, "imputing a complete table changes nothing");

  const ImputationResult res = impute_with_trace(t);
  expect_eq_size(res.rows.size(), 0, "no rows traced for a complete table");
}

void test_sparse_car_example() {
  const DecisionTable t = make_sparse_car_table();
  expect_eq_size(t.best_alternative(), 0, "before imputation, rows with gaps are not ranked");

  const ImputationResult res = impute_with_trace(t);
  expect_true(res.complete(), "car example imputes completely");
  expect_eq_size(res.rows.size(), 2, "two rows synthesized");
  expect_eq_size(res.rows[0].row, 3, "first traced row is Lexus RX 460");
  expect_eq_size(res.rows[0].donor, 0, "Lexus RX 460 borrows from Lexus RX 350");
  expect_eq_size(res.rows[0].filled, 3, "three cells borrowed");
  expect_eq_size(res.rows[1].donor, 2, "Honda Civic borrows from Toyota Prius");
  expect_eq_size(res.rows[1].filled, 4, "four cells borrowed");

  expect_true(same_row(res.table.scores()[3], ScoreRow{8, 7, 10, 8, 7}), "Lexus RX 460 synthesized row");
  expect_true(same_row(res.table.scores()[4], ScoreRow{5, 10, 3, 6, 1}), "Honda Civic synthesized row");
  expect_near(res.table.total_weighted_score(3), 248.0, "Lexus RX 460 total after imputation");
  expect_eq_size(res.table.best_alternative(), 3, "Lexus RX 460 wins once imputed");
  expect_eq_size(t.missing_count(), 7, "source still has its gaps");
}

void test_no_complete_row() {
  const DecisionTable t({"a", "b", "c"}, {1, 1, 1}, {"r0", "r1"}, {{kMissing, 1, 2}, {3, kMissing, 2}});

  expect_error([&] { (void)closest_complete_row(t, 0); }, ErrorCode::kNoCompleteRow,
               "no complete donor is an explicit error");
  expect_error([&] { (void)impute(t); }, ErrorCode::kNoCompleteRow,
               "impute with the default policy fails without a complete donor");

  ImputationSettings fallback;
  fallback.donor_policy = DonorPolicy::LeastIncomplete;

  std::ostringstream out_sink;
  std::ostringstream err_sink;
  set_log_sinks(&out_sink, &err_sink);
  const DecisionTable out = impute(t, fallback);
  reset_log_sinks();

  expect_true(same_row(out.scores()[0], ScoreRow{3, 1, 2}), "fallback donor fills r0");
  expect_true(same_row(out.scores()[1], ScoreRow{3, 1, 2}), "fallback donor fills r1");
  expect_contains(err_sink.str(), "no complete donor", "fallback is announced on the warning sink");
}

void test_fallback_leaves_gaps() {
  const DecisionTable t({"a", "b", "c"}, {1, 1, 1}, {"r0", "r1", "r2"},
                        {{kMissing, 1, 2}, {3, kMissing, 2}, {kMissing, kMissing, 9}});
  ImputationSettings fallback;
  fallback.donor_policy = DonorPolicy::LeastIncomplete;

  std::ostringstream out_sink;
  std::ostringstream err_sink;
  set_log_sinks(&out_sink, &err_sink);

  const ImputationResult res = impute_with_trace(t, fallback);
  expect_true(!res.complete(), "trace reports the unfilled cell");
  expect_eq_size(res.rows.size(), 3, "every row was gappy");
  expect_eq_size(res.rows[2].donor, 0, "equidistant partial donors: lowest index wins");
  expect_eq_size(res.rows[2].still_missing, 1, "cell missing in both rows stays missing");
  expect_eq_size(res.rows[2].filled, 1, "one cell borrowed");
  expect_nan(res.table.score(2, 0), "unfilled cell is still missing");
  expect_contains(err_sink.str(), "still missing 1", "unfilled cells are logged as a warning");

  expect_error([&] { (void)impute(t, fallback); }, ErrorCode::kIncompleteImputation,
               "impute refuses to return a partially missing row");
  reset_log_sinks();
}

void test_lone_alternative() {
  const DecisionTable t({"a", "b"}, {1, 1}, {"only"}, {{kMissing, 1}});
  ImputationSettings fallback;
  fallback.donor_policy = DonorPolicy::LeastIncomplete;

  expect_error([&] { (void)impute(t); }, ErrorCode::kNoCompleteRow, "lone gappy row, default policy");
  expect_error([&] { (void)impute(t, fallback); }, ErrorCode::kNoCompleteRow, "lone gappy row, fallback policy");
}

}  // namespace
}  // namespace ktda

int main() {
  ktda::set_log_level(ktda::LogLevel::WARN);

  ktda::test_missing_predicates();
  ktda::test_distance();
  ktda::test_closest_complete_row();
  ktda::test_impute_scenario();
  ktda::test_single_missing_cell();
  ktda::test_idempotent_on_complete_table();
  ktda::test_sparse_car_example();
  ktda::test_no_complete_row();
  ktda::test_fallback_leaves_gaps();
  ktda::test_lone_alternative();

  return ktda::selftest::finish("imputation_selftest");
}
