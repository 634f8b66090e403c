/*
  Decision Table Selftest

  Checks scoring, best-alternative selection (ties, missing totals),
  normalization, shape validation and index checking.

  Usage:
      ./decision_table_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <numeric>
#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/score.hpp"

namespace ktda {
namespace {

using namespace ktda::selftest;

DecisionTable make_car_table() {
  return DecisionTable({"Safety", "Cost", "Comfort", "Resale Value", "Prestige"},
                       {10, 8, 5, 6, 2},
                       {"Lexus RX 350", "Audi A6", "Toyota Prius"},
                       {{8, 7, 9, 8, 6}, {9, 3, 6, 6, 10}, {5, 10, 3, 6, 2}});
}

void test_two_criteria_scenario() {
  const DecisionTable t({"Safety", "Cost"}, {10, 8}, {"A", "B"}, {{8, 7}, {9, 3}});
  expect_near(t.weighted_score(0, 0), 80.0, "weighted_score(A, Safety) == 80");
  expect_near(t.weighted_score(1, 1), 24.0, "weighted_score(B, Cost) == 24");
  expect_near(t.total_weighted_score(0), 136.0, "total(A) == 10*8 + 8*7");
  expect_near(t.total_weighted_score(1), 114.0, "total(B) == 10*9 + 8*3");
  expect_eq_size(t.best_alternative(), 0, "A is best");
}

void test_car_totals() {
  const DecisionTable t = make_car_table();
  const std::vector<double> totals = t.total_weighted_scores();
  expect_eq_size(totals.size(), 3, "one total per alternative");
  expect_near(totals[0], 241.0, "Lexus RX 350 total");
  expect_near(totals[1], 200.0, "Audi A6 total");
  expect_near(totals[2], 185.0, "Toyota Prius total");
  expect_eq_size(t.best_alternative(), 0, "Lexus RX 350 wins");
  expect_near(t.weighted_score(1, 4), 20.0, "Audi prestige weighted score");

  const std::vector<std::size_t> order = t.ranking();
  expect_true(order == std::vector<std::size_t>{0, 1, 2}, "ranking follows totals");
}

void test_ties_go_to_lowest_index() {
  const DecisionTable t({"x", "y"}, {1, 1}, {"low", "tie-a", "tie-b"}, {{3, 1}, {5, 5}, {4, 6}});
  expect_eq_size(t.best_alternative(), 1, "first of two maximal totals wins");

  const std::vector<std::size_t> order = t.ranking();
  expect_true(order == std::vector<std::size_t>{1, 2, 0}, "ranking keeps index order on ties");
}

void test_missing_totals() {
  const DecisionTable t({"x", "y"}, {1, 1}, {"unknown", "known"}, {{kMissing, 9}, {1, 1}});
  expect_nan(t.weighted_score(0, 0), "weighted score of a missing cell is missing");
  expect_nan(t.total_weighted_score(0), "one missing cell makes the total missing");
  expect_eq_size(t.best_alternative(), 1, "missing total never wins");
  expect_true(t.ranking() == std::vector<std::size_t>{1, 0}, "missing totals rank last");
  expect_eq_size(t.missing_count(), 1, "missing_count");
  expect_true(!t.is_complete(), "table with a gap is not complete");

  const DecisionTable all_missing({"x"}, {1}, {"a", "b"}, {{kMissing}, {kMissing}});
  expect_error([&] { (void)all_missing.best_alternative(); }, ErrorCode::kNoRankableAlternative,
               "best_alternative with every total missing fails");

  const DecisionTable empty({"x"}, {1}, {}, {});
  expect_error([&] { (void)empty.best_alternative(); }, ErrorCode::kNoRankableAlternative,
               "best_alternative with no alternatives fails");
}

void test_shape_errors() {
  expect_error([] { DecisionTable({"a", "b"}, {1}, {"x"}, {{1, 2}}); }, ErrorCode::kShape,
               "weights shorter than criteria");
  expect_error([] { DecisionTable({"a"}, {1}, {"x", "y"}, {{1}}); }, ErrorCode::kShape,
               "fewer rows than alternatives");
  expect_error([] { DecisionTable({"a", "b"}, {1, 2}, {"x"}, {{1, 2, 3}}); }, ErrorCode::kShape,
               "row longer than criteria is not truncated");
  expect_error([] { DecisionTable({"a", "b"}, {1, 2}, {"x"}, {{1}}); }, ErrorCode::kShape,
               "row shorter than criteria is not padded");
  expect_error([] { DecisionTable({"a"}, {kMissing}, {"x"}, {{1}}); }, ErrorCode::kInvalidArgument,
               "NaN weight rejected");
  expect_error([] { DecisionTable({"a"}, {1}, {"x"}, {{INFINITY}}); }, ErrorCode::kInvalidArgument,
               "infinite score rejected");

  const DecisionTable t = make_car_table();
  expect_error([&] { (void)t.with_weights({1, 2}); }, ErrorCode::kShape, "with_weights validates shape");
}

void test_index_errors() {
  const DecisionTable t = make_car_table();
  expect_error([&] { (void)t.weighted_score(3, 0); }, ErrorCode::kOutOfRange, "alternative index == M");
  expect_error([&] { (void)t.weighted_score(0, 5); }, ErrorCode::kOutOfRange, "criterion index == N");
  expect_error([&] { (void)t.total_weighted_score(99); }, ErrorCode::kOutOfRange, "total of bad index");
  expect_error([&] { (void)t.score(0, 42); }, ErrorCode::kOutOfRange, "score of bad criterion");
}

void test_normalized() {
  const DecisionTable t = make_car_table();
  const DecisionTable n = t.normalized();

  const double sum = std::accumulate(n.weights().begin(), n.weights().end(), 0.0);
  expect_near(sum, 100.0, "normalized weights total 100", 1e-9);
  expect_near(n.weights()[0], 100.0 * 10.0 / 31.0, "Safety weight share");
  expect_near(n.score(1, 4), 1.0, "10 on a 10-point scale is 1");
  expect_near(n.score(2, 0), 0.5, "5 on a 10-point scale is 0.5");
  expect_true(n.criteria() == t.criteria(), "criteria names unchanged");
  expect_true(n.alternatives() == t.alternatives(), "alternative names unchanged");
  expect_near(t.weights()[0], 10.0, "source weights untouched");
  expect_near(t.score(1, 4), 10.0, "source scores untouched");

  const DecisionTable n5 = t.normalized(5.0);
  bool all_divided = true;
  for (std::size_t a = 0; a < t.alternative_count(); ++a) {
    for (std::size_t c = 0; c < t.criterion_count(); ++c) {
      if (!near(n5.score(a, c), t.score(a, c) / 5.0)) all_divided = false;
    }
  }
  expect_true(all_divided, "every cell divided by max_score");
  expect_near(n5.score(1, 4), 2.0, "values above max_score are not clamped");

  const DecisionTable gappy({"a", "b"}, {1, 3}, {"x"}, {{kMissing, 4}});
  const DecisionTable gn = gappy.normalized();
  expect_nan(gn.score(0, 0), "missing stays missing after normalization");
  expect_near(gn.score(0, 1), 0.4, "known cell normalized");
  expect_near(gn.weights()[1], 75.0, "weight share with a gap row");

  const DecisionTable zero({"a", "b"}, {0, 0}, {"x"}, {{1, 2}});
  expect_error([&] { (void)zero.normalized(); }, ErrorCode::kDegenerateWeights, "zero weight sum rejected");

  const DecisionTable cancel({"a", "b"}, {5, -5}, {"x"}, {{1, 2}});
  expect_error([&] { (void)cancel.normalized(); }, ErrorCode::kDegenerateWeights,
               "weights cancelling to zero rejected");

  const DecisionTable huge({"a", "b"}, {1e307, 1e307}, {"x"}, {{1, 2}});
  const DecisionTable hn = huge.normalized();
  expect_near(hn.weights()[0], 50.0, "huge finite weights split 50/50 (a)");
  expect_near(hn.weights()[1], 50.0, "huge finite weights split 50/50 (b)");

  const DecisionTable max_weights({"a", "b", "c"}, {1e308, 1e308, 5e307}, {"x"}, {{1, 2, 3}});
  const DecisionTable mn = max_weights.normalized();
  const double msum = std::accumulate(mn.weights().begin(), mn.weights().end(), 0.0);
  expect_near(msum, 100.0, "weights whose plain sum overflows still total 100", 1e-9);
  expect_near(mn.weights()[0], 40.0, "share of a weight near DBL_MAX");

  const DecisionTable unbalanced({"a", "b"}, {1e308, 1.0}, {"x"}, {{1, 2}});
  const DecisionTable un = unbalanced.normalized();
  expect_near(un.weights()[0], 100.0, "dominant weight takes the whole share");
  expect_true(std::isfinite(un.weights()[1]) && un.weights()[1] >= 0.0, "tiny share stays finite");

  expect_error([&] { (void)t.normalized(1e-308); }, ErrorCode::kInvalidArgument,
               "scores overflowing the division by max_score rejected");

  expect_error([&] { (void)t.normalized(0.0); }, ErrorCode::kInvalidArgument, "max_score 0 rejected");
  expect_error([&] { (void)t.normalized(-10.0); }, ErrorCode::kInvalidArgument, "negative max_score rejected");
}

}  // namespace
}  // namespace ktda

int main() {
  ktda::set_log_level(ktda::LogLevel::WARN);

  ktda::test_two_criteria_scenario();
  ktda::test_car_totals();
  ktda::test_ties_go_to_lowest_index();
  ktda::test_missing_totals();
  ktda::test_shape_errors();
  ktda::test_index_errors();
  ktda::test_normalized();

  return ktda::selftest::finish("decision_table_selftest");
}
