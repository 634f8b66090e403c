/*
  Sensitivity Selftest

  Usage:
      ./sensitivity_selftest
  Non-zero return code indicates failure.
*/

#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/score.hpp"
#include "engine/decision/sensitivity.hpp"

namespace ktda {
namespace {

using namespace ktda::selftest;

DecisionTable make_car_table() {
  return DecisionTable({"Safety", "Cost", "Comfort", "Resale Value", "Prestige"},
                       {10, 8, 5, 6, 2},
                       {"Lexus RX 350", "Audi A6", "Toyota Prius"},
                       {{8, 7, 9, 8, 6}, {9, 3, 6, 6, 10}, {5, 10, 3, 6, 2}});
}

void test_car_sweep_order() {
  const DecisionTable t = make_car_table();
  const SensitivityReport rep = analyze_weight_sensitivity(t);

  expect_eq_size(rep.records.size(), 10, "one record per (criterion, factor)");
  expect_eq_size(rep.baseline_best, 0, "baseline winner");

  expect_eq_str(rep.records[0].criterion, "Safety", "criteria iterate outer");
  expect_near(rep.records[0].factor, 0.9, "factors iterate inner (first)");
  expect_near(rep.records[0].weight, 9.0, "Safety weight x0.9");
  expect_near(rep.records[1].factor, 1.1, "factors iterate inner (second)");
  expect_near(rep.records[1].weight, 11.0, "Safety weight x1.1");
  expect_eq_str(rep.records[2].criterion, "Cost", "second criterion follows");
  expect_near(rep.records[2].weight, 7.2, "Cost weight x0.9");
  expect_eq_size(rep.records[9].criterion_index, 4, "last record is Prestige");
  expect_near(rep.records[9].weight, 2.2, "Prestige weight x1.1");

  bool all_first = true;
  for (const auto& r : rep.records) {
    if (r.best_index != 0 || r.best_display() != 1) all_first = false;
  }
  expect_true(all_first, "Lexus RX 350 stays best under +/-10%");
  expect_true(rep.stable(), "car example is stable");

  expect_near(t.weights()[0], 10.0, "source weights untouched");
  expect_near(t.weights()[4], 2.0, "source weights untouched (last)");
}

void test_sweep_detects_rank_change() {
  const DecisionTable t({"a", "b"}, {1, 1}, {"A", "B"}, {{10, 0}, {0, 9.5}});
  const SensitivityReport rep = analyze_weight_sensitivity(t);

  expect_eq_size(rep.baseline_best, 0, "A wins at equal weights");
  expect_eq_size(rep.records[0].best_index, 1, "a x0.9 hands the win to B");
  expect_true(rep.records[0].changed, "change flagged");
  expect_eq_size(rep.records[1].best_index, 0, "a x1.1 keeps A");
  expect_true(!rep.records[1].changed, "no change flagged");
  expect_eq_size(rep.records[2].best_index, 0, "b x0.9 keeps A");
  expect_eq_size(rep.records[3].best_index, 1, "b x1.1 hands the win to B");
  expect_eq_size(rep.records[3].best_display(), 2, "1-based display index");
  expect_eq_size(rep.changed_count(), 2, "two perturbations change the winner");
  expect_true(!rep.stable(), "sweep is not stable");
}

void test_custom_factors() {
  const DecisionTable t({"a", "b"}, {2, 4}, {"A", "B"}, {{1, 2}, {2, 1}});
  SensitivitySettings s;
  s.factors = {0.5, 1.0, 2.0};
  const SensitivityReport rep = analyze_weight_sensitivity(t, s);
  expect_eq_size(rep.records.size(), 6, "criteria x factors records");
  expect_near(rep.records[3].weight, 4.0, "b x1.0 keeps its weight");
  expect_near(rep.records[5].weight, 8.0, "b x2.0");
}

void test_zero_factor_drops_criterion() {
  const DecisionTable t = make_car_table();
  SensitivitySettings s;
  s.factors = {0.0};
  const SensitivityReport rep = analyze_weight_sensitivity(t, s);

  expect_eq_size(rep.records.size(), 5, "one record per criterion");
  bool all_zero = true;
  for (const auto& r : rep.records) {
    if (r.weight != 0.0) all_zero = false;
  }
  expect_true(all_zero, "factor 0 zeroes the perturbed weight");
  expect_eq_size(rep.records[0].best_index, 0, "Lexus RX 350 still wins without Safety");
  expect_true(rep.stable(), "dropping any single car criterion keeps the winner");
}

void test_sweep_with_missing_totals() {
  // Row 0 has the largest known score but a gap, so its total is missing.
  const DecisionTable t({"a", "b"}, {1, 1}, {"gappy", "B", "C"}, {{kMissing, 100}, {3, 4}, {5, 1}});
  SensitivitySettings s;
  s.factors = {0.0, 0.9, 1.1, 10.0};
  const SensitivityReport rep = analyze_weight_sensitivity(t, s);

  expect_eq_size(rep.baseline_best, 1, "baseline skips the missing total");
  expect_eq_size(rep.records.size(), 8, "criteria x factors records");

  bool gappy_never_wins = true;
  for (const auto& r : rep.records) {
    if (r.best_index == 0) gappy_never_wins = false;
  }
  expect_true(gappy_never_wins, "a missing total never wins a perturbed ranking");

  expect_eq_size(rep.records[0].best_index, 1, "a x0: B 4 vs C 1");
  expect_eq_size(rep.records[3].best_index, 2, "a x10: C 51 vs B 34");
  expect_eq_size(rep.records[4].best_index, 2, "b x0: C 5 vs B 3");
  expect_eq_size(rep.records[7].best_index, 1, "b x10: B 43 vs C 15");
  expect_eq_size(rep.changed_count(), 2, "two perturbations hand the win to C");
}

void test_sweep_errors() {
  const DecisionTable t = make_car_table();

  SensitivitySettings none;
  none.factors.clear();
  expect_throws<ValidationError>([&] { (void)analyze_weight_sensitivity(t, none); }, "empty factor list rejected");

  SensitivitySettings negative;
  negative.factors = {1.0, -0.5};
  expect_throws<ValidationError>([&] { (void)analyze_weight_sensitivity(t, negative); }, "negative factor rejected");

  SensitivitySettings nan_factor;
  nan_factor.factors = {kMissing};
  expect_throws<ValidationError>([&] { (void)analyze_weight_sensitivity(t, nan_factor); }, "NaN factor rejected");

  const DecisionTable unranked({"a"}, {1}, {"x"}, {{kMissing}});
  expect_error([&] { (void)analyze_weight_sensitivity(unranked); }, ErrorCode::kNoRankableAlternative,
               "sweep over an unrankable table fails");
}

}  // namespace
}  // namespace ktda

int main() {
  ktda::set_log_level(ktda::LogLevel::WARN);

  ktda::test_car_sweep_order();
  ktda::test_sweep_detects_rank_change();
  ktda::test_custom_factors();
  ktda::test_zero_factor_drops_criterion();
  ktda::test_sweep_with_missing_totals();
  ktda::test_sweep_errors();

  return ktda::selftest::finish("sensitivity_selftest");
}
