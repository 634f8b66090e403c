/*
  Report Selftest (text worksheet + CSV)

  Checks that:
    1) Missing values never render as "nan" (text: "?", CSV: empty field).
    2) Worksheet carries weights, scores, weighted scores and totals.
    3) CSV column ordering is stable and strings are escaped.
    4) File writers report I/O failure instead of throwing.

  Usage:
      ./report_selftest
  Non-zero return code indicates failure.
*/

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/score.hpp"
#include "engine/decision/sensitivity.hpp"
#include "engine/exports/decision_report_csv.hpp"
#include "engine/exports/table_report.hpp"

namespace ktda {
namespace {

using namespace ktda::selftest;

DecisionTable make_car_table() {
  return DecisionTable({"Safety", "Cost", "Comfort", "Resale Value", "Prestige"},
                       {10, 8, 5, 6, 2},
                       {"Lexus RX 350", "Audi A6", "Toyota Prius"},
                       {{8, 7, 9, 8, 6}, {9, 3, 6, 6, 10}, {5, 10, 3, 6, 2}});
}

DecisionTable make_gappy_table() {
  return DecisionTable({"Safety", "Cost"}, {10, 8}, {"Known", "Partial"}, {{8, 7}, {kMissing, 3}});
}

std::string first_line(const std::string& s) {
  return s.substr(0, s.find('\n'));
}

void test_text_worksheet() {
  const DecisionTable t = make_car_table();
  const std::string text = format_table(t);

  const std::string header = first_line(text);
  expect_true(header.rfind("criterion", 0) == 0, "header starts with the criterion column");
  expect_contains(header, "S3", "header has one score column per alternative");
  expect_contains(header, "WS3", "header has one weighted column per alternative");

  expect_contains(text, "Safety", "criterion rows present");
  expect_contains(text, "10.00", "weights printed with two decimals");
  expect_contains(text, "80.00", "weighted scores printed");
  expect_contains(text, "TOTALS", "totals row present");
  expect_contains(text, "241.00", "Lexus RX 350 total printed");
  expect_contains(text, "185.00", "Toyota Prius total printed");

  std::istringstream lines(text);
  std::string line;
  std::size_t n = 0;
  while (std::getline(lines, line)) ++n;
  expect_eq_size(n, 7, "header + 5 criteria + totals");

  ReportSettings coarse;
  coarse.precision = 0;
  expect_contains(format_table(t, coarse), "241", "precision 0 prints integers");

  expect_contains(format_legend(t), "S2 = Audi A6", "legend names each column");
}

void test_text_missing() {
  const std::string text = format_table(make_gappy_table());
  expect_contains(text, "?", "missing cells print as '?'");
  expect_true(text.find("nan") == std::string::npos, "no 'nan' in the worksheet");
  expect_true(text.find("NaN") == std::string::npos, "no 'NaN' in the worksheet");
}

void test_text_sensitivity() {
  const DecisionTable t = make_car_table();
  const std::string text = format_sensitivity(t, analyze_weight_sensitivity(t));
  expect_contains(text, "baseline best: 1 (Lexus RX 350)", "baseline line");
  expect_contains(text, "(Safety, 9.00, 1)", "first perturbation line");
  expect_contains(text, "(Prestige, 2.20, 1)", "last perturbation line");
  expect_contains(text, "changed: 0 of 10", "summary line");
}

void test_table_csv() {
  const std::string csv = table_to_csv(make_car_table());
  expect_eq_str(first_line(csv),
                "criterion,weight,S:Lexus RX 350,S:Audi A6,S:Toyota Prius,"
                "WS:Lexus RX 350,WS:Audi A6,WS:Toyota Prius",
                "table CSV header");
  expect_contains(csv, "\nSafety,10.00,8.00,9.00,5.00,80.00,90.00,50.00\n", "Safety row");
  expect_contains(csv, "\nTOTALS,31.00,,,,241.00,200.00,185.00\n", "totals row");

  const std::string gappy = table_to_csv(make_gappy_table());
  expect_contains(gappy, "\nSafety,10.00,8.00,,80.00,\n", "missing cells export empty");
  expect_contains(gappy, "\nTOTALS,18.00,,,136.00,\n", "missing total exports empty");
  expect_true(gappy.find("nan") == std::string::npos, "no 'nan' in the CSV");

  const DecisionTable quoted({"Cost, total", "Say \"hi\""}, {1, 1}, {"x"}, {{1, 2}});
  const std::string q = table_to_csv(quoted);
  expect_contains(q, "\n\"Cost, total\",", "delimiter in a name is quoted");
  expect_contains(q, "\n\"Say \"\"hi\"\"\",", "quotes are doubled");

  ReportSettings semi;
  semi.csv_delimiter = ';';
  expect_contains(table_to_csv(make_car_table(), semi), "\nCost;8.00;7.00;", "custom delimiter");
}

void test_sensitivity_csv() {
  const DecisionTable t = make_car_table();
  const std::string csv = sensitivity_to_csv(t, analyze_weight_sensitivity(t));
  expect_eq_str(first_line(csv), "criterion,criterion_index,factor,weight,best_index,best_alternative,changed",
                "sensitivity CSV header");
  expect_contains(csv, "\nSafety,0,0.9000,9.00,1,Lexus RX 350,0\n", "first record");
  expect_contains(csv, "\nResale Value,3,1.1000,6.60,1,Lexus RX 350,0\n", "record with a spaced name");
}

void test_file_writers() {
  const DecisionTable t = make_car_table();

  std::ostringstream out_sink;
  std::ostringstream err_sink;
  set_log_sinks(&out_sink, &err_sink);

  const std::filesystem::path dir = std::filesystem::temp_directory_path();
  const std::filesystem::path path = dir / "ktda_report_selftest.csv";
  expect_true(write_table_csv_file(t, path.string()), "table CSV written");

  std::ifstream in(path);
  std::stringstream buf;
  buf << in.rdbuf();
  expect_eq_str(buf.str(), table_to_csv(t), "file content equals the in-memory CSV");
  in.close();
  std::error_code ec;
  std::filesystem::remove(path, ec);

  const std::string bad = (dir / "ktda-no-such-dir" / "x" / "out.csv").string();
  expect_true(!write_table_csv_file(t, bad), "unwritable path reports failure");
  expect_true(!write_sensitivity_csv_file(t, analyze_weight_sensitivity(t), bad),
              "unwritable path reports failure (sensitivity)");
  expect_contains(err_sink.str(), "cannot open", "I/O failure logged as an error");

  reset_log_sinks();
}

void test_report_settings() {
  ReportSettings bad;
  bad.precision = 11;
  expect_throws<ValidationError>([&] { (void)format_table(make_car_table(), bad); }, "precision above 10 rejected");

  ReportSettings quote;
  quote.csv_delimiter = '"';
  expect_throws<ValidationError>([&] { (void)table_to_csv(make_car_table(), quote); }, "quote as delimiter rejected");
}

}  // namespace
}  // namespace ktda

int main() {
  ktda::set_log_level(ktda::LogLevel::WARN);

  ktda::test_text_worksheet();
  ktda::test_text_missing();
  ktda::test_text_sensitivity();
  ktda::test_table_csv();
  ktda::test_sensitivity_csv();
  ktda::test_file_writers();
  ktda::test_report_settings();

  return ktda::selftest::finish("report_selftest");
}
