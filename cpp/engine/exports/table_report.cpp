/*
================================================================================
Exports: Text Report Implementation
FILE: cpp/engine/exports/table_report.cpp
================================================================================
*/

#include "table_report.hpp"

#include "engine/decision/score.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace ktda {

namespace {

constexpr int kNameWidth = 14;

// Fixed-point cell, or "?" padded to the same width when unknown.
std::string cell(double x, int width, int precision) {
  std::ostringstream oss;
  if (is_missing(x)) {
    oss << std::setw(width) << "?";
  } else {
    oss << std::fixed << std::setprecision(precision) << std::setw(width) << x;
  }
  return oss.str();
}

std::string padded_name(const std::string& s) {
  std::ostringstream oss;
  oss << std::left << std::setw(kNameWidth) << s;
  return oss.str();
}

}  // namespace

std::string format_table(const DecisionTable& table, const ReportSettings& opt) {
  opt.validate_or_throw();

  const std::size_t n_alt = table.alternative_count();
  const int p = opt.precision;
  const int score_w = p + 4;   // "10.00" at precision 2
  const int ws_w = p + 5;      // "100.00" at precision 2

  std::ostringstream os;

  // Header
  os << std::left << std::setw(kNameWidth) << "criterion" << std::right << std::setw(score_w) << "W";
  for (std::size_t i = 0; i < n_alt; ++i) {
    os << std::setw(score_w + 1) << ("S" + std::to_string(i + 1));
  }
  for (std::size_t i = 0; i < n_alt; ++i) {
    os << std::setw(ws_w + 2) << ("WS" + std::to_string(i + 1));
  }
  os << "\n";

  // One line per criterion
  for (std::size_t c = 0; c < table.criterion_count(); ++c) {
    os << padded_name(table.criteria()[c]) << cell(table.weights()[c], score_w, p);
    for (std::size_t a = 0; a < n_alt; ++a) {
      os << " " << cell(table.score(a, c), score_w, p);
    }
    for (std::size_t a = 0; a < n_alt; ++a) {
      os << "  " << cell(table.weighted_score(a, c), ws_w, p);
    }
    os << "\n";
  }

  // Totals
  os << std::left << std::setw(kNameWidth + score_w) << " TOTALS" << std::right;
  for (std::size_t a = 0; a < n_alt; ++a) {
    os << std::string(static_cast<std::size_t>(score_w + 1), ' ');
  }
  for (std::size_t a = 0; a < n_alt; ++a) {
    os << "  " << cell(table.total_weighted_score(a), ws_w, p);
  }
  os << "\n";

  return os.str();
}

std::string format_legend(const DecisionTable& table) {
  std::ostringstream os;
  for (std::size_t a = 0; a < table.alternative_count(); ++a) {
    os << "S" << (a + 1) << " = " << table.alternatives()[a] << "\n";
  }
  return os.str();
}

std::string format_sensitivity(const DecisionTable& table,
                               const SensitivityReport& report,
                               const ReportSettings& opt) {
  opt.validate_or_throw();

  std::ostringstream os;
  os << "baseline best: " << (report.baseline_best + 1);
  if (report.baseline_best < table.alternative_count()) {
    os << " (" << table.alternatives()[report.baseline_best] << ")";
  }
  os << "\n";

  for (const SensitivityRecord& r : report.records) {
    os << "(" << r.criterion << ", "
       << std::fixed << std::setprecision(opt.precision) << r.weight << ", "
       << r.best_display() << ")";
    if (r.changed) os << "  <- changed";
    os << "\n";
  }
  os << "changed: " << report.changed_count() << " of " << report.records.size() << "\n";
  return os.str();
}

void print_table(std::ostream& os, const DecisionTable& table, const ReportSettings& opt) {
  os << format_table(table, opt);
}

}  // namespace ktda
