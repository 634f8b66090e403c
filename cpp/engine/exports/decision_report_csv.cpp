/*
================================================================================
Exports: CSV Exporter Implementation
FILE: cpp/engine/exports/decision_report_csv.cpp
================================================================================
*/

#include "decision_report_csv.hpp"

#include "engine/core/logging.hpp"
#include "engine/decision/score.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace ktda {

// Quote if the field contains the delimiter, a quote or a newline.
static std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

// Empty string for missing/non-finite values.
static std::string csv_double(double x, int precision) {
  if (is_missing(x) || !std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

static bool write_text_file(const std::string& text, const std::string& file_path) {
  std::ofstream f(file_path, std::ios::binary | std::ios::trunc);
  if (!f) {
    log(LogLevel::ERROR, "cannot open '" + file_path + "' for writing");
    return false;
  }
  f << text;
  f.flush();
  if (!f) {
    log(LogLevel::ERROR, "write to '" + file_path + "' failed");
    return false;
  }
  log(LogLevel::INFO, "wrote " + file_path);
  return true;
}

std::string table_to_csv(const DecisionTable& table, const ReportSettings& opt) {
  opt.validate_or_throw();
  const char d = opt.csv_delimiter;
  const int p = opt.precision;

  std::ostringstream os;

  os << "criterion" << d << "weight";
  for (const std::string& a : table.alternatives()) os << d << csv_escape("S:" + a, d);
  for (const std::string& a : table.alternatives()) os << d << csv_escape("WS:" + a, d);
  os << "\n";

  for (std::size_t c = 0; c < table.criterion_count(); ++c) {
    os << csv_escape(table.criteria()[c], d) << d << csv_double(table.weights()[c], p);
    for (std::size_t a = 0; a < table.alternative_count(); ++a) os << d << csv_double(table.score(a, c), p);
    for (std::size_t a = 0; a < table.alternative_count(); ++a) os << d << csv_double(table.weighted_score(a, c), p);
    os << "\n";
  }

  const double weight_sum = std::accumulate(table.weights().begin(), table.weights().end(), 0.0);
  os << "TOTALS" << d << csv_double(weight_sum, p);
  for (std::size_t a = 0; a < table.alternative_count(); ++a) os << d;
  for (std::size_t a = 0; a < table.alternative_count(); ++a) os << d << csv_double(table.total_weighted_score(a), p);
  os << "\n";

  return os.str();
}

std::string sensitivity_to_csv(const DecisionTable& table,
                               const SensitivityReport& report,
                               const ReportSettings& opt) {
  opt.validate_or_throw();
  const char d = opt.csv_delimiter;
  const int p = opt.precision;

  std::ostringstream os;
  os << "criterion" << d << "criterion_index" << d << "factor" << d << "weight" << d
     << "best_index" << d << "best_alternative" << d << "changed" << "\n";

  for (const SensitivityRecord& r : report.records) {
    const std::string best_name =
        (r.best_index < table.alternative_count()) ? table.alternatives()[r.best_index] : std::string{};
    os << csv_escape(r.criterion, d) << d
       << r.criterion_index << d
       << csv_double(r.factor, 4) << d
       << csv_double(r.weight, p) << d
       << r.best_display() << d
       << csv_escape(best_name, d) << d
       << (r.changed ? 1 : 0) << "\n";
  }
  return os.str();
}

bool write_table_csv_file(const DecisionTable& table,
                          const std::string& file_path,
                          const ReportSettings& opt) {
  return write_text_file(table_to_csv(table, opt), file_path);
}

bool write_sensitivity_csv_file(const DecisionTable& table,
                                const SensitivityReport& report,
                                const std::string& file_path,
                                const ReportSettings& opt) {
  return write_text_file(sensitivity_to_csv(table, report, opt), file_path);
}

}  // namespace ktda
