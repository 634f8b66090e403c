/*
================================================================================
CLI: Main Entry Point (ktda_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the decision-table engine, driven by the
    built-in car-purchase example.
  - Commands:
    * figures     - full walkthrough: original, normalized, sensitivity,
                    sparse, imputed
    * table       - original table
    * normalize   - weights to 100, scores to [0,1]
    * sensitivity - weight perturbation sweep
    * impute      - sparse table before/after imputation
    * help        - show help message

Usage:
  ktda_cli [command] [options]

Hardening:
  - Explicit exit codes for CI integration
  - Settings validated before any computation
  - No silent failures
================================================================================
*/

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/imputation.hpp"
#include "engine/decision/score.hpp"
#include "engine/decision/sensitivity.hpp"
#include "engine/exports/decision_report_csv.hpp"
#include "engine/exports/table_report.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace ktda;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

struct Args {
  std::string command = "help";
  AnalysisSettings settings = AnalysisSettings::defaults();
  std::string csv_path;
};

void print_help() {
  std::cout << R"(
ktda_cli - Kepner-Tregoe Decision Analysis

Usage:
  ktda_cli [command] [options]

Commands:
  figures       Full walkthrough of the car example
  table         Original decision table
  normalize     Table with weights totaling 100 and scores in [0,1]
  sensitivity   Best alternative under +/- weight perturbations
  impute        Sparse table before and after nearest-neighbor imputation
  help          Show this help message

Options:
  --max-score <x>                      Top of the score scale (default 10)
  --factors <a,b,...>                  Weight multipliers (default 0.9,1.1)
  --donor-policy complete|least-incomplete
  --precision <n>                      Digits after the decimal point (default 2)
  --log-level debug|info|warn|error
  --csv <path>                         Also write the command's result as CSV

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

// ----------------------------- Example data ----------------------------------

DecisionTable create_car_table() {
  return DecisionTable(
      {"Safety", "Cost", "Comfort", "Resale Value", "Prestige"},
      {10, 8, 5, 6, 2},
      {"Lexus RX 350", "Audi A6", "Toyota Prius"},
      {
          {8, 7, 9, 8, 6},
          {9, 3, 6, 6, 10},
          {5, 10, 3, 6, 2},
      });
}

// Car table plus two alternatives that were only partly evaluated.
DecisionTable create_sparse_car_table() {
  const DecisionTable base = create_car_table();

  std::vector<std::string> alternatives = base.alternatives();
  alternatives.push_back("Lexus RX 460");
  alternatives.push_back("Honda Civic");

  std::vector<ScoreRow> scores = base.scores();
  scores.push_back({kMissing, kMissing, 10, kMissing, 7});
  scores.push_back({kMissing, kMissing, kMissing, kMissing, 1});

  return DecisionTable(base.criteria(), base.weights(), std::move(alternatives), std::move(scores));
}

// ----------------------------- Argument parsing ------------------------------

static bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

static bool parse_int(const char* s, long lo, long hi, int* out) {
  if (!s || !out) return false;
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0' || errno == ERANGE) return false;
  if (v < lo || v > hi) return false;
  *out = static_cast<int>(v);
  return true;
}

static bool parse_factor_list(const char* s, std::vector<double>* out) {
  if (!s || !out) return false;
  std::vector<double> factors;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    double f = 0.0;
    if (!parse_double(item.c_str(), &f)) return false;
    factors.push_back(f);
  }
  if (factors.empty()) return false;
  *out = std::move(factors);
  return true;
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (argc >= 2) a->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--max-score") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--max-score requires a value"; return false; }
      if (!parse_double(v, &a->settings.normalization.max_score)) { *err = "--max-score must be a finite number"; return false; }
      continue;
    }

    if (std::strcmp(k, "--factors") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--factors requires a value"; return false; }
      if (!parse_factor_list(v, &a->settings.sensitivity.factors)) { *err = "--factors must be a comma-separated list of numbers"; return false; }
      continue;
    }

    if (std::strcmp(k, "--donor-policy") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--donor-policy requires a value"; return false; }
      if (!parse_donor_policy(v, &a->settings.imputation.donor_policy)) { *err = "--donor-policy must be complete or least-incomplete"; return false; }
      continue;
    }

    if (std::strcmp(k, "--precision") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--precision requires a value"; return false; }
      if (!parse_int(v, 0, 10, &a->settings.report.precision)) { *err = "--precision must be an integer in [0,10]"; return false; }
      continue;
    }

    if (std::strcmp(k, "--log-level") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--log-level requires a value"; return false; }
      if (!parse_log_level(v, &a->settings.log_level)) { *err = "--log-level must be debug, info, warn or error"; return false; }
      continue;
    }

    if (std::strcmp(k, "--csv") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--csv requires a path"; return false; }
      a->csv_path = v;
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }
  return true;
}

// ----------------------------- Commands --------------------------------------

static void show(const std::string& title, const DecisionTable& t, const ReportSettings& rs) {
  std::cout << "\n\n" << title << "\n";
  std::cout << format_legend(t);
  print_table(std::cout, t, rs);
}

static int write_csv_or_fail(bool ok) {
  return ok ? ExitCode::SUCCESS : ExitCode::IO_ERROR;
}

int cmd_table(const Args& a) {
  const DecisionTable t = create_car_table();
  show("Original Table", t, a.settings.report);
  std::cout << "\nBest alternative: " << t.alternatives()[t.best_alternative()] << "\n";
  if (!a.csv_path.empty()) return write_csv_or_fail(write_table_csv_file(t, a.csv_path, a.settings.report));
  return ExitCode::SUCCESS;
}

int cmd_normalize(const Args& a) {
  const DecisionTable t = create_car_table().normalized(a.settings.normalization.max_score);
  show("With Normalized Weights and Scores", t, a.settings.report);
  if (!a.csv_path.empty()) return write_csv_or_fail(write_table_csv_file(t, a.csv_path, a.settings.report));
  return ExitCode::SUCCESS;
}

int cmd_sensitivity(const Args& a) {
  const DecisionTable t = create_car_table();
  const SensitivityReport rep = analyze_weight_sensitivity(t, a.settings.sensitivity);
  std::cout << "\n\nSensitivity Results\n" << format_sensitivity(t, rep, a.settings.report);
  if (!a.csv_path.empty()) {
    return write_csv_or_fail(write_sensitivity_csv_file(t, rep, a.csv_path, a.settings.report));
  }
  return ExitCode::SUCCESS;
}

int cmd_impute(const Args& a) {
  const DecisionTable sparse = create_sparse_car_table();
  show("Sparse Data Without Imputations", sparse, a.settings.report);

  const ImputationResult res = impute_with_trace(sparse, a.settings.imputation);
  show("After Imputation", res.table, a.settings.report);
  for (const RowImputation& r : res.rows) {
    std::cout << sparse.alternatives()[r.row] << " <- " << sparse.alternatives()[r.donor]
              << " (filled " << r.filled << ", still missing " << r.still_missing << ")\n";
  }
  if (!res.complete()) {
    std::cerr << "Imputation left missing scores; totals for those rows are unknown\n";
    return ExitCode::COMPUTATION_FAILED;
  }

  std::cout << "\nBest alternative after imputation: "
            << res.table.alternatives()[res.table.best_alternative()] << "\n";
  if (!a.csv_path.empty()) return write_csv_or_fail(write_table_csv_file(res.table, a.csv_path, a.settings.report));
  return ExitCode::SUCCESS;
}

int cmd_figures(const Args& a) {
  const DecisionTable fig1 = create_car_table();
  show("Figure 1: Original Table", fig1, a.settings.report);
  show("Figure 2: With Normalized Weights and Scores",
       fig1.normalized(a.settings.normalization.max_score), a.settings.report);

  const SensitivityReport rep = analyze_weight_sensitivity(fig1, a.settings.sensitivity);
  std::cout << "\n\nFigure 3: Sensitivity Results\n" << format_sensitivity(fig1, rep, a.settings.report);

  const DecisionTable fig4 = create_sparse_car_table();
  show("Figure 4: Sparse Data Without Imputations", fig4, a.settings.report);

  const DecisionTable fig5 = impute(fig4, a.settings.imputation);
  show("Figure 5: After Imputation", fig5, a.settings.report);

  if (!a.csv_path.empty()) return write_csv_or_fail(write_table_csv_file(fig5, a.csv_path, a.settings.report));
  return ExitCode::SUCCESS;
}

int main(int argc, char** argv) {
  Args args;
  std::string err;
  if (!parse_args(argc, argv, &args, &err)) {
    std::cerr << err << "\n";
    std::cerr << "Run 'ktda_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  const std::string& cmd = args.command;
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  try {
    args.settings.validate_or_throw();
    set_log_level(args.settings.log_level);

    if (cmd == "figures") return cmd_figures(args);
    if (cmd == "table") return cmd_table(args);
    if (cmd == "normalize") return cmd_normalize(args);
    if (cmd == "sensitivity") return cmd_sensitivity(args);
    if (cmd == "impute") return cmd_impute(args);

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const Error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return e.code() == ErrorCode::kIoError ? ExitCode::IO_ERROR : ExitCode::COMPUTATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'ktda_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
