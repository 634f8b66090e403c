#pragma once
/*
================================================================================
Core: Analysis Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every knob that changes an analysis result (normalization
    scale, sensitivity factors, imputation donor policy, report precision)
    into one validated object.
  - The CLI maps its flags onto these structs; the engine only reads them.

Hardening:
  - validate_or_throw() rejects nonsensical values before any computation.
  - Defaults reproduce the classic Kepner-Tregoe worksheet: scores on a
    0..10 scale, weights nudged by +/-10%.
================================================================================
*/

#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace ktda {

// ----------------------------- Normalization ---------------------------------
struct NormalizationSettings {
  // Highest score on the table's scale; raw scores are divided by it.
  double max_score = 10.0;

  void validate_or_throw() const {
    if (!std::isfinite(max_score) || max_score <= 0.0) {
      throw ValidationError("NormalizationSettings: max_score must be finite and > 0");
    }
  }
};

// ----------------------------- Sensitivity -----------------------------------
struct SensitivitySettings {
  // Multipliers applied to one criterion weight at a time.
  std::vector<double> factors{0.9, 1.1};

  void validate_or_throw() const {
    if (factors.empty()) {
      throw ValidationError("SensitivitySettings: factors must not be empty");
    }
    for (double f : factors) {
      if (!std::isfinite(f) || f < 0.0) {
        throw ValidationError("SensitivitySettings: each factor must be finite and >= 0");
      }
    }
  }
};

// ----------------------------- Imputation ------------------------------------
// Which rows may donate values to a row with missing scores.
enum class DonorPolicy : int {
  RequireComplete = 0,  // only rows with no missing scores; none -> error
  LeastIncomplete = 1   // fall back to the rows with the fewest missing scores
};

inline const char* to_string(DonorPolicy p) noexcept {
  switch (p) {
    case DonorPolicy::RequireComplete: return "complete";
    case DonorPolicy::LeastIncomplete: return "least-incomplete";
    default:                           return "complete";
  }
}

inline bool parse_donor_policy(std::string_view s, DonorPolicy* out) noexcept {
  if (!out) return false;
  if (s == "complete") { *out = DonorPolicy::RequireComplete; return true; }
  if (s == "least-incomplete") { *out = DonorPolicy::LeastIncomplete; return true; }
  return false;
}

struct ImputationSettings {
  DonorPolicy donor_policy = DonorPolicy::RequireComplete;

  void validate_or_throw() const {
    if (donor_policy != DonorPolicy::RequireComplete &&
        donor_policy != DonorPolicy::LeastIncomplete) {
      throw ValidationError("ImputationSettings: unknown donor_policy");
    }
  }
};

// ----------------------------- Reports ---------------------------------------
struct ReportSettings {
  // Digits after the decimal point for scores and weights.
  int precision = 2;

  char csv_delimiter = ',';

  void validate_or_throw() const {
    if (precision < 0 || precision > 10) {
      throw ValidationError("ReportSettings: precision must be in [0,10]");
    }
    if (csv_delimiter == '"' || csv_delimiter == '\n' || csv_delimiter == '\r' || csv_delimiter == '\0') {
      throw ValidationError("ReportSettings: csv_delimiter not usable");
    }
  }
};

// ----------------------------- AnalysisSettings ------------------------------
struct AnalysisSettings {
  NormalizationSettings normalization;
  SensitivitySettings sensitivity;
  ImputationSettings imputation;
  ReportSettings report;

  LogLevel log_level = LogLevel::INFO;

  void validate_or_throw() const {
    normalization.validate_or_throw();
    sensitivity.validate_or_throw();
    imputation.validate_or_throw();
    report.validate_or_throw();
  }

  static AnalysisSettings defaults() {
    AnalysisSettings s;
    return s;
  }
};

}  // namespace ktda
