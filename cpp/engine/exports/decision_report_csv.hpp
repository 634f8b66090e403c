#pragma once
/*
================================================================================
Exports: CSV Exporter (Decision Table + Sensitivity Sweep)
FILE: cpp/engine/exports/decision_report_csv.hpp

Output format (table):
  criterion,weight,S:<alt1>,...,WS:<alt1>,...
  one row per criterion, then a TOTALS row (weight column = weight sum,
  score columns empty, WS columns = total weighted score).

Output format (sensitivity):
  criterion,criterion_index,factor,weight,best_index,best_alternative,changed

Hardening:
  - Strings holding the delimiter, quotes or newlines are quoted ("" escapes).
  - Missing values export as an empty field (never "nan").
  - Stable column ordering.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/sensitivity.hpp"

#include <string>

namespace ktda {

std::string table_to_csv(const DecisionTable& table, const ReportSettings& opt = ReportSettings());

std::string sensitivity_to_csv(const DecisionTable& table,
                               const SensitivityReport& report,
                               const ReportSettings& opt = ReportSettings());

// Returns true on success, false on I/O error.
bool write_table_csv_file(const DecisionTable& table,
                          const std::string& file_path,
                          const ReportSettings& opt = ReportSettings());

bool write_sensitivity_csv_file(const DecisionTable& table,
                                const SensitivityReport& report,
                                const std::string& file_path,
                                const ReportSettings& opt = ReportSettings());

}  // namespace ktda
