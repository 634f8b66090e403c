#pragma once
/*
================================================================================
Exports: Text Report (Decision Table + Sensitivity Sweep)
FILE: cpp/engine/exports/table_report.hpp

Purpose:
  - Render a decision table as the classic worksheet:
        criterion         W    S1    S2  ...    WS1     WS2 ...
        Safety        10.00  8.00  9.00  ...  80.00   90.00 ...
         TOTALS                              ... totals ...
  - Render a sensitivity sweep one perturbation per line.

Hardening:
  - Missing scores (and anything derived from them) print as "?", never "nan".
  - Read-only: takes the table by const reference, returns a string.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/decision/decision_table.hpp"
#include "engine/decision/sensitivity.hpp"

#include <iosfwd>
#include <string>

namespace ktda {

std::string format_table(const DecisionTable& table, const ReportSettings& opt = ReportSettings());

// "S1 = <name>" lines, one per alternative.
std::string format_legend(const DecisionTable& table);

std::string format_sensitivity(const DecisionTable& table,
                               const SensitivityReport& report,
                               const ReportSettings& opt = ReportSettings());

void print_table(std::ostream& os, const DecisionTable& table, const ReportSettings& opt = ReportSettings());

}  // namespace ktda
