/*
  Core Selftest (errors, logging, settings)

  Usage:
      ./core_selftest
  Non-zero return code indicates failure.
*/

#include <sstream>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"

namespace ktda {
namespace {

using namespace ktda::selftest;

void test_error_what() {
  try {
    KTDA_THROW(ErrorCode::kDegenerateWeights, "weights sum to zero");
    fail("KTDA_THROW did not throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kDegenerateWeights, "code preserved");
    expect_eq_str(e.message(), "weights sum to zero", "message preserved");
    expect_contains(e.what(), "[ktda::Error code=DegenerateWeights(2)]", "what() carries the code");
    expect_contains(e.what(), "core_selftest.cpp", "what() carries the throw site");
    expect_true(e.line() > 0, "line recorded");
  }

  expect_error([] { KTDA_ENSURE(1 + 1 == 3, ErrorCode::kInternal, "arithmetic"); }, ErrorCode::kInternal,
               "KTDA_ENSURE throws on false");

  bool threw = false;
  try {
    KTDA_ENSURE(true, ErrorCode::kInternal, "never");
  } catch (const Error&) {
    threw = true;
  }
  expect_true(!threw, "KTDA_ENSURE is silent on true");

  expect_eq_str(to_string(ErrorCode::kNoCompleteRow), "NoCompleteRow", "code names are stable");
}

void test_logging_levels_and_sinks() {
  std::ostringstream out;
  std::ostringstream err;
  set_log_sinks(&out, &err);

  set_log_level(LogLevel::INFO);
  log(LogLevel::DEBUG, "hidden-debug");
  log(LogLevel::INFO, "shown-info");
  log(LogLevel::WARN, "shown-warn");
  log(LogLevel::ERROR, "shown-error");

  expect_true(out.str().find("hidden-debug") == std::string::npos, "DEBUG filtered at INFO");
  expect_contains(out.str(), "[INFO] shown-info", "INFO goes to the output sink");
  expect_contains(err.str(), "[WARN] shown-warn", "WARN goes to the error sink");
  expect_contains(err.str(), "[ERROR] shown-error", "ERROR goes to the error sink");
  expect_true(out.str().find("shown-warn") == std::string::npos, "WARN not duplicated on output");
  expect_true(out.str().rfind("[", 0) == 0 && out.str().find("Z]") != std::string::npos,
              "lines start with a UTC timestamp");

  set_log_level(LogLevel::ERROR);
  log(LogLevel::WARN, "quiet-warn");
  expect_true(err.str().find("quiet-warn") == std::string::npos, "WARN filtered at ERROR");
  expect_true(get_log_level() == LogLevel::ERROR, "get_log_level round trip");

  reset_log_sinks();
  set_log_level(LogLevel::WARN);
}

void test_parse_log_level() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("debug", &lvl) && lvl == LogLevel::DEBUG, "debug");
  expect_true(parse_log_level("WARNING", &lvl) && lvl == LogLevel::WARN, "WARNING (any case)");
  expect_true(parse_log_level("Error", &lvl) && lvl == LogLevel::ERROR, "Error");
  expect_true(!parse_log_level("loud", &lvl) && lvl == LogLevel::ERROR, "unknown level rejected, output untouched");
  expect_true(!parse_log_level("info", nullptr), "null output rejected");
}

void test_settings() {
  AnalysisSettings s = AnalysisSettings::defaults();
  bool ok = true;
  try {
    s.validate_or_throw();
  } catch (const ValidationError&) {
    ok = false;
  }
  expect_true(ok, "defaults validate");
  expect_near(s.normalization.max_score, 10.0, "default max score");
  expect_true(s.sensitivity.factors.size() == 2, "default factor pair");
  expect_true(s.imputation.donor_policy == DonorPolicy::RequireComplete, "default donor policy");

  AnalysisSettings bad_scale = s;
  bad_scale.normalization.max_score = 0.0;
  expect_throws<ValidationError>([&] { bad_scale.validate_or_throw(); }, "max_score 0 rejected");

  AnalysisSettings bad_factor = s;
  bad_factor.sensitivity.factors = {1.0, -0.5};
  expect_throws<ValidationError>([&] { bad_factor.validate_or_throw(); }, "negative factor rejected");

  AnalysisSettings bad_policy = s;
  bad_policy.imputation.donor_policy = static_cast<DonorPolicy>(7);
  expect_throws<ValidationError>([&] { bad_policy.validate_or_throw(); }, "unknown donor policy rejected");

  AnalysisSettings bad_precision = s;
  bad_precision.report.precision = -1;
  expect_throws<ValidationError>([&] { bad_precision.validate_or_throw(); }, "negative precision rejected");

  DonorPolicy p = DonorPolicy::RequireComplete;
  expect_true(parse_donor_policy("least-incomplete", &p) && p == DonorPolicy::LeastIncomplete, "parse least-incomplete");
  expect_true(!parse_donor_policy("nearest", &p), "unknown policy name rejected");
  expect_eq_str(to_string(DonorPolicy::LeastIncomplete), "least-incomplete", "policy name round trip");
}

}  // namespace
}  // namespace ktda

int main() {
  ktda::set_log_level(ktda::LogLevel::WARN);

  ktda::test_error_what();
  ktda::test_logging_levels_and_sinks();
  ktda::test_parse_log_level();
  ktda::test_settings();

  return ktda::selftest::finish("core_selftest");
}
