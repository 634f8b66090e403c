#pragma once
/*
  Core: Selftest Helpers

  Framework-free expectations shared by the *_selftest executables.
  Each check prints "[ OK ]" or "[FAIL]" to stderr; failures are counted and
  finish() turns the count into the process exit code (0 = all passed).
*/

#include <cmath>
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"

namespace ktda::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline bool near(double a, double b, double tol = 1e-9) {
  return std::fabs(a - b) <= tol;
}

inline void expect_near(double got, double exp, std::string_view msg, double tol = 1e-9) {
  if (!near(got, exp, tol)) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_nan(double v, std::string_view msg) {
  if (!std::isnan(v)) {
    fail(msg);
    std::cerr << "  expected NaN, got " << v << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_size(std::size_t got, std::size_t exp, std::string_view msg) {
  if (got != exp) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_contains(const std::string& hay, std::string_view needle, std::string_view msg) {
  if (hay.find(needle) == std::string::npos) {
    fail(msg);
    std::cerr << "  missing: " << needle << "\n";
  } else {
    pass(msg);
  }
}

// Runs fn and expects a ktda::Error carrying `code`.
template <typename Fn>
void expect_error(Fn&& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected ktda::Error " << to_string(code) << ", nothing thrown\n";
  } catch (const Error& e) {
    if (e.code() != code) {
      fail(msg);
      std::cerr << "  expected " << to_string(code) << ", got " << to_string(e.code()) << "\n";
    } else {
      pass(msg);
    }
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected exception: " << e.what() << "\n";
  }
}

// Runs fn and expects an exception of type E (any message).
template <typename E, typename Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
  } catch (const E&) {
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected exception: " << e.what() << "\n";
  }
}

inline int finish(std::string_view suite) {
  if (g_fail_count == 0) {
    std::cerr << suite << ": all checks passed\n";
    return 0;
  }
  std::cerr << suite << ": " << g_fail_count << " check(s) FAILED\n";
  return 1;
}

}  // namespace ktda::selftest
