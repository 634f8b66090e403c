#pragma once
/*
===============================================================================
Decision: Score values and the missing-score sentinel
File: cpp/engine/decision/score.hpp
===============================================================================
A score is a plain double. An unmeasured score is quiet NaN (kMissing), so it
propagates through weighting and summation on its own. is_missing() is the
only supported test; never compare against kMissing.
===============================================================================
*/

#include <cmath>
#include <limits>
#include <vector>

namespace ktda {

inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

inline bool is_missing(double x) noexcept {
  return std::isnan(x);
}

// Scores of one alternative, one cell per criterion.
using ScoreRow = std::vector<double>;

}  // namespace ktda
