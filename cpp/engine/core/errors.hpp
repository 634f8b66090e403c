#pragma once
/*
================================================================================
Core: Settings Validation Errors
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Configuration problems (bad max score, empty factor list, unknown policy
    name) are reported separately from computation failures (ktda::Error), so
    the CLI can map them to its "validation failed" exit code.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace ktda {

// Base for configuration-side errors.
class KtdaError : public std::runtime_error {
 public:
  explicit KtdaError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public KtdaError {
 public:
  explicit ValidationError(std::string msg) : KtdaError(std::move(msg)) {}
};

} // namespace ktda
