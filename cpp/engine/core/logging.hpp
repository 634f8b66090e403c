#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by all engine modules.
  - Centralizes the stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Coarse mutex keeps lines whole.
  - WARN/ERROR go to the error sink, DEBUG/INFO to the output sink.

Notes:
  - Sinks are redirectable so selftests can capture what the engine says.
===========================================================
*/

#include <iosfwd>
#include <string>
#include <string_view>

namespace ktda {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// Route output (DEBUG/INFO) and error (WARN/ERROR) lines. Null keeps the
// current sink. The streams must outlive every log call made while installed.
void set_log_sinks(std::ostream* out, std::ostream* err) noexcept;

// Back to std::cout / std::cerr.
void reset_log_sinks() noexcept;

// "debug", "info", "warn"/"warning", "error" (any case). Returns false on
// anything else and leaves *out untouched.
bool parse_log_level(std::string_view text, LogLevel* out) noexcept;

const char* to_string(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace ktda
