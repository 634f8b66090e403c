/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ktda {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;
static std::ostream* g_out = nullptr;  // guarded by g_log_mu; null = std::cout
static std::ostream* g_err = nullptr;  // guarded by g_log_mu; null = std::cerr

const char* to_string(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_sinks(std::ostream* out, std::ostream* err) noexcept {
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (out) g_out = out;
  if (err) g_err = err;
}

void reset_log_sinks() noexcept {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_out = nullptr;
  g_err = nullptr;
}

static bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const int ca = std::tolower(static_cast<unsigned char>(a[i]));
    const int cb = std::tolower(static_cast<unsigned char>(b[i]));
    if (ca != cb) return false;
  }
  return true;
}

bool parse_log_level(std::string_view text, LogLevel* out) noexcept {
  if (!out) return false;
  if (iequals(text, "debug")) { *out = LogLevel::DEBUG; return true; }
  if (iequals(text, "info")) { *out = LogLevel::INFO; return true; }
  if (iequals(text, "warn") || iequals(text, "warning")) { *out = LogLevel::WARN; return true; }
  if (iequals(text, "error")) { *out = LogLevel::ERROR; return true; }
  return false;
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    const int cur = g_level.load(std::memory_order_relaxed);
    if (static_cast<int>(lvl) < cur) return;

    std::lock_guard<std::mutex> lk(g_log_mu);

    std::ostream& out = (lvl >= LogLevel::WARN) ? (g_err ? *g_err : std::cerr)
                                                : (g_out ? *g_out : std::cout);
    out << "[" << utc_timestamp() << "]"
        << "[" << to_string(lvl) << "] "
        << msg << "\n";
    out.flush();
  } catch (...) {
    // Must never throw.
  }
}

} // namespace ktda
