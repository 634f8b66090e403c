#pragma once
/*
===========================================================
Core: Error (code + site carrying exception)
FILE: cpp/engine/core/error.hpp
===========================================================
Every failure raised by the decision engine is a ktda::Error.
Callers catch by code, never by message text.
===========================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ktda {

enum class ErrorCode : int {
  kShape                 = 1,  // weights/criteria/rows disagree in length
  kDegenerateWeights     = 2,  // weights sum to zero
  kOutOfRange            = 3,  // alternative/criterion index
  kNoCompleteRow         = 4,  // imputation found no donor
  kNoRankableAlternative = 5,  // every total is missing
  kInvalidArgument       = 6,
  kIncompleteImputation  = 7,  // donor could not fill every gap
  kIoError               = 8,
  kInternal              = 9,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kShape:                 return "Shape";
    case ErrorCode::kDegenerateWeights:     return "DegenerateWeights";
    case ErrorCode::kOutOfRange:            return "OutOfRange";
    case ErrorCode::kNoCompleteRow:         return "NoCompleteRow";
    case ErrorCode::kNoRankableAlternative: return "NoRankableAlternative";
    case ErrorCode::kInvalidArgument:       return "InvalidArgument";
    case ErrorCode::kIncompleteImputation:  return "IncompleteImputation";
    case ErrorCode::kIoError:               return "IoError";
    case ErrorCode::kInternal:              return "Internal";
    default:                                return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[ktda::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace ktda

#define KTDA_THROW(CODE, MSG) ::ktda::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define KTDA_ENSURE(EXPR, CODE, MSG) ::ktda::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
