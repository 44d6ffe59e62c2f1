#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>

namespace sitebuild::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kSuccess = 2,
  kWarn = 3,
  kError = 4,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kSuccess:
    return "SUCCESS";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|success|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "success") {
    level = LogLevel::kSuccess;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid --log-level '" + std::string(raw) +
          "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

// Build narration sink. ERROR lines go to `err`, everything else to `out`, so
// a CI log keeps failures on stderr while progress stays on stdout.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo,
                  std::ostream& out = std::cout,
                  std::ostream& err = std::cerr)
      : min_level_(min_level), out_(&out), err_(&err) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::ostream& sink = level == LogLevel::kError ? *err_ : *out_;

    std::string text;
    if (level == LogLevel::kSuccess) {
      text = "\xE2\x9C\x93 ";
    }
    text.append(message);

    sink << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
         << " level=" << ToString(level)
         << " msg=" << Quote(text);

    for (const auto& field : fields) {
      sink << ' ' << field.key << '=' << Quote(field.value);
    }

    sink << '\n';
    sink.flush();
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Success(std::string_view message,
               std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kSuccess, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

  // Unprefixed report line (separators, numbered lists, tables). When the
  // logger is restricted to errors, only lines of an error report
  // (`level == kError`) are kept so an error heading never loses its list.
  void Print(std::string_view line, LogLevel level = LogLevel::kInfo) {
    if (min_level_ == LogLevel::kError && level != LogLevel::kError) {
      return;
    }
    (*out_) << line << '\n';
    out_->flush();
  }

private:
  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cout;
  std::ostream* err_ = &std::cerr;
};

} // namespace sitebuild::core::logging
