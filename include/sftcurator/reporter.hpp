#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sftcurator {

enum class LogLevel {
  kInfo = 0,
  kWarn,
  kError,
};

using LogFields = std::vector<std::pair<std::string, std::string>>;

// Sink for progress and diagnostics. Components receive one by reference and
// never write to process-wide streams themselves.
class Reporter {
 public:
  virtual ~Reporter() = default;

  virtual void Log(LogLevel level, std::string_view message, const LogFields& fields) = 0;

  void Info(std::string_view message, const LogFields& fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }
  void Warn(std::string_view message, const LogFields& fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }
  void Error(std::string_view message, const LogFields& fields = {}) {
    Log(LogLevel::kError, message, fields);
  }
};

class NullReporter final : public Reporter {
 public:
  void Log(LogLevel, std::string_view, const LogFields&) override {}
};

// Writes "[level] message key=value ..." lines.
class StreamReporter final : public Reporter {
 public:
  explicit StreamReporter(std::ostream& out, LogLevel min_level = LogLevel::kInfo)
      : out_(out), min_level_(min_level) {}

  void Log(LogLevel level, std::string_view message, const LogFields& fields) override;

 private:
  std::ostream& out_;
  LogLevel min_level_;
};

[[nodiscard]] std::string_view LogLevelName(LogLevel level);

// Shared do-nothing reporter used as the default collaborator.
Reporter& DefaultReporter();

}  // namespace sftcurator
