#include "sftcurator/reporter.hpp"

namespace sftcurator {

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

void StreamReporter::Log(LogLevel level, std::string_view message, const LogFields& fields) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  out_ << '[' << LogLevelName(level) << "] " << message;
  for (const auto& [key, value] : fields) {
    out_ << ' ' << key << '=';
    if (value.find(' ') != std::string::npos) {
      out_ << '"' << value << '"';
    } else {
      out_ << value;
    }
  }
  out_ << '\n';
}

Reporter& DefaultReporter() {
  static NullReporter reporter;
  return reporter;
}

}  // namespace sftcurator
