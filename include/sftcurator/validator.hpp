#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sftcurator/record.hpp"
#include "sftcurator/reporter.hpp"

namespace sftcurator {

struct ValidationOptions {
  std::size_t min_records = 10;
  double max_quality_drop_pct = 5.0;
  double min_avg_answer_length = 200.0;
  double max_avg_answer_length = 5000.0;
  std::string required_system_prompt = "CMMC";
};

// Format errors fail a batch; quality warnings and comparison notes are for
// human review only.
struct ValidationResult {
  bool passed = true;
  std::size_t total_records = 0;
  std::vector<std::string> format_errors;
  std::vector<std::string> quality_warnings;
  std::vector<std::string> comparison_notes;
  nlohmann::json stats = nlohmann::json::object();

  [[nodiscard]] std::string Summary() const;
};

class Validator {
 public:
  explicit Validator(ValidationOptions options = {}, Reporter& reporter = DefaultReporter());

  // Never drops or mutates records. `existing_corpus_dir`, when given, is
  // compared against on assistant answer length.
  [[nodiscard]] ValidationResult ValidateAll(
      const std::vector<ChatRecord>& records,
      const std::optional<std::filesystem::path>& existing_corpus_dir = std::nullopt) const;

  // Up to `n` records in batch order, chosen reproducibly from `seed`.
  [[nodiscard]] std::vector<ChatRecord> SpotCheck(const std::vector<ChatRecord>& records, std::size_t n,
                                                  std::uint64_t seed = 0) const;

  [[nodiscard]] const ValidationOptions& options() const { return options_; }

 private:
  void ValidateFormat(const std::vector<ChatRecord>& records, ValidationResult& result) const;
  void ValidateVolume(const std::vector<ChatRecord>& records, ValidationResult& result) const;
  void ValidateLengths(const std::vector<ChatRecord>& records, ValidationResult& result) const;
  void ValidateSources(const std::vector<ChatRecord>& records, ValidationResult& result) const;
  void CompareAgainstExisting(const std::vector<ChatRecord>& records, const std::filesystem::path& dir,
                              ValidationResult& result) const;

  ValidationOptions options_;
  Reporter& reporter_;
};

}  // namespace sftcurator
