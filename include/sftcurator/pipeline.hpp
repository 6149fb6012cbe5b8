#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sftcurator/config.hpp"
#include "sftcurator/dedup_index.hpp"
#include "sftcurator/quality_filter.hpp"
#include "sftcurator/record.hpp"
#include "sftcurator/reporter.hpp"
#include "sftcurator/validator.hpp"

namespace sftcurator {

enum class PipelineOutcome {
  kNoRecords = 0,
  kAllFiltered,
  kAllDuplicates,
  kValidationFailed,
  kDryRun,
  kSnapshotCreated,
  kMerged,
};

[[nodiscard]] std::string_view PipelineOutcomeName(PipelineOutcome outcome);

struct PipelineOptions {
  bool skip_validation = false;
  bool auto_merge = false;
  bool dry_run = false;
  std::vector<std::string> sources;  // recorded on the snapshot
  std::string run_id;                // defaults to a UTC timestamp
};

struct PipelineReport {
  PipelineOutcome outcome = PipelineOutcome::kNoRecords;
  std::string run_id;
  FilterStats filter;
  DedupStats dedup;
  std::optional<ValidationResult> validation;
  std::optional<std::string> version;
  std::optional<std::filesystem::path> merged_into;
};

// Filter, dedup against the training corpus, validate, snapshot and
// optionally merge one batch of chat records.
class Pipeline {
 public:
  explicit Pipeline(CuratorConfig config, Reporter& reporter = DefaultReporter());

  // VersionStore errors propagate; every other stop is an outcome.
  PipelineReport Run(const std::vector<ChatRecord>& batch, const PipelineOptions& options = {});

  [[nodiscard]] const CuratorConfig& config() const { return config_; }

 private:
  [[nodiscard]] std::optional<std::filesystem::path> TrainingDir() const;

  CuratorConfig config_;
  Reporter& reporter_;
};

// "YYYYmmdd_HHMMSS" in UTC.
[[nodiscard]] std::string MakeRunId();

}  // namespace sftcurator
