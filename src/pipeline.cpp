#include "sftcurator/pipeline.hpp"

#include <ctime>
#include <system_error>
#include <utility>

#include "sftcurator/version_store.hpp"

namespace sftcurator {

namespace {

std::string JoinSources(const std::vector<std::string>& sources) {
  std::string out;
  for (const auto& s : sources) {
    if (!out.empty()) out += ", ";
    out += s;
  }
  return out;
}

// Distinct record sources in first-seen order.
std::vector<std::string> SourcesOf(const std::vector<ChatRecord>& records) {
  std::vector<std::string> out;
  for (const auto& r : records) {
    if (r.source.empty()) continue;
    bool seen = false;
    for (const auto& s : out) {
      if (s == r.source) {
        seen = true;
        break;
      }
    }
    if (!seen) out.push_back(r.source);
  }
  return out;
}

}  // namespace

std::string_view PipelineOutcomeName(PipelineOutcome outcome) {
  switch (outcome) {
    case PipelineOutcome::kNoRecords:
      return "no_records";
    case PipelineOutcome::kAllFiltered:
      return "all_filtered";
    case PipelineOutcome::kAllDuplicates:
      return "all_duplicates";
    case PipelineOutcome::kValidationFailed:
      return "validation_failed";
    case PipelineOutcome::kDryRun:
      return "dry_run";
    case PipelineOutcome::kSnapshotCreated:
      return "snapshot_created";
    case PipelineOutcome::kMerged:
      return "merged";
  }
  return "no_records";
}

std::string MakeRunId() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

Pipeline::Pipeline(CuratorConfig config, Reporter& reporter) : config_(std::move(config)), reporter_(reporter) {}

std::optional<std::filesystem::path> Pipeline::TrainingDir() const {
  if (config_.training_data_dir.empty()) return std::nullopt;
  std::error_code ec;
  std::filesystem::path dir(config_.training_data_dir);
  if (!std::filesystem::is_directory(dir, ec)) return std::nullopt;
  return dir;
}

PipelineReport Pipeline::Run(const std::vector<ChatRecord>& batch, const PipelineOptions& options) {
  PipelineReport report;
  report.run_id = options.run_id.empty() ? MakeRunId() : options.run_id;
  reporter_.Info("pipeline run", {{"run_id", report.run_id}, {"records", std::to_string(batch.size())}});

  if (batch.empty()) {
    reporter_.Warn("no records in batch; nothing to do");
    report.outcome = PipelineOutcome::kNoRecords;
    return report;
  }

  QualityFilter filter(config_.quality);
  auto filtered = filter.FilterBatch(batch);
  report.filter = filtered.stats;
  reporter_.Info("quality filter", {{"passed", std::to_string(filtered.stats.passed)},
                                    {"rejected", std::to_string(filtered.stats.TotalRejected())}});
  if (filtered.passed.empty()) {
    reporter_.Warn("no records passed quality filter");
    report.outcome = PipelineOutcome::kAllFiltered;
    return report;
  }

  const auto training_dir = TrainingDir();
  DedupIndex dedup(config_.dedup, reporter_);
  if (training_dir) {
    dedup.SeedFromCorpus(*training_dir);
  }
  auto deduped = dedup.DeduplicateBatch(filtered.passed);
  report.dedup = deduped.stats;
  reporter_.Info("dedup", {{"unique", std::to_string(deduped.stats.unique)},
                           {"exact_dupes", std::to_string(deduped.stats.exact_dupes)},
                           {"near_dupes", std::to_string(deduped.stats.near_dupes)}});
  if (deduped.kept.empty()) {
    reporter_.Warn("all records were duplicates");
    report.outcome = PipelineOutcome::kAllDuplicates;
    return report;
  }

  Validator validator(config_.validation, reporter_);
  report.validation = validator.ValidateAll(deduped.kept, training_dir);
  reporter_.Info("validation", {{"summary", report.validation->Summary()}});
  if (!report.validation->passed && !options.skip_validation) {
    reporter_.Error("validation failed; pass --skip-validation to override");
    report.outcome = PipelineOutcome::kValidationFailed;
    return report;
  }

  if (options.dry_run) {
    reporter_.Info("dry run; skipping snapshot creation");
    report.outcome = PipelineOutcome::kDryRun;
    return report;
  }

  const std::vector<std::string> sources = options.sources.empty() ? SourcesOf(deduped.kept) : options.sources;
  std::optional<std::filesystem::path> merge_dir;
  if (!config_.training_data_dir.empty()) merge_dir = config_.training_data_dir;
  VersionStore store(config_.pipeline_dir, merge_dir, reporter_);
  const std::string description = "Pipeline run " + report.run_id + ": " + std::to_string(deduped.kept.size()) +
                                  " records from " + JoinSources(sources);
  report.version = store.CreateSnapshot(deduped.kept, description, sources);
  report.outcome = PipelineOutcome::kSnapshotCreated;

  if (options.auto_merge) {
    report.merged_into = store.MergeToTraining(report.version);
    report.outcome = PipelineOutcome::kMerged;
  } else {
    reporter_.Info("snapshot created; merge when ready", {{"version", *report.version}});
  }
  return report;
}

}  // namespace sftcurator
