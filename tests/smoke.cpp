#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <vector>

#include "sftcurator/pipeline.hpp"
#include "sftcurator/templates.hpp"
#include "sftcurator/version_store.hpp"

int main() {
  using namespace sftcurator;

  const auto root = std::filesystem::temp_directory_path() / "sftcurator_smoke";
  std::filesystem::remove_all(root);
  const auto training = root / "training";
  std::filesystem::create_directories(training);

  const std::string existing_a =
      "Multifactor authentication is required for local and network access to privileged accounts and for "
      "network access to non-privileged accounts. Organizations select authenticators that resist replay "
      "and document how each factor is provisioned, rotated, and revoked when personnel leave.";
  const std::string existing_b =
      "Audit records must be retained long enough to support after-the-fact investigations of security "
      "incidents. The logging configuration captures the event type, the time it occurred, the location, "
      "the source, the outcome, and the identity of any individuals associated with the event.";
  const std::string fresh =
      "Media containing controlled unclassified information is sanitized or destroyed before disposal or "
      "release for reuse. Sanitization techniques include clearing, purging, cryptographic erase, and "
      "physical destruction, chosen according to the sensitivity of the information on the media.";

  {
    std::ofstream out(training / "train.jsonl");
    out << ToJsonLine(MakeChatRecord("q", existing_a, "corpus_a")) << "\n";
    out << ToJsonLine(MakeChatRecord("q", existing_b, "corpus_b")) << "\n";
  }

  std::vector<ChatRecord> batch = {
      MakeChatRecord("What is required for MFA?", existing_a, "batch_dup"),
      MakeChatRecord("What is 3.2.1?", "too short", "batch_short"),
      MakeChatRecord("How is media sanitized?", fresh, "batch_fresh"),
  };

  CuratorConfig cfg;
  cfg.training_data_dir = training.string();
  cfg.pipeline_dir = (root / "pipeline").string();
  cfg.validation.min_records = 1;

  Pipeline pipeline(cfg);
  PipelineOptions opts;
  opts.run_id = "smoke";
  auto report = pipeline.Run(batch, opts);

  assert(report.outcome == PipelineOutcome::kSnapshotCreated);
  assert(report.filter.total == 3);
  assert(report.filter.TotalRejected() == 1);
  assert(report.filter.Rejected(RejectReason::kTooShort) == 1);
  assert(report.dedup.exact_dupes == 1);
  assert(report.dedup.near_dupes == 0);
  assert(report.dedup.unique == 1);
  assert(report.validation && report.validation->passed);
  assert(report.version && *report.version == "v001");

  VersionStore store(cfg.pipeline_dir, training);
  assert(store.ListVersions().size() == 1);
  assert(store.ListVersions()[0].record_count == 1);
  assert(store.ListVersions()[0].description == "Pipeline run smoke: 1 records from batch_fresh");
  const auto records = store.CurrentRecords();
  assert(records.size() == 1 && records[0].source == "batch_fresh");

  // The same batch again is fully deduplicated once merged.
  store.MergeToTraining();
  auto second = pipeline.Run(batch, opts);
  assert(second.outcome == PipelineOutcome::kAllDuplicates);
  assert(second.dedup.exact_dupes == 2);

  opts.dry_run = true;
  assert(pipeline.Run({}, opts).outcome == PipelineOutcome::kNoRecords);

  std::filesystem::remove_all(root);
  return 0;
}
