#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sftcurator/record.hpp"
#include "sftcurator/reporter.hpp"

namespace sftcurator {

struct VersionInfo {
  std::string version;
  std::string created_at;  // ISO-8601, UTC
  std::string description;
  std::size_t record_count = 0;
  std::vector<std::string> sources;
  std::optional<std::string> parent_version;
};

struct Manifest {
  std::vector<VersionInfo> versions;  // creation order
  std::optional<std::string> current;
};

struct VersionDiff {
  std::string version_a;
  std::string version_b;
  std::size_t records_a = 0;
  std::size_t records_b = 0;
  long long delta = 0;  // records_b - records_a
  std::vector<std::string> new_sources;
  std::vector<std::string> removed_sources;
};

[[nodiscard]] nlohmann::json ToJson(const VersionInfo& info);
VersionInfo VersionInfoFromJson(const nlohmann::json& j);
[[nodiscard]] nlohmann::json ToJson(const Manifest& manifest);
Manifest ManifestFromJson(const nlohmann::json& j);

// "v" followed by one or more digits.
[[nodiscard]] bool IsVersionId(const std::string& id);

// "v001" for an empty history, otherwise one past the largest numeric
// suffix in the manifest. Throws MalformedInputError on a bad id.
[[nodiscard]] std::string NextVersionId(const Manifest& manifest);

// Append-only snapshot history under `base_dir`:
//
//   base_dir/manifest.json
//   base_dir/versions/<id>/records.jsonl
//   base_dir/versions/<id>/version_info.json
//
// The manifest is rewritten before every mutating call returns. A single
// writer is assumed; there is no file locking.
class VersionStore {
 public:
  explicit VersionStore(std::filesystem::path base_dir,
                        std::optional<std::filesystem::path> training_data_dir = std::nullopt,
                        Reporter& reporter = DefaultReporter());

  std::string CreateSnapshot(const std::vector<ChatRecord>& records, const std::string& description = "",
                             const std::vector<std::string>& sources = {});

  // Moves `current` without touching the version list. Throws NotFoundError.
  std::vector<ChatRecord> Rollback(const std::string& target_version);

  [[nodiscard]] const std::vector<VersionInfo>& ListVersions() const { return manifest_.versions; }
  [[nodiscard]] const std::optional<std::string>& Current() const { return manifest_.current; }
  [[nodiscard]] const Manifest& manifest() const { return manifest_; }

  [[nodiscard]] std::vector<ChatRecord> LoadVersionRecords(const std::string& version) const;
  [[nodiscard]] std::vector<ChatRecord> CurrentRecords() const;

  [[nodiscard]] VersionDiff Diff(const std::string& version_a, const std::string& version_b) const;

  // Throws NotFoundError unless `version` is listed in the manifest, and
  // InvalidOperationError for the current version. Directories under
  // versions/ that the manifest does not list are left alone.
  void DeleteVersion(const std::string& version);

  // Appends the version's records to <training_data_dir>/train.jsonl after
  // copying the old file to train.jsonl.bak.<version>. Defaults to current.
  std::filesystem::path MergeToTraining(const std::optional<std::string>& version = std::nullopt);

  [[nodiscard]] std::filesystem::path VersionDir(const std::string& version) const;
  [[nodiscard]] const std::filesystem::path& base_dir() const { return base_dir_; }

 private:
  void LoadManifest();
  void SaveManifest() const;
  [[nodiscard]] bool HasVersion(const std::string& version) const;

  std::filesystem::path base_dir_;
  std::filesystem::path versions_dir_;
  std::filesystem::path manifest_path_;
  std::optional<std::filesystem::path> training_data_dir_;
  Reporter& reporter_;
  Manifest manifest_;
};

}  // namespace sftcurator
