#include "sftcurator/version_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "sftcurator/corpus_reader.hpp"
#include "sftcurator/errors.hpp"

namespace sftcurator {

namespace {

constexpr const char* kManifestFile = "manifest.json";
constexpr const char* kVersionsDir = "versions";
constexpr const char* kRecordsFile = "records.jsonl";
constexpr const char* kVersionInfoFile = "version_info.json";
constexpr const char* kTrainFile = "train.jsonl";

std::string UtcNowIso8601() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
  gmtime_r(&secs, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros
      << "+00:00";
  return oss.str();
}

void WriteJsonFile(const std::filesystem::path& path, const nlohmann::json& j) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open for writing: " + path.string());
  }
  out << j.dump(2) << '\n';
  if (!out) {
    throw std::runtime_error("failed to write: " + path.string());
  }
}

std::set<std::string> SourcesOf(const std::vector<ChatRecord>& records) {
  std::set<std::string> sources;
  for (const auto& record : records) {
    if (record.HasTurns()) {
      sources.insert(record.source);
    }
  }
  return sources;
}

std::vector<std::string> SetDifference(const std::set<std::string>& lhs, const std::set<std::string>& rhs) {
  std::vector<std::string> out;
  std::set_difference(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(out));
  return out;
}

}  // namespace

nlohmann::json ToJson(const VersionInfo& info) {
  nlohmann::json j = {
      {"version", info.version},
      {"created_at", info.created_at},
      {"description", info.description},
      {"record_count", info.record_count},
      {"sources", info.sources},
  };
  j["parent_version"] = info.parent_version ? nlohmann::json(*info.parent_version) : nlohmann::json(nullptr);
  return j;
}

VersionInfo VersionInfoFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw MalformedInputError("version entry is not an object");
  }
  VersionInfo info;
  try {
    info.version = j.at("version").get<std::string>();
    info.created_at = j.value("created_at", std::string());
    info.description = j.value("description", std::string());
    info.record_count = j.value("record_count", std::size_t{0});
    if (j.contains("sources") && !j["sources"].is_null()) {
      info.sources = j["sources"].get<std::vector<std::string>>();
    }
    if (j.contains("parent_version") && j["parent_version"].is_string() &&
        !j["parent_version"].get<std::string>().empty()) {
      info.parent_version = j["parent_version"].get<std::string>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw MalformedInputError(std::string("bad version entry: ") + e.what());
  }
  return info;
}

nlohmann::json ToJson(const Manifest& manifest) {
  nlohmann::json versions = nlohmann::json::array();
  for (const auto& info : manifest.versions) {
    versions.push_back(ToJson(info));
  }
  nlohmann::json j;
  j["versions"] = std::move(versions);
  j["current"] = manifest.current ? nlohmann::json(*manifest.current) : nlohmann::json(nullptr);
  return j;
}

Manifest ManifestFromJson(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("versions") || !j["versions"].is_array()) {
    throw MalformedInputError("manifest has no 'versions' list");
  }
  Manifest manifest;
  for (const auto& entry : j["versions"]) {
    manifest.versions.push_back(VersionInfoFromJson(entry));
  }
  if (j.contains("current") && !j["current"].is_null()) {
    if (!j["current"].is_string()) {
      throw MalformedInputError("manifest 'current' is not a string");
    }
    const auto current = j["current"].get<std::string>();
    const bool known = std::any_of(manifest.versions.begin(), manifest.versions.end(),
                                   [&](const VersionInfo& v) { return v.version == current; });
    if (!known) {
      throw MalformedInputError("manifest 'current' refers to unknown version " + current);
    }
    manifest.current = current;
  }
  return manifest;
}

bool IsVersionId(const std::string& id) {
  if (id.size() < 2 || id[0] != 'v') return false;
  return std::all_of(id.begin() + 1, id.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string NextVersionId(const Manifest& manifest) {
  long long last = 0;
  for (const auto& info : manifest.versions) {
    const std::string& id = info.version;
    std::size_t pos = 0;
    while (pos < id.size() && id[pos] == 'v') ++pos;
    std::size_t parsed = 0;
    long long n = 0;
    try {
      n = std::stoll(id.substr(pos), &parsed);
    } catch (const std::exception&) {
      throw MalformedInputError("version id has no numeric suffix: " + id);
    }
    if (parsed != id.size() - pos) {
      throw MalformedInputError("version id has no numeric suffix: " + id);
    }
    last = std::max(last, n);
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "v%03lld", last + 1);
  return buf;
}

VersionStore::VersionStore(std::filesystem::path base_dir, std::optional<std::filesystem::path> training_data_dir,
                           Reporter& reporter)
    : base_dir_(std::move(base_dir)),
      versions_dir_(base_dir_ / kVersionsDir),
      manifest_path_(base_dir_ / kManifestFile),
      training_data_dir_(std::move(training_data_dir)),
      reporter_(reporter) {
  if (training_data_dir_ && training_data_dir_->empty()) {
    training_data_dir_.reset();
  }
  std::filesystem::create_directories(versions_dir_);
  LoadManifest();
}

void VersionStore::LoadManifest() {
  std::ifstream in(manifest_path_);
  if (!in) {
    manifest_ = Manifest{};
    return;
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    throw MalformedInputError("manifest is not valid JSON: " + manifest_path_.string());
  }
  manifest_ = ManifestFromJson(j);
}

void VersionStore::SaveManifest() const {
  WriteJsonFile(manifest_path_, ToJson(manifest_));
}

bool VersionStore::HasVersion(const std::string& version) const {
  return std::any_of(manifest_.versions.begin(), manifest_.versions.end(),
                     [&](const VersionInfo& v) { return v.version == version; });
}

std::filesystem::path VersionStore::VersionDir(const std::string& version) const {
  return versions_dir_ / version;
}

std::string VersionStore::CreateSnapshot(const std::vector<ChatRecord>& records, const std::string& description,
                                         const std::vector<std::string>& sources) {
  const std::string version = NextVersionId(manifest_);
  const auto dir = VersionDir(version);
  std::filesystem::create_directories(dir);

  WriteJsonl(dir / kRecordsFile, records);

  VersionInfo info;
  info.version = version;
  info.created_at = UtcNowIso8601();
  info.description = description;
  info.record_count = records.size();
  info.sources = sources;
  info.parent_version = manifest_.current;

  auto info_json = ToJson(info);
  info_json["schema_version"] = kRecordSchemaVersion;
  WriteJsonFile(dir / kVersionInfoFile, info_json);

  manifest_.versions.push_back(std::move(info));
  manifest_.current = version;
  SaveManifest();

  reporter_.Info("created snapshot", {{"version", version}, {"records", std::to_string(records.size())}});
  return version;
}

std::vector<ChatRecord> VersionStore::Rollback(const std::string& target_version) {
  if (!IsVersionId(target_version) || !HasVersion(target_version)) {
    throw NotFoundError("Version " + target_version + " not found");
  }
  const auto dir = VersionDir(target_version);
  std::error_code ec;
  const bool on_disk = std::filesystem::is_directory(dir, ec);
  if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
    throw std::filesystem::filesystem_error("cannot stat version directory", dir, ec);
  }
  if (!on_disk) {
    throw NotFoundError("Version " + target_version + " not found");
  }

  auto records = LoadVersionRecords(target_version);
  manifest_.current = target_version;
  SaveManifest();

  reporter_.Info("rolled back", {{"version", target_version}, {"records", std::to_string(records.size())}});
  return records;
}

std::vector<ChatRecord> VersionStore::LoadVersionRecords(const std::string& version) const {
  std::vector<ChatRecord> records;
  CorpusReader reader(reporter_);
  const auto path = VersionDir(version) / kRecordsFile;
  if (!reader.LoadChatRecords(path.string(), records)) {
    return {};
  }
  return records;
}

std::vector<ChatRecord> VersionStore::CurrentRecords() const {
  if (!manifest_.current) {
    return {};
  }
  return LoadVersionRecords(*manifest_.current);
}

VersionDiff VersionStore::Diff(const std::string& version_a, const std::string& version_b) const {
  const auto records_a = LoadVersionRecords(version_a);
  const auto records_b = LoadVersionRecords(version_b);
  const auto sources_a = SourcesOf(records_a);
  const auto sources_b = SourcesOf(records_b);

  VersionDiff diff;
  diff.version_a = version_a;
  diff.version_b = version_b;
  diff.records_a = records_a.size();
  diff.records_b = records_b.size();
  diff.delta = static_cast<long long>(records_b.size()) - static_cast<long long>(records_a.size());
  diff.new_sources = SetDifference(sources_b, sources_a);
  diff.removed_sources = SetDifference(sources_a, sources_b);
  return diff;
}

void VersionStore::DeleteVersion(const std::string& version) {
  if (!IsVersionId(version) || !HasVersion(version)) {
    throw NotFoundError("Version " + version + " not found");
  }
  if (manifest_.current && *manifest_.current == version) {
    throw InvalidOperationError("Cannot delete the current version " + version + ". Rollback first.");
  }

  std::filesystem::remove_all(VersionDir(version));
  auto& versions = manifest_.versions;
  versions.erase(std::remove_if(versions.begin(), versions.end(),
                                [&](const VersionInfo& v) { return v.version == version; }),
                 versions.end());
  SaveManifest();
  reporter_.Info("deleted version", {{"version", version}});
}

std::filesystem::path VersionStore::MergeToTraining(const std::optional<std::string>& version) {
  if (!training_data_dir_) {
    throw InvalidOperationError("No training data directory configured");
  }
  const std::optional<std::string> target = version ? version : manifest_.current;
  if (!target || target->empty()) {
    throw InvalidOperationError("No version specified and no current version");
  }

  const auto records = LoadVersionRecords(*target);
  if (records.empty()) {
    throw InvalidOperationError("No records in version " + *target);
  }

  std::filesystem::create_directories(*training_data_dir_);
  const auto train_path = *training_data_dir_ / kTrainFile;

  std::vector<std::string> existing;
  std::error_code ec;
  if (std::filesystem::exists(train_path, ec)) {
    std::ifstream in(train_path, std::ios::binary);
    if (!in) {
      throw std::runtime_error("failed to read training data: " + train_path.string());
    }
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.find_first_not_of(" \t") == std::string::npos) continue;
      existing.push_back(std::move(line));
    }
    in.close();

    auto backup = train_path;
    backup += ".bak." + *target;
    std::filesystem::copy_file(train_path, backup, std::filesystem::copy_options::overwrite_existing);
  }

  std::ofstream out(train_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open training data for writing: " + train_path.string());
  }
  for (const auto& line : existing) {
    out << line << '\n';
  }
  for (const auto& record : records) {
    out << ToJsonLine(record) << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write training data: " + train_path.string());
  }

  reporter_.Info("merged version into training data",
                 {{"version", *target},
                  {"existing", std::to_string(existing.size())},
                  {"new", std::to_string(records.size())},
                  {"total", std::to_string(existing.size() + records.size())}});
  return train_path;
}

}  // namespace sftcurator
