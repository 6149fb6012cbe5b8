#include "sftcurator/dedup_index.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "sftcurator/corpus_reader.hpp"
#include "sftcurator/errors.hpp"

namespace sftcurator {

std::string_view DedupVerdictName(DedupVerdict verdict) {
  switch (verdict) {
    case DedupVerdict::kUnique:
      return "unique";
    case DedupVerdict::kExactDuplicate:
      return "exact";
    case DedupVerdict::kNearDuplicate:
      return "near";
  }
  return "unique";
}

DedupIndex::DedupIndex(DedupOptions options, Reporter& reporter)
    : options_(options),
      reporter_(reporter),
      hasher_(options.num_perm, options.shingle_size),
      near_(options.lsh_threshold, options.num_perm) {}

void DedupIndex::Index(std::string_view text, const std::string& key) {
  exact_.Insert(FingerprintOf(text));
  near_.Insert(key, hasher_.Signature(text));
}

std::size_t DedupIndex::SeedFromRecords(const std::vector<ChatRecord>& records) {
  std::size_t indexed = 0;
  for (const auto& record : records) {
    const std::string* content = record.AssistantContent();
    if (!content || content->empty()) continue;
    Index(*content, "existing_" + std::to_string(seeded_++));
    ++indexed;
  }
  return indexed;
}

std::size_t DedupIndex::SeedFromCorpus(const std::filesystem::path& corpus_dir) {
  CorpusReader reader(reporter_);
  CorpusLoadStats stats;
  const auto records = reader.LoadCorpusDir(corpus_dir, &stats);
  const std::size_t indexed = SeedFromRecords(records);
  reporter_.Info("loaded existing records into dedup index",
                 {{"dir", corpus_dir.string()},
                  {"indexed", std::to_string(indexed)},
                  {"skipped_lines", std::to_string(stats.skipped)}});
  return indexed;
}

DedupVerdict DedupIndex::Check(std::string_view text) const {
  if (text.empty()) {
    throw std::invalid_argument("cannot dedup-check empty text");
  }
  if (exact_.Contains(FingerprintOf(text))) {
    return DedupVerdict::kExactDuplicate;
  }
  if (near_.HasCandidate(hasher_.Signature(text))) {
    return DedupVerdict::kNearDuplicate;
  }
  return DedupVerdict::kUnique;
}

bool DedupIndex::Admit(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  const bool fresh = exact_.Insert(FingerprintOf(text));
  near_.Insert("rec_" + std::to_string(admitted_++), hasher_.Signature(text));
  return fresh;
}

template <typename Record, typename TextOf>
DedupBatchResult<Record> DedupIndex::DeduplicateWith(const std::vector<Record>& records, TextOf&& text_of) {
  DedupBatchResult<Record> result;
  result.stats.total_input = records.size();
  for (const auto& record : records) {
    const std::string text = text_of(record);
    if (text.empty()) {
      ++result.stats.skipped_empty;
      continue;
    }
    switch (Check(text)) {
      case DedupVerdict::kExactDuplicate:
        ++result.stats.exact_dupes;
        break;
      case DedupVerdict::kNearDuplicate:
        ++result.stats.near_dupes;
        break;
      case DedupVerdict::kUnique:
        Admit(text);
        result.kept.push_back(record);
        ++result.stats.unique;
        break;
    }
  }
  return result;
}

DedupBatchResult<ChatRecord> DedupIndex::DeduplicateBatch(const std::vector<ChatRecord>& records) {
  return DeduplicateWith(records, [](const ChatRecord& r) {
    const std::string* content = r.AssistantContent();
    return content ? *content : std::string();
  });
}

DedupBatchResult<RawRecord> DedupIndex::DeduplicateBatch(const std::vector<RawRecord>& records,
                                                         const std::string& content_key) {
  return DeduplicateWith(records, [&](const RawRecord& r) { return r.Text(content_key); });
}

void DedupIndex::Persist(const std::filesystem::path& path) const {
  nlohmann::json j = nlohmann::json::array();
  for (Fingerprint fp : exact_.Sorted()) {
    j.push_back(FingerprintToHex(fp));
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to create dedup index file: " + path.string());
  }
  out << j.dump();
  if (!out) {
    throw std::runtime_error("failed to write dedup index file: " + path.string());
  }
}

bool DedupIndex::Restore(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    throw MalformedInputError("dedup index is not a JSON array: " + path.string());
  }
  ExactIndex restored;
  for (const auto& item : j) {
    if (!item.is_string()) {
      throw MalformedInputError("dedup index entry is not a string: " + path.string());
    }
    auto fp = FingerprintFromHex(item.get<std::string>());
    if (!fp) {
      throw MalformedInputError("dedup index entry is not a hex digest: " + item.get<std::string>());
    }
    restored.Insert(*fp);
  }
  exact_ = std::move(restored);
  reporter_.Info("restored exact dedup index", {{"file", path.string()}, {"fingerprints", std::to_string(exact_.Size())}});
  return true;
}

}  // namespace sftcurator
