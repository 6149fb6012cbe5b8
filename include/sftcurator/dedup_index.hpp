#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "sftcurator/exact_index.hpp"
#include "sftcurator/lsh_index.hpp"
#include "sftcurator/minhash.hpp"
#include "sftcurator/record.hpp"
#include "sftcurator/reporter.hpp"

namespace sftcurator {

struct DedupOptions {
  std::size_t num_perm = 128;
  double lsh_threshold = 0.8;
  std::size_t shingle_size = 5;
};

enum class DedupVerdict {
  kUnique = 0,
  kExactDuplicate,
  kNearDuplicate,
};

[[nodiscard]] std::string_view DedupVerdictName(DedupVerdict verdict);

struct DedupStats {
  std::size_t total_input = 0;
  std::size_t exact_dupes = 0;
  std::size_t near_dupes = 0;
  std::size_t unique = 0;
  std::size_t skipped_empty = 0;
};

template <typename Record>
struct DedupBatchResult {
  std::vector<Record> kept;
  DedupStats stats;
};

// Exact (xxHash64) plus near (MinHash LSH) duplicate detection. Check() is
// read-only; the caller admits a text after a kUnique verdict so later
// copies in the same batch are caught. Only the exact set is persisted; the
// LSH tables are rebuilt from corpus text on every run.
class DedupIndex {
 public:
  explicit DedupIndex(DedupOptions options = {}, Reporter& reporter = DefaultReporter());

  // Indexes the assistant turn of every record in the corpus directory's
  // train/validation splits. Returns the number of texts indexed.
  std::size_t SeedFromCorpus(const std::filesystem::path& corpus_dir);
  std::size_t SeedFromRecords(const std::vector<ChatRecord>& records);

  // Throws std::invalid_argument for empty text.
  [[nodiscard]] DedupVerdict Check(std::string_view text) const;

  // Returns false for empty text, which is never indexed.
  bool Admit(std::string_view text);

  // Keeps the first occurrence of each content; deduplicates on the
  // assistant turn of chat records.
  DedupBatchResult<ChatRecord> DeduplicateBatch(const std::vector<ChatRecord>& records);
  DedupBatchResult<RawRecord> DeduplicateBatch(const std::vector<RawRecord>& records,
                                               const std::string& content_key = "text");

  // Writes the exact fingerprint set as a JSON array of hex digests.
  void Persist(const std::filesystem::path& path) const;
  // Replaces the exact fingerprint set. Returns false if `path` is missing;
  // throws MalformedInputError on a corrupt file.
  bool Restore(const std::filesystem::path& path);

  [[nodiscard]] std::size_t ExactSize() const { return exact_.Size(); }
  [[nodiscard]] std::size_t NearSize() const { return near_.Size(); }
  [[nodiscard]] const DedupOptions& options() const { return options_; }

 private:
  void Index(std::string_view text, const std::string& key);

  template <typename Record, typename TextOf>
  DedupBatchResult<Record> DeduplicateWith(const std::vector<Record>& records, TextOf&& text_of);

  DedupOptions options_;
  Reporter& reporter_;
  ShingleHasher hasher_;
  ExactIndex exact_;
  NearDuplicateIndex near_;
  std::size_t seeded_ = 0;
  std::size_t admitted_ = 0;
};

}  // namespace sftcurator
