#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "sftcurator/record.hpp"
#include "sftcurator/reporter.hpp"

namespace sftcurator {

enum class CorpusFormat {
  kUnknown = 0,
  kJsonl,
  kJsonlGz,
  kJsonlXz,
};

CorpusFormat DetectCorpusFormat(const std::string& path);

struct CorpusLoadStats {
  std::size_t lines = 0;
  std::size_t loaded = 0;
  std::size_t skipped = 0;
};

// Line-oriented reader for newline-delimited JSON corpora, plain or
// compressed. Bad lines are reported and skipped; a missing file is a
// `false` return, never an exception.
class CorpusReader {
 public:
  explicit CorpusReader(Reporter& reporter = DefaultReporter());

  bool ForEachLine(const std::string& path, const std::function<void(const std::string&)>& fn) const;

  bool LoadChatRecords(const std::string& path, std::vector<ChatRecord>& out,
                       CorpusLoadStats* stats = nullptr) const;
  bool LoadRawRecords(const std::string& path, std::vector<RawRecord>& out,
                      CorpusLoadStats* stats = nullptr) const;

  // Reads the train and validation splits of a corpus directory. A missing
  // directory or split contributes nothing.
  std::vector<ChatRecord> LoadCorpusDir(const std::filesystem::path& dir,
                                        CorpusLoadStats* stats = nullptr) const;

 private:
  bool ReadTextLines(const std::string& path, const std::function<void(const std::string&)>& fn) const;
  bool ReadGzLines(const std::string& path, const std::function<void(const std::string&)>& fn) const;
  bool ReadXzLines(const std::string& path, const std::function<void(const std::string&)>& fn) const;

  Reporter& reporter_;
};

// train.jsonl / validation.jsonl of `dir`, falling back to the .gz and .xz
// variants per split. Only existing files are returned.
std::vector<std::filesystem::path> ResolveCorpusFiles(const std::filesystem::path& dir);

// Throws std::runtime_error when the file cannot be written.
void WriteJsonl(const std::filesystem::path& path, const std::vector<ChatRecord>& records);

}  // namespace sftcurator
