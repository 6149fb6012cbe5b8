#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sftcurator {

using Fingerprint = std::uint64_t;

// xxHash64 of the UTF-8 bytes, seed 0.
[[nodiscard]] Fingerprint FingerprintOf(std::string_view text);

// 16 lowercase hex digits, the on-disk form of a fingerprint.
[[nodiscard]] std::string FingerprintToHex(Fingerprint fp);
[[nodiscard]] std::optional<Fingerprint> FingerprintFromHex(std::string_view hex);

class ExactIndex {
 public:
  // Returns true when the fingerprint was not present before.
  bool Insert(Fingerprint fp) { return fingerprints_.insert(fp).second; }
  [[nodiscard]] bool Contains(Fingerprint fp) const { return fingerprints_.count(fp) != 0; }

  [[nodiscard]] std::size_t Size() const { return fingerprints_.size(); }
  void Clear() { fingerprints_.clear(); }

  // Sorted, so persisted files are stable across runs.
  [[nodiscard]] std::vector<Fingerprint> Sorted() const;

 private:
  std::unordered_set<Fingerprint> fingerprints_;
};

}  // namespace sftcurator
