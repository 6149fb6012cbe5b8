#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "sftcurator/minhash.hpp"

namespace sftcurator {

struct LshParams {
  std::size_t bands = 0;
  std::size_t rows = 0;
};

// Band/row split for `num_perm` permutations that minimizes
// 0.5 * P(false positive below threshold) + 0.5 * P(false negative above it).
[[nodiscard]] LshParams OptimalLshParams(double threshold, std::size_t num_perm);

// Banded LSH over MinHash signatures. Keys are caller-chosen identifiers.
class NearDuplicateIndex {
 public:
  NearDuplicateIndex(double threshold, std::size_t num_perm);

  // Returns false, leaving the index unchanged, when `key` is already indexed.
  bool Insert(const std::string& key, const MinHashSignature& signature);

  // Keys sharing at least one band bucket with `signature`.
  [[nodiscard]] std::vector<std::string> Query(const MinHashSignature& signature) const;
  [[nodiscard]] bool HasCandidate(const MinHashSignature& signature) const;

  [[nodiscard]] bool Contains(const std::string& key) const { return keys_.count(key) != 0; }
  [[nodiscard]] std::size_t Size() const { return keys_.size(); }
  [[nodiscard]] const LshParams& params() const { return params_; }

 private:
  [[nodiscard]] std::uint64_t BandKey(const MinHashSignature& signature, std::size_t band) const;
  void CheckSignature(const MinHashSignature& signature) const;

  std::size_t num_perm_;
  LshParams params_;
  std::vector<std::unordered_map<std::uint64_t, std::vector<std::string>>> tables_;
  std::unordered_set<std::string> keys_;
};

}  // namespace sftcurator
