#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace sftcurator {

using MinHashSignature = std::vector<std::uint32_t>;

// MinHash over the set of `shingle_size`-codepoint substrings of a text.
// Permutations are (a * h + b) mod (2^61 - 1), truncated to 32 bits, with
// (a, b) drawn from a fixed splitmix64 sequence so signatures are
// reproducible across runs and platforms.
class ShingleHasher {
 public:
  static constexpr std::uint64_t kMersennePrime = (1ull << 61) - 1;
  static constexpr std::uint32_t kMaxHash = 0xFFFFFFFFu;

  explicit ShingleHasher(std::size_t num_perm = 128, std::size_t shingle_size = 5, std::uint64_t seed = 1);

  // A text shorter than `shingle_size` codepoints has no shingles and yields
  // the all-kMaxHash signature.
  [[nodiscard]] MinHashSignature Signature(std::string_view text) const;

  [[nodiscard]] std::size_t num_perm() const { return a_.size(); }
  [[nodiscard]] std::size_t shingle_size() const { return shingle_size_; }

 private:
  std::size_t shingle_size_;
  std::vector<std::uint64_t> a_;
  std::vector<std::uint64_t> b_;
};

// Fraction of positions on which two equally sized signatures agree.
[[nodiscard]] double EstimateJaccard(const MinHashSignature& lhs, const MinHashSignature& rhs);

// Byte offsets of each UTF-8 codepoint start, plus text.size() at the end.
[[nodiscard]] std::vector<std::size_t> CodepointOffsets(std::string_view text);

}  // namespace sftcurator
