#include "sftcurator/minhash.hpp"

#include <algorithm>
#include <stdexcept>

#include <xxhash.h>

namespace sftcurator {

namespace {

std::uint64_t SplitMix64(std::uint64_t& state) {
  std::uint64_t z = (state += 0x9e3779b97f4a7c15ull);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

inline std::uint64_t MulAddModMersenne(std::uint64_t a, std::uint64_t x, std::uint64_t b) {
  unsigned __int128 v = static_cast<unsigned __int128>(a) * x + b;
  constexpr std::uint64_t p = ShingleHasher::kMersennePrime;
  std::uint64_t r = static_cast<std::uint64_t>(v & p) + static_cast<std::uint64_t>(v >> 61);
  r = (r & p) + (r >> 61);
  return r >= p ? r - p : r;
}

}  // namespace

ShingleHasher::ShingleHasher(std::size_t num_perm, std::size_t shingle_size, std::uint64_t seed)
    : shingle_size_(shingle_size) {
  if (num_perm == 0) {
    throw std::invalid_argument("num_perm must be positive");
  }
  if (shingle_size == 0) {
    throw std::invalid_argument("shingle_size must be positive");
  }
  a_.reserve(num_perm);
  b_.reserve(num_perm);
  std::uint64_t state = seed;
  for (std::size_t i = 0; i < num_perm; ++i) {
    a_.push_back(SplitMix64(state) % (kMersennePrime - 1) + 1);
    b_.push_back(SplitMix64(state) % kMersennePrime);
  }
}

MinHashSignature ShingleHasher::Signature(std::string_view text) const {
  MinHashSignature sig(a_.size(), kMaxHash);
  const auto offsets = CodepointOffsets(text);
  const std::size_t codepoints = offsets.size() - 1;
  if (codepoints < shingle_size_) {
    return sig;
  }

  for (std::size_t i = 0; i + shingle_size_ <= codepoints; ++i) {
    const std::size_t begin = offsets[i];
    const std::size_t end = offsets[i + shingle_size_];
    const auto hv = static_cast<std::uint32_t>(XXH64(text.data() + begin, end - begin, 0));
    for (std::size_t p = 0; p < a_.size(); ++p) {
      const auto phv = static_cast<std::uint32_t>(MulAddModMersenne(a_[p], hv, b_[p]) & kMaxHash);
      sig[p] = std::min(sig[p], phv);
    }
  }
  return sig;
}

double EstimateJaccard(const MinHashSignature& lhs, const MinHashSignature& rhs) {
  if (lhs.size() != rhs.size()) {
    throw std::invalid_argument("signatures have different num_perm");
  }
  if (lhs.empty()) {
    return 0.0;
  }
  std::size_t equal = 0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (lhs[i] == rhs[i]) ++equal;
  }
  return static_cast<double>(equal) / static_cast<double>(lhs.size());
}

std::vector<std::size_t> CodepointOffsets(std::string_view text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (std::size_t i = 0; i < text.size(); ++i) {
    // Continuation bytes (10xxxxxx) never start a codepoint.
    if ((static_cast<unsigned char>(text[i]) & 0xC0u) != 0x80u) {
      offsets.push_back(i);
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

}  // namespace sftcurator
