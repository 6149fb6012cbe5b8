#include "sftcurator/exact_index.hpp"

#include <algorithm>

#include <xxhash.h>

namespace sftcurator {

Fingerprint FingerprintOf(std::string_view text) {
  return static_cast<Fingerprint>(XXH64(text.data(), text.size(), 0));
}

std::string FingerprintToHex(Fingerprint fp) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kDigits[fp & 0xFu];
    fp >>= 4;
  }
  return out;
}

std::optional<Fingerprint> FingerprintFromHex(std::string_view hex) {
  if (hex.empty() || hex.size() > 16) {
    return std::nullopt;
  }
  Fingerprint value = 0;
  for (char c : hex) {
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<Fingerprint>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<Fingerprint>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<Fingerprint>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

std::vector<Fingerprint> ExactIndex::Sorted() const {
  std::vector<Fingerprint> out(fingerprints_.begin(), fingerprints_.end());
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace sftcurator
