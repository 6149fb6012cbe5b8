#include "sftcurator/lsh_index.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <xxhash.h>

namespace sftcurator {

namespace {

template <typename Fn>
double Integrate(Fn&& f, double lo, double hi) {
  // Composite Simpson; the integrands are smooth polynomials in s.
  constexpr int kSteps = 200;
  if (hi <= lo) return 0.0;
  const double h = (hi - lo) / kSteps;
  double acc = f(lo) + f(hi);
  for (int i = 1; i < kSteps; ++i) {
    acc += f(lo + i * h) * ((i % 2) ? 4.0 : 2.0);
  }
  return acc * h / 3.0;
}

double FalsePositiveProbability(double threshold, std::size_t b, std::size_t r) {
  const double bands = static_cast<double>(b);
  const double rows = static_cast<double>(r);
  return Integrate([&](double s) { return 1.0 - std::pow(1.0 - std::pow(s, rows), bands); }, 0.0, threshold);
}

double FalseNegativeProbability(double threshold, std::size_t b, std::size_t r) {
  const double bands = static_cast<double>(b);
  const double rows = static_cast<double>(r);
  return Integrate([&](double s) { return std::pow(1.0 - std::pow(s, rows), bands); }, threshold, 1.0);
}

}  // namespace

LshParams OptimalLshParams(double threshold, std::size_t num_perm) {
  if (threshold <= 0.0 || threshold >= 1.0) {
    throw std::invalid_argument("lsh threshold must be in (0, 1)");
  }
  if (num_perm < 2) {
    throw std::invalid_argument("num_perm too small for LSH");
  }
  LshParams best;
  double min_error = std::numeric_limits<double>::max();
  for (std::size_t b = 1; b <= num_perm; ++b) {
    const std::size_t max_r = num_perm / b;
    for (std::size_t r = 1; r <= max_r; ++r) {
      const double error = 0.5 * FalsePositiveProbability(threshold, b, r) +
                           0.5 * FalseNegativeProbability(threshold, b, r);
      if (error < min_error) {
        min_error = error;
        best = {b, r};
      }
    }
  }
  return best;
}

NearDuplicateIndex::NearDuplicateIndex(double threshold, std::size_t num_perm)
    : num_perm_(num_perm), params_(OptimalLshParams(threshold, num_perm)), tables_(params_.bands) {}

void NearDuplicateIndex::CheckSignature(const MinHashSignature& signature) const {
  if (signature.size() != num_perm_) {
    throw std::invalid_argument("signature size " + std::to_string(signature.size()) +
                                " does not match num_perm " + std::to_string(num_perm_));
  }
}

std::uint64_t NearDuplicateIndex::BandKey(const MinHashSignature& signature, std::size_t band) const {
  const std::uint32_t* begin = signature.data() + band * params_.rows;
  return static_cast<std::uint64_t>(XXH64(begin, params_.rows * sizeof(std::uint32_t), band));
}

bool NearDuplicateIndex::Insert(const std::string& key, const MinHashSignature& signature) {
  CheckSignature(signature);
  if (!keys_.insert(key).second) {
    return false;
  }
  for (std::size_t band = 0; band < params_.bands; ++band) {
    tables_[band][BandKey(signature, band)].push_back(key);
  }
  return true;
}

std::vector<std::string> NearDuplicateIndex::Query(const MinHashSignature& signature) const {
  CheckSignature(signature);
  std::unordered_set<std::string> seen;
  std::vector<std::string> out;
  for (std::size_t band = 0; band < params_.bands; ++band) {
    auto it = tables_[band].find(BandKey(signature, band));
    if (it == tables_[band].end()) continue;
    for (const auto& key : it->second) {
      if (seen.insert(key).second) {
        out.push_back(key);
      }
    }
  }
  return out;
}

bool NearDuplicateIndex::HasCandidate(const MinHashSignature& signature) const {
  CheckSignature(signature);
  for (std::size_t band = 0; band < params_.bands; ++band) {
    if (tables_[band].count(BandKey(signature, band)) != 0) {
      return true;
    }
  }
  return false;
}

}  // namespace sftcurator
