#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "sftcurator/record.hpp"

namespace sftcurator {

struct RelevanceStats {
  std::size_t total = 0;
  std::size_t kept = 0;
  std::size_t removed_irrelevant = 0;
};

struct RelevanceResult {
  std::vector<RawRecord> kept;
  RelevanceStats stats;
};

// "252.204-7012" from a title like "252.204-7012 Safeguarding ...", or empty.
[[nodiscard]] std::string ExtractDfarsClause(std::string_view title);

// 32 CFR 170 and 45 CFR 164 are always in scope; 48 CFR 252 only for the
// cyber and CMMC clauses. Any other CFR reference is kept.
[[nodiscard]] bool IsRelevantEcfr(const RawRecord& raw);

// Applied to raw records before conversion. Only "ecfr" records are
// filtered; other source types pass through unchanged.
[[nodiscard]] RelevanceResult FilterRelevance(const std::vector<RawRecord>& records, const std::string& source_type);

}  // namespace sftcurator
