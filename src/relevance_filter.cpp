#include "sftcurator/relevance_filter.hpp"

#include <array>
#include <cctype>

namespace sftcurator {

namespace {

constexpr std::array<std::string_view, 10> kRelevantDfarsClauses = {
    "252.204-7008",  // safeguarding covered defense information controls
    "252.204-7009",  // third-party cyber incident information
    "252.204-7012",  // safeguarding CDI and cyber incident reporting
    "252.204-7019",  // notice of SP 800-171 assessment requirements
    "252.204-7020",  // SP 800-171 assessment requirements
    "252.204-7021",  // CMMC level requirements
    "252.204-7024",  // notice of CMMC assessment and scoping
    "252.204-7025",  // notice of CMMC level requirements
    "252.239-7009",  // cloud computing representation
    "252.239-7010",  // cloud computing services
};

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Integer field, or a string of digits; -1 otherwise.
long long CfrNumber(const RawRecord& raw, const std::string& key) {
  if (!raw.fields.is_object()) return -1;
  auto it = raw.fields.find(key);
  if (it == raw.fields.end()) return -1;
  if (it->is_number_integer()) return it->get<long long>();
  if (it->is_string()) {
    const auto s = it->get<std::string>();
    if (s.empty() || s.size() > 9) return -1;
    for (char c : s) {
      if (!IsDigit(c)) return -1;
    }
    return std::stoll(s);
  }
  return -1;
}

}  // namespace

std::string ExtractDfarsClause(std::string_view title) {
  constexpr std::string_view kPrefix = "252.";
  if (title.substr(0, kPrefix.size()) != kPrefix) return {};
  std::size_t i = kPrefix.size();
  const std::size_t part_start = i;
  while (i < title.size() && IsDigit(title[i])) ++i;
  if (i == part_start || i >= title.size() || title[i] != '-') return {};
  ++i;
  const std::size_t clause_start = i;
  while (i < title.size() && IsDigit(title[i])) ++i;
  if (i == clause_start) return {};
  return std::string(title.substr(0, i));
}

bool IsRelevantEcfr(const RawRecord& raw) {
  const long long title = CfrNumber(raw, "cfr_title");
  const long long part = CfrNumber(raw, "cfr_part");

  if (title == 32 && part == 170) return true;  // CMMC program rule
  if (title == 45 && part == 164) return true;  // HIPAA Security Rule
  if (title == 48 && part == 252) {
    const std::string clause = ExtractDfarsClause(raw.StringField("title"));
    if (clause.empty()) return false;
    for (std::string_view relevant : kRelevantDfarsClauses) {
      if (clause.compare(0, relevant.size(), relevant) == 0) return true;
    }
    return false;
  }
  return true;
}

RelevanceResult FilterRelevance(const std::vector<RawRecord>& records, const std::string& source_type) {
  RelevanceResult result;
  result.stats.total = records.size();
  if (source_type != "ecfr") {
    result.kept = records;
    result.stats.kept = records.size();
    return result;
  }
  for (const auto& record : records) {
    if (IsRelevantEcfr(record)) {
      result.kept.push_back(record);
      ++result.stats.kept;
    } else {
      ++result.stats.removed_irrelevant;
    }
  }
  return result;
}

}  // namespace sftcurator
