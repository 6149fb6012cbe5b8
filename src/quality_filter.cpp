#include "sftcurator/quality_filter.hpp"

#include <cctype>
#include <cstdint>

namespace sftcurator {

namespace {

constexpr std::string_view kImageMarker = "<!-- image -->";

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view Strip(std::string_view s) {
  while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
  return s;
}

std::size_t CountNonOverlapping(std::string_view text, std::string_view needle) {
  std::size_t count = 0;
  for (std::size_t pos = text.find(needle); pos != std::string_view::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

// Decodes one codepoint starting at i; invalid bytes decode as themselves.
std::uint32_t NextCodepoint(std::string_view s, std::size_t& i) {
  const auto c = static_cast<unsigned char>(s[i]);
  std::size_t extra = 0;
  std::uint32_t cp = c;
  if ((c & 0xE0u) == 0xC0u) {
    extra = 1;
    cp = c & 0x1Fu;
  } else if ((c & 0xF0u) == 0xE0u) {
    extra = 2;
    cp = c & 0x0Fu;
  } else if ((c & 0xF8u) == 0xF0u) {
    extra = 3;
    cp = c & 0x07u;
  }
  if (extra == 0 || i + extra >= s.size()) {
    ++i;
    return c;
  }
  for (std::size_t k = 1; k <= extra; ++k) {
    const auto cc = static_cast<unsigned char>(s[i + k]);
    if ((cc & 0xC0u) != 0x80u) {
      ++i;
      return c;
    }
    cp = (cp << 6) | (cc & 0x3Fu);
  }
  i += extra + 1;
  return cp;
}

// Letters outside ASCII are approximated by script block.
bool IsAlphaCodepoint(std::uint32_t cp) {
  if (cp < 0x80) {
    return std::isalpha(static_cast<int>(cp)) != 0;
  }
  return (cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7) ||
         (cp >= 0x0370 && cp <= 0x1FFF) ||
         (cp >= 0x3040 && cp <= 0x9FFF) ||
         (cp >= 0xAC00 && cp <= 0xD7AF);
}

bool IsSectionNumbersOnly(std::string_view stripped) {
  if (stripped.empty()) return false;
  for (char c : stripped) {
    if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.')) return false;
  }
  return true;
}

bool IsTableBordersOnly(std::string_view stripped) {
  if (stripped.empty()) return false;
  for (char c : stripped) {
    if (!(IsSpace(c) || c == '|' || c == '_' || c == '-' || c == '=')) return false;
  }
  return true;
}

}  // namespace

std::string_view RejectReasonName(RejectReason reason) {
  switch (reason) {
    case RejectReason::kTooShort:
      return "too_short";
    case RejectReason::kTooLong:
      return "too_long";
    case RejectReason::kSectionNumbersOnly:
      return "section_numbers_only";
    case RejectReason::kTableBordersOnly:
      return "table_borders_only";
    case RejectReason::kTableHeavy:
      return "table_heavy";
    case RejectReason::kLowAlpha:
      return "low_alpha";
    case RejectReason::kImageArtifacts:
      return "image_artifacts";
  }
  return "too_short";
}

TextMetrics MeasureText(std::string_view text) {
  TextMetrics m;
  for (std::size_t i = 0; i < text.size();) {
    const std::uint32_t cp = NextCodepoint(text, i);
    ++m.length;
    if (IsAlphaCodepoint(cp)) ++m.alpha;
    if (cp == '|') ++m.table_chars;
  }
  m.table_chars += 3 * CountNonOverlapping(text, "---");
  m.table_chars += 3 * CountNonOverlapping(text, "===");
  m.image_artifacts = CountNonOverlapping(text, kImageMarker);
  return m;
}

std::size_t CodepointLength(std::string_view text) {
  std::size_t n = 0;
  for (std::size_t i = 0; i < text.size();) {
    NextCodepoint(text, i);
    ++n;
  }
  return n;
}

FilterVerdict QualityFilter::Evaluate(std::string_view text) const {
  return Evaluate(text, options_.min_answer_length);
}

FilterVerdict QualityFilter::EvaluateRaw(std::string_view text) const {
  return Evaluate(text, options_.min_content_length);
}

FilterVerdict QualityFilter::Evaluate(std::string_view text, std::size_t min_length) const {
  const TextMetrics m = MeasureText(text);

  if (m.length < min_length) {
    return FilterVerdict::Reject(RejectReason::kTooShort);
  }
  if (options_.max_answer_length > 0 && m.length > options_.max_answer_length) {
    return FilterVerdict::Reject(RejectReason::kTooLong);
  }

  const std::string_view stripped = Strip(text);
  if (IsSectionNumbersOnly(stripped)) {
    return FilterVerdict::Reject(RejectReason::kSectionNumbersOnly);
  }
  if (IsTableBordersOnly(stripped)) {
    return FilterVerdict::Reject(RejectReason::kTableBordersOnly);
  }

  if (m.length > 0) {
    const double len = static_cast<double>(m.length);
    if (static_cast<double>(m.table_chars) / len > options_.max_table_ratio) {
      return FilterVerdict::Reject(RejectReason::kTableHeavy);
    }
    if (static_cast<double>(m.alpha) / len < options_.min_alpha_ratio) {
      return FilterVerdict::Reject(RejectReason::kLowAlpha);
    }
  }

  if (m.image_artifacts > options_.max_image_artifacts) {
    return FilterVerdict::Reject(RejectReason::kImageArtifacts);
  }
  return FilterVerdict::Accept();
}

FilterBatchResult<ChatRecord> QualityFilter::FilterBatch(const std::vector<ChatRecord>& records) const {
  FilterBatchResult<ChatRecord> result;
  for (const auto& record : records) {
    ++result.stats.total;
    const std::string* content = record.AssistantContent();
    const FilterVerdict verdict = content ? Evaluate(*content) : FilterVerdict::Reject(RejectReason::kTooShort);
    if (verdict.accepted) {
      ++result.stats.passed;
      result.passed.push_back(record);
    } else {
      ++result.stats.rejected[static_cast<std::size_t>(verdict.reason)];
    }
  }
  return result;
}

FilterBatchResult<RawRecord> QualityFilter::FilterBatch(const std::vector<RawRecord>& records,
                                                        const std::string& content_key) const {
  FilterBatchResult<RawRecord> result;
  for (const auto& record : records) {
    ++result.stats.total;
    const FilterVerdict verdict = EvaluateRaw(record.Text(content_key));
    if (verdict.accepted) {
      ++result.stats.passed;
      result.passed.push_back(record);
    } else {
      ++result.stats.rejected[static_cast<std::size_t>(verdict.reason)];
    }
  }
  return result;
}

}  // namespace sftcurator
