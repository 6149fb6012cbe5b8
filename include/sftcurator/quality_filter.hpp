#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sftcurator/record.hpp"

namespace sftcurator {

struct QualityOptions {
  std::size_t min_content_length = 100;
  std::size_t min_answer_length = 200;
  std::size_t max_answer_length = 8000;  // 0 disables the upper bound
  double max_table_ratio = 0.3;
  double min_alpha_ratio = 0.3;
  std::size_t max_image_artifacts = 2;
};

// Evaluation order; the first failing check wins.
enum class RejectReason {
  kTooShort = 0,
  kTooLong,
  kSectionNumbersOnly,
  kTableBordersOnly,
  kTableHeavy,
  kLowAlpha,
  kImageArtifacts,
};

inline constexpr std::size_t kRejectReasonCount = 7;

[[nodiscard]] std::string_view RejectReasonName(RejectReason reason);

struct FilterVerdict {
  bool accepted = true;
  RejectReason reason = RejectReason::kTooShort;  // meaningful only when rejected

  static FilterVerdict Accept() { return {}; }
  static FilterVerdict Reject(RejectReason r) { return {false, r}; }
};

struct FilterStats {
  std::size_t total = 0;
  std::size_t passed = 0;
  std::array<std::size_t, kRejectReasonCount> rejected{};

  [[nodiscard]] std::size_t Rejected(RejectReason reason) const {
    return rejected[static_cast<std::size_t>(reason)];
  }
  [[nodiscard]] std::size_t TotalRejected() const { return total - passed; }
};

template <typename Record>
struct FilterBatchResult {
  std::vector<Record> passed;
  FilterStats stats;
};

// Text metrics measured in codepoints.
struct TextMetrics {
  std::size_t length = 0;
  std::size_t alpha = 0;
  std::size_t table_chars = 0;  // '|' + 3 * "---" + 3 * "==="
  std::size_t image_artifacts = 0;
};

[[nodiscard]] TextMetrics MeasureText(std::string_view text);
[[nodiscard]] std::size_t CodepointLength(std::string_view text);

class QualityFilter {
 public:
  explicit QualityFilter(QualityOptions options = {}) : options_(options) {}

  // Chat answers: lower bound is min_answer_length.
  [[nodiscard]] FilterVerdict Evaluate(std::string_view text) const;
  // Raw scraped text: lower bound is min_content_length.
  [[nodiscard]] FilterVerdict EvaluateRaw(std::string_view text) const;
  [[nodiscard]] FilterVerdict Evaluate(std::string_view text, std::size_t min_length) const;

  // Filters on the assistant turn; records without one count as too short.
  [[nodiscard]] FilterBatchResult<ChatRecord> FilterBatch(const std::vector<ChatRecord>& records) const;
  [[nodiscard]] FilterBatchResult<RawRecord> FilterBatch(const std::vector<RawRecord>& records,
                                                         const std::string& content_key = "text") const;

  [[nodiscard]] const QualityOptions& options() const { return options_; }

 private:
  QualityOptions options_;
};

}  // namespace sftcurator
