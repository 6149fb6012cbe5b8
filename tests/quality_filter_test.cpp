#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "sftcurator/quality_filter.hpp"
#include "sftcurator/templates.hpp"

using namespace sftcurator;

namespace {

std::string Repeat(const std::string& unit, std::size_t n) {
  std::string out;
  for (std::size_t i = 0; i < n; ++i) out += unit;
  return out;
}

const std::string kProse = Repeat(
    "Organizations must protect the confidentiality of controlled unclassified information at rest. ", 4);

RejectReason ReasonOf(const FilterVerdict& v) {
  assert(!v.accepted);
  return v.reason;
}

void TestEachReason() {
  QualityFilter filter;
  assert(filter.Evaluate(kProse).accepted);

  assert(ReasonOf(filter.Evaluate("3.2.1")) == RejectReason::kTooShort);
  assert(ReasonOf(filter.Evaluate(std::string(8001, 'a'))) == RejectReason::kTooLong);

  // Lower bound disabled so the structural checks are reached.
  assert(ReasonOf(filter.Evaluate("  3.2.1  ", 0)) == RejectReason::kSectionNumbersOnly);
  assert(ReasonOf(filter.Evaluate("|---|---|\n|===|", 0)) == RejectReason::kTableBordersOnly);
  assert(ReasonOf(filter.Evaluate(Repeat("ab|", 100))) == RejectReason::kTableHeavy);
  assert(ReasonOf(filter.Evaluate(Repeat("12345 67890 ", 20))) == RejectReason::kLowAlpha);

  const std::string with_images = kProse + "<!-- image -->\n<!-- image -->\n<!-- image -->\n";
  assert(ReasonOf(filter.Evaluate(with_images)) == RejectReason::kImageArtifacts);
  const std::string two_images = kProse + "<!-- image -->\n<!-- image -->\n";
  assert(filter.Evaluate(two_images).accepted);
}

void TestOrderShortCircuits() {
  QualityFilter filter;
  // Short and low alpha at once: the length check runs first.
  assert(ReasonOf(filter.Evaluate("1234 5678")) == RejectReason::kTooShort);
}

void TestBoundsAndOptions() {
  QualityOptions opts;
  opts.max_answer_length = 0;
  QualityFilter unbounded(opts);
  assert(unbounded.Evaluate(Repeat(kProse, 30)).accepted);

  QualityFilter filter;
  const std::string medium = kProse.substr(0, 150);
  assert(ReasonOf(filter.Evaluate(medium)) == RejectReason::kTooShort);
  assert(filter.EvaluateRaw(medium).accepted);

  assert(CodepointLength("h\xC3\xA9llo") == 5);
  const auto m = MeasureText("a|b---c");
  assert(m.length == 7);
  assert(m.table_chars == 4);
  assert(m.alpha == 3);
}

void TestMonotonicInMinLength() {
  const std::vector<std::string> texts = {kProse, kProse.substr(0, 250), kProse.substr(0, 120), "short"};
  for (std::size_t strict = 0; strict <= 400; strict += 50) {
    for (const auto& t : texts) {
      QualityFilter filter;
      if (filter.Evaluate(t, strict + 50).accepted) {
        assert(filter.Evaluate(t, strict).accepted);
      }
    }
  }
}

void TestBatch() {
  ChatRecord no_answer;
  no_answer.messages = {{"system", std::string(kSystemPrompt)}, {"user", "q"}};
  std::vector<ChatRecord> batch = {
      MakeChatRecord("q1", kProse, "good"),
      MakeChatRecord("q2", "3.2.1", "short"),
      no_answer,
      MakeChatRecord("q3", Repeat("ab|", 100), "table"),
  };
  QualityFilter filter;
  auto result = filter.FilterBatch(batch);
  assert(result.stats.total == 4);
  assert(result.stats.passed == 1);
  assert(result.stats.TotalRejected() == 3);
  assert(result.stats.Rejected(RejectReason::kTooShort) == 2);
  assert(result.stats.Rejected(RejectReason::kTableHeavy) == 1);
  assert(result.passed.size() == 1 && result.passed[0].source == "good");

  std::vector<RawRecord> raw(2);
  raw[0].fields = {{"text", kProse}};
  raw[1].fields = {{"text", "tiny"}};
  auto raw_result = filter.FilterBatch(raw);
  assert(raw_result.stats.passed == 1);
  assert(RejectReasonName(RejectReason::kImageArtifacts) == "image_artifacts");
}

}  // namespace

int main() {
  TestEachReason();
  TestOrderShortCircuits();
  TestBoundsAndOptions();
  TestMonotonicInMinLength();
  TestBatch();
  return 0;
}
