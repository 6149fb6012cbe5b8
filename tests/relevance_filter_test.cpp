#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "sftcurator/relevance_filter.hpp"

using namespace sftcurator;

namespace {

RawRecord Ecfr(nlohmann::json title, nlohmann::json part, const std::string& heading) {
  RawRecord raw;
  raw.fields = {{"text", "Section body."}, {"cfr_title", title}, {"cfr_part", part}, {"title", heading}};
  return raw;
}

void TestExtractClause() {
  assert(ExtractDfarsClause("252.204-7012 Safeguarding covered defense information") == "252.204-7012");
  assert(ExtractDfarsClause("252.239-7010") == "252.239-7010");
  assert(ExtractDfarsClause("Subpart 252.2").empty());
  assert(ExtractDfarsClause("252.204 Definitions").empty());
  assert(ExtractDfarsClause("").empty());
}

void TestEcfrScope() {
  assert(IsRelevantEcfr(Ecfr(32, 170, "170.14 CMMC model")));
  assert(IsRelevantEcfr(Ecfr(45, 164, "164.312 Technical safeguards")));
  assert(IsRelevantEcfr(Ecfr(48, 252, "252.204-7012 Safeguarding covered defense information")));
  assert(IsRelevantEcfr(Ecfr(48, 252, "252.239-7010 Cloud computing services")));
  assert(!IsRelevantEcfr(Ecfr(48, 252, "252.225-7001 Buy American and balance of payments program")));
  assert(!IsRelevantEcfr(Ecfr(48, 252, "Part 252 general")));
  assert(IsRelevantEcfr(Ecfr("48", "252", "252.204-7021 Contractor compliance with CMMC")));
  // Any other CFR reference is kept.
  assert(IsRelevantEcfr(Ecfr(2, 200, "200.1 Definitions")));
}

void TestFilterBatch() {
  const std::vector<RawRecord> batch = {
      Ecfr(32, 170, "170.14 CMMC model"),
      Ecfr(48, 252, "252.225-7001 Buy American"),
      Ecfr(48, 252, "252.204-7012 Safeguarding"),
      Ecfr(48, 252, "252.211-7003 Item unique identification"),
  };
  const auto result = FilterRelevance(batch, "ecfr");
  assert(result.stats.total == 4);
  assert(result.stats.kept == 2);
  assert(result.stats.removed_irrelevant == 2);
  assert(result.kept.size() == 2);
  assert(result.kept[1].StringField("title") == "252.204-7012 Safeguarding");

  const auto passthrough = FilterRelevance(batch, "federal_register");
  assert(passthrough.kept.size() == 4);
  assert(passthrough.stats.kept == 4);
  assert(passthrough.stats.removed_irrelevant == 0);
}

}  // namespace

int main() {
  TestExtractClause();
  TestEcfrScope();
  TestFilterBatch();
  return 0;
}
