#undef NDEBUG
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "sftcurator/errors.hpp"
#include "sftcurator/record.hpp"
#include "sftcurator/templates.hpp"

using namespace sftcurator;

namespace {

void TestSelectionIsDeterministic() {
  TemplateContext ctx;
  ctx.source = "NIST SP 800-53";
  ctx.topic = "Account Management";
  const std::string first = SelectTemplate(ctx);
  for (int i = 0; i < 5; ++i) assert(SelectTemplate(ctx) == first);
  assert(first.find("{") == std::string::npos);
  assert(first.find("NIST SP 800-53") != std::string::npos);
}

void TestPrecedence() {
  TemplateContext reg;
  reg.cfr_ref = "32 CFR 170.14";
  reg.topic = "Assessment requirements";
  reg.doc_type = "Rule";
  const std::string q = SelectTemplate(reg);
  assert(q.find("32 CFR 170.14") != std::string::npos);

  TemplateContext sp;
  sp.framework = "sp800_171";
  sp.topic = "Access Enforcement";
  assert(SelectTemplate(sp).find("800-171") != std::string::npos);

  TemplateContext fed;
  fed.doc_type = "Proposed Rule";
  fed.topic = "Incident reporting";
  assert(SelectTemplate(fed).find("Incident reporting") != std::string::npos);

  TemplateContext source_only;
  source_only.source = "DFARS";
  assert(SelectTemplate(source_only).find("DFARS") != std::string::npos);

  assert(SelectTemplate(TemplateContext{}) ==
         "What are the key cybersecurity compliance requirements described here?");
}

void TestExtractTopic() {
  assert(ExtractTopic("3.1.1 Limit System Access\nThe organization shall...") == "Limit System Access");
  assert(ExtractTopic("Configuration Management Policy\nbody") == "Configuration Management Policy");
  assert(ExtractTopic("Short\nbody").empty());
  assert(ExtractTopic("42\n").empty());
}

void TestConvertRawRecord() {
  RawRecord raw;
  raw.fields = {{"text", "3.1.1 Limit System Access\nLimit system access to authorized users."},
                {"control_id", "3.1.1"},
                {"title", "Account Management"}};
  const ChatRecord rec = ConvertRawRecord(raw, "nist_sp800_171");
  assert(rec.HasTurns());
  assert(rec.source == "nist_sp800_171_3.1.1");
  assert(rec.messages[kSystemTurn].content == kSystemPrompt);
  assert(*rec.AssistantContent() == raw.Text());
  assert(rec.messages[kUserTurn].content.find("Account Management") != std::string::npos);

  RawRecord fr;
  fr.fields = {{"text", "Body of the notice."}, {"document_number", "2024-123"}, {"chunk_index", 2}};
  assert(ConvertRawRecord(fr, "federal_register").source == "federal_register_2024-123_chunk2");

  RawRecord ecfr;
  ecfr.fields = {{"text", "Section text."}, {"cfr_title", "32"}, {"cfr_part", "170"}, {"section_number", "170.14"}};
  assert(ConvertRawRecord(ecfr, "ecfr").source == "ecfr_32_170_170_14");

  RawRecord dod;
  dod.fields = {{"text", "Chunk text."}, {"doc_name", "CMMC Assessment Guide"}, {"chunk_index", 4}};
  assert(ConvertRawRecord(dod, "dod_documents").source == "dod_cmmc_assessment_guide_chunk4");

  bool threw = false;
  try {
    (void)ConvertRawRecord(raw, "unknown_source");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  RawRecord empty;
  threw = false;
  try {
    (void)ConvertRawRecord(empty, "nist_csf");
  } catch (const MalformedInputError&) {
    threw = true;
  }
  assert(threw);

  const auto batch = ConvertBatch({raw, empty, fr}, "nist_sp800_171");
  assert(batch.size() == 2);
}

void TestRecordRoundTrip() {
  auto j = nlohmann::json::parse(R"({"messages": [{"role": "system", "content": "s"},
      {"role": "user", "content": "u"}, {"role": "assistant", "content": "a"}],
      "source": "x", "topic_tag": "ac"})");
  const ChatRecord rec = ParseChatRecord(j);
  assert(rec.source == "x");
  assert(rec.extra["topic_tag"] == "ac");
  assert(ToJson(rec) == j);

  bool threw = false;
  try {
    (void)ParseChatRecord(nlohmann::json::parse(R"({"messages": "nope"})"));
  } catch (const MalformedInputError&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestSelectionIsDeterministic();
  TestPrecedence();
  TestExtractTopic();
  TestConvertRawRecord();
  TestRecordRoundTrip();
  return 0;
}
