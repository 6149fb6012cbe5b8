#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sftcurator/record.hpp"
#include "sftcurator/reporter.hpp"

namespace sftcurator {

// Must match the system turn of the existing training data byte for byte.
extern const std::string_view kSystemPrompt;

struct TemplateContext {
  std::string source;
  std::string topic;
  std::string doc_type;
  std::string cfr_ref;
  std::string framework;  // "sp800_171", "csf", "dod_document" or empty
};

// Picks and fills a question template. The choice is a pure function of the
// context: its fields are hashed and reduced modulo the candidate list size.
[[nodiscard]] std::string SelectTemplate(const TemplateContext& ctx);

[[nodiscard]] ChatRecord MakeChatRecord(std::string question, std::string answer, std::string source_id);

// Heading-like topic from a leading "3.2.1 Title" line or a plain first line;
// empty when neither is 11..99 codepoints long.
[[nodiscard]] std::string ExtractTopic(std::string_view text);

// Source types: nist_csrc, federal_register, ecfr, nist_sp800_171, nist_csf,
// dod_documents. Throws std::invalid_argument for an unknown type and
// MalformedInputError for a record without text.
ChatRecord ConvertRawRecord(const RawRecord& raw, const std::string& source_type,
                            const std::string& content_key = "text");

// Skips (and reports) records that fail to convert.
std::vector<ChatRecord> ConvertBatch(const std::vector<RawRecord>& records, const std::string& source_type,
                                     Reporter& reporter = DefaultReporter(),
                                     const std::string& content_key = "text");

[[nodiscard]] bool IsKnownSourceType(const std::string& source_type);

}  // namespace sftcurator
