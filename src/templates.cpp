#include "sftcurator/templates.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

#include <xxhash.h>

#include "sftcurator/errors.hpp"
#include "sftcurator/minhash.hpp"
#include "sftcurator/quality_filter.hpp"

namespace sftcurator {

const std::string_view kSystemPrompt =
    "You are a CMMC and cybersecurity compliance expert with deep knowledge of "
    "CMMC 2.0, NIST SP 800-171, NIST SP 800-172, NIST CSF, HIPAA Security Rule, "
    "and related frameworks. You provide accurate, practical guidance on compliance "
    "requirements, security controls, implementation procedures, and assessment "
    "preparation. You cite specific standards, controls, and regulatory references.";

namespace {

constexpr std::array<std::string_view, 7> kQuestionTemplates = {
    "What does {source} say about this topic?",
    "According to {source}, what are the key requirements?",
    "Summarize the guidance provided in {source}.",
    "What are the compliance requirements described in {source}?",
    "Explain the security controls outlined in {source}.",
    "What does {source} recommend for implementation?",
    "What guidance does {source} provide?",
};

constexpr std::array<std::string_view, 5> kTopicTemplates = {
    "What does {source} say about {topic}?",
    "What are the requirements for {topic} according to {source}?",
    "Explain {topic} as described in {source}.",
    "How does {source} address {topic}?",
    "What controls does {source} require for {topic}?",
};

constexpr std::array<std::string_view, 4> kFederalRegisterTemplates = {
    "What changes does this Federal Register notice introduce regarding {topic}?",
    "Summarize the key provisions of this {doc_type} about {topic}.",
    "What are the compliance implications of this {doc_type} for {topic}?",
    "What does the Federal Register say about {topic} in this {doc_type}?",
};

constexpr std::array<std::string_view, 4> kRegulationTemplates = {
    "What does {cfr_ref} require regarding {topic}?",
    "Explain the requirements in {cfr_ref} for {topic}.",
    "What are the regulatory requirements for {topic} under {cfr_ref}?",
    "Summarize {cfr_ref} section on {topic}.",
};

constexpr std::array<std::string_view, 5> kSp800171Templates = {
    "What does NIST SP 800-171 Rev. 3 require for {topic}?",
    "Explain the {topic} control in SP 800-171 Rev. 3 and how to assess it.",
    "What are the CUI security requirements for {topic} under SP 800-171?",
    "Describe the {topic} requirement in SP 800-171 Rev. 3 including assessment objectives.",
    "How should organizations implement {topic} per NIST SP 800-171 Rev. 3?",
};

constexpr std::array<std::string_view, 4> kCsfTemplates = {
    "What does NIST CSF 2.0 say about {topic}?",
    "Explain the {topic} category in the NIST Cybersecurity Framework 2.0.",
    "How does NIST CSF 2.0 address {topic}?",
    "What are the CSF 2.0 recommendations for {topic}?",
};

constexpr std::array<std::string_view, 4> kDodDocumentTemplates = {
    "What does the {source} say about {topic}?",
    "According to the {source}, what are the key requirements for {topic}?",
    "Summarize the guidance in the {source} regarding {topic}.",
    "What does DoD guidance recommend for {topic}?",
};

constexpr std::string_view kFallbackTemplate =
    "What are the key cybersecurity compliance requirements described here?";

std::uint64_t ContextHash(const TemplateContext& ctx) {
  std::string key;
  for (const std::string* part : {&ctx.source, &ctx.topic, &ctx.doc_type, &ctx.cfr_ref, &ctx.framework}) {
    key += *part;
    key.push_back('\x1f');
  }
  return static_cast<std::uint64_t>(XXH64(key.data(), key.size(), 0));
}

void ReplaceAll(std::string& s, std::string_view placeholder, const std::string& value) {
  for (std::size_t pos = s.find(placeholder); pos != std::string::npos;
       pos = s.find(placeholder, pos + value.size())) {
    s.replace(pos, placeholder.size(), value);
  }
}

template <std::size_t N>
std::string Fill(const std::array<std::string_view, N>& templates, const TemplateContext& ctx) {
  std::string out(templates[ContextHash(ctx) % N]);
  ReplaceAll(out, "{source}", ctx.source);
  ReplaceAll(out, "{topic}", ctx.topic);
  ReplaceAll(out, "{doc_type}", ctx.doc_type);
  ReplaceAll(out, "{cfr_ref}", ctx.cfr_ref);
  return out;
}

std::string Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return std::string(s);
}

bool TopicLengthOk(const std::string& topic) {
  const std::size_t n = CodepointLength(topic);
  return n > 10 && n < 100;
}

std::string Truncate(const std::string& s, std::size_t max_codepoints) {
  const auto offsets = CodepointOffsets(s);
  if (offsets.size() - 1 <= max_codepoints) return s;
  return s.substr(0, offsets[max_codepoints]);
}

std::string ToLower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

long long IntField(const RawRecord& raw, const std::string& key) {
  auto it = raw.fields.find(key);
  if (it == raw.fields.end()) return 0;
  if (it->is_number_integer()) return it->get<long long>();
  if (it->is_string()) {
    try {
      return std::stoll(it->get<std::string>());
    } catch (const std::exception&) {
      return 0;
    }
  }
  return 0;
}

std::string FirstNonEmpty(const std::string& a, const std::string& b) {
  return a.empty() ? b : a;
}

}  // namespace

std::string SelectTemplate(const TemplateContext& ctx) {
  const bool has_topic = !ctx.topic.empty();
  if (!ctx.cfr_ref.empty() && has_topic) return Fill(kRegulationTemplates, ctx);
  if (ctx.framework == "sp800_171" && has_topic) return Fill(kSp800171Templates, ctx);
  if (ctx.framework == "csf" && has_topic) return Fill(kCsfTemplates, ctx);
  if (ctx.framework == "dod_document" && has_topic && !ctx.source.empty()) return Fill(kDodDocumentTemplates, ctx);
  if (!ctx.doc_type.empty() && has_topic) return Fill(kFederalRegisterTemplates, ctx);
  if (!ctx.source.empty() && has_topic) return Fill(kTopicTemplates, ctx);
  if (!ctx.source.empty()) return Fill(kQuestionTemplates, ctx);
  return std::string(kFallbackTemplate);
}

ChatRecord MakeChatRecord(std::string question, std::string answer, std::string source_id) {
  ChatRecord record;
  record.messages = {
      {"system", std::string(kSystemPrompt)},
      {"user", std::move(question)},
      {"assistant", std::move(answer)},
  };
  record.source = std::move(source_id);
  return record;
}

std::string ExtractTopic(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) ++i;
  if (i > 0) {
    std::size_t j = i;
    while (j < text.size() && std::isspace(static_cast<unsigned char>(text[j]))) ++j;
    if (j > i && j < text.size()) {
      const std::size_t eol = text.find('\n', j);
      std::string topic = Trim(text.substr(j, eol == std::string_view::npos ? std::string_view::npos : eol - j));
      if (TopicLengthOk(topic)) return topic;
    }
  }

  std::string first_line = Trim(text.substr(0, text.find('\n')));
  if (TopicLengthOk(first_line) && std::isalpha(static_cast<unsigned char>(first_line.front()))) {
    return first_line;
  }
  return {};
}

bool IsKnownSourceType(const std::string& source_type) {
  return source_type == "nist_csrc" || source_type == "federal_register" || source_type == "ecfr" ||
         source_type == "nist_sp800_171" || source_type == "nist_csf" || source_type == "dod_documents";
}

ChatRecord ConvertRawRecord(const RawRecord& raw, const std::string& source_type, const std::string& content_key) {
  if (!IsKnownSourceType(source_type)) {
    throw std::invalid_argument("Unknown source type: " + source_type);
  }
  std::string text = raw.Text(content_key);
  if (text.empty()) {
    throw MalformedInputError("raw record has no '" + content_key + "' text");
  }
  const std::string title = raw.StringField("title");

  TemplateContext ctx;
  std::string source_id;

  if (source_type == "nist_csrc") {
    ctx.source = FirstNonEmpty(raw.StringField("source"), "NIST Publication");
    ctx.topic = FirstNonEmpty(ExtractTopic(text), title);
    source_id = "nist_csrc_" + raw.StringField("control_id");
  } else if (source_type == "federal_register") {
    ctx.topic = title.empty() ? ExtractTopic(text) : Truncate(title, 100);
    ctx.doc_type = FirstNonEmpty(raw.StringField("doc_type"), "Document");
    source_id = "federal_register_" + raw.StringField("document_number");
    if (const long long chunk = IntField(raw, "chunk_index"); chunk > 0) {
      source_id += "_chunk" + std::to_string(chunk);
    }
  } else if (source_type == "ecfr") {
    ctx.cfr_ref = raw.StringField("cfr_ref");
    ctx.topic = FirstNonEmpty(title, ExtractTopic(text));
    std::string section = raw.StringField("section_number");
    for (char& c : section) {
      if (c == '.') c = '_';
    }
    source_id = "ecfr_" + raw.StringField("cfr_title") + "_" + raw.StringField("cfr_part") + "_" + section;
  } else if (source_type == "nist_sp800_171") {
    ctx.source = "NIST SP 800-171 Rev. 3";
    ctx.topic = FirstNonEmpty(title, ExtractTopic(text));
    ctx.framework = "sp800_171";
    source_id = "nist_sp800_171_" + raw.StringField("control_id");
  } else if (source_type == "nist_csf") {
    ctx.source = "NIST CSF 2.0";
    ctx.topic = FirstNonEmpty(title, ExtractTopic(text));
    ctx.framework = "csf";
    source_id = "nist_csf_" + FirstNonEmpty(raw.StringField("subcategory_id"), raw.StringField("category_id"));
  } else {
    const std::string doc_name = FirstNonEmpty(raw.StringField("doc_name"), raw.StringField("source"));
    ctx.source = doc_name;
    const bool title_is_doc = !doc_name.empty() && title.rfind(doc_name, 0) == 0;
    ctx.topic = (!title.empty() && !title_is_doc) ? title : ExtractTopic(text);
    ctx.framework = "dod_document";
    std::string slug = raw.StringField("doc_name");
    for (char& c : slug) {
      if (c == ' ') c = '_';
    }
    source_id = "dod_" + ToLower(slug) + "_chunk" + std::to_string(IntField(raw, "chunk_index"));
  }

  return MakeChatRecord(SelectTemplate(ctx), std::move(text), std::move(source_id));
}

std::vector<ChatRecord> ConvertBatch(const std::vector<RawRecord>& records, const std::string& source_type,
                                     Reporter& reporter, const std::string& content_key) {
  if (!IsKnownSourceType(source_type)) {
    throw std::invalid_argument("Unknown source type: " + source_type);
  }
  std::vector<ChatRecord> out;
  out.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    try {
      out.push_back(ConvertRawRecord(records[i], source_type, content_key));
    } catch (const MalformedInputError& e) {
      reporter.Warn("failed to convert record",
                    {{"source_type", source_type}, {"index", std::to_string(i)}, {"error", e.what()}});
    }
  }
  return out;
}

}  // namespace sftcurator
