#include "sftcurator/validator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <random>
#include <set>
#include <sstream>

#include "sftcurator/corpus_reader.hpp"
#include "sftcurator/quality_filter.hpp"

namespace sftcurator {

namespace {

constexpr const char* kExpectedRoles[] = {"system", "user", "assistant"};
constexpr std::size_t kMaxListedSources = 20;

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::vector<std::size_t> AnswerLengths(const std::vector<ChatRecord>& records) {
  std::vector<std::size_t> lengths;
  lengths.reserve(records.size());
  for (const auto& record : records) {
    if (const std::string* content = record.AssistantContent()) {
      lengths.push_back(CodepointLength(*content));
    }
  }
  return lengths;
}

double Mean(const std::vector<std::size_t>& values) {
  double sum = 0.0;
  for (auto v : values) sum += static_cast<double>(v);
  return sum / static_cast<double>(values.size());
}

std::string Fixed(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

double RoundTo(double value, int digits) {
  const double scale = std::pow(10.0, digits);
  return std::round(value * scale) / scale;
}

}  // namespace

std::string ValidationResult::Summary() const {
  std::ostringstream oss;
  oss << "Validation " << (passed ? "PASSED" : "FAILED") << ": " << total_records << " records";
  if (!format_errors.empty()) {
    oss << "\n  Format errors: " << format_errors.size();
  }
  if (!quality_warnings.empty()) {
    oss << "\n  Quality warnings: " << quality_warnings.size();
  }
  return oss.str();
}

Validator::Validator(ValidationOptions options, Reporter& reporter)
    : options_(std::move(options)), reporter_(reporter) {}

ValidationResult Validator::ValidateAll(const std::vector<ChatRecord>& records,
                                        const std::optional<std::filesystem::path>& existing_corpus_dir) const {
  ValidationResult result;
  result.total_records = records.size();

  ValidateFormat(records, result);
  ValidateVolume(records, result);
  ValidateLengths(records, result);
  ValidateSources(records, result);
  if (existing_corpus_dir && !existing_corpus_dir->empty()) {
    CompareAgainstExisting(records, *existing_corpus_dir, result);
  }

  result.passed = result.format_errors.empty();
  reporter_.Info("validation finished", {{"records", std::to_string(records.size())},
                                         {"passed", result.passed ? "true" : "false"},
                                         {"format_errors", std::to_string(result.format_errors.size())},
                                         {"quality_warnings", std::to_string(result.quality_warnings.size())}});
  return result;
}

void Validator::ValidateFormat(const std::vector<ChatRecord>& records, ValidationResult& result) const {
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& record = records[i];
    const std::string prefix = "Record " + std::to_string(i) + ": ";
    if (!record.HasTurns()) {
      result.format_errors.push_back(prefix + "needs >= 3 messages, got " + std::to_string(record.messages.size()));
      continue;
    }

    for (std::size_t j = 0; j < std::size(kExpectedRoles); ++j) {
      const std::string& actual = record.messages[j].role;
      if (actual != kExpectedRoles[j]) {
        result.format_errors.push_back(prefix + "message " + std::to_string(j) + " role is '" + actual +
                                       "', expected '" + kExpectedRoles[j] + "'");
      }
    }

    for (std::size_t j = 0; j < record.messages.size(); ++j) {
      if (IsBlank(record.messages[j].content)) {
        result.format_errors.push_back(prefix + "message " + std::to_string(j) + " has empty content");
      }
    }

    if (record.messages[kSystemTurn].content.find(options_.required_system_prompt) == std::string::npos) {
      result.quality_warnings.push_back(prefix + "system prompt missing '" + options_.required_system_prompt + "'");
    }
    if (record.source.empty()) {
      result.quality_warnings.push_back(prefix + "missing 'source' field");
    }
  }
}

void Validator::ValidateVolume(const std::vector<ChatRecord>& records, ValidationResult& result) const {
  if (records.size() < options_.min_records) {
    result.format_errors.push_back("Too few records: " + std::to_string(records.size()) + " < minimum " +
                                   std::to_string(options_.min_records));
  }
}

void Validator::ValidateLengths(const std::vector<ChatRecord>& records, ValidationResult& result) const {
  const auto lengths = AnswerLengths(records);
  if (lengths.empty()) {
    return;
  }
  const double avg = Mean(lengths);
  result.stats["avg_answer_length"] = static_cast<std::int64_t>(std::llround(avg));
  result.stats["min_answer_length"] = *std::min_element(lengths.begin(), lengths.end());
  result.stats["max_answer_length"] = *std::max_element(lengths.begin(), lengths.end());

  if (avg < options_.min_avg_answer_length) {
    result.quality_warnings.push_back("Average answer length (" + Fixed(avg, 0) + ") below threshold (" +
                                      Fixed(options_.min_avg_answer_length, 0) + ")");
  }
  if (avg > options_.max_avg_answer_length) {
    result.quality_warnings.push_back("Average answer length (" + Fixed(avg, 0) + ") above threshold (" +
                                      Fixed(options_.max_avg_answer_length, 0) + ")");
  }
}

void Validator::ValidateSources(const std::vector<ChatRecord>& records, ValidationResult& result) const {
  std::set<std::string> sources;
  for (const auto& record : records) {
    // An absent and an empty source both count as "unknown".
    sources.insert(record.source.empty() ? std::string("unknown") : record.source);
  }
  result.stats["unique_sources"] = sources.size();
  nlohmann::json listed = nlohmann::json::array();
  for (const auto& source : sources) {
    if (listed.size() >= kMaxListedSources) break;
    listed.push_back(source);
  }
  result.stats["source_list"] = std::move(listed);
}

void Validator::CompareAgainstExisting(const std::vector<ChatRecord>& records, const std::filesystem::path& dir,
                                       ValidationResult& result) const {
  CorpusReader reader(reporter_);
  const auto existing = reader.LoadCorpusDir(dir);
  if (existing.empty()) {
    result.comparison_notes.push_back("No existing training data found for comparison");
    return;
  }

  const auto existing_lengths = AnswerLengths(existing);
  const auto new_lengths = AnswerLengths(records);
  if (!existing_lengths.empty() && !new_lengths.empty()) {
    const double existing_avg = Mean(existing_lengths);
    const double new_avg = Mean(new_lengths);
    result.stats["existing_avg_length"] = static_cast<std::int64_t>(std::llround(existing_avg));
    result.stats["new_avg_length"] = static_cast<std::int64_t>(std::llround(new_avg));

    if (existing_avg > 0.0) {
      const double pct_diff = std::fabs(new_avg - existing_avg) / existing_avg * 100.0;
      result.stats["avg_length_diff_pct"] = RoundTo(pct_diff, 1);
      if (pct_diff > options_.max_quality_drop_pct) {
        result.quality_warnings.push_back("Average answer length differs by " + Fixed(pct_diff, 1) +
                                          "% from existing data (existing: " + Fixed(existing_avg, 0) +
                                          ", new: " + Fixed(new_avg, 0) + ")");
      }
    }
  }

  result.comparison_notes.push_back("Compared against " + std::to_string(existing.size()) + " existing records");
  result.stats["existing_record_count"] = existing.size();
  result.stats["addition_pct"] =
      RoundTo(static_cast<double>(records.size()) / static_cast<double>(existing.size()) * 100.0, 1);
}

std::vector<ChatRecord> Validator::SpotCheck(const std::vector<ChatRecord>& records, std::size_t n,
                                             std::uint64_t seed) const {
  std::vector<ChatRecord> samples;
  samples.reserve(std::min(n, records.size()));
  std::mt19937_64 rng(seed);
  std::sample(records.begin(), records.end(), std::back_inserter(samples), n, rng);
  return samples;
}

}  // namespace sftcurator
