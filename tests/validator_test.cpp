#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "sftcurator/templates.hpp"
#include "sftcurator/validator.hpp"

using namespace sftcurator;

namespace {

std::filesystem::path MakeTempDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("sftcurator_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::vector<ChatRecord> MakeBatch(std::size_t n, std::size_t answer_len) {
  std::vector<ChatRecord> out;
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(MakeChatRecord("Question " + std::to_string(i), std::string(answer_len, 'a'),
                                 "src_" + std::to_string(i % 3)));
  }
  return out;
}

void TestCleanBatchPasses() {
  Validator validator;
  const auto result = validator.ValidateAll(MakeBatch(12, 400));
  assert(result.passed);
  assert(result.total_records == 12);
  assert(result.format_errors.empty());
  assert(result.quality_warnings.empty());
  assert(result.stats["avg_answer_length"].get<long long>() == 400);
  assert(result.stats["unique_sources"].get<std::size_t>() == 3);
  assert(result.stats["source_list"].size() == 3);
  assert(result.Summary().find("PASSED") != std::string::npos);
}

void TestFormatErrorsFail() {
  auto batch = MakeBatch(12, 400);
  batch[0].messages[1].role = "assistant";
  batch[1].messages[2].content = "   ";
  batch[2].messages.pop_back();

  Validator validator;
  const auto result = validator.ValidateAll(batch);
  assert(!result.passed);
  assert(result.format_errors.size() == 3);
  assert(result.format_errors[0].find("Record 0") == 0);
  assert(result.format_errors[2].find("needs >= 3 messages") != std::string::npos);
  assert(result.Summary().find("FAILED") != std::string::npos);
}

void TestVolumeAndWarnings() {
  Validator validator;
  auto small = validator.ValidateAll(MakeBatch(3, 400));
  assert(!small.passed);
  assert(small.format_errors.size() == 1);
  assert(small.format_errors[0].find("Too few records") == 0);

  auto batch = MakeBatch(12, 50);
  batch[0].messages[0].content = "You are a helpful assistant.";
  batch[1].source.clear();
  const auto result = validator.ValidateAll(batch);
  assert(result.passed);
  // System prompt, missing source and short average.
  assert(result.quality_warnings.size() == 3);
  assert(result.stats["unique_sources"].get<std::size_t>() == 4);

  ValidationOptions opts;
  opts.max_avg_answer_length = 100.0;
  Validator strict(opts);
  const auto long_result = strict.ValidateAll(MakeBatch(12, 400));
  assert(long_result.passed);
  assert(long_result.quality_warnings.size() == 1);
  assert(long_result.quality_warnings[0].find("above threshold") != std::string::npos);
}

void TestCompareAgainstExisting() {
  const auto dir = MakeTempDir("validator_existing");
  {
    std::ofstream out(dir / "train.jsonl");
    for (const auto& r : MakeBatch(4, 200)) out << ToJsonLine(r) << "\n";
  }
  Validator validator;
  const auto result = validator.ValidateAll(MakeBatch(12, 400), dir);
  assert(result.passed);
  assert(result.stats["existing_record_count"].get<std::size_t>() == 4);
  assert(result.stats["existing_avg_length"].get<long long>() == 200);
  assert(result.stats["new_avg_length"].get<long long>() == 400);
  assert(result.stats["avg_length_diff_pct"].get<double>() == 100.0);
  assert(result.stats["addition_pct"].get<double>() == 300.0);
  assert(result.quality_warnings.size() == 1);
  assert(result.comparison_notes.size() == 1);

  const auto missing = validator.ValidateAll(MakeBatch(12, 400), dir / "missing");
  assert(missing.comparison_notes.size() == 1);
  assert(missing.comparison_notes[0].find("No existing training data") == 0);
  std::filesystem::remove_all(dir);
}

void TestSpotCheck() {
  Validator validator;
  const auto batch = MakeBatch(20, 300);
  const auto a = validator.SpotCheck(batch, 5, 42);
  const auto b = validator.SpotCheck(batch, 5, 42);
  assert(a.size() == 5);
  for (std::size_t i = 0; i < a.size(); ++i) {
    assert(a[i].messages[kUserTurn].content == b[i].messages[kUserTurn].content);
  }
  assert(validator.SpotCheck(batch, 50).size() == 20);
  assert(validator.SpotCheck({}, 5).empty());
}

}  // namespace

int main() {
  TestCleanBatchPasses();
  TestFormatErrorsFail();
  TestVolumeAndWarnings();
  TestCompareAgainstExisting();
  TestSpotCheck();
  return 0;
}
