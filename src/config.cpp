#include "sftcurator/config.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace sftcurator {

namespace {

std::string Trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(start, end - start);
}

bool ParseSize(const std::string& s, std::size_t& out) {
  try {
    std::size_t pos = 0;
    const unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size() || s.front() == '-') return false;
    if (v > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseDouble(const std::string& s, double& out) {
  try {
    std::size_t pos = 0;
    const double v = std::stod(s, &pos);
    if (pos != s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

void SetSize(const std::string& s, std::size_t& field) {
  std::size_t v = 0;
  if (ParseSize(Trim(s), v)) field = v;
}

void SetDouble(const std::string& s, double& field) {
  double v = 0.0;
  if (ParseDouble(Trim(s), v)) field = v;
}

}  // namespace

std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path) {
  std::unordered_map<std::string, std::string> env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') continue;
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

void ApplyEnvOverrides(CuratorConfig& cfg, const std::unordered_map<std::string, std::string>& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    return it == env.end() ? nullptr : &it->second;
  };
  if (auto v = get("TRAINING_DATA_DIR")) cfg.training_data_dir = *v;
  if (auto v = get("PIPELINE_DIR")) cfg.pipeline_dir = *v;
  if (auto v = get("CONTENT_KEY")) cfg.content_key = *v;
  if (auto v = get("SOURCE_TYPE")) cfg.source_type = *v;

  if (auto v = get("DEDUP_NUM_PERM")) SetSize(*v, cfg.dedup.num_perm);
  if (auto v = get("DEDUP_LSH_THRESHOLD")) SetDouble(*v, cfg.dedup.lsh_threshold);
  if (auto v = get("DEDUP_SHINGLE_SIZE")) SetSize(*v, cfg.dedup.shingle_size);

  if (auto v = get("MIN_CONTENT_LENGTH")) SetSize(*v, cfg.quality.min_content_length);
  if (auto v = get("MIN_ANSWER_LENGTH")) SetSize(*v, cfg.quality.min_answer_length);
  if (auto v = get("MAX_ANSWER_LENGTH")) SetSize(*v, cfg.quality.max_answer_length);
  if (auto v = get("MAX_TABLE_RATIO")) SetDouble(*v, cfg.quality.max_table_ratio);
  if (auto v = get("MIN_ALPHA_RATIO")) SetDouble(*v, cfg.quality.min_alpha_ratio);
  if (auto v = get("MAX_IMAGE_ARTIFACTS")) SetSize(*v, cfg.quality.max_image_artifacts);

  if (auto v = get("MIN_RECORDS")) SetSize(*v, cfg.validation.min_records);
  if (auto v = get("MAX_QUALITY_DROP_PCT")) SetDouble(*v, cfg.validation.max_quality_drop_pct);
  if (auto v = get("MIN_AVG_ANSWER_LENGTH")) SetDouble(*v, cfg.validation.min_avg_answer_length);
  if (auto v = get("MAX_AVG_ANSWER_LENGTH")) SetDouble(*v, cfg.validation.max_avg_answer_length);
  if (auto v = get("REQUIRED_SYSTEM_PROMPT")) cfg.validation.required_system_prompt = *v;
}

std::string DetectEnvPathArg(int argc, char** argv, const std::string& default_path) {
  std::string path = default_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--env" && i + 1 < argc) {
      path = argv[++i];
    }
  }
  return path;
}

bool ParseCuratorArgs(const std::vector<std::string>& args, CuratorConfig& cfg,
                      std::vector<std::string>& positional, std::string& err, bool& show_help) {
  show_help = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    auto require_value = [&]() -> const std::string* {
      if (i + 1 >= args.size()) {
        err = "missing value for " + arg;
        return nullptr;
      }
      return &args[++i];
    };
    auto require_size = [&](std::size_t& field) -> bool {
      const std::string* v = require_value();
      if (!v) return false;
      if (!ParseSize(*v, field)) {
        err = "invalid " + arg + ": " + *v;
        return false;
      }
      return true;
    };
    auto require_double = [&](double& field) -> bool {
      const std::string* v = require_value();
      if (!v) return false;
      if (!ParseDouble(*v, field)) {
        err = "invalid " + arg + ": " + *v;
        return false;
      }
      return true;
    };
    auto require_string = [&](std::string& field) -> bool {
      const std::string* v = require_value();
      if (!v) return false;
      field = *v;
      return true;
    };

    bool ok = true;
    if (arg == "--help" || arg == "-h") {
      show_help = true;
      return false;
    } else if (arg == "--env") {
      ok = require_string(cfg.env_path);
    } else if (arg == "--training-dir") {
      ok = require_string(cfg.training_data_dir);
    } else if (arg == "--pipeline-dir") {
      ok = require_string(cfg.pipeline_dir);
    } else if (arg == "--content-key") {
      ok = require_string(cfg.content_key);
    } else if (arg == "--source-type") {
      ok = require_string(cfg.source_type);
    } else if (arg == "--num-perm") {
      ok = require_size(cfg.dedup.num_perm);
    } else if (arg == "--lsh-threshold") {
      ok = require_double(cfg.dedup.lsh_threshold);
    } else if (arg == "--shingle-size") {
      ok = require_size(cfg.dedup.shingle_size);
    } else if (arg == "--min-answer-length") {
      ok = require_size(cfg.quality.min_answer_length);
    } else if (arg == "--max-answer-length") {
      ok = require_size(cfg.quality.max_answer_length);
    } else if (arg == "--min-records") {
      ok = require_size(cfg.validation.min_records);
    } else if (arg == "--required-system-prompt") {
      ok = require_string(cfg.validation.required_system_prompt);
    } else if (arg == "--skip-validation") {
      cfg.skip_validation = true;
    } else if (arg == "--auto-merge") {
      cfg.auto_merge = true;
    } else if (arg == "--dry-run") {
      cfg.dry_run = true;
    } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      err = "unknown option: " + arg;
      return false;
    } else {
      positional.push_back(arg);
    }
    if (!ok) return false;
  }
  return true;
}

void PrintCuratorUsage() {
  std::cerr << "SFT corpus curator\n"
            << "Usage:\n"
            << "  sftcurator run <batch.jsonl...> [options]   filter, dedup, validate, snapshot\n"
            << "  sftcurator validate <batch.jsonl>           validate a chat-format batch\n"
            << "  sftcurator status                           list snapshot history\n"
            << "  sftcurator diff <version_a> <version_b>     compare two snapshots\n"
            << "  sftcurator rollback <version>               move current to an older snapshot\n"
            << "  sftcurator merge [version]                  append a snapshot to train.jsonl\n"
            << "  sftcurator delete <version>                 remove a non-current snapshot\n\n"
            << "Options:\n"
            << "  --env <path>                  Path to .env (default: .env)\n"
            << "  --training-dir <dir>          Existing corpus dir with train.jsonl / validation.jsonl\n"
            << "  --pipeline-dir <dir>          Snapshot store (default: data/pipeline)\n"
            << "  --source-type <name>          Convert raw batch records (nist_csrc, federal_register, ecfr,\n"
            << "                                nist_sp800_171, nist_csf, dod_documents)\n"
            << "  --content-key <name>          Raw record text field (default: text)\n"
            << "  --num-perm <n>                MinHash permutations (default: 128)\n"
            << "  --lsh-threshold <x>           Near-duplicate Jaccard threshold (default: 0.8)\n"
            << "  --shingle-size <n>            Shingle length in characters (default: 5)\n"
            << "  --min-answer-length <n>       Minimum answer length (default: 200)\n"
            << "  --max-answer-length <n>       Maximum answer length (default: 8000)\n"
            << "  --min-records <n>             Minimum batch size (default: 10)\n"
            << "  --required-system-prompt <s>  Substring expected in system prompts (default: CMMC)\n"
            << "  --skip-validation             Snapshot even if validation fails\n"
            << "  --auto-merge                  Merge the new snapshot into training data\n"
            << "  --dry-run                     Stop before creating a snapshot\n";
}

}  // namespace sftcurator
