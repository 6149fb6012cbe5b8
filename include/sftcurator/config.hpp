#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "sftcurator/dedup_index.hpp"
#include "sftcurator/quality_filter.hpp"
#include "sftcurator/validator.hpp"

namespace sftcurator {

struct CuratorConfig {
  std::string env_path = ".env";
  std::string training_data_dir;
  std::string pipeline_dir = "data/pipeline";
  std::string content_key = "text";
  std::string source_type;  // converts raw batch files when set

  DedupOptions dedup;
  QualityOptions quality;
  ValidationOptions validation;

  bool skip_validation = false;
  bool auto_merge = false;
  bool dry_run = false;
};

// KEY=VALUE lines; '#' comments, surrounding quotes and a UTF-8 BOM are
// stripped. A missing file yields an empty map.
std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path);

// Unparseable values leave the current setting untouched.
void ApplyEnvOverrides(CuratorConfig& cfg, const std::unordered_map<std::string, std::string>& env);

std::string DetectEnvPathArg(int argc, char** argv, const std::string& default_path);

// Parses flags from `args`, collecting everything else into `positional`.
// Returns false with `err` set on a bad flag, or with `show_help` set.
bool ParseCuratorArgs(const std::vector<std::string>& args, CuratorConfig& cfg,
                      std::vector<std::string>& positional, std::string& err, bool& show_help);

void PrintCuratorUsage();

}  // namespace sftcurator
