#include "sftcurator/config.hpp"
#include "sftcurator/corpus_reader.hpp"
#include "sftcurator/errors.hpp"
#include "sftcurator/pipeline.hpp"
#include "sftcurator/relevance_filter.hpp"
#include "sftcurator/templates.hpp"
#include "sftcurator/validator.hpp"
#include "sftcurator/version_store.hpp"

#include <iostream>
#include <stdexcept>

using namespace sftcurator;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitValidation = 2;
constexpr int kExitStore = 3;

std::optional<std::filesystem::path> TrainingDir(const CuratorConfig& cfg) {
    if (cfg.training_data_dir.empty()) return std::nullopt;
    return std::filesystem::path(cfg.training_data_dir);
}

void PrintValidation(const ValidationResult& result) {
    std::cout << result.Summary() << "\n";
    for (const auto& e : result.format_errors) std::cout << "  error: " << e << "\n";
    for (const auto& w : result.quality_warnings) std::cout << "  warning: " << w << "\n";
    for (const auto& n : result.comparison_notes) std::cout << "  note: " << n << "\n";
    if (!result.stats.empty()) std::cout << "  stats: " << result.stats.dump() << "\n";
}

void PrintFilterStats(const FilterStats& stats) {
    std::cout << "quality filter: passed=" << stats.passed << " rejected=" << stats.TotalRejected() << "\n";
    for (std::size_t i = 0; i < kRejectReasonCount; ++i) {
        if (stats.rejected[i] == 0) continue;
        std::cout << "  " << RejectReasonName(static_cast<RejectReason>(i)) << ": " << stats.rejected[i] << "\n";
    }
}

bool LoadBatch(const CuratorConfig& cfg, const std::vector<std::string>& files, Reporter& reporter,
               std::vector<ChatRecord>& out) {
    CorpusReader reader(reporter);
    for (const auto& file : files) {
        if (cfg.source_type.empty()) {
            if (!reader.LoadChatRecords(file, out)) {
                std::cerr << "failed to read " << file << "\n";
                return false;
            }
            continue;
        }
        std::vector<RawRecord> raw;
        if (!reader.LoadRawRecords(file, raw)) {
            std::cerr << "failed to read " << file << "\n";
            return false;
        }
        const auto relevant = FilterRelevance(raw, cfg.source_type);
        if (relevant.stats.removed_irrelevant > 0) {
            reporter.Info("relevance filter", {{"file", file},
                                               {"kept", std::to_string(relevant.stats.kept)},
                                               {"removed_irrelevant", std::to_string(relevant.stats.removed_irrelevant)}});
        }
        auto converted = ConvertBatch(relevant.kept, cfg.source_type, reporter, cfg.content_key);
        out.insert(out.end(), converted.begin(), converted.end());
    }
    return true;
}

int RunCommand(const CuratorConfig& cfg, const std::vector<std::string>& files, Reporter& reporter) {
    if (files.empty()) {
        std::cerr << "run: no batch files given\n";
        return kExitUsage;
    }
    if (!cfg.source_type.empty() && !IsKnownSourceType(cfg.source_type)) {
        std::cerr << "unknown source type: " << cfg.source_type << "\n";
        return kExitUsage;
    }
    std::vector<ChatRecord> batch;
    if (!LoadBatch(cfg, files, reporter, batch)) return kExitUsage;

    PipelineOptions popts;
    popts.skip_validation = cfg.skip_validation;
    popts.auto_merge = cfg.auto_merge;
    popts.dry_run = cfg.dry_run;
    if (!cfg.source_type.empty()) popts.sources.push_back(cfg.source_type);

    Pipeline pipeline(cfg, reporter);
    const auto report = pipeline.Run(batch, popts);

    PrintFilterStats(report.filter);
    std::cout << "dedup: unique=" << report.dedup.unique << " exact=" << report.dedup.exact_dupes
              << " near=" << report.dedup.near_dupes << "\n";
    if (report.validation) PrintValidation(*report.validation);
    if (report.version) std::cout << "version: " << *report.version << "\n";
    if (report.merged_into) std::cout << "merged into: " << report.merged_into->string() << "\n";
    std::cout << "outcome: " << PipelineOutcomeName(report.outcome) << "\n";

    return report.outcome == PipelineOutcome::kValidationFailed ? kExitValidation : kExitOk;
}

int ValidateCommand(const CuratorConfig& cfg, const std::vector<std::string>& args, Reporter& reporter) {
    if (args.size() != 1) {
        std::cerr << "validate: expected one batch file\n";
        return kExitUsage;
    }
    std::vector<ChatRecord> records;
    CorpusReader reader(reporter);
    if (!reader.LoadChatRecords(args[0], records)) {
        std::cerr << "failed to read " << args[0] << "\n";
        return kExitUsage;
    }
    Validator validator(cfg.validation, reporter);
    const auto result = validator.ValidateAll(records, TrainingDir(cfg));
    PrintValidation(result);
    for (const auto& r : validator.SpotCheck(records, 3)) {
        const std::string* answer = r.AssistantContent();
        std::cout << "  sample [" << r.source << "]: " << (answer ? answer->substr(0, 120) : std::string()) << "\n";
    }
    return result.passed ? kExitOk : kExitValidation;
}

int StatusCommand(VersionStore& store) {
    const auto& versions = store.ListVersions();
    if (versions.empty()) {
        std::cout << "no versions\n";
        return kExitOk;
    }
    for (const auto& v : versions) {
        const bool is_current = store.Current() && *store.Current() == v.version;
        std::cout << (is_current ? "* " : "  ") << v.version << "  " << v.created_at << "  records=" << v.record_count;
        if (v.parent_version) std::cout << "  parent=" << *v.parent_version;
        if (!v.description.empty()) std::cout << "  " << v.description;
        std::cout << "\n";
    }
    return kExitOk;
}

int DiffCommand(VersionStore& store, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "diff: expected two versions\n";
        return kExitUsage;
    }
    const auto d = store.Diff(args[0], args[1]);
    std::cout << d.version_a << ": " << d.records_a << " records\n"
              << d.version_b << ": " << d.records_b << " records\n"
              << "delta: " << (d.delta > 0 ? "+" : "") << d.delta << "\n";
    for (const auto& s : d.new_sources) std::cout << "  + " << s << "\n";
    for (const auto& s : d.removed_sources) std::cout << "  - " << s << "\n";
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintCuratorUsage();
        return kExitUsage;
    }

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        PrintCuratorUsage();
        return kExitOk;
    }

    CuratorConfig cfg;
    cfg.env_path = DetectEnvPathArg(argc, argv, cfg.env_path);
    ApplyEnvOverrides(cfg, ReadEnvFile(cfg.env_path));

    std::vector<std::string> args(argv + 2, argv + argc);
    std::vector<std::string> positional;
    std::string err;
    bool show_help = false;
    if (!ParseCuratorArgs(args, cfg, positional, err, show_help)) {
        if (show_help) {
            PrintCuratorUsage();
            return kExitOk;
        }
        std::cerr << err << "\n";
        return kExitUsage;
    }

    StreamReporter reporter(std::cerr);
    try {
        if (cmd == "run") return RunCommand(cfg, positional, reporter);
        if (cmd == "validate") return ValidateCommand(cfg, positional, reporter);

        VersionStore store(cfg.pipeline_dir, TrainingDir(cfg), reporter);
        if (cmd == "status") return StatusCommand(store);
        if (cmd == "diff") return DiffCommand(store, positional);
        if (cmd == "rollback") {
            if (positional.size() != 1) {
                std::cerr << "rollback: expected one version\n";
                return kExitUsage;
            }
            const auto records = store.Rollback(positional[0]);
            std::cout << "current: " << positional[0] << " (" << records.size() << " records)\n";
            return kExitOk;
        }
        if (cmd == "merge") {
            if (positional.size() > 1) {
                std::cerr << "merge: expected at most one version\n";
                return kExitUsage;
            }
            std::optional<std::string> version;
            if (!positional.empty()) version = positional[0];
            const auto path = store.MergeToTraining(version);
            std::cout << "merged into " << path.string() << "\n";
            return kExitOk;
        }
        if (cmd == "delete") {
            if (positional.size() != 1) {
                std::cerr << "delete: expected one version\n";
                return kExitUsage;
            }
            store.DeleteVersion(positional[0]);
            std::cout << "deleted " << positional[0] << "\n";
            return kExitOk;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "invalid configuration: " << e.what() << "\n";
        return kExitUsage;
    } catch (const CuratorError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return kExitStore;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return kExitStore;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return kExitUsage;
}
