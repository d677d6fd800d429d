// Prompt stability evaluation tool
//
// Loads stored agent responses, groups them by base prompt and agent, and
// estimates how consistently each agent answers stylistic variants of the
// same prompt using Monte-Carlo resampling of pairwise response similarity.
//
// Usage:
//   ./prompt-stability [options]

#include "config.h"
#include "enum_utils.h"
#include "runner.h"
#include "similarity/similarity_registry.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

void printUsage(char const* prog) {
    std::cout << "Prompt Stability Evaluation Tool\n\n"
              << "Estimates how consistently each agent answers stylistic variants of the\n"
              << "same base prompt, using Monte-Carlo resampling of response similarity.\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>        Config file (default: config/default.toml or defaults)\n"
              << "  --data-dir <dir>       Directory holding test_results.json (default: test_data)\n"
              << "  --iterations <N>       Monte-Carlo iterations (default: 1000)\n"
              << "  --metric <name>        Similarity metric: " << enum_utils::joinedNames<SimilarityMetricType>() << "\n"
              << "  --sampling <mode>      Trial sampling: halved (default), fixed\n"
              << "  --sample-size <N>      Responses per trial in fixed mode (default: all)\n"
              << "  --prompt <text>        Evaluate only this base prompt\n"
              << "  --seed <N>             Random seed for reproducible runs\n"
              << "  --threads <N>          Worker threads per group (0 = auto, default: 1)\n"
              << "  --format <fmt>         Report format: text (default), json\n"
              << "  --output <path>        Write the report to a file instead of stdout\n"
              << "  --summary-only         Print only summary statistics\n"
              << "  --set <key>=<value>    Override config parameter (can be used multiple times)\n"
              << "  --save-config <path>   Write the resolved config to a TOML file\n"
              << "  --list-metrics         List available similarity metrics\n"
              << "  -h, --help             Show this help\n\n"
              << "Parameter keys use dot notation: section.parameter\n"
              << "  Sections: stability, storage, evaluation, output\n\n"
              << "Examples:\n"
              << "  " << prog << " --iterations 500 --metric length\n"
              << "  " << prog << " --summary-only --seed 42\n"
              << "  " << prog << " --prompt \"Tell me about X\" --format json --output report.json\n";
}

void printMetrics() {
    std::cout << "Available similarity metrics:\n";
    for (auto const& def : similarity::SIMILARITY_REGISTRY) {
        std::cout << "  " << std::left << std::setw(15) << def.name << def.description << "\n";
    }
}

// Parse --set key=value argument
std::optional<std::pair<std::string, std::string>> parseSetArg(std::string const& arg) {
    auto eq_pos = arg.find('=');
    if (eq_pos == std::string::npos) {
        std::cerr << "Invalid --set argument (missing '='): " << arg << "\n";
        return std::nullopt;
    }
    return std::make_pair(arg.substr(0, eq_pos), arg.substr(eq_pos + 1));
}

struct CLIOptions {
    std::string config_path;
    std::string save_config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
};

Config loadConfig(CLIOptions const& opts) {
    if (!opts.config_path.empty()) {
        std::cerr << "Loading config: " << opts.config_path << "\n";
        return Config::load(opts.config_path);
    }
    if (fs::exists("config/default.toml")) {
        std::cerr << "Loading config: config/default.toml\n";
        return Config::load("config/default.toml");
    }
    return Config::defaults();
}

int run(CLIOptions const& opts) {
    Config config = loadConfig(opts);

    for (auto const& [key, value] : opts.overrides) {
        if (!config.applyOverride(key, value)) {
            return 1;
        }
    }
    config.validate();

    if (!opts.save_config_path.empty()) {
        if (!config.save(opts.save_config_path)) {
            return 1;
        }
        std::cerr << "Config saved to " << opts.save_config_path << "\n";
    }

    // Report on stdout, everything else on stderr
    return runEvaluation(config, std::cout, std::cerr);
}

int main(int argc, char* argv[]) {
    CLIOptions opts;

    // Dedicated flags are shorthands for --set overrides, applied in order
    auto flagKey = [](std::string const& arg) -> char const* {
        if (arg == "--data-dir") return "storage.directory";
        if (arg == "--iterations") return "stability.iterations";
        if (arg == "--metric") return "stability.metric";
        if (arg == "--sampling") return "stability.sampling";
        if (arg == "--sample-size") return "stability.sample_size";
        if (arg == "--seed") return "stability.seed";
        if (arg == "--threads") return "stability.thread_count";
        if (arg == "--prompt") return "evaluation.prompt";
        if (arg == "--format") return "output.format";
        if (arg == "--output") return "output.path";
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--list-metrics") {
            printMetrics();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--save-config" && i + 1 < argc) {
            opts.save_config_path = argv[++i];
        } else if (arg == "--summary-only") {
            opts.overrides.emplace_back("evaluation.summary_only", "true");
        } else if (arg == "--set" && i + 1 < argc) {
            auto parsed = parseSetArg(argv[++i]);
            if (!parsed) return 1;
            opts.overrides.push_back(*parsed);
        } else if (auto key = flagKey(arg); key && i + 1 < argc) {
            opts.overrides.emplace_back(key, argv[++i]);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        return run(opts);
    } catch (ConfigError const& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
