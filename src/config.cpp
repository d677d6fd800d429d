#include "config.h"
#include "enum_utils.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <toml++/toml.hpp>

namespace {

template <typename E> E parseEnum(std::string const& str, std::string_view key) {
    if (auto value = enum_utils::fromString<E>(str)) {
        return *value;
    }
    throw ConfigError("Unknown " + std::string(key) + ": '" + str + "' (expected one of: " +
                      enum_utils::joinedNames<E>() + ")");
}

bool parseBool(std::string const& str) {
    if (str == "true" || str == "1" || str == "yes")
        return true;
    if (str == "false" || str == "0" || str == "no")
        return false;
    throw ConfigError("Expected a boolean, got '" + str + "'");
}

// Safe value extraction helpers
template <typename T> T get_or(toml::table const& tbl, std::string_view key, T default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<T>()) {
            return *val;
        }
    }
    return default_val;
}

std::string get_string_or(toml::table const& tbl, std::string_view key, std::string default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<std::string>()) {
            return *val;
        }
    }
    return default_val;
}

// TOML basic string: quotes, backslashes and control characters escaped
std::string quoted(std::string const& str) {
    std::string out = "\"";
    for (char c : str) {
        auto uc = static_cast<unsigned char>(c);
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            if (uc < 0x20 || uc == 0x7f) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(uc));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
    return out;
}

// Unsigned seed; a leading '-' is rejected instead of wrapping
uint64_t parseSeed(std::string const& str) {
    auto first = str.find_first_not_of(" \t");
    if (first != std::string::npos && str[first] == '-') {
        throw ConfigError("stability.seed cannot be negative (got '" + str + "')");
    }
    return std::stoull(str);
}

} // namespace

int StabilityParams::resolvedThreadCount() const {
    if (thread_count > 0) {
        return thread_count;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

Config Config::defaults() {
    return Config{};
}

// Load config values from a TOML table into an existing config (for include support)
static void loadConfigFromTable(Config& config, toml::table const& tbl) {
    if (auto st = tbl["stability"].as_table()) {
        auto metric_str = get_string_or(*st, "metric", "");
        if (!metric_str.empty()) {
            config.stability.metric = parseEnum<SimilarityMetricType>(metric_str, "similarity metric");
        }
        config.stability.iterations = get_or(*st, "iterations", config.stability.iterations);
        auto sampling_str = get_string_or(*st, "sampling", "");
        if (!sampling_str.empty()) {
            config.stability.sampling = parseEnum<SamplingMode>(sampling_str, "sampling mode");
        }
        if (st->contains("sample_size")) {
            config.stability.sample_size = get_or(*st, "sample_size", 0);
        }
        if (st->contains("seed")) {
            config.stability.seed = static_cast<uint64_t>(get_or<int64_t>(*st, "seed", 0));
        }
        config.stability.thread_count = get_or(*st, "thread_count", config.stability.thread_count);
    }

    if (auto storage = tbl["storage"].as_table()) {
        auto dir = get_string_or(*storage, "directory", "");
        if (!dir.empty()) {
            config.storage.directory = dir;
        }
        auto filename = get_string_or(*storage, "filename", "");
        if (!filename.empty()) {
            config.storage.filename = filename;
        }
    }

    if (auto eval = tbl["evaluation"].as_table()) {
        config.evaluation.prompt = get_string_or(*eval, "prompt", config.evaluation.prompt);
        config.evaluation.summary_only = get_or(*eval, "summary_only", config.evaluation.summary_only);
    }

    if (auto out = tbl["output"].as_table()) {
        auto format_str = get_string_or(*out, "format", "");
        if (!format_str.empty()) {
            config.output.format = parseEnum<OutputFormat>(format_str, "output format");
        }
        config.output.path = get_string_or(*out, "path", config.output.path);
        config.output.precision = get_or(*out, "precision", config.output.precision);
    }
}

Config Config::load(std::string const& path) {
    Config config;

    if (!std::filesystem::exists(path)) {
        std::cerr << "Warning: Config file not found: " << path << ", using defaults\n";
        return config;
    }

    try {
        auto tbl = toml::parse_file(path);
        std::string base_path = std::filesystem::path(path).parent_path().string();
        if (base_path.empty()) base_path = ".";

        // Includes provide base values that this file can override
        if (auto includes = tbl["include"].as_array()) {
            for (auto const& inc : *includes) {
                if (auto inc_path = inc.value<std::string>()) {
                    std::filesystem::path full_path;
                    if (std::filesystem::path(*inc_path).is_absolute()) {
                        full_path = *inc_path;
                    } else {
                        full_path = std::filesystem::path(base_path) / *inc_path;
                    }
                    if (std::filesystem::exists(full_path)) {
                        try {
                            auto inc_tbl = toml::parse_file(full_path.string());
                            loadConfigFromTable(config, inc_tbl);
                        } catch (toml::parse_error const& err) {
                            std::cerr << "Error parsing included config " << full_path << ": "
                                      << err.description() << "\n";
                        }
                    } else {
                        std::cerr << "Warning: Included config not found: " << full_path << "\n";
                    }
                }
            }
        }

        loadConfigFromTable(config, tbl);

    } catch (toml::parse_error const& err) {
        std::cerr << "Error parsing config: " << err.description() << "\n";
        std::cerr << "Using defaults\n";
        return Config{};
    }

    return config;
}

void Config::validate() const {
    if (stability.iterations <= 0) {
        throw ConfigError("stability.iterations must be positive (got " +
                          std::to_string(stability.iterations) + ")");
    }
    if (stability.sample_size && *stability.sample_size <= 0) {
        throw ConfigError("stability.sample_size must be positive (got " +
                          std::to_string(*stability.sample_size) + ")");
    }
    if (stability.thread_count < 0) {
        throw ConfigError("stability.thread_count cannot be negative (got " +
                          std::to_string(stability.thread_count) + ")");
    }
    if (output.precision < 0) {
        throw ConfigError("output.precision cannot be negative");
    }
    if (storage.filename.empty()) {
        throw ConfigError("storage.filename cannot be empty");
    }
}

bool Config::applyOverride(std::string const& key, std::string const& value) {
    // Parse dot-notation key (e.g., "stability.iterations")
    auto dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        std::cerr << "Invalid parameter key (missing section): " << key << "\n";
        return false;
    }

    std::string section = key.substr(0, dot_pos);
    std::string param = key.substr(dot_pos + 1);

    try {
        if (section == "stability") {
            if (param == "metric") {
                stability.metric = parseEnum<SimilarityMetricType>(value, "similarity metric");
            } else if (param == "iterations") {
                stability.iterations = std::stoi(value);
            } else if (param == "sampling") {
                stability.sampling = parseEnum<SamplingMode>(value, "sampling mode");
            } else if (param == "sample_size") {
                stability.sample_size = std::stoi(value);
            } else if (param == "seed") {
                stability.seed = parseSeed(value);
            } else if (param == "thread_count") {
                stability.thread_count = std::stoi(value);
            } else {
                std::cerr << "Unknown stability parameter: " << param << "\n";
                return false;
            }
        } else if (section == "storage") {
            if (param == "directory") {
                storage.directory = value;
            } else if (param == "filename") {
                storage.filename = value;
            } else {
                std::cerr << "Unknown storage parameter: " << param << "\n";
                return false;
            }
        } else if (section == "evaluation") {
            if (param == "prompt") {
                evaluation.prompt = value;
            } else if (param == "summary_only") {
                evaluation.summary_only = parseBool(value);
            } else {
                std::cerr << "Unknown evaluation parameter: " << param << "\n";
                return false;
            }
        } else if (section == "output") {
            if (param == "format") {
                output.format = parseEnum<OutputFormat>(value, "output format");
            } else if (param == "path") {
                output.path = value;
            } else if (param == "precision") {
                output.precision = std::stoi(value);
            } else {
                std::cerr << "Unknown output parameter: " << param << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown section: " << section << "\n";
            return false;
        }
    } catch (std::exception const& e) {
        std::cerr << "Error parsing value for " << key << ": " << e.what() << "\n";
        return false;
    }

    return true;
}

bool Config::save(std::string const& path) const {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return false;
    }

    file << "[stability]\n";
    file << "metric = " << quoted(enum_utils::toString(stability.metric)) << "\n";
    file << "iterations = " << stability.iterations << "\n";
    file << "sampling = " << quoted(enum_utils::toString(stability.sampling)) << "\n";
    if (stability.sample_size) {
        file << "sample_size = " << *stability.sample_size << "\n";
    }
    if (stability.seed) {
        // TOML integers are signed 64-bit
        file << "seed = " << static_cast<int64_t>(*stability.seed) << "\n";
    }
    file << "thread_count = " << stability.thread_count << "\n";
    file << "\n";

    file << "[storage]\n";
    file << "directory = " << quoted(storage.directory) << "\n";
    file << "filename = " << quoted(storage.filename) << "\n";
    file << "\n";

    file << "[evaluation]\n";
    file << "prompt = " << quoted(evaluation.prompt) << "\n";
    file << "summary_only = " << (evaluation.summary_only ? "true" : "false") << "\n";
    file << "\n";

    file << "[output]\n";
    file << "format = " << quoted(enum_utils::toString(output.format)) << "\n";
    file << "path = " << quoted(output.path) << "\n";
    file << "precision = " << output.precision << "\n";
    return static_cast<bool>(file);
}
