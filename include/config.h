#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// Thrown for configuration values that cannot be used (zero iterations,
// non-positive sample size, unknown metric name, ...)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(std::string const& message) : std::runtime_error(message) {}
};

// Similarity strategy used to compare two responses
enum class SimilarityMetricType {
    Jaccard,      // Word-set overlap
    Length,       // Character length ratio
    EditDistance, // Normalized Levenshtein distance
    Cosine        // Term-frequency cosine
};

// How many responses each Monte-Carlo trial draws
enum class SamplingMode {
    Halved, // max(2, n / 2), used for dispersion estimation
    Fixed   // stability.sample_size, or the whole set when unset
};

enum class OutputFormat { Text, Json };

struct StabilityParams {
    SimilarityMetricType metric = SimilarityMetricType::Jaccard;
    int iterations = 1000;
    SamplingMode sampling = SamplingMode::Halved;

    // Only consulted by SamplingMode::Fixed
    std::optional<int> sample_size;

    // Unset = seed from std::random_device
    std::optional<uint64_t> seed;

    // 1 = sequential trials, 0 = auto (hardware concurrency)
    int thread_count = 1;

    int resolvedThreadCount() const;
};

struct StorageParams {
    std::string directory = "test_data";
    std::string filename = "test_results.json";
};

struct EvaluationParams {
    // Empty = evaluate every prompt
    std::string prompt;
    bool summary_only = false;
};

struct OutputParams {
    OutputFormat format = OutputFormat::Text;
    std::string path; // Empty = stdout
    int precision = 4;
};

struct Config {
    StabilityParams stability;
    StorageParams storage;
    EvaluationParams evaluation;
    OutputParams output;

    // Load from TOML file
    static Config load(std::string const& path);

    // Load with defaults
    static Config defaults();

    // Save to TOML file; false if the file could not be written
    bool save(std::string const& path) const;

    // Apply a parameter override from CLI (e.g., "stability.iterations", "500")
    // Returns true if the key was recognized and applied
    bool applyOverride(std::string const& key, std::string const& value);

    // Throws ConfigError on values no computation can start from
    void validate() const;
};
