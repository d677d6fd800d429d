#pragma once

#include "config.h"
#include "similarity/similarity_metric.h"

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace stability {

// =============================================================================
// Monte-Carlo Stability Estimation
// =============================================================================
//
// Stability of one agent on one prompt is the mean pairwise similarity of its
// responses. A single full-set score hides how much that number depends on
// which responses happened to be observed, so the calculator repeatedly draws
// subsamples (without replacement), scores each one, and summarizes the
// distribution of trial scores. The spread is a result in its own right.
//
// SAMPLING POLICIES:
//    - Halved: each trial draws max(2, n / 2) responses. Default for
//      comprehensiveStability() and always used by stabilityVariance().
//    - Fixed:  each trial draws sample_size responses, or the whole set when
//      no size is configured. Always used by monteCarloStability().
//    A sample size at or above the population uses the whole set.
//
// RANDOMNESS:
//    Every operation takes an explicit Rng&. With thread_count > 1 the trials
//    are split into contiguous slices, one per worker, and each worker owns an
//    engine seeded from values drawn off the caller's engine. A fixed seed and
//    thread count therefore reproduce the same scores.
// =============================================================================

using Rng = std::mt19937_64;
using ResponseList = std::vector<std::string>;
using ResponseSets = std::map<std::string, ResponseList>; // agent -> responses

struct StabilityMetrics {
    double mean_stability = 1.0;
    double variance = 0.0;
    double std_dev = 0.0;
    double min_stability = 1.0;
    double max_stability = 1.0;
    int trials = 0; // 0 for degenerate groups

    // Fewer than two responses: trivially self-consistent by convention
    static StabilityMetrics degenerate() { return StabilityMetrics{}; }

    static StabilityMetrics fromTrialScores(std::vector<double> const& scores);

    bool isDegenerate() const { return trials == 0; }

    nlohmann::json toJSON() const;

    bool operator==(StabilityMetrics const&) const = default;
};

struct SamplingPolicy {
    SamplingMode mode = SamplingMode::Halved;
    std::optional<int> sample_size;

    static SamplingPolicy halved() { return {SamplingMode::Halved, std::nullopt}; }
    static SamplingPolicy fixed(std::optional<int> size) { return {SamplingMode::Fixed, size}; }
};

class StabilityCalculator {
public:
    // Null metric = JaccardSimilarity. Throws ConfigError on a non-positive
    // sample size or negative thread count.
    explicit StabilityCalculator(std::unique_ptr<similarity::SimilarityMetric> metric = nullptr,
                                 SamplingPolicy policy = {},
                                 int thread_count = 1);

    // Build from [stability] config (metric, sampling, sample_size, thread_count)
    static StabilityCalculator fromParams(StabilityParams const& params);

    similarity::SimilarityMetric const& metric() const { return *metric_; }
    SamplingPolicy const& samplingPolicy() const { return policy_; }
    int threadCount() const { return thread_count_; }

    // Similarity of every unordered pair (i < j), in index order
    std::vector<double> pairwiseSimilarities(ResponseList const& responses) const;

    // Mean pairwise similarity; 1.0 for fewer than two responses
    double stabilityScore(ResponseList const& responses) const;

    // Draw sample_size responses without replacement (whole set if too large)
    static ResponseList resampleTrial(ResponseList const& responses, size_t sample_size, Rng& rng);

    // Responses drawn per trial from a population of n under a policy
    static size_t trialSampleSize(size_t n, SamplingPolicy const& policy);

    // Exactly n_iterations trial scores
    std::vector<double> trialScores(ResponseList const& responses, int n_iterations,
                                    SamplingPolicy const& policy, Rng& rng) const;

    // Mean, population variance / std dev, min and max of trial scores per
    // agent, sampled under the configured policy
    std::map<std::string, StabilityMetrics> comprehensiveStability(
        ResponseSets const& response_sets, int n_iterations, Rng& rng) const;

    // Mean trial score per agent under the fixed policy
    std::map<std::string, double> monteCarloStability(
        ResponseSets const& response_sets, int n_iterations, Rng& rng) const;

    // Trial score variance per agent under the halved policy
    std::map<std::string, double> stabilityVariance(
        ResponseSets const& response_sets, int n_iterations, Rng& rng) const;

private:
    std::unique_ptr<similarity::SimilarityMetric> metric_;
    SamplingPolicy policy_;
    int thread_count_;
};

} // namespace stability
