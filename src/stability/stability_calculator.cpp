#include "stability/stability_calculator.h"
#include "similarity/similarity_registry.h"
#include "stability/stats.h"

#include <algorithm>
#include <iostream>
#include <numeric>
#include <system_error>
#include <thread>

namespace stability {

namespace {

void checkIterations(int n_iterations) {
    if (n_iterations <= 0) {
        throw ConfigError("Monte-Carlo iteration count must be positive (got " +
                          std::to_string(n_iterations) + ")");
    }
}

} // namespace

// =============================================================================
// StabilityMetrics
// =============================================================================

StabilityMetrics StabilityMetrics::fromTrialScores(std::vector<double> const& scores) {
    if (scores.empty()) {
        return degenerate();
    }

    Stats s = Stats::compute(scores);

    StabilityMetrics m;
    m.mean_stability = s.mean;
    m.variance = s.variance;
    m.std_dev = s.stddev;
    m.min_stability = s.min;
    m.max_stability = s.max;
    m.trials = static_cast<int>(s.count);
    return m;
}

nlohmann::json StabilityMetrics::toJSON() const {
    return {
        {"mean_stability", mean_stability},
        {"variance", variance},
        {"std_dev", std_dev},
        {"min_stability", min_stability},
        {"max_stability", max_stability},
        {"trials", trials},
    };
}

// =============================================================================
// StabilityCalculator
// =============================================================================

StabilityCalculator::StabilityCalculator(std::unique_ptr<similarity::SimilarityMetric> metric,
                                         SamplingPolicy policy, int thread_count)
    : metric_(std::move(metric)), policy_(policy), thread_count_(thread_count) {
    if (!metric_) {
        metric_ = std::make_unique<similarity::JaccardSimilarity>();
    }
    if (policy_.sample_size && *policy_.sample_size <= 0) {
        throw ConfigError("Sample size must be positive (got " +
                          std::to_string(*policy_.sample_size) + ")");
    }
    if (thread_count_ < 0) {
        throw ConfigError("Thread count cannot be negative (got " +
                          std::to_string(thread_count_) + ")");
    }
    if (thread_count_ == 0) {
        thread_count_ = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

StabilityCalculator StabilityCalculator::fromParams(StabilityParams const& params) {
    return StabilityCalculator(similarity::createSimilarityMetric(params.metric),
                               SamplingPolicy{params.sampling, params.sample_size},
                               params.resolvedThreadCount());
}

std::vector<double> StabilityCalculator::pairwiseSimilarities(ResponseList const& responses) const {
    std::vector<double> similarities;
    size_t const n = responses.size();
    if (n < 2) {
        return similarities;
    }
    similarities.reserve(n * (n - 1) / 2);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            similarities.push_back(metric_->calculate(responses[i], responses[j]));
        }
    }
    return similarities;
}

double StabilityCalculator::stabilityScore(ResponseList const& responses) const {
    // A single sample cannot disagree with itself
    if (responses.size() < 2) {
        return 1.0;
    }

    return mean(pairwiseSimilarities(responses));
}

ResponseList StabilityCalculator::resampleTrial(ResponseList const& responses, size_t sample_size,
                                                Rng& rng) {
    size_t const n = responses.size();
    if (sample_size >= n) {
        return responses;
    }

    // Partial Fisher-Yates over positions
    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    for (size_t i = 0; i < sample_size; ++i) {
        std::uniform_int_distribution<size_t> pick(i, n - 1);
        std::swap(indices[i], indices[pick(rng)]);
    }

    ResponseList sampled;
    sampled.reserve(sample_size);
    for (size_t i = 0; i < sample_size; ++i) {
        sampled.push_back(responses[indices[i]]);
    }
    return sampled;
}

size_t StabilityCalculator::trialSampleSize(size_t n, SamplingPolicy const& policy) {
    switch (policy.mode) {
    case SamplingMode::Halved:
        return std::max<size_t>(2, n / 2);
    case SamplingMode::Fixed:
        if (policy.sample_size) {
            return static_cast<size_t>(*policy.sample_size);
        }
        return n;
    }
    return n;
}

std::vector<double> StabilityCalculator::trialScores(ResponseList const& responses, int n_iterations,
                                                     SamplingPolicy const& policy, Rng& rng) const {
    checkIterations(n_iterations);

    size_t const sample_size = trialSampleSize(responses.size(), policy);
    std::vector<double> scores(static_cast<size_t>(n_iterations), 0.0);

    int const workers = std::min(thread_count_, n_iterations);
    if (workers <= 1) {
        for (auto& score : scores) {
            score = stabilityScore(resampleTrial(responses, sample_size, rng));
        }
        return scores;
    }

    // One independent engine per worker, seeded from the caller's stream
    std::vector<uint64_t> seeds(workers);
    for (auto& seed : seeds) {
        seed = rng();
    }

    int const chunk_size = n_iterations / workers;

    // Slice t covers [t * chunk_size, next slice) and owns engine seeds[t]
    auto runSlice = [&](int t) {
        int start = t * chunk_size;
        int end = (t == workers - 1) ? n_iterations : start + chunk_size;
        Rng worker_rng(seeds[t]);
        for (int i = start; i < end; ++i) {
            scores[i] = stabilityScore(resampleTrial(responses, sample_size, worker_rng));
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);

    int spawned = 0;
    try {
        for (; spawned < workers; ++spawned) {
            threads.emplace_back(runSlice, spawned);
        }
    } catch (std::system_error const& e) {
        std::cerr << "Warning: Could only start " << spawned << " of " << workers
                  << " worker threads (" << e.what() << "), running the rest inline\n";
    }

    // Same seeds per slice, so the scores do not depend on where a slice ran
    for (int t = spawned; t < workers; ++t) {
        runSlice(t);
    }

    for (auto& th : threads) {
        th.join();
    }

    return scores;
}

std::map<std::string, StabilityMetrics> StabilityCalculator::comprehensiveStability(
    ResponseSets const& response_sets, int n_iterations, Rng& rng) const {
    checkIterations(n_iterations);

    std::map<std::string, StabilityMetrics> results;
    for (auto const& [agent_name, responses] : response_sets) {
        if (responses.size() < 2) {
            results[agent_name] = StabilityMetrics::degenerate();
            continue;
        }
        auto scores = trialScores(responses, n_iterations, policy_, rng);
        results[agent_name] = StabilityMetrics::fromTrialScores(scores);
    }
    return results;
}

std::map<std::string, double> StabilityCalculator::monteCarloStability(
    ResponseSets const& response_sets, int n_iterations, Rng& rng) const {
    checkIterations(n_iterations);

    auto const policy = SamplingPolicy::fixed(policy_.sample_size);

    std::map<std::string, double> results;
    for (auto const& [agent_name, responses] : response_sets) {
        if (responses.size() < 2) {
            results[agent_name] = 1.0;
            continue;
        }
        results[agent_name] = mean(trialScores(responses, n_iterations, policy, rng));
    }
    return results;
}

std::map<std::string, double> StabilityCalculator::stabilityVariance(
    ResponseSets const& response_sets, int n_iterations, Rng& rng) const {
    checkIterations(n_iterations);

    std::map<std::string, double> results;
    for (auto const& [agent_name, responses] : response_sets) {
        if (responses.size() < 2) {
            results[agent_name] = 0.0;
            continue;
        }
        auto scores = trialScores(responses, n_iterations, SamplingPolicy::halved(), rng);
        results[agent_name] = Stats::compute(scores).variance;
    }
    return results;
}

} // namespace stability
