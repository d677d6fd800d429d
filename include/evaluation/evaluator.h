#pragma once

#include "config.h"
#include "evaluation/result_aggregator.h"
#include "stability/stability_calculator.h"
#include "storage/data_storage.h"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace evaluation {

// Stability of every agent on one base prompt
struct PromptEvaluation {
    std::string base_prompt;
    std::map<std::string, stability::StabilityMetrics> stability_metrics; // agent -> metrics
    std::map<std::string, int> num_responses_per_agent;

    nlohmann::json toJSON() const;

    bool operator==(PromptEvaluation const&) const = default;
};

// Per-prompt evaluations in first-observation order of the prompts
struct EvaluationResult {
    std::vector<PromptEvaluation> prompts;

    // nullptr if the prompt was not evaluated
    PromptEvaluation const* find(std::string const& base_prompt) const;

    bool empty() const { return prompts.empty(); }
    size_t size() const { return prompts.size(); }

    // {base_prompt: {stability_metrics: ..., num_responses_per_agent: ...}}
    nlohmann::json toJSON() const;

    bool operator==(EvaluationResult const&) const = default;
};

// Cross-prompt view over every agent's mean_stability
struct Summary {
    double overall_mean = 0.0;
    double overall_min = 0.0;
    double overall_max = 0.0;
    std::map<std::string, double> agent_averages;

    nlohmann::json toJSON() const;

    bool operator==(Summary const&) const = default;
};

// Aggregates records and runs Monte-Carlo stability over every group.
// Owns the random engine so repeated runs with the same seed reproduce.
class Evaluator {
public:
    // Throws ConfigError on invalid stability parameters
    explicit Evaluator(StabilityParams const& params = {});
    Evaluator(stability::StabilityCalculator calculator, int iterations,
              std::optional<uint64_t> seed = std::nullopt);

    // Rebuild the grouping from scratch; returns the number of records kept
    size_t load(std::vector<ResponseRecord> const& records);
    size_t load(storage::DataStorage const& storage);

    EvaluationResult evaluateAll();
    EvaluationResult evaluateAll(int n_iterations);

    // Single-prompt scope; empty result for an unknown prompt
    EvaluationResult evaluatePrompt(std::string const& base_prompt);

    // Evaluates everything, then summarizes
    Summary summary();

    static Summary summarize(EvaluationResult const& result);

    // Restart the random stream (same seed -> same results)
    void reseed(uint64_t seed);

    ResultAggregator const& aggregator() const { return aggregator_; }
    stability::StabilityCalculator const& calculator() const { return calculator_; }
    int iterations() const { return iterations_; }
    size_t droppedCount() const { return aggregator_.droppedCount(); }

private:
    std::optional<PromptEvaluation> evaluateOne(std::string const& base_prompt, int n_iterations);

    stability::StabilityCalculator calculator_;
    int iterations_;
    stability::Rng rng_;
    ResultAggregator aggregator_;
};

} // namespace evaluation
