#include "evaluation/evaluator.h"
#include "stability/stats.h"

#include <algorithm>
#include <iostream>

namespace evaluation {

namespace {

uint64_t initialSeed(std::optional<uint64_t> seed) {
    if (seed) {
        return *seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

// =============================================================================
// Result types
// =============================================================================

nlohmann::json PromptEvaluation::toJSON() const {
    nlohmann::json metrics = nlohmann::json::object();
    for (auto const& [agent, m] : stability_metrics) {
        metrics[agent] = m.toJSON();
    }
    return {
        {"stability_metrics", metrics},
        {"num_responses_per_agent", num_responses_per_agent},
    };
}

PromptEvaluation const* EvaluationResult::find(std::string const& base_prompt) const {
    for (auto const& prompt : prompts) {
        if (prompt.base_prompt == base_prompt) {
            return &prompt;
        }
    }
    return nullptr;
}

nlohmann::json EvaluationResult::toJSON() const {
    nlohmann::json j = nlohmann::json::object();
    for (auto const& prompt : prompts) {
        j[prompt.base_prompt] = prompt.toJSON();
    }
    return j;
}

nlohmann::json Summary::toJSON() const {
    return {
        {"overall_mean_stability", overall_mean},
        {"overall_min_stability", overall_min},
        {"overall_max_stability", overall_max},
        {"agent_averages", agent_averages},
    };
}

// =============================================================================
// Evaluator
// =============================================================================

Evaluator::Evaluator(StabilityParams const& params)
    : Evaluator(stability::StabilityCalculator::fromParams(params), params.iterations, params.seed) {}

Evaluator::Evaluator(stability::StabilityCalculator calculator, int iterations,
                     std::optional<uint64_t> seed)
    : calculator_(std::move(calculator)), iterations_(iterations), rng_(initialSeed(seed)) {
    if (iterations_ <= 0) {
        throw ConfigError("Monte-Carlo iteration count must be positive (got " +
                          std::to_string(iterations_) + ")");
    }
}

size_t Evaluator::load(std::vector<ResponseRecord> const& records) {
    aggregator_.clear();
    for (auto const& record : records) {
        aggregator_.addRecord(record);
    }

    if (aggregator_.droppedCount() > 0) {
        std::cerr << "Warning: Dropped " << aggregator_.droppedCount() << " of " << records.size()
                  << " records missing base_prompt, agent_name or response\n";
    }
    return aggregator_.recordCount();
}

size_t Evaluator::load(storage::DataStorage const& storage) {
    return load(storage.loadRecords());
}

std::optional<PromptEvaluation> Evaluator::evaluateOne(std::string const& base_prompt,
                                                       int n_iterations) {
    auto response_sets = aggregator_.responseSets(base_prompt);
    if (response_sets.empty()) {
        return std::nullopt;
    }

    PromptEvaluation evaluation;
    evaluation.base_prompt = base_prompt;
    evaluation.stability_metrics =
        calculator_.comprehensiveStability(response_sets, n_iterations, rng_);
    for (auto const& [agent, responses] : response_sets) {
        evaluation.num_responses_per_agent[agent] = static_cast<int>(responses.size());
    }
    return evaluation;
}

EvaluationResult Evaluator::evaluateAll() {
    return evaluateAll(iterations_);
}

EvaluationResult Evaluator::evaluateAll(int n_iterations) {
    if (n_iterations <= 0) {
        throw ConfigError("Monte-Carlo iteration count must be positive (got " +
                          std::to_string(n_iterations) + ")");
    }

    EvaluationResult result;
    for (auto const& prompt : aggregator_.allPrompts()) {
        if (auto evaluation = evaluateOne(prompt, n_iterations)) {
            result.prompts.push_back(std::move(*evaluation));
        }
    }
    return result;
}

EvaluationResult Evaluator::evaluatePrompt(std::string const& base_prompt) {
    EvaluationResult result;
    if (auto evaluation = evaluateOne(base_prompt, iterations_)) {
        result.prompts.push_back(std::move(*evaluation));
    }
    return result;
}

Summary Evaluator::summary() {
    return summarize(evaluateAll());
}

Summary Evaluator::summarize(EvaluationResult const& result) {
    std::vector<double> all_stabilities;
    std::map<std::string, std::vector<double>> agent_stabilities;

    for (auto const& prompt : result.prompts) {
        for (auto const& [agent, metrics] : prompt.stability_metrics) {
            all_stabilities.push_back(metrics.mean_stability);
            agent_stabilities[agent].push_back(metrics.mean_stability);
        }
    }

    Summary summary;
    if (all_stabilities.empty()) {
        return summary;
    }

    summary.overall_mean = stability::mean(all_stabilities);
    summary.overall_min = *std::min_element(all_stabilities.begin(), all_stabilities.end());
    summary.overall_max = *std::max_element(all_stabilities.begin(), all_stabilities.end());
    for (auto const& [agent, values] : agent_stabilities) {
        summary.agent_averages[agent] = stability::mean(values);
    }
    return summary;
}

void Evaluator::reseed(uint64_t seed) {
    rng_.seed(seed);
}

} // namespace evaluation
