#include "evaluation/evaluator.h"
#include "storage/data_storage.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace evaluation;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

ResponseRecord record(std::string prompt, std::string agent, std::string response) {
    ResponseRecord r;
    r.base_prompt = std::move(prompt);
    r.agent_name = std::move(agent);
    r.response = std::move(response);
    return r;
}

StabilityParams seededParams(uint64_t seed, int iterations = 200) {
    StabilityParams params;
    params.iterations = iterations;
    params.seed = seed;
    return params;
}

std::vector<ResponseRecord> sampleRecords() {
    return {
        record("P1", "agentA", "cats are great"),
        record("P1", "agentA", "cats are great"),
        record("P1", "agentA", "dogs are nice"),
        record("P1", "agentB", "only one answer"),
        record("P2", "agentA", "the sky is blue"),
        record("P2", "agentA", "the sky is grey"),
        record("P2", "agentA", "blue sky today"),
        record("P2", "agentA", "it is raining"),
        record("P2", "agentB", "sunny"),
        record("P2", "agentB", "sunny"),
    };
}

} // namespace

void test_mixed_scenario() {
    std::cout << "Testing mixed agent scenario..." << std::endl;

    StabilityParams params = seededParams(42, 1);
    params.sampling = SamplingMode::Fixed;

    Evaluator evaluator(params);
    evaluator.load(std::vector<ResponseRecord>{
        record("P1", "agentA", "cats are great"),
        record("P1", "agentA", "cats are great"),
        record("P1", "agentA", "dogs are nice"),
        record("P1", "agentB", "only one answer"),
    });

    auto result = evaluator.evaluateAll();
    assert(result.size() == 1);

    auto const* p1 = result.find("P1");
    assert(p1 != nullptr);
    assert(p1->num_responses_per_agent.at("agentA") == 3);
    assert(p1->num_responses_per_agent.at("agentB") == 1);

    auto const& a = p1->stability_metrics.at("agentA");
    assert(a.mean_stability > 0.0 && a.mean_stability < 1.0);
    assert(near(a.mean_stability, 1.4 / 3.0));

    auto const& b = p1->stability_metrics.at("agentB");
    assert(b.mean_stability == 1.0);
    assert(b.variance == 0.0);
    assert(b.isDegenerate());

    std::cout << "  PASS" << std::endl;
}

void test_empty_input() {
    std::cout << "Testing empty input..." << std::endl;

    Evaluator evaluator(seededParams(1));
    assert(evaluator.load(std::vector<ResponseRecord>{}) == 0);

    auto result = evaluator.evaluateAll();
    assert(result.empty());
    assert(result.toJSON().empty());

    Summary summary = Evaluator::summarize(result);
    assert(summary.overall_mean == 0.0);
    assert(summary.overall_min == 0.0);
    assert(summary.overall_max == 0.0);
    assert(summary.agent_averages.empty());

    std::cout << "  PASS" << std::endl;
}

void test_malformed_records_dropped() {
    std::cout << "Testing malformed records are dropped..." << std::endl;

    auto records = sampleRecords();
    records.push_back(record("", "agentA", "no prompt"));
    records.push_back(ResponseRecord::fromJSON({{"base_prompt", "P1"}, {"agent_name", 7}, {"response", "x"}}));

    Evaluator evaluator(seededParams(3));
    size_t kept = evaluator.load(records);
    assert(kept == sampleRecords().size());
    assert(evaluator.droppedCount() == 2);

    auto result = evaluator.evaluateAll();
    assert(result.size() == 2);
    assert(result.find("P1")->num_responses_per_agent.at("agentA") == 3);

    std::cout << "  PASS" << std::endl;
}

void test_load_replaces_previous() {
    std::cout << "Testing load replaces previous grouping..." << std::endl;

    Evaluator evaluator(seededParams(4));
    evaluator.load(sampleRecords());
    evaluator.load(std::vector<ResponseRecord>{record("P9", "agentZ", "r")});

    auto result = evaluator.evaluateAll();
    assert(result.size() == 1);
    assert(result.prompts[0].base_prompt == "P9");

    std::cout << "  PASS" << std::endl;
}

void test_result_bounds() {
    std::cout << "Testing result bounds and ordering..." << std::endl;

    Evaluator evaluator(seededParams(5, 500));
    evaluator.load(sampleRecords());
    auto result = evaluator.evaluateAll();

    assert(result.size() == 2);
    assert(result.prompts[0].base_prompt == "P1");
    assert(result.prompts[1].base_prompt == "P2");

    for (auto const& prompt : result.prompts) {
        for (auto const& [agent, m] : prompt.stability_metrics) {
            assert(m.min_stability >= 0.0);
            assert(m.max_stability <= 1.0);
            assert(m.min_stability <= m.mean_stability);
            assert(m.mean_stability <= m.max_stability);
            assert(m.variance >= 0.0);
        }
    }

    auto const& identical = result.find("P2")->stability_metrics.at("agentB");
    assert(identical.mean_stability == 1.0);
    assert(identical.trials == 500);

    std::cout << "  PASS" << std::endl;
}

void test_seed_reproducibility() {
    std::cout << "Testing seeded runs reproduce..." << std::endl;

    Evaluator first(seededParams(77));
    Evaluator second(seededParams(77));
    first.load(sampleRecords());
    second.load(sampleRecords());

    auto r1 = first.evaluateAll();
    auto r2 = second.evaluateAll();
    assert(r1 == r2);

    // Reseeding restarts the stream
    first.reseed(77);
    assert(first.evaluateAll() == r1);

    // Aggregation is untouched by evaluation
    assert(first.aggregator().recordCount() == sampleRecords().size());

    std::cout << "  PASS" << std::endl;
}

void test_evaluate_prompt() {
    std::cout << "Testing evaluatePrompt..." << std::endl;

    Evaluator evaluator(seededParams(8));
    evaluator.load(sampleRecords());

    auto only_p2 = evaluator.evaluatePrompt("P2");
    assert(only_p2.size() == 1);
    assert(only_p2.prompts[0].base_prompt == "P2");
    assert(only_p2.prompts[0].stability_metrics.size() == 2);

    assert(evaluator.evaluatePrompt("missing").empty());

    std::cout << "  PASS" << std::endl;
}

void test_summary() {
    std::cout << "Testing summary statistics..." << std::endl;

    EvaluationResult result;
    PromptEvaluation p1;
    p1.base_prompt = "P1";
    p1.stability_metrics["agentA"].mean_stability = 0.5;
    p1.stability_metrics["agentB"].mean_stability = 1.0;
    PromptEvaluation p2;
    p2.base_prompt = "P2";
    p2.stability_metrics["agentA"].mean_stability = 0.25;
    result.prompts = {p1, p2};

    Summary summary = Evaluator::summarize(result);
    assert(near(summary.overall_mean, 1.75 / 3.0));
    assert(summary.overall_min == 0.25);
    assert(summary.overall_max == 1.0);
    assert(summary.agent_averages.size() == 2);
    assert(near(summary.agent_averages.at("agentA"), 0.375));
    assert(summary.agent_averages.at("agentB") == 1.0);

    auto j = summary.toJSON();
    assert(j.contains("overall_mean_stability"));
    assert(j.contains("overall_min_stability"));
    assert(j.contains("overall_max_stability"));
    assert(j["agent_averages"]["agentB"] == 1.0);

    // summary() evaluates everything and matches summarize() on the same stream
    Evaluator first(seededParams(9));
    Evaluator second(seededParams(9));
    first.load(sampleRecords());
    second.load(sampleRecords());
    assert(first.summary() == Evaluator::summarize(second.evaluateAll()));

    std::cout << "  PASS" << std::endl;
}

void test_load_from_storage() {
    std::cout << "Testing load from storage..." << std::endl;

    storage::MemoryDataStorage store(sampleRecords());
    Evaluator evaluator(seededParams(10));
    assert(evaluator.load(store) == sampleRecords().size());
    assert(evaluator.aggregator().allPrompts().size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_result_json() {
    std::cout << "Testing result JSON..." << std::endl;

    Evaluator evaluator(seededParams(11));
    evaluator.load(sampleRecords());
    auto j = evaluator.evaluateAll().toJSON();

    assert(j.contains("P1"));
    assert(j.contains("P2"));
    auto const& p1 = j["P1"];
    assert(p1["num_responses_per_agent"]["agentA"] == 3);
    auto const& metrics = p1["stability_metrics"]["agentA"];
    for (char const* key : {"mean_stability", "variance", "std_dev", "min_stability", "max_stability"}) {
        assert(metrics.contains(key));
    }

    std::cout << "  PASS" << std::endl;
}

void test_invalid_iterations() {
    std::cout << "Testing invalid iteration counts..." << std::endl;

    bool threw = false;
    try {
        Evaluator evaluator(seededParams(1, 0));
    } catch (ConfigError const&) {
        threw = true;
    }
    assert(threw);

    Evaluator evaluator(seededParams(1));
    evaluator.load(sampleRecords());
    threw = false;
    try {
        evaluator.evaluateAll(-1);
    } catch (ConfigError const&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    test_mixed_scenario();
    test_empty_input();
    test_malformed_records_dropped();
    test_load_replaces_previous();
    test_result_bounds();
    test_seed_reproducibility();
    test_evaluate_prompt();
    test_summary();
    test_load_from_storage();
    test_result_json();
    test_invalid_iterations();

    std::cout << "\nAll evaluator tests passed!" << std::endl;
    return 0;
}
