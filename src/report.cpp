#include "report.h"

#include <iomanip>

void printReport(std::ostream& os, evaluation::EvaluationResult const& result,
                 ReportContext const& context) {
    os << std::string(80, '=') << "\n";
    os << "PROMPT STABILITY EVALUATION REPORT\n";
    os << std::string(80, '=') << "\n\n";

    os << "Monte-Carlo Iterations: " << context.iterations << "\n";
    os << "Similarity Metric: " << context.metric_name << "\n";
    os << "Sampling: " << context.sampling << "\n";
    os << "Records: " << context.records_loaded << " loaded";
    if (context.records_dropped > 0) {
        os << ", " << context.records_dropped << " dropped";
    }
    os << "\n";
    os << "Total Prompts Evaluated: " << result.size() << "\n\n";

    os << std::fixed << std::setprecision(context.precision);

    for (auto const& prompt : result.prompts) {
        os << std::string(80, '-') << "\n";
        os << "Base Prompt: " << prompt.base_prompt << "\n";
        os << std::string(80, '-') << "\n";

        for (auto const& [agent, m] : prompt.stability_metrics) {
            int count = 0;
            auto it = prompt.num_responses_per_agent.find(agent);
            if (it != prompt.num_responses_per_agent.end()) {
                count = it->second;
            }

            os << "\nAgent: " << agent << "\n";
            os << "  Number of Responses: " << count << "\n";
            os << "  Mean Stability: " << m.mean_stability << "\n";
            os << "  Stability Std Dev: " << m.std_dev << "\n";
            os << "  Stability Variance: " << m.variance << "\n";
            os << "  Min Stability: " << m.min_stability << "\n";
            os << "  Max Stability: " << m.max_stability << "\n";
            if (m.isDegenerate()) {
                os << "  (fewer than 2 responses, stability by convention)\n";
            }
        }
        os << "\n";
    }

    os << std::string(80, '=') << "\n";
}

void printSummary(std::ostream& os, evaluation::Summary const& summary, int precision) {
    os << std::string(80, '=') << "\n";
    os << "SUMMARY STATISTICS\n";
    os << std::string(80, '=') << "\n";

    os << std::fixed << std::setprecision(precision);
    os << "Overall Mean Stability: " << summary.overall_mean << "\n";
    os << "Overall Min Stability: " << summary.overall_min << "\n";
    os << "Overall Max Stability: " << summary.overall_max << "\n";

    os << "\nAgent Averages:\n";
    if (summary.agent_averages.empty()) {
        os << "  (none)\n";
    }
    for (auto const& [agent, average] : summary.agent_averages) {
        os << "  " << agent << ": " << average << "\n";
    }
}

nlohmann::json reportToJSON(evaluation::EvaluationResult const& result,
                            evaluation::Summary const& summary, ReportContext const& context) {
    nlohmann::json j;
    j["config"] = {
        {"iterations", context.iterations},
        {"metric", context.metric_name},
        {"sampling", context.sampling},
        {"records_loaded", context.records_loaded},
        {"records_dropped", context.records_dropped},
    };
    j["results"] = result.toJSON();
    j["summary"] = summary.toJSON();
    return j;
}
