#include "runner.h"
#include "enum_utils.h"
#include "evaluation/evaluator.h"
#include "report.h"
#include "similarity/similarity_registry.h"
#include "storage/data_storage.h"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace {

int writeReport(Config const& config, std::string const& text, std::ostream& out,
                std::ostream& log) {
    if (config.output.path.empty()) {
        out << text;
        return 0;
    }

    std::ofstream file(config.output.path);
    if (!file) {
        log << "Error: Could not write to " << config.output.path << "\n";
        return 1;
    }
    file << text;
    log << "Report saved to " << config.output.path << "\n";
    return 0;
}

} // namespace

int runEvaluation(Config const& config, std::ostream& out, std::ostream& log) {
    storage::JsonDataStorage store(config.storage.directory, config.storage.filename);
    auto records = store.loadRecords();
    if (records.empty()) {
        log << "No test data found in " << store.dataFile() << "\n";
        return 1;
    }

    auto const& metric_def = similarity::getSimilarityDef(config.stability.metric);
    log << "Loaded " << records.size() << " test results\n";
    log << "Using " << metric_def.name << " similarity metric\n";
    log << "Running Monte-Carlo simulation with " << config.stability.iterations
        << " iterations...\n";

    evaluation::Evaluator evaluator(config.stability);
    evaluator.load(records);

    auto start_time = std::chrono::steady_clock::now();
    auto result = config.evaluation.prompt.empty()
                      ? evaluator.evaluateAll()
                      : evaluator.evaluatePrompt(config.evaluation.prompt);
    auto summary = evaluation::Evaluator::summarize(result);
    double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    if (!config.evaluation.prompt.empty() && result.empty()) {
        log << "Warning: Prompt not found in test data: " << config.evaluation.prompt << "\n";
    }

    ReportContext context;
    context.iterations = config.stability.iterations;
    context.metric_name = metric_def.name;
    context.sampling = enum_utils::toString(config.stability.sampling);
    context.records_loaded = evaluator.aggregator().recordCount();
    context.records_dropped = evaluator.droppedCount();
    context.precision = config.output.precision;

    std::ostringstream report;
    if (config.output.format == OutputFormat::Json) {
        auto j = reportToJSON(result, summary, context);
        report << (config.evaluation.summary_only ? j["summary"] : j)
                      .dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    } else if (config.evaluation.summary_only) {
        printSummary(report, summary, config.output.precision);
    } else {
        printReport(report, result, context);
    }

    int status = writeReport(config, report.str(), out, log);
    log << "Evaluation time: " << std::fixed << std::setprecision(2) << elapsed << "s\n";
    return status;
}
