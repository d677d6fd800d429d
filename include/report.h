#pragma once

#include "evaluation/evaluator.h"

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

// Run parameters echoed in report headers
struct ReportContext {
    int iterations = 0;
    std::string metric_name;
    std::string sampling;
    size_t records_loaded = 0;
    size_t records_dropped = 0;
    int precision = 4;
};

void printReport(std::ostream& os, evaluation::EvaluationResult const& result,
                 ReportContext const& context);

void printSummary(std::ostream& os, evaluation::Summary const& summary, int precision = 4);

// {"config": ..., "results": ..., "summary": ...}
nlohmann::json reportToJSON(evaluation::EvaluationResult const& result,
                            evaluation::Summary const& summary, ReportContext const& context);
