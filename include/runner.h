#pragma once

#include "config.h"

#include <ostream>

// Load the store named by config.storage, evaluate it and render the report.
// The report goes to config.output.path, or to `out` when no path is set.
// Progress and status lines go to `log` so `out` holds nothing but the report.
// Returns the process exit status.
int runEvaluation(Config const& config, std::ostream& out, std::ostream& log);
