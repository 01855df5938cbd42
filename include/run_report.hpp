/*
 * Service Monitor - Run Report
 *
 * JSON export of one run's results. Failures to write are non-fatal
 * (warning logged, no exception thrown).
 */

#pragma once

#include "probe_types.hpp"
#include <string>

namespace RunReport {
    // {"results": [{"test", "status", "detail"}...], "down": n, "errors": n}
    std::string to_json(const RunSummary& summary);

    // Returns true on success
    bool save_to_file(const RunSummary& summary, const std::string& filename);
}
