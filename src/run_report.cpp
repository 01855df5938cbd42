/*
 * Service Monitor - Run Report
 */

#include "run_report.hpp"
#include "log.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace RunReport {

std::string to_json(const RunSummary& summary) {
    nlohmann::ordered_json results = nlohmann::ordered_json::array();
    for (const auto& r : summary.results) {
        results.push_back({
            {"test", r.test_name},
            {"status", to_string(r.status)},
            {"detail", r.detail},
        });
    }

    nlohmann::ordered_json report;
    report["results"] = std::move(results);
    report["down"] = summary.down().size();
    report["errors"] = summary.errors().size();
    return report.dump(2);
}

bool save_to_file(const RunSummary& summary, const std::string& filename) {
    std::string json = to_json(summary);

    std::ofstream file(filename);
    if (!file.is_open()) {
        Log::warn("Could not open report file for writing: " + filename);
        return false;
    }

    file << json << "\n";
    file.close();

    if (file.fail()) {
        Log::warn("Failed to write report to " + filename);
        return false;
    }

    return true;
}

} // namespace RunReport
