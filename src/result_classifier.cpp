/*
 * Service Monitor - Result Classifier
 */

#include "result_classifier.hpp"
#include <algorithm>

namespace {

struct OutcomeVisitor {
    const TestDefinition& test;

    ClassifiedResult operator()(const HttpResponse& response) const {
        const auto& codes = test.accepted_codes;
        bool accepted = std::find(codes.begin(), codes.end(), response.status_code) != codes.end();
        return {test.name, accepted ? ProbeStatus::UP : ProbeStatus::DOWN,
                std::to_string(response.status_code)};
    }

    ClassifiedResult operator()(const ProbeFailure& failure) const {
        std::string detail = failure.description;
        if (detail.empty()) detail = std::string("Probe failed (") + to_string(failure.kind) + ")";
        return {test.name, ProbeStatus::ERROR, detail};
    }
};

} // anonymous namespace

namespace ResultClassifier {

ClassifiedResult classify(const TestDefinition& test, const ProbeOutcome& outcome) {
    // Configuration errors, reported the same way whatever the endpoint answered
    if (!test.config_error.empty()) {
        return {test.name, ProbeStatus::ERROR, "Invalid test definition: " + test.config_error};
    }
    if (test.accepted_codes.empty()) {
        return {test.name, ProbeStatus::ERROR, "No accepted status codes configured"};
    }
    return std::visit(OutcomeVisitor{test}, outcome);
}

} // namespace ResultClassifier
