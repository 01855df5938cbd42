/*
 * Service Monitor - Run Aggregator
 */

#include "probe_run.hpp"
#include "log.hpp"
#include "result_classifier.hpp"
#include <stdexcept>

namespace {

std::string codes_text(const std::vector<int>& codes) {
    std::string out = "[";
    for (size_t i = 0; i < codes.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(codes[i]);
    }
    return out + "]";
}

const TestDefinition* find_test(const std::vector<TestDefinition>& tests, const std::string& name) {
    for (const auto& t : tests) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

NotificationRequest make_request(NotificationCategory category,
                                 const std::vector<std::string>& recipients,
                                 const std::vector<ClassifiedResult>& results,
                                 const std::vector<TestDefinition>& tests) {
    NotificationRequest request;
    request.category = category;
    request.recipients = recipients;
    for (const auto& r : results) {
        NotificationEntry entry;
        entry.test_name = r.test_name;
        entry.detail = r.detail;
        if (const TestDefinition* t = find_test(tests, r.test_name)) {
            entry.url = t->url;
            entry.accepted_codes = t->accepted_codes;
        }
        request.entries.push_back(std::move(entry));
    }
    return request;
}

} // anonymous namespace

ProbeRun::ProbeRun(std::unique_ptr<ProbeExecutor> e) : executor(std::move(e)) {
    if (!executor) throw std::invalid_argument("ProbeRun requires an executor");
}

RunSummary ProbeRun::run(const std::vector<TestDefinition>& tests) {
    RunSummary summary;
    summary.results.reserve(tests.size());

    for (const auto& test : tests) {
        summary.results.push_back(probe(test));
    }

    log_summary(summary);
    return summary;
}

ClassifiedResult ProbeRun::probe(const TestDefinition& test) {
    Log::debug("Probing `" + test.name + "`: " + to_string(test.method) + " " + test.url);

    ProbeOutcome outcome;
    try {
        if (!test.config_error.empty()) {
            outcome = ProbeFailure{FailureKind::INVALID_DEFINITION, test.config_error};
        } else {
            outcome = executor->execute(test);
        }
    } catch (const std::exception& e) {
        outcome = ProbeFailure{FailureKind::INTERNAL, std::string("Unexpected failure: ") + e.what()};
    }

    ClassifiedResult result = ResultClassifier::classify(test, outcome);

    switch (result.status) {
        case ProbeStatus::UP:
            Log::debug("Test `" + test.name + "` is up (" + result.detail + ")");
            break;
        case ProbeStatus::DOWN: {
            std::string message = "Test `" + test.name + "` is down: " + test.url +
                                  " expected " + codes_text(test.accepted_codes) +
                                  ", got " + result.detail;
            if (const auto* response = std::get_if<HttpResponse>(&outcome)) {
                if (!response->body_excerpt.empty()) message += "\nContent: " + response->body_excerpt;
            }
            Log::error(message);
            break;
        }
        case ProbeStatus::ERROR:
            Log::error("Unexpected failure for `" + test.name + "`: " + result.detail);
            break;
    }

    return result;
}

void ProbeRun::log_summary(const RunSummary& summary) {
    size_t down = summary.down().size();
    size_t errors = summary.errors().size();
    size_t up = summary.results.size() - down - errors;

    std::string line = "Probed " + std::to_string(summary.results.size()) + " test(s): " +
                       std::to_string(up) + " up, " + std::to_string(down) + " down, " +
                       std::to_string(errors) + " error(s)";
    if (summary.has_failures()) {
        Log::warn(line);
    } else {
        Log::info(line);
    }
}

std::vector<NotificationRequest> ProbeRun::plan_notifications(
    const RunSummary& summary,
    const std::vector<TestDefinition>& tests,
    const Contacts& contacts) {
    std::vector<NotificationRequest> requests;

    auto down = summary.down();
    if (!down.empty()) {
        requests.push_back(make_request(NotificationCategory::SERVICE_DOWN,
                                        contacts.recipients, down, tests));
    }

    auto errors = summary.errors();
    if (!errors.empty()) {
        requests.push_back(make_request(NotificationCategory::SCRIPT_ERROR,
                                        contacts.script_recipients, errors, tests));
    }

    return requests;
}
