/*
 * Service Monitor - Probe Data Structures
 */

#include "probe_types.hpp"

namespace {

std::vector<ClassifiedResult> select(const std::vector<ClassifiedResult>& results,
                                     ProbeStatus status) {
    std::vector<ClassifiedResult> out;
    for (const auto& r : results) {
        if (r.status == status) out.push_back(r);
    }
    return out;
}

} // anonymous namespace

std::vector<ClassifiedResult> RunSummary::down() const {
    return select(results, ProbeStatus::DOWN);
}

std::vector<ClassifiedResult> RunSummary::errors() const {
    return select(results, ProbeStatus::ERROR);
}

bool RunSummary::has_failures() const {
    for (const auto& r : results) {
        if (r.status != ProbeStatus::UP) return true;
    }
    return false;
}

const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:         return "GET";
        case HttpMethod::POST:        return "POST";
        case HttpMethod::UNSUPPORTED: return "UNSUPPORTED";
    }
    return "UNSUPPORTED";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::UNSUPPORTED_METHOD: return "unsupported method";
        case FailureKind::INVALID_DEFINITION: return "invalid definition";
        case FailureKind::TRANSPORT:          return "transport";
        case FailureKind::INTERNAL:           return "internal";
    }
    return "internal";
}

const char* to_string(ProbeStatus status) {
    switch (status) {
        case ProbeStatus::UP:    return "UP";
        case ProbeStatus::DOWN:  return "DOWN";
        case ProbeStatus::ERROR: return "ERROR";
    }
    return "ERROR";
}

const char* to_string(NotificationCategory category) {
    switch (category) {
        case NotificationCategory::SERVICE_DOWN: return "SERVICE_DOWN";
        case NotificationCategory::SCRIPT_ERROR: return "SCRIPT_ERROR";
    }
    return "SCRIPT_ERROR";
}
