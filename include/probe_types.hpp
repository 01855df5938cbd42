/*
 * Service Monitor - Probe Data Structures
 *
 * Test definitions as loaded from the configuration, the raw outcome of
 * one probe, and the classified results aggregated over a run.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class HttpMethod {
    GET,
    POST,
    UNSUPPORTED
};

struct TestDefinition {
    std::string name;
    std::string url;
    HttpMethod  method = HttpMethod::GET;
    std::string method_name;    // verb as written in the config, e.g. "get"

    std::optional<nlohmann::ordered_json> payload;                // POST only
    std::vector<std::pair<std::string, std::string>> query_args;  // GET only

    std::vector<int> accepted_codes;

    // Set when the definition failed validation; the test then always reports ERROR
    std::string config_error;
};

struct HttpResponse {
    long        status_code = 0;
    std::string body_excerpt;   // first bytes of the body, for logging only
};

enum class FailureKind {
    UNSUPPORTED_METHOD,
    INVALID_DEFINITION,
    TRANSPORT,
    INTERNAL
};

struct ProbeFailure {
    FailureKind kind = FailureKind::TRANSPORT;
    std::string description;
};

// Exactly one of a response or a failure.
using ProbeOutcome = std::variant<HttpResponse, ProbeFailure>;

enum class ProbeStatus {
    UP,
    DOWN,
    ERROR
};

struct ClassifiedResult {
    std::string test_name;
    ProbeStatus status = ProbeStatus::ERROR;
    std::string detail;
};

struct RunSummary {
    std::vector<ClassifiedResult> results;   // configuration order

    std::vector<ClassifiedResult> down() const;
    std::vector<ClassifiedResult> errors() const;
    bool has_failures() const;
};

enum class NotificationCategory {
    SERVICE_DOWN,
    SCRIPT_ERROR
};

struct NotificationEntry {
    std::string      test_name;
    std::string      detail;
    std::string      url;
    std::vector<int> accepted_codes;
};

struct NotificationRequest {
    NotificationCategory           category = NotificationCategory::SERVICE_DOWN;
    std::vector<std::string>       recipients;
    std::vector<NotificationEntry> entries;
};

const char* to_string(HttpMethod method);
const char* to_string(FailureKind kind);
const char* to_string(ProbeStatus status);
const char* to_string(NotificationCategory category);
