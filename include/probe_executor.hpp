/*
 * Service Monitor - HTTP Probe Executor
 *
 * Issues one HTTP request per test definition. Transport problems are
 * returned as ProbeFailure values, never thrown.
 */

#pragma once

#include "probe_types.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

// curl_global_init / curl_global_cleanup for the lifetime of main()
struct CurlGlobal {
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct ProbeSettings {
    long timeout_seconds = 60;          // whole transfer
    long connect_timeout_seconds = 10;  // clamped to timeout_seconds
    long max_redirects = 30;
    size_t body_excerpt_bytes = 512;
    std::string user_agent = "service-monitor/1.0";
};

class ProbeExecutor {
public:
    virtual ~ProbeExecutor() = default;

    // Single attempt, no retry
    virtual ProbeOutcome execute(const TestDefinition& test) = 0;
};

std::unique_ptr<ProbeExecutor> create_curl_executor(const ProbeSettings& settings);

namespace HttpProbe {
    // Connect timeout actually applied, never longer than the whole transfer
    long connect_timeout(const ProbeSettings& settings);

    // Appends URL-encoded query arguments, using '&' if the URL already has a query
    std::string build_url(const std::string& url,
                          const std::vector<std::pair<std::string, std::string>>& query_args);
}
