/*
 * Service Monitor - HTTP Probe Executor
 *
 * libcurl implementation. One easy handle per request, bounded by a
 * connect timeout and a total transfer timeout.
 */

#include "probe_executor.hpp"
#include "curl_handle.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

struct BodySink {
    std::string excerpt;
    size_t limit = 0;
};

// Keeps the first bytes of the body; the rest is read and dropped
size_t excerpt_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* sink = static_cast<BodySink*>(userp);
    if (sink->excerpt.size() < sink->limit) {
        size_t take = std::min(total, sink->limit - sink->excerpt.size());
        sink->excerpt.append(static_cast<char*>(contents), take);
    }
    return total;
}

std::string describe_error(CURLcode code, const char* errbuf) {
    std::string description = curl_easy_strerror(code);
    if (errbuf[0] != '\0') {
        description += ": ";
        description += errbuf;
    }
    return description;
}

class CurlProbeExecutor : public ProbeExecutor {
public:
    explicit CurlProbeExecutor(const ProbeSettings& s) : settings(s) {
        settings.connect_timeout_seconds = HttpProbe::connect_timeout(settings);
    }

    ProbeOutcome execute(const TestDefinition& test) override {
        if (!test.config_error.empty()) {
            return ProbeFailure{FailureKind::INVALID_DEFINITION, test.config_error};
        }

        switch (test.method) {
            case HttpMethod::GET: {
                std::string url;
                try {
                    url = HttpProbe::build_url(test.url, test.query_args);
                } catch (const std::runtime_error& e) {
                    return ProbeFailure{FailureKind::INTERNAL, e.what()};
                }
                return perform(test, url, nullptr);
            }
            case HttpMethod::POST: {
                std::string body = test.payload ? test.payload->dump() : std::string();
                return perform(test, test.url, &body);
            }
            case HttpMethod::UNSUPPORTED:
                break;
        }
        return ProbeFailure{FailureKind::UNSUPPORTED_METHOD,
                            "Unsupported REST type: `" + test.method_name + "`"};
    }

private:
    // body == nullptr issues a GET, otherwise a POST with that body
    ProbeOutcome perform(const TestDefinition& test, const std::string& url,
                         const std::string* body) {
        CurlPtr curl(curl_easy_init());
        if (!curl) {
            return ProbeFailure{FailureKind::INTERNAL, "Could not initialize curl"};
        }

        char errbuf[CURL_ERROR_SIZE];
        errbuf[0] = '\0';
        BodySink sink;
        sink.limit = settings.body_excerpt_bytes;

        SlistPtr headers;
        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, excerpt_callback);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, settings.timeout_seconds);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, settings.connect_timeout_seconds);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, settings.max_redirects);
        curl_easy_setopt(h, CURLOPT_USERAGENT, settings.user_agent.c_str());

        if (body != nullptr) {
            if (test.payload) {
                if (!slist_append(headers, "Content-Type: application/json")) {
                    return ProbeFailure{FailureKind::INTERNAL, "Could not build request headers"};
                }
                curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
            }
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body->size()));
        } else {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        }

        CURLcode res = curl_easy_perform(h);
        if (res != CURLE_OK) {
            return ProbeFailure{FailureKind::TRANSPORT, describe_error(res, errbuf)};
        }

        long http_code = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code == 0) {
            // Transfer succeeded without an HTTP status line (e.g. non-HTTP scheme)
            return ProbeFailure{FailureKind::TRANSPORT, "No HTTP status code received"};
        }

        return HttpResponse{http_code, std::move(sink.excerpt)};
    }

    ProbeSettings settings;
};

} // anonymous namespace

CurlGlobal::CurlGlobal() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(res));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

std::unique_ptr<ProbeExecutor> create_curl_executor(const ProbeSettings& settings) {
    return std::make_unique<CurlProbeExecutor>(settings);
}

namespace HttpProbe {

long connect_timeout(const ProbeSettings& settings) {
    return std::min(settings.connect_timeout_seconds, settings.timeout_seconds);
}

std::string build_url(const std::string& url,
                      const std::vector<std::pair<std::string, std::string>>& query_args) {
    if (query_args.empty()) return url;

    CurlPtr curl(curl_easy_init());
    if (!curl) throw std::runtime_error("Could not initialize curl for URL encoding");

    auto escape = [&curl](const std::string& s) {
        char* encoded = curl_easy_escape(curl.get(), s.c_str(), static_cast<int>(s.size()));
        if (!encoded) throw std::runtime_error("URL encoding failed");
        std::string out(encoded);
        curl_free(encoded);
        return out;
    };

    std::string query;
    for (const auto& arg : query_args) {
        if (!query.empty()) query += '&';
        query += escape(arg.first) + "=" + escape(arg.second);
    }

    // Keep any fragment after the query
    std::string base = url;
    std::string fragment;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base.erase(hash);
    }

    char sep = '?';
    if (base.find('?') != std::string::npos) {
        sep = (base.back() == '?' || base.back() == '&') ? '\0' : '&';
    }

    std::string out = base;
    if (sep != '\0') out += sep;
    return out + query + fragment;
}

} // namespace HttpProbe
