/*
 * Service Monitor - Configuration
 */

#include "monitor_config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>

using json = nlohmann::ordered_json;

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const json& require(const json& parent, const std::string& key, const std::string& path) {
    auto it = parent.find(key);
    if (it == parent.end()) {
        throw ConfigError("Missing required field `" + path + "`");
    }
    return *it;
}

const json& require_object(const json& parent, const std::string& key, const std::string& path) {
    const json& value = require(parent, key, path);
    if (!value.is_object()) throw ConfigError("`" + path + "` must be an object");
    return value;
}

std::string require_string(const json& parent, const std::string& key, const std::string& path) {
    const json& value = require(parent, key, path);
    if (!value.is_string()) throw ConfigError("`" + path + "` must be a string");
    return value.get<std::string>();
}

std::vector<std::string> string_list(const json& value, const std::string& path) {
    if (!value.is_array()) throw ConfigError("`" + path + "` must be an array of strings");
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) throw ConfigError("`" + path + "` must be an array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

constexpr std::int64_t kMaxSeconds = 86400;

long optional_positive(const json& parent, const std::string& key, const std::string& path,
                       long fallback) {
    auto it = parent.find(key);
    if (it == parent.end()) return fallback;
    bool valid = it->is_number_unsigned()
        ? it->get<std::uint64_t>() > 0 && it->get<std::uint64_t>() <= kMaxSeconds
        : it->is_number_integer() && it->get<std::int64_t>() > 0 && it->get<std::int64_t>() <= kMaxSeconds;
    if (!valid) {
        throw ConfigError("`" + path + "` must be a positive integer");
    }
    return static_cast<long>(it->get<std::int64_t>());
}

// Scalars become strings the way they appear in a query string; null is skipped
bool query_value(const json& value, std::string& out) {
    if (value.is_string()) {
        out = value.get<std::string>();
    } else if (value.is_boolean()) {
        out = value.get<bool>() ? "true" : "false";
    } else if (value.is_number()) {
        out = value.dump();
    } else {
        return false;
    }
    return true;
}

std::vector<std::pair<std::string, std::string>> parse_query_args(const json& args,
                                                                  const std::string& path) {
    std::vector<std::pair<std::string, std::string>> out;
    if (args.is_null()) return out;
    if (!args.is_object()) throw ConfigError("`" + path + "` must be an object");

    for (const auto& item : args.items()) {
        const json& value = item.value();
        std::string text;
        if (value.is_array()) {
            for (const auto& element : value) {
                if (element.is_null()) continue;
                if (!query_value(element, text)) {
                    throw ConfigError("`" + path + "." + item.key() + "` has a non-scalar element");
                }
                out.emplace_back(item.key(), text);
            }
        } else if (value.is_null()) {
            continue;
        } else if (query_value(value, text)) {
            out.emplace_back(item.key(), text);
        } else {
            throw ConfigError("`" + path + "." + item.key() + "` must be a scalar or an array");
        }
    }
    return out;
}

std::vector<int> parse_accept(const json& accept, const std::string& path) {
    if (!accept.is_array()) throw ConfigError("`" + path + "` must be an array of status codes");

    std::vector<int> codes;
    for (const auto& code : accept) {
        if (!code.is_number_integer()) {
            throw ConfigError("`" + path + "` must contain integer status codes");
        }
        // Range-check before narrowing so huge values cannot wrap into range
        bool in_range = code.is_number_unsigned()
            ? code.get<std::uint64_t>() >= 100 && code.get<std::uint64_t>() <= 599
            : code.get<std::int64_t>() >= 100 && code.get<std::int64_t>() <= 599;
        if (!in_range) {
            throw ConfigError("`" + path + "` contains invalid status code " + code.dump());
        }
        int value = code.get<int>();
        if (std::find(codes.begin(), codes.end(), value) == codes.end()) codes.push_back(value);
    }
    return codes;
}

TestDefinition parse_test(const std::string& name, const json& details) {
    std::string path = "tests." + name;
    if (!details.is_object()) throw ConfigError("`" + path + "` must be an object");

    TestDefinition test;
    test.name = name;
    test.url = trim(require_string(details, "url", path + ".url"));
    if (test.url.empty()) throw ConfigError("`" + path + ".url` must not be empty");

    test.method_name = lower(trim(require_string(details, "type", path + ".type")));
    test.method = MonitorConfigLoader::parse_method(test.method_name);
    if (test.method == HttpMethod::UNSUPPORTED) {
        Log::warn("Test `" + name + "` uses unsupported REST type `" + test.method_name +
                  "`, it will be reported as a script error");
    }

    test.accepted_codes = parse_accept(require(details, "accept", path + ".accept"), path + ".accept");
    if (test.accepted_codes.empty()) {
        Log::warn("Test `" + name + "` accepts no status codes, it will be reported as a script error");
    }

    auto args = details.find("query_args");
    if (args != details.end()) test.query_args = parse_query_args(*args, path + ".query_args");

    auto payload = details.find("payload");
    if (payload != details.end() && !payload->is_null()) test.payload = *payload;

    return test;
}

// A broken definition does not stop the other tests; it is kept so every run reports it
TestDefinition invalid_test(const std::string& name, const json& details, const std::string& error) {
    TestDefinition test;
    test.name = name;
    test.method = HttpMethod::UNSUPPORTED;
    test.config_error = error;
    if (details.is_object()) {
        auto url = details.find("url");
        if (url != details.end() && url->is_string()) test.url = trim(url->get<std::string>());
        auto type = details.find("type");
        if (type != details.end() && type->is_string()) test.method_name = lower(trim(type->get<std::string>()));
    }
    return test;
}

} // anonymous namespace

namespace MonitorConfigLoader {

HttpMethod parse_method(const std::string& verb) {
    std::string v = lower(trim(verb));
    if (v == "get") return HttpMethod::GET;
    if (v == "post") return HttpMethod::POST;
    return HttpMethod::UNSUPPORTED;
}

MonitorConfig parse(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON: ") + e.what());
    }
    if (!root.is_object()) throw ConfigError("Configuration root must be an object");

    MonitorConfig config;

    const json& contacts = require_object(root, "contacts", "contacts");
    config.contacts.recipients =
        string_list(require(contacts, "recipients", "contacts.recipients"), "contacts.recipients");
    if (contacts.contains("script_recipients")) {
        config.contacts.script_recipients =
            string_list(contacts.at("script_recipients"), "contacts.script_recipients");
    } else {
        config.contacts.script_recipients =
            string_list(require(contacts, "script_recipient", "contacts.script_recipients"),
                        "contacts.script_recipient");
    }
    if (config.contacts.recipients.empty()) {
        throw ConfigError("`contacts.recipients` must not be empty");
    }
    if (config.contacts.script_recipients.empty()) {
        throw ConfigError("`contacts.script_recipients` must not be empty");
    }
    const json& source = require_object(contacts, "source", "contacts.source");
    config.contacts.source_account = require_string(source, "account", "contacts.source.account");
    if (source.contains("service")) {
        config.contacts.source_service = require_string(source, "service", "contacts.source.service");
    }

    const json& email = require_object(root, "email_metadata", "email_metadata");
    config.email.subject = require_string(email, "subject", "email_metadata.subject");
    if (email.contains("script_subject")) {
        config.email.script_subject =
            require_string(email, "script_subject", "email_metadata.script_subject");
    }

    auto smtp = root.find("smtp");
    if (smtp != root.end()) {
        if (!smtp->is_object()) throw ConfigError("`smtp` must be an object");
        if (smtp->contains("host")) config.smtp.host = require_string(*smtp, "host", "smtp.host");
        config.smtp.port = optional_positive(*smtp, "port", "smtp.port", config.smtp.port);
        config.smtp.timeout_seconds =
            optional_positive(*smtp, "timeout_seconds", "smtp.timeout_seconds",
                              config.smtp.timeout_seconds);
        auto starttls = smtp->find("use_starttls");
        if (starttls != smtp->end()) {
            if (!starttls->is_boolean()) throw ConfigError("`smtp.use_starttls` must be a boolean");
            config.smtp.use_starttls = starttls->get<bool>();
        }
    }

    auto probe = root.find("probe");
    if (probe != root.end()) {
        if (!probe->is_object()) throw ConfigError("`probe` must be an object");
        config.probe.timeout_seconds =
            optional_positive(*probe, "timeout_seconds", "probe.timeout_seconds",
                              config.probe.timeout_seconds);
        config.probe.connect_timeout_seconds =
            optional_positive(*probe, "connect_timeout_seconds", "probe.connect_timeout_seconds",
                              config.probe.connect_timeout_seconds);
    }

    const json& tests = require_object(root, "tests", "tests");
    for (const auto& item : tests.items()) {
        try {
            config.tests.push_back(parse_test(item.key(), item.value()));
        } catch (const ConfigError& e) {
            Log::error(std::string(e.what()) + ", test `" + item.key() + "` will be reported as a script error");
            config.tests.push_back(invalid_test(item.key(), item.value(), e.what()));
        }
    }
    if (config.tests.empty()) {
        Log::warn("No tests configured, nothing will be probed");
    }

    return config;
}

MonitorConfig load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw ConfigError("Could not read config file: " + path);
    }

    return parse(ss.str());
}

} // namespace MonitorConfigLoader
