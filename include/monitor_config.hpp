/*
 * Service Monitor - Configuration
 *
 * Loads the JSON configuration into typed structs. Everything a run needs
 * is validated here, so a malformed file fails before any probe is sent.
 */

#pragma once

#include "probe_executor.hpp"
#include "probe_types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Contacts {
    std::vector<std::string> recipients;          // SERVICE_DOWN
    std::vector<std::string> script_recipients;   // SCRIPT_ERROR
    std::string source_account;                   // SMTP login, e.g. "monitor"
    std::string source_service;                   // e.g. "@gmail.com"

    std::string from_address() const { return source_account + source_service; }
};

struct EmailMetadata {
    std::string subject;
    std::string script_subject;   // empty = subject + " (script error)"
};

struct SmtpSettings {
    std::string host = "smtp.gmail.com";
    long port = 465;
    bool use_starttls = false;    // false = implicit TLS (smtps://)
    long timeout_seconds = 30;
};

struct MonitorConfig {
    Contacts contacts;
    EmailMetadata email;
    SmtpSettings smtp;
    ProbeSettings probe;
    std::vector<TestDefinition> tests;   // file order
};

namespace MonitorConfigLoader {
    // Throws ConfigError if the file cannot be read or fails validation
    MonitorConfig load(const std::string& path);

    MonitorConfig parse(const std::string& json_text);

    // "get" / "post" in any case, surrounding whitespace ignored
    HttpMethod parse_method(const std::string& verb);
}
