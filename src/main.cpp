/*
 * Service Monitor - Main Entry Point
 *
 * Probes the configured HTTP endpoints once and e-mails a report when a
 * service is down or the probing itself failed. Meant to be invoked by
 * cron or a systemd timer.
 */

#include "env.hpp"
#include "log.hpp"
#include "monitor_config.hpp"
#include "notifier.hpp"
#include "probe_executor.hpp"
#include "probe_run.hpp"
#include "run_report.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct CliOptions {
    std::string config_path = "./config.json";
    std::string env_path = "./.env";
    std::string log_path = "service_monitor.log";
    std::string report_path;
    bool dry_run = false;
    bool verbose = false;
};

void show_help() {
    std::cout << "Service Monitor - HTTP endpoint checks with e-mail alerts\n\n"
              << "Usage: service-monitor [OPTIONS]\n\n"
              << "Options:\n"
              << "  -p, --path FILE      Config file (default: ./config.json)\n"
              << "  -e, --env FILE       Dotenv file with EMAIL_APP_PASSWORD (default: ./.env)\n"
              << "  -l, --log-file FILE  Log file (default: service_monitor.log)\n"
              << "      --no-log-file    Log to stderr only\n"
              << "  -o, --report FILE    Write the run results as JSON\n"
              << "  -n, --dry-run        Print alert e-mails instead of sending them\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help\n\n"
              << "Exit status: 0 run completed, 1 configuration or delivery failure, 2 usage error\n";
}

bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return (short_name != nullptr && strcmp(arg, short_name) == 0) ||
           (long_name != nullptr && strcmp(arg, long_name) == 0);
}

// Best effort: the run itself already failed, so a delivery error is only logged
void report_script_error(const std::string& what, const MonitorConfig& config, Notifier& notifier) {
    NotificationRequest request;
    request.category = NotificationCategory::SCRIPT_ERROR;
    request.recipients = config.contacts.script_recipients;
    request.entries.push_back({"service monitor", "Script error: " + what, "", {}});

    try {
        deliver_notifications({request}, config, notifier);
    } catch (const NotifyError& e) {
        Log::error(e.what());
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (is_flag(arg, "-h", "--help")) {
            show_help();
            return 0;
        }
        if (is_flag(arg, "-n", "--dry-run")) {
            options.dry_run = true;
            continue;
        }
        if (is_flag(arg, "-v", "--verbose")) {
            options.verbose = true;
            continue;
        }
        if (is_flag(arg, nullptr, "--no-log-file")) {
            options.log_path.clear();
            continue;
        }
        if (is_flag(arg, "-p", "--path") && has_value) {
            options.config_path = argv[++i];
            continue;
        }
        if (is_flag(arg, "-e", "--env") && has_value) {
            options.env_path = argv[++i];
            continue;
        }
        if (is_flag(arg, "-l", "--log-file") && has_value) {
            options.log_path = argv[++i];
            continue;
        }
        if (is_flag(arg, "-o", "--report") && has_value) {
            options.report_path = argv[++i];
            continue;
        }
        std::cerr << "Unknown option or missing value: " << arg << std::endl;
        show_help();
        return 2;
    }

    Log::set_verbose(options.verbose);
    Log::set_file(options.log_path);

    int loaded = Env::load_dotenv(options.env_path);
    if (loaded > 0) Log::debug("Loaded " + std::to_string(loaded) + " variable(s) from " + options.env_path);

    MonitorConfig config;
    try {
        config = MonitorConfigLoader::load(options.config_path);
    } catch (const ConfigError& e) {
        Log::error(std::string("Error loading config: ") + e.what());
        return 1;
    }

    std::unique_ptr<Notifier> notifier = options.dry_run
        ? create_dry_run_notifier(std::cout)
        : create_smtp_notifier(config.smtp, config.contacts);

    try {
        CurlGlobal curl_global;
        ProbeRun run(create_curl_executor(config.probe));
        RunSummary summary = run.run(config.tests);

        if (!options.report_path.empty()) {
            RunReport::save_to_file(summary, options.report_path);
        }

        deliver_notifications(ProbeRun::plan_notifications(summary, config.tests, config.contacts),
                              config, *notifier);
    } catch (const NotifyError& e) {
        Log::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Log::error(std::string("Script encountered an error: ") + e.what());
        report_script_error(e.what(), config, *notifier);
        return 1;
    }

    return 0;
}
