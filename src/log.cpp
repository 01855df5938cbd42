/*
 * Service Monitor - Logging
 */

#include "log.hpp"
#include <ctime>
#include <fstream>
#include <iostream>

namespace {

std::ofstream log_file;
bool verbose_enabled = false;

const char* level_tag(Log::Level level) {
    switch (level) {
        case Log::Level::DEBUG: return "[DEBUG]";
        case Log::Level::INFO:  return "[INFO]";
        case Log::Level::WARN:  return "[WARN]";
        case Log::Level::ERROR: return "[ERROR]";
    }
    return "[INFO]";
}

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0) return "";
    return buf;
}

} // anonymous namespace

namespace Log {

bool set_file(const std::string& path) {
    if (log_file.is_open()) log_file.close();
    if (path.empty()) return true;

    log_file.open(path, std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "[WARN] Could not open log file " << path
                  << ", logging to stderr only" << std::endl;
        return false;
    }
    return true;
}

void set_verbose(bool verbose) {
    verbose_enabled = verbose;
}

void write(Level level, const std::string& message) {
    if (level == Level::DEBUG && !verbose_enabled) return;

    std::string line = timestamp() + " " + level_tag(level) + " " + message;
    std::cerr << line << std::endl;

    if (log_file.is_open()) {
        log_file << line << std::endl;
        if (log_file.fail()) {
            // Stop mirroring instead of failing every subsequent line
            log_file.close();
            std::cerr << "[WARN] Log file write failed, logging to stderr only" << std::endl;
        }
    }
}

} // namespace Log
