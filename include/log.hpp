/*
 * Service Monitor - Logging
 *
 * Levelled log lines on stderr, mirrored to an optional log file.
 * Logging never throws.
 */

#pragma once

#include <string>

namespace Log {
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Appends to the given file from now on. An empty path closes the file sink.
    // Returns false (and warns on stderr) if the file cannot be opened.
    bool set_file(const std::string& path);

    // DEBUG lines are dropped unless verbose
    void set_verbose(bool verbose);

    void write(Level level, const std::string& message);

    inline void debug(const std::string& message) { write(Level::DEBUG, message); }
    inline void info(const std::string& message)  { write(Level::INFO, message); }
    inline void warn(const std::string& message)  { write(Level::WARN, message); }
    inline void error(const std::string& message) { write(Level::ERROR, message); }
}
