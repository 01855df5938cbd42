/*
 * Service Monitor - Environment
 */

#include "env.hpp"
#include "log.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string unquote(const std::string& value) {
    // A quoted value ends at its closing quote; anything after it is a comment
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        auto close = value.find(value.front(), 1);
        if (close != std::string::npos) return value.substr(1, close - 1);
    }
    // Unquoted values may carry a trailing " # comment"
    auto comment = value.find(" #");
    return comment == std::string::npos ? value : trim(value.substr(0, comment));
}

} // anonymous namespace

namespace Env {

int load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return 0;

    int count = 0;
    int line_no = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            Log::warn(path + ":" + std::to_string(line_no) + ": ignoring malformed line");
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        if (std::getenv(key.c_str()) != nullptr) continue;

        if (setenv(key.c_str(), value.c_str(), 0) != 0) {
            Log::warn("Could not set " + key + ": " + std::strerror(errno));
            continue;
        }
        ++count;
    }
    return count;
}

std::optional<std::string> get(const char* name) {
    const char* val = std::getenv(name);
    if (val == nullptr || val[0] == '\0') return std::nullopt;
    return std::string(val);
}

} // namespace Env
