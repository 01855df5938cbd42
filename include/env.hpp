/*
 * Service Monitor - Environment
 *
 * Secrets (the SMTP app password) come from the process environment,
 * optionally seeded from a dotenv file.
 */

#pragma once

#include <optional>
#include <string>

namespace Env {
    // Reads KEY=VALUE lines into the environment. Variables that are already
    // set win. Returns the number of variables set, 0 if the file is missing.
    int load_dotenv(const std::string& path);

    // Unset and empty variables both yield nullopt
    std::optional<std::string> get(const char* name);
}
