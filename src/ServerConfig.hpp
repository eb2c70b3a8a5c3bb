#pragma once
#include <chrono>
#include <string>
#include <vector>

struct ServerConfig {
    std::vector<std::string> allowedPaths;
    std::chrono::seconds confirmationTtl{60};
    std::string confirmationStore = "./.pending_confirmations.json";
    int port = 8080;
    bool listenerConfigured = false; // Drogon already listens on `port`

    // Reads the "securefs" section (and the first listener's port) of a Drogon style
    // config file. SECUREFS_ALLOWED_PATHS, colon separated, replaces allowed_paths.
    // `defaultStore` is used when the file names no confirmation_store; each front end
    // passes its own so two servers started side by side never share a store file.
    // Throws std::runtime_error when the file cannot be parsed or no allowed path is left.
    static ServerConfig load(const std::string& configPath,
                             const std::string& defaultStore = "./.pending_confirmations.json");
};
