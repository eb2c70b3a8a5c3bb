#include "ServerConfig.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

ServerConfig ServerConfig::load(const std::string& configPath, const std::string& defaultStore) {
    ServerConfig config;
    config.confirmationStore = defaultStore;

    std::ifstream configFile(configPath);
    if (configFile) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errs;
        if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
            throw std::runtime_error("Failed to parse " + configPath + ": " + errs);
        }
        LOG_INFO << "Config file " << configPath << " parsed successfully";

        const Json::Value& listeners = root["listeners"];
        if (listeners.isArray() && !listeners.empty() && listeners[0].isMember("port")) {
            config.port = listeners[0]["port"].asInt();
            config.listenerConfigured = true;
        }

        const Json::Value& section = root["securefs"];
        if (section.isObject()) {
            for (const auto& path : section["allowed_paths"]) {
                config.allowedPaths.push_back(path.asString());
            }
            if (section.isMember("confirmation_ttl_seconds")) {
                int ttl = section["confirmation_ttl_seconds"].asInt();
                if (ttl <= 0) {
                    throw std::runtime_error("confirmation_ttl_seconds must be positive");
                }
                config.confirmationTtl = std::chrono::seconds(ttl);
            }
            if (section.isMember("confirmation_store")) {
                config.confirmationStore = section["confirmation_store"].asString();
            }
        } else {
            LOG_WARN << "No 'securefs' section in " << configPath;
        }
    } else {
        LOG_WARN << "Config file " << configPath << " not found, relying on environment";
    }

    if (const char* env = std::getenv("SECUREFS_ALLOWED_PATHS")) {
        std::vector<std::string> paths;
        std::string value(env);
        boost::algorithm::split(paths, value, boost::algorithm::is_any_of(":"));
        config.allowedPaths.clear();
        for (auto& path : paths) {
            if (!path.empty()) config.allowedPaths.push_back(std::move(path));
        }
    }

    if (config.allowedPaths.empty()) {
        throw std::runtime_error("No allowed directories configured (securefs.allowed_paths or SECUREFS_ALLOWED_PATHS)");
    }
    for (const auto& path : config.allowedPaths) {
        LOG_INFO << "  - Adding allowed path: " << path;
    }
    return config;
}
