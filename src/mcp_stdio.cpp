#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include "ConfirmationRegistry.hpp"
#include "FileOpController.hpp"
#include "FileOperations.hpp"
#include "PathGuard.hpp"
#include "ServerConfig.hpp"

namespace {

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::cout << Json::writeString(writer, message) << std::endl;
}

void processRequest(FileOpController& controller, const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        LOG_ERROR << "JSON parse error: " << errs;
        writeMessage(controller.createError(Json::Value(), -32700, "Parse error"));
        return;
    }

    Json::Value response = controller.handleRequest(request, "mcp-securefs");
    if (!response.isNull()) {
        writeMessage(response);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries the protocol; keep log lines on stderr.
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) { std::fwrite(msg, 1, len, stderr); },
        []() { std::fflush(stderr); });

    const std::string configPath = argc > 1 ? argv[1] : "config.json";
    std::unique_ptr<PathGuard> guard;
    std::unique_ptr<ConfirmationRegistry> confirmations;
    try {
        ServerConfig config = ServerConfig::load(configPath, "./.pending_confirmations.stdio.json");
        guard = std::make_unique<PathGuard>(config.allowedPaths);
        confirmations = std::make_unique<ConfirmationRegistry>(makeConfirmationStore(config.confirmationStore),
                                                               config.confirmationTtl);
    } catch (const std::exception& e) {
        LOG_ERROR << "Startup failed: " << e.what();
        return 1;
    }

    FileOperations operations(*guard, *confirmations);
    FileOpController controller(operations);

    LOG_INFO << "MCP stdio server started";
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            processRequest(controller, line);
        }
    }

    return 0;
}
