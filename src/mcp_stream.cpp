#include <drogon/drogon.h>
#include <json/json.h>
#include <filesystem>
#include <memory>
#include "ConfirmationRegistry.hpp"
#include "FileOpController.hpp"
#include "FileOperations.hpp"
#include "PathGuard.hpp"
#include "ServerConfig.hpp"

namespace {

std::unique_ptr<FileOpController> controller;

drogon::HttpStatusCode httpStatus(FsErrorKind kind) {
    switch (kind) {
        case FsErrorKind::AccessDenied:
        case FsErrorKind::PermissionDenied:
            return drogon::k403Forbidden;
        case FsErrorKind::NotFound:
            return drogon::k404NotFound;
        case FsErrorKind::IOFailure:
            return drogon::k500InternalServerError;
        default:
            return drogon::k400BadRequest;
    }
}

// Main HTTP handler for MCP JSON-RPC requests
void handleMcpRequest(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            controller->createError(Json::Value(), -32700, "Parse error"));
        resp->setStatusCode(drogon::k400BadRequest);
        callback(resp);
        return;
    }

    Json::Value response = controller->handleRequest(*json, "mcp-securefs-stream");
    if (response.isNull()) {
        // Notifications get no body
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k204NoContent);
        callback(resp);
        return;
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(response));
}

// One REST route per operation; the JSON body carries the tool arguments.
void handleRestRequest(const std::string& operation, const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    Json::Value arguments(Json::objectValue);
    if (req->method() == drogon::Post) {
        auto json = req->getJsonObject();
        if (!json || !json->isObject()) {
            Json::Value body;
            body["detail"] = "Request body must be a JSON object";
            auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
            resp->setStatusCode(drogon::k422UnprocessableEntity);
            callback(resp);
            return;
        }
        arguments = *json;
    }

    try {
        callback(drogon::HttpResponse::newHttpJsonResponse(controller->invoke(operation, arguments)));
    } catch (const FsError& e) {
        Json::Value body;
        body["detail"] = FileOpController::errorData(e);
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(httpStatus(e.kind()));
        callback(resp);
    } catch (const std::exception& e) {
        LOG_ERROR << operation << " failed: " << e.what();
        Json::Value body;
        body["detail"]["kind"] = toString(FsErrorKind::IOFailure);
        body["detail"]["message"] = e.what();
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(drogon::k500InternalServerError);
        callback(resp);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace drogon;

    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    // Drogon exits on a missing config file; the securefs section may come from the environment instead.
    if (std::filesystem::exists(configPath)) {
        app().loadConfigFile(configPath);
    }

    std::unique_ptr<PathGuard> guard;
    std::unique_ptr<ConfirmationRegistry> confirmations;
    std::unique_ptr<FileOperations> operations;
    ServerConfig config;
    try {
        config = ServerConfig::load(configPath);
        guard = std::make_unique<PathGuard>(config.allowedPaths);
        confirmations = std::make_unique<ConfirmationRegistry>(makeConfirmationStore(config.confirmationStore),
                                                               config.confirmationTtl);
    } catch (const std::exception& e) {
        LOG_ERROR << "Startup failed: " << e.what();
        return 1;
    }
    operations = std::make_unique<FileOperations>(*guard, *confirmations);
    controller = std::make_unique<FileOpController>(*operations);
    LOG_INFO << "Configured " << guard->allowedRoots().size() << " allowed path(s)";

    // HTTP JSON-RPC endpoint
    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(req, std::move(callback));
        },
        {Post});

    const std::vector<std::string> postRoutes = {
        "read_file", "write_file", "edit_file", "create_directory", "list_directory", "directory_tree",
        "search_files", "search_content", "delete_path", "move_path", "get_metadata"};
    for (const auto& operation : postRoutes) {
        app().registerHandler("/" + operation,
            [operation](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
                handleRestRequest(operation, req, std::move(callback));
            },
            {Post});
    }
    app().registerHandler("/list_allowed_directories",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleRestRequest("list_allowed_directories", req, std::move(callback));
        },
        {Get});

    // CORS support
    app().registerSyncAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    if (!config.listenerConfigured) {
        app().addListener("0.0.0.0", static_cast<uint16_t>(config.port));
    }

    LOG_INFO << "MCP securefs server starting on port " << config.port;
    LOG_INFO << "  JSON-RPC endpoint: http://localhost:" << config.port << "/mcp";
    app().run();

    return 0;
}
