#pragma once
#include <json/json.h>
#include <string>
#include "FileOperations.hpp"
#include "FsError.hpp"

// Maps MCP tool calls and REST requests onto FileOperations and renders the results as JSON.
class FileOpController {
public:
    explicit FileOpController(FileOperations& operations);

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message,
                            const Json::Value& data = Json::Value()) const;

    Json::Value initializeResult(const std::string& serverName) const;
    Json::Value listTools() const;

    // Dispatch one JSON-RPC request and return the response to send back. Notifications
    // return a null value. A request that is not an object carrying a string "method"
    // gets -32600.
    Json::Value handleRequest(const Json::Value& request, const std::string& serverName);

    // Call tool by name. Returns a Json::Value suitable as the 'result' field for a JSON-RPC
    // response, or an object holding "__error__": {code, message, data} on failure.
    Json::Value callTool(const Json::Value& params);

    // Run one operation and return its structured payload. Throws FsError.
    Json::Value invoke(const std::string& operation, const Json::Value& arguments);

    static int errorCode(FsErrorKind kind);
    static Json::Value errorData(const FsError& error);

private:
    FileOperations& operations_;
};
