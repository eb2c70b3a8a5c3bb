#include "FileOpController.hpp"
#include "TimeFormat.hpp"
#include <trantor/utils/Logger.h>

namespace {

std::string requireString(const Json::Value& args, const char* key) {
    const Json::Value& v = args[key];
    if (!v.isString()) {
        throw FsError(FsErrorKind::InvalidArgument, std::string("Missing or invalid string argument: ") + key);
    }
    return v.asString();
}

std::string optionalString(const Json::Value& args, const char* key, const std::string& fallback) {
    const Json::Value& v = args[key];
    if (v.isNull()) return fallback;
    if (!v.isString()) {
        throw FsError(FsErrorKind::InvalidArgument, std::string("Argument must be a string: ") + key);
    }
    return v.asString();
}

bool optionalBool(const Json::Value& args, const char* key, bool fallback) {
    const Json::Value& v = args[key];
    if (v.isNull()) return fallback;
    if (!v.isBool()) {
        throw FsError(FsErrorKind::InvalidArgument, std::string("Argument must be a boolean: ") + key);
    }
    return v.asBool();
}

std::vector<std::string> optionalStringList(const Json::Value& args, const char* key) {
    std::vector<std::string> out;
    const Json::Value& v = args[key];
    if (v.isNull()) return out;
    if (!v.isArray()) {
        throw FsError(FsErrorKind::InvalidArgument, std::string("Argument must be an array of strings: ") + key);
    }
    for (const auto& item : v) {
        if (!item.isString()) {
            throw FsError(FsErrorKind::InvalidArgument, std::string("Argument must be an array of strings: ") + key);
        }
        out.push_back(item.asString());
    }
    return out;
}

std::vector<EditOperation> requireEdits(const Json::Value& args) {
    const Json::Value& v = args["edits"];
    if (!v.isArray()) {
        throw FsError(FsErrorKind::InvalidArgument, "edits must be an array");
    }
    std::vector<EditOperation> edits;
    for (const auto& item : v) {
        if (!item.isObject()) {
            throw FsError(FsErrorKind::InvalidArgument, "Each edit must be an object with oldText and newText");
        }
        edits.push_back({requireString(item, "oldText"), requireString(item, "newText")});
    }
    return edits;
}

Json::Value treeToJson(const std::vector<TreeNode>& nodes) {
    Json::Value out(Json::arrayValue);
    for (const auto& node : nodes) {
        Json::Value item;
        item["name"] = node.name;
        item["type"] = node.isDirectory ? "directory" : "file";
        if (node.isDirectory) {
            item["children"] = treeToJson(node.children);
        }
        out.append(item);
    }
    return out;
}

void markEmpty(Json::Value& payload, bool hasMatches) {
    payload["has_matches"] = hasMatches;
    if (!hasMatches) {
        payload["message"] = "No matches found";
    }
}

Json::Value toolSchema(const char* name, const char* description, const Json::Value& properties,
                       std::initializer_list<const char*> required) {
    Json::Value tool;
    tool["name"] = name;
    tool["description"] = description;
    tool["inputSchema"]["type"] = "object";
    tool["inputSchema"]["properties"] = properties.isNull() ? Json::Value(Json::objectValue) : properties;
    tool["inputSchema"]["required"] = Json::Value(Json::arrayValue);
    for (const char* r : required) {
        tool["inputSchema"]["required"].append(r);
    }
    return tool;
}

Json::Value stringProperty(const char* description) {
    Json::Value p;
    p["type"] = "string";
    p["description"] = description;
    return p;
}

Json::Value boolProperty(const char* description, bool fallback) {
    Json::Value p;
    p["type"] = "boolean";
    p["description"] = description;
    p["default"] = fallback;
    return p;
}

} // namespace

FileOpController::FileOpController(FileOperations& operations) : operations_(operations) {
}

Json::Value FileOpController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value FileOpController::createError(const Json::Value& id, int code, const std::string& message,
                                          const Json::Value& data) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    if (!data.isNull()) {
        response["error"]["data"] = data;
    }
    return response;
}

Json::Value FileOpController::initializeResult(const std::string& serverName) const {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["serverInfo"]["name"] = serverName;
    result["serverInfo"]["version"] = "0.1.1";
    return result;
}

int FileOpController::errorCode(FsErrorKind kind) {
    switch (kind) {
        case FsErrorKind::AccessDenied: return -32001;
        case FsErrorKind::NotFound: return -32002;
        case FsErrorKind::PermissionDenied: return -32003;
        case FsErrorKind::EditNotFound: return -32004;
        case FsErrorKind::InvalidToken: return -32005;
        case FsErrorKind::TokenExpired: return -32006;
        case FsErrorKind::ParameterMismatch: return -32007;
        case FsErrorKind::DirectoryNotEmpty: return -32008;
        case FsErrorKind::InvalidArgument: return -32602;
        case FsErrorKind::IOFailure: return -32000;
    }
    return -32000;
}

Json::Value FileOpController::errorData(const FsError& error) {
    Json::Value data;
    data["kind"] = toString(error.kind());
    data["message"] = error.what();
    if (error.kind() == FsErrorKind::AccessDenied) {
        data["error"] = "Access Denied";
        data["requested_path"] = error.requestedPath();
        data["allowed_directories"] = Json::Value(Json::arrayValue);
        for (const auto& root : error.allowedRoots()) {
            data["allowed_directories"].append(root);
        }
    }
    return data;
}

Json::Value FileOpController::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value pathOnly;
    pathOnly["path"] = stringProperty("Path to operate on (must be inside an allowed directory)");

    Json::Value write;
    write["path"] = stringProperty("Path to write to. Existing file will be overwritten.");
    write["content"] = stringProperty("UTF-8 encoded text content to write.");

    Json::Value edit;
    edit["path"] = stringProperty("Path to the file to edit.");
    edit["edits"]["type"] = "array";
    edit["edits"]["description"] = "List of edits to apply in order; each replaces the first occurrence of oldText.";
    edit["edits"]["items"]["type"] = "object";
    edit["edits"]["items"]["properties"]["oldText"] = stringProperty("Text to find and replace (exact match required)");
    edit["edits"]["items"]["properties"]["newText"] = stringProperty("Replacement text");
    edit["edits"]["items"]["required"].append("oldText");
    edit["edits"]["items"]["required"].append("newText");
    edit["dryRun"] = boolProperty("If true, only return diff without modifying file.", false);

    Json::Value searchFiles;
    searchFiles["path"] = stringProperty("Base directory to search in.");
    searchFiles["pattern"] = stringProperty("Filename pattern (case-insensitive substring match).");
    searchFiles["excludePatterns"]["type"] = "array";
    searchFiles["excludePatterns"]["items"]["type"] = "string";
    searchFiles["excludePatterns"]["description"] = "Glob patterns of directories to skip.";

    Json::Value searchContent;
    searchContent["path"] = stringProperty("Base directory to search within.");
    searchContent["search_query"] = stringProperty("Text content to search for (case-insensitive).");
    searchContent["recursive"] = boolProperty("Whether to search recursively in subdirectories.", true);
    searchContent["file_pattern"] = stringProperty("Glob pattern to filter files to search within (e.g., '*.py').");
    searchContent["file_pattern"]["default"] = "*";

    Json::Value del;
    del["path"] = stringProperty("Path to the file or directory to delete.");
    del["recursive"] = boolProperty("If true and path is a directory, delete recursively. Required if directory is not empty.", false);
    del["confirmation_token"] = stringProperty("Token required for confirming deletion after initial request.");

    Json::Value move;
    move["source_path"] = stringProperty("The current path of the file or directory.");
    move["destination_path"] = stringProperty("The new path for the file or directory.");

    tools.append(toolSchema("read_file", "Read the entire contents of a UTF-8 text file.", pathOnly, {"path"}));
    tools.append(toolSchema("write_file", "Write content to a file, overwriting it if it exists.", write, {"path", "content"}));
    tools.append(toolSchema("edit_file", "Apply a list of exact-match edits to a text file; dry run returns a unified diff.", edit, {"path", "edits"}));
    tools.append(toolSchema("create_directory", "Create a directory and any missing parents.", pathOnly, {"path"}));
    tools.append(toolSchema("list_directory", "List the immediate contents of a directory.", pathOnly, {"path"}));
    tools.append(toolSchema("directory_tree", "Return the recursive tree of a directory.", pathOnly, {"path"}));
    tools.append(toolSchema("search_files", "Search file and directory names containing a pattern.", searchFiles, {"path", "pattern"}));
    tools.append(toolSchema("search_content", "Search for text inside files.", searchContent, {"path", "search_query"}));
    tools.append(toolSchema("delete_path", "Delete a file or directory (two-step confirmation).", del, {"path"}));
    tools.append(toolSchema("move_path", "Move or rename a file or directory.", move, {"source_path", "destination_path"}));
    tools.append(toolSchema("get_metadata", "Get file or directory metadata.", pathOnly, {"path"}));
    tools.append(toolSchema("list_allowed_directories", "Show all directories this server can access.", Json::Value(), {}));

    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value FileOpController::invoke(const std::string& operation, const Json::Value& arguments) {
    const Json::Value args = arguments.isObject() ? arguments : Json::Value(Json::objectValue);
    Json::Value payload(Json::objectValue);

    if (operation == "read_file") {
        payload["content"] = operations_.read(requireString(args, "path"));
    } else if (operation == "write_file") {
        payload["message"] = operations_.write(requireString(args, "path"), requireString(args, "content"));
    } else if (operation == "edit_file") {
        auto outcome = operations_.edit(requireString(args, "path"), requireEdits(args),
                                        optionalBool(args, "dryRun", false));
        if (outcome.dryRun) {
            payload["diff"] = outcome.diff;
        } else {
            payload["message"] = outcome.message;
        }
    } else if (operation == "create_directory") {
        payload["message"] = operations_.createDirectory(requireString(args, "path"));
    } else if (operation == "list_directory") {
        payload = Json::Value(Json::arrayValue);
        for (const auto& entry : operations_.list(requireString(args, "path"))) {
            Json::Value item;
            item["name"] = entry.name;
            item["type"] = entry.isDirectory ? "directory" : "file";
            payload.append(item);
        }
    } else if (operation == "directory_tree") {
        payload = treeToJson(operations_.tree(requireString(args, "path")));
    } else if (operation == "search_files") {
        auto found = operations_.searchFiles(requireString(args, "path"), requireString(args, "pattern"),
                                             optionalStringList(args, "excludePatterns"));
        payload["matches"] = Json::Value(Json::arrayValue);
        for (const auto& match : found.matches) {
            payload["matches"].append(match);
        }
        markEmpty(payload, found.hasMatches());
    } else if (operation == "search_content") {
        auto report = operations_.searchContent(requireString(args, "path"), requireString(args, "search_query"),
                                                optionalBool(args, "recursive", true),
                                                optionalString(args, "file_pattern", "*"));
        payload["matches"] = Json::Value(Json::arrayValue);
        for (const auto& match : report.result.matches) {
            Json::Value item;
            item["file_path"] = match.filePath;
            item["line_number"] = static_cast<Json::UInt64>(match.lineNumber);
            item["line_content"] = match.lineText;
            payload["matches"].append(item);
        }
        payload["skipped"] = Json::Value(Json::arrayValue);
        for (const auto& skipped : report.skipped) {
            Json::Value item;
            item["file_path"] = skipped.filePath;
            item["reason"] = skipped.reason;
            payload["skipped"].append(item);
        }
        markEmpty(payload, report.result.hasMatches());
    } else if (operation == "delete_path") {
        std::optional<std::string> token;
        if (!args["confirmation_token"].isNull()) {
            token = requireString(args, "confirmation_token");
        }
        auto outcome = operations_.deletePath(requireString(args, "path"), optionalBool(args, "recursive", false), token);
        payload["message"] = outcome.message;
        if (outcome.confirmationRequired) {
            payload["confirmation_token"] = outcome.confirmation.token;
            payload["expires_at"] = format_utc(outcome.confirmation.expiry);
        }
    } else if (operation == "move_path") {
        payload["message"] = operations_.move(requireString(args, "source_path"), requireString(args, "destination_path"));
    } else if (operation == "get_metadata") {
        auto meta = operations_.getMetadata(requireString(args, "path"));
        payload["path"] = meta.path;
        payload["type"] = meta.kind;
        payload["size_bytes"] = static_cast<Json::UInt64>(meta.sizeBytes);
        payload["modification_time_utc"] = meta.modifiedUtc;
        payload["creation_time_utc"] = meta.createdUtc;
        payload["last_metadata_change_time_utc"] = meta.metadataChangedUtc;
    } else if (operation == "list_allowed_directories") {
        payload["allowed_directories"] = Json::Value(Json::arrayValue);
        for (const auto& root : operations_.allowedRoots()) {
            payload["allowed_directories"].append(root);
        }
    } else {
        throw FsError(FsErrorKind::InvalidArgument, "Unknown tool: " + operation);
    }
    return payload;
}

Json::Value FileOpController::handleRequest(const Json::Value& request, const std::string& serverName) {
    if (!request.isObject() || !request.get("method", Json::Value()).isString()) {
        const Json::Value id = request.isObject() ? request.get("id", Json::Value()) : Json::Value();
        LOG_WARN << "Rejecting malformed JSON-RPC request";
        return createError(id, -32600, "Invalid Request");
    }
    const std::string method = request["method"].asString();
    const Json::Value id = request.get("id", Json::Value());

    if (method == "initialize") {
        return createResponse(id, initializeResult(serverName));
    } else if (method == "tools/list") {
        return createResponse(id, listTools());
    } else if (method == "tools/call") {
        Json::Value result = callTool(request.get("params", Json::Value()));
        if (result.isMember("__error__")) {
            const Json::Value& err = result["__error__"];
            return createError(id, err["code"].asInt(), err["message"].asString(), err["data"]);
        }
        return createResponse(id, result);
    } else if (method.rfind("notifications/", 0) == 0) {
        return Json::Value();
    }
    return createError(id, -32601, "Method not found: " + method);
}

Json::Value FileOpController::callTool(const Json::Value& params) {
    Json::Value result;
    if (!params.isObject() || !params["name"].isString()) {
        result["__error__"]["code"] = -32602;
        result["__error__"]["message"] = "Invalid params: expected an object with a string 'name'";
        return result;
    }
    const std::string toolName = params["name"].asString();
    try {
        Json::Value payload = invoke(toolName, params["arguments"]);

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        result["content"][0]["type"] = "text";
        if (toolName == "read_file") {
            result["content"][0]["text"] = payload["content"];
        } else if (toolName == "edit_file" && payload.isMember("diff")) {
            result["content"][0]["text"] = payload["diff"];
        } else {
            result["content"][0]["text"] = Json::writeString(writer, payload);
        }
        if (payload.isObject()) {
            result["structuredContent"] = payload;
        }
        return result;
    } catch (const FsError& e) {
        LOG_DEBUG << "Tool " << toolName << " failed: " << e.what();
        result["__error__"]["code"] = errorCode(e.kind());
        result["__error__"]["message"] = e.what();
        result["__error__"]["data"] = errorData(e);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR << "Tool " << toolName << " failed unexpectedly: " << e.what();
        result["__error__"]["code"] = errorCode(FsErrorKind::IOFailure);
        result["__error__"]["message"] = std::string("Error: ") + e.what();
        result["__error__"]["data"]["kind"] = toString(FsErrorKind::IOFailure);
        return result;
    }
}
