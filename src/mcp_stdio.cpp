#include <iostream>
#include <string>
#include <sstream>
#include <json/json.h>
#include "ServerConfig.hpp"
#include "TextFrameController.hpp"

TextFrameController controller;

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output, one message per line
    std::cout << Json::writeString(writer, message) << std::endl;
}

void handleInitialize(const Json::Value& id) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = true;
    result["serverInfo"]["name"] = "textframe";
    result["serverInfo"]["version"] = "0.3.0";
    writeMessage(controller.createResponse(id, result));
}

void handleListResources(const Json::Value& id) {
    writeMessage(controller.createResponse(id, controller.listResources()));
}

void handleReadResource(const Json::Value& id, const Json::Value& params) {
    Json::Value result = controller.readResourceFromUri(params);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    writeMessage(controller.createResponse(id, result));
}

void handleListTools(const Json::Value& id) {
    writeMessage(controller.createResponse(id, controller.listTools()));
}

void sendResourceListChanged() {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = "notifications/resources/list_changed";
    writeMessage(notification);
}

void handleCallTool(const Json::Value& id, const Json::Value& params) {
    auto progressCallback = [](const Json::Value&) {
        // stdio doesn't emit progress updates
    };
    Json::Value result = controller.callTool(params, progressCallback);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    writeMessage(controller.createResponse(id, result));
    if (result.get("resourceListChanged", false).asBool()) {
        sendResourceListChanged();
    }
}

void processRequest(const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        std::cerr << "JSON parse error: " << errs << std::endl;
        writeMessage(controller.createError(Json::Value::null, -32700, "Parse error"));
        return;
    }

    std::string method = request["method"].asString();
    Json::Value id = request["id"];
    Json::Value params = request["params"];

    if (method == "initialize") {
        handleInitialize(id);
    } else if (method == "tools/list") {
        handleListTools(id);
    } else if (method == "tools/call") {
        handleCallTool(id, params);
    } else if (method == "resources/list") {
        handleListResources(id);
    } else if (method == "resources/read") {
        handleReadResource(id, params);
    } else if (method == "notifications/initialized") {
        // No response needed for notifications
    } else {
        writeMessage(controller.createError(id, -32601, "Method not found: " + method));
    }
}

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";
    try {
        ServerConfig config = load_server_config(configPath);
        controller.setAllowedPaths(config.allowedPaths);
        controller.setRegistryOptions(config.registry);
        std::cerr << "Configured " << config.allowedPaths.size() << " allowed path(s)" << std::endl;
        if (!config.registry.cacheDir.empty()) {
            std::cerr << "Index cache directory: " << config.registry.cacheDir << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }

    std::string line;
    std::cerr << "textframe stdio server started" << std::endl;

    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            processRequest(line);
        }
    }

    return 0;
}
