#include <drogon/drogon.h>
#include <json/json.h>
#include <iostream>
#include <memory>
#include "SSEBroadcaster.hpp"
#include "ServerConfig.hpp"
#include "TextFrameController.hpp"

TextFrameController controller;
SSEBroadcaster broadcaster;

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

void sendNotification(const std::string& method, const Json::Value& params = Json::Value()) {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.isNull()) {
        notification["params"] = params;
    }
    broadcaster.broadcast(method, compactJson(notification));
}

// Handle MCP initialize
void handleInitialize(const Json::Value& id, std::function<void(const Json::Value&)> sendResponse) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = true;
    result["capabilities"]["streaming"] = true;
    result["serverInfo"]["name"] = "textframe-stream";
    result["serverInfo"]["version"] = "0.3.0";

    sendResponse(controller.createResponse(id, result));
}

// Handle tool calls; read_multiple progress goes out on the event stream
void handleCallTool(const Json::Value& id, const Json::Value& params, std::function<void(const Json::Value&)> sendResponse) {
    auto progressCb = [id](const Json::Value& p) {
        Json::Value progress = p;
        progress["requestId"] = id;
        sendNotification("notifications/progress", progress);
    };
    Json::Value result = controller.callTool(params, progressCb);
    if (result.isMember("__error__")) {
        sendResponse(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    sendResponse(controller.createResponse(id, result));
    if (result.get("resourceListChanged", false).asBool()) {
        sendNotification("notifications/resources/list_changed");
    }
}

// Main HTTP handler for MCP JSON-RPC requests
void handleMcpRequest(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            controller.createError(Json::Value::null, -32700, "Parse error"));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }

    std::string method = (*json)["method"].asString();
    Json::Value id = (*json)["id"];
    Json::Value params = (*json)["params"];

    auto sendResponse = [callback](const Json::Value& response) {
        callback(drogon::HttpResponse::newHttpJsonResponse(response));
    };

    if (method == "initialize") {
        handleInitialize(id, sendResponse);
    } else if (method == "tools/list") {
        sendResponse(controller.createResponse(id, controller.listTools()));
    } else if (method == "tools/call") {
        handleCallTool(id, params, sendResponse);
    } else if (method == "resources/list") {
        sendResponse(controller.createResponse(id, controller.listResources()));
    } else if (method == "resources/read") {
        Json::Value result = controller.readResourceFromUri(params);
        if (result.isMember("__error__")) {
            sendResponse(controller.createError(id, -32000, result["__error__"].asString()));
        } else {
            sendResponse(controller.createResponse(id, result));
        }
    } else if (method == "notifications/initialized") {
        // No response for notifications
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k204NoContent);
        callback(resp);
    } else {
        sendResponse(controller.createError(id, -32601, "Method not found: " + method));
    }
}

// SSE endpoint for notifications and progress
void handleSSE(const drogon::HttpRequestPtr&,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto resp = drogon::HttpResponse::newAsyncStreamResponse(
        [](drogon::ResponseStreamPtr stream) {
            std::shared_ptr<drogon::ResponseStream> shared(std::move(stream));
            if (!shared->send(SSEBroadcaster::formatEvent("connected", "{\"type\":\"connected\"}"))) {
                return;
            }
            broadcaster.subscribe([shared](const std::string& event) {
                return shared->send(event);
            });
        });
    resp->setContentTypeString("text/event-stream");
    resp->addHeader("Cache-Control", "no-cache");
    resp->addHeader("Connection", "keep-alive");
    resp->addHeader("X-Accel-Buffering", "no");
    callback(resp);
}

int main(int argc, char** argv) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    app().loadConfigFile(configPath);

    try {
        ServerConfig config = load_server_config(configPath);
        controller.setAllowedPaths(config.allowedPaths);
        controller.setRegistryOptions(config.registry);
        for (const auto& path : config.allowedPaths) {
            std::cout << "  - Adding allowed path: " << path << std::endl;
        }
        std::cout << "Configured " << config.allowedPaths.size() << " allowed path(s)" << std::endl;
        if (!config.registry.cacheDir.empty()) {
            std::cout << "Index cache directory: " << config.registry.cacheDir << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }

    // HTTP JSON-RPC endpoint
    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(req, std::move(callback));
        },
        {Post});

    // SSE endpoint for notifications
    app().registerHandler("/mcp/events",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleSSE(req, std::move(callback));
        },
        {Get});

    // CORS support
    app().registerPreHandlingAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
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

    std::cout << "textframe stream server starting with " << configPath << std::endl;
    std::cout << "  HTTP endpoint: /mcp" << std::endl;
    std::cout << "  SSE endpoint: /mcp/events" << std::endl;
    app().run();

    return 0;
}
