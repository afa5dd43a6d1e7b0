#pragma once
#include <json/json.h>
#include <functional>
#include <string>
#include "TextFileRegistry.hpp"

class TextFrameController {
public:
    explicit TextFrameController();

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    // Resources and tools
    Json::Value listTools() const;
    Json::Value listResources();
    Json::Value readResourceFromUri(const Json::Value& params);

    // Call tool by name. Optional progress callback invoked once per range during read_multiple.
    // Returns a Json::Value suitable as the 'result' field for a JSON-RPC response;
    // failures are reported under '__error__'.
    Json::Value callTool(const Json::Value& params, std::function<void(const Json::Value&)> progress = nullptr);

    // Configure allowed paths and index options
    void setAllowedPaths(const std::vector<std::string>& paths);
    void setRegistryOptions(const RegistryOptions& options);

private:
    std::string readRange(SharedTextFile& text, const std::string& unit, const Json::Value& range);

    TextFileRegistry registry_;
};
