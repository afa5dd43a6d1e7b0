#include "TextFrameController.hpp"
#include <filesystem>
#include <stdexcept>
#include <vector>

TextFrameController::TextFrameController() {
}

Json::Value TextFrameController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value TextFrameController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value TextFrameController::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value tool;
    tool["name"] = "textframe";
    tool["description"] = "Random access to large UTF-8 texts by unicode character offset, line number or byte offset, without loading whole files into memory";
    tool["inputSchema"]["type"] = "object";

    // operation parameter
    auto& props = tool["inputSchema"]["properties"];
    props["operation"]["type"] = "string";
    props["operation"]["description"] = "Operation to perform";
    props["operation"]["enum"].append("open");
    props["operation"]["enum"].append("read");
    props["operation"]["enum"].append("read_lines");
    props["operation"]["enum"].append("read_bytes");
    props["operation"]["enum"].append("read_multiple");
    props["operation"]["enum"].append("info");
    props["operation"]["enum"].append("save_index");
    props["operation"]["enum"].append("close");

    // path parameter (for open, save_index)
    props["path"]["type"] = "string";
    props["path"]["description"] = "Text file to open (required for 'open'); optional index cache destination for 'save_index'";

    // handler parameter
    props["handler"]["type"] = "string";
    props["handler"]["description"] = "Handler returned by 'open' (required for 'read', 'info', 'save_index', 'close')";

    // unit parameter
    props["unit"]["type"] = "string";
    props["unit"]["enum"].append("chars");
    props["unit"]["enum"].append("lines");
    props["unit"]["enum"].append("bytes");
    props["unit"]["default"] = "chars";
    props["unit"]["description"] = "How 'begin' and 'end' are counted by 'read'. 'lines' requires a line index; 'bytes' must fall on character boundaries. 'read_lines' and 'read_bytes' imply their unit.";

    // begin/end parameters (for read)
    props["begin"]["type"] = "integer";
    props["begin"]["description"] = "Start offset, 0-based. Negative values count back from the end (chars and lines only).";
    props["begin"]["default"] = 0;
    props["end"]["type"] = "integer";
    props["end"]["description"] = "End offset, exclusive. 0 means the end of the text; negative values count back from the end (chars and lines only).";
    props["end"]["default"] = 0;

    // segments parameter (for read_multiple) - array of { handler, unit?, ranges: [{begin,end}] }
    props["segments"]["type"] = "array";
    props["segments"]["description"] = "Array of segments to read. Each segment contains 'handler', optional 'unit', and 'ranges' of {begin, end}.";
    auto& item = props["segments"]["items"];
    item["type"] = "object";
    item["properties"]["handler"]["type"] = "string";
    item["properties"]["unit"]["type"] = "string";
    item["properties"]["ranges"]["type"] = "array";
    item["properties"]["ranges"]["items"]["type"] = "object";
    item["properties"]["ranges"]["items"]["properties"]["begin"]["type"] = "integer";
    item["properties"]["ranges"]["items"]["properties"]["end"]["type"] = "integer";

    // Required fields
    tool["inputSchema"]["required"].append("operation");

    tools.append(tool);
    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value TextFrameController::listResources() {
    Json::Value resources(Json::arrayValue);
    auto handlers = registry_.listHandlers();
    for (const auto& handler : handlers) {
        auto text = registry_.getByHandler(handler);
        if (text) {
            Json::Value resource;
            resource["uri"] = "file:///" + handler;
            resource["name"] = std::filesystem::path(handler).filename().string();
            resource["description"] = "UTF-8 text (" + std::to_string(text->length()) + " characters, " +
                                      std::to_string(text->byteLength()) + " bytes)";
            resource["mimeType"] = "text/plain";
            resources.append(resource);
        }
    }
    Json::Value result;
    result["resources"] = resources;
    return result;
}

Json::Value TextFrameController::readResourceFromUri(const Json::Value& params) {
    Json::Value result;
    std::string uri = params["uri"].asString();
    if (uri.rfind("file:///", 0) != 0) {
        result["__error__"] = "Unsupported resource URI: " + uri;
        return result;
    }
    std::string handler = uri.substr(8); // Skip file:/// prefix
    auto text = registry_.getByHandler(handler);
    if (!text) {
        result["__error__"] = "Resource not found";
        return result;
    }
    try {
        result["contents"][0]["uri"] = uri;
        result["contents"][0]["mimeType"] = "text/plain";
        result["contents"][0]["text"] = text->readChars(0, 0);
    } catch (const std::exception& e) {
        Json::Value error;
        error["__error__"] = std::string("Error: ") + e.what();
        return error;
    }
    return result;
}

std::string TextFrameController::readRange(SharedTextFile& text, const std::string& unit, const Json::Value& range) {
    Json::Int64 begin = range.get("begin", Json::Int64(0)).asInt64();
    Json::Int64 end = range.get("end", Json::Int64(0)).asInt64();
    if (unit == "chars") {
        return text.readChars(begin, end);
    } else if (unit == "lines") {
        return text.readLines(begin, end);
    } else if (unit == "bytes") {
        if (begin < 0 || end < 0) {
            throw std::invalid_argument("byte offsets must not be negative");
        }
        // byte ranges have no end-of-text sentinel
        return text.readBytes(static_cast<size_t>(begin), static_cast<size_t>(end));
    }
    throw std::invalid_argument("Unknown unit: " + unit);
}

Json::Value TextFrameController::callTool(const Json::Value& params, std::function<void(const Json::Value&)> progress) {
    Json::Value result;
    std::string toolName = params["name"].asString();
    const Json::Value& arguments = params["arguments"];
    try {
        if (toolName != "textframe") {
            result["__error__"] = std::string("Unknown tool: ") + toolName;
            return result;
        }

        std::string operation = arguments["operation"].asString();
        if (operation == "open") {
            std::string path = arguments["path"].asString();
            auto text = registry_.open(path);
            std::string handler = std::filesystem::canonical(path).string();
            auto lines = text->lineCount();
            std::string summary = "Text opened successfully.\n\nHandler: " + handler +
                "\nCharacters: " + std::to_string(text->length()) +
                "\nBytes: " + std::to_string(text->byteLength());
            if (lines) summary += "\nLines: " + std::to_string(*lines);
            summary += "\nResource URI: file:///" + handler;
            result["content"][0]["type"] = "text";
            result["content"][0]["text"] = summary;
            result["structuredContent"]["handler"] = handler;
            result["structuredContent"]["characters"] = (Json::UInt64)text->length();
            result["structuredContent"]["bytes"] = (Json::UInt64)text->byteLength();
            if (lines) result["structuredContent"]["lines"] = (Json::UInt64)*lines;
            result["resourceListChanged"] = true;
            return result;
        } else if (operation == "read" || operation == "read_lines" || operation == "read_bytes") {
            std::string handler = arguments["handler"].asString();
            std::string unit = arguments.get("unit", "chars").asString();
            if (operation == "read_lines") unit = "lines";
            if (operation == "read_bytes") unit = "bytes";
            auto text = registry_.getByHandler(handler);
            if (!text) {
                result["__error__"] = std::string("Invalid handler: ") + handler;
                return result;
            }
            result["content"][0]["type"] = "text";
            result["content"][0]["text"] = readRange(*text, unit, arguments);
            return result;
        } else if (operation == "read_multiple") {
            // `segments` is an array of objects { handler, unit?, ranges: [{begin, end}, ...] }
            if (!arguments.isMember("segments") || !arguments["segments"].isArray()) {
                result["__error__"] = "segments must be an array";
                return result;
            }
            // Resolve every handler up front so nothing is read for a bad request
            std::vector<std::shared_ptr<SharedTextFile>> texts;
            Json::UInt64 totalRanges = 0;
            for (const auto& s : arguments["segments"]) {
                std::string handler = s["handler"].asString();
                auto text = registry_.getByHandler(handler);
                if (!text) {
                    result["__error__"] = std::string("Invalid handler: ") + handler;
                    return result;
                }
                texts.push_back(text);
                totalRanges += s["ranges"].size();
            }

            Json::Value contentArray(Json::arrayValue);
            Json::UInt64 rangesRead = 0;
            Json::ArrayIndex segmentIndex = 0;
            for (const auto& s : arguments["segments"]) {
                std::string unit = s.get("unit", "chars").asString();
                auto& text = texts[segmentIndex++];
                for (const auto& r : s["ranges"]) {
                    Json::Value item;
                    item["type"] = "text";
                    item["text"] = readRange(*text, unit, r);
                    contentArray.append(item);

                    ++rangesRead;
                    if (progress) {
                        Json::Value p;
                        p["ranges_read"] = rangesRead;
                        p["total_ranges"] = totalRanges;
                        p["progress"] = (double)rangesRead / (double)totalRanges;
                        progress(p);
                    }
                }
            }
            result["content"] = contentArray;
            return result;
        } else if (operation == "info") {
            std::string handler = arguments["handler"].asString();
            auto text = registry_.getByHandler(handler);
            if (!text) {
                result["__error__"] = std::string("Invalid handler: ") + handler;
                return result;
            }
            Json::Value info;
            info["handler"] = handler;
            info["characters"] = (Json::UInt64)text->length();
            info["bytes"] = (Json::UInt64)text->byteLength();
            if (auto lines = text->lineCount()) info["lines"] = (Json::UInt64)*lines;
            info["sha256"] = text->checksumHex();
            info["index_from_cache"] = text->indexLoadedFromCache();
            info["frames"] = (Json::UInt64)text->frameCount();
            result["content"][0]["type"] = "text";
            result["content"][0]["text"] = Json::writeString(Json::StreamWriterBuilder(), info);
            result["structuredContent"] = info;
            return result;
        } else if (operation == "save_index") {
            std::string handler = arguments["handler"].asString();
            auto text = registry_.getByHandler(handler);
            if (!text) {
                result["__error__"] = std::string("Invalid handler: ") + handler;
                return result;
            }
            std::string path = arguments.get("path", "").asString();
            if (path.empty()) path = registry_.cachePathFor(handler);
            if (path.empty()) {
                result["__error__"] = "No index path given and no cache directory configured";
                return result;
            }
            text->saveIndex(path);
            result["content"][0]["type"] = "text";
            result["content"][0]["text"] = "Index saved: " + path;
            return result;
        } else if (operation == "close") {
            std::string handler = arguments["handler"].asString();
            registry_.close(handler);
            result["content"][0]["type"] = "text";
            result["content"][0]["text"] = std::string("Handler closed successfully: ") + handler;
            result["resourceListChanged"] = true;
            return result;
        } else {
            result["__error__"] = std::string("Unknown operation: ") + operation;
            return result;
        }
    } catch (const std::exception& e) {
        Json::Value error;
        error["__error__"] = std::string("Error: ") + e.what();
        return error;
    }
}

void TextFrameController::setAllowedPaths(const std::vector<std::string>& paths) {
    registry_.setAllowedPaths(paths);
}

void TextFrameController::setRegistryOptions(const RegistryOptions& options) {
    registry_.setOptions(options);
}
