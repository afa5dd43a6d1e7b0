#include "ServerConfig.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

ServerConfig parse_server_config(const Json::Value& config) {
    ServerConfig result;
    if (!config.isObject() || !config.isMember("textframe")) {
        return result;
    }
    const Json::Value& section = config["textframe"];

    if (section.isMember("allowed_paths")) {
        if (!section["allowed_paths"].isArray()) {
            throw std::runtime_error("textframe.allowed_paths must be an array");
        }
        for (const auto& path : section["allowed_paths"]) {
            result.allowedPaths.push_back(path.asString());
        }
    }
    if (section.isMember("cache_dir")) {
        result.registry.cacheDir = section["cache_dir"].asString();
    }
    if (section.isMember("line_index")) {
        result.registry.mode = section["line_index"].asBool() ? TextFileMode::WithLineIndex
                                                              : TextFileMode::NoLineIndex;
    }
    if (section.isMember("checkpoint_interval")) {
        Json::Int64 interval = section["checkpoint_interval"].asInt64();
        if (interval <= 0) {
            throw std::runtime_error("textframe.checkpoint_interval must be positive");
        }
        result.registry.checkpointInterval = static_cast<size_t>(interval);
    }
    return result;
}

ServerConfig load_server_config(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return ServerConfig();
    }
    std::ifstream configFile(path);
    if (!configFile) {
        throw std::runtime_error("cannot open " + path);
    }
    Json::Value config;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &config, &errs)) {
        throw std::runtime_error("failed to parse " + path + ": " + errs);
    }
    return parse_server_config(config);
}
