#pragma once
#include <string>
#include <vector>
#include <json/json.h>
#include "TextFileRegistry.hpp"

// Settings from the "textframe" section of config.json.
struct ServerConfig {
    std::vector<std::string> allowedPaths;
    RegistryOptions registry;
};

// Reads a "textframe" section; missing keys keep their defaults.
ServerConfig parse_server_config(const Json::Value& config);

// Loads the config file at path. A missing file yields the defaults;
// an unreadable or malformed one throws std::runtime_error.
ServerConfig load_server_config(const std::string& path);
