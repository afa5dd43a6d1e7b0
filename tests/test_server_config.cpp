#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>
#include <json/json.h>
#include "../src/ServerConfig.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errs;
    std::istringstream iss(text);
    Json::parseFromStream(builder, iss, &value, &errs);
    return value;
}

int main() {
    try {
        // defaults without a textframe section
        ServerConfig defaults = parse_server_config(parse("{\"listeners\": []}"));
        ASSERT_TRUE(defaults.allowedPaths.empty());
        ASSERT_TRUE(defaults.registry.cacheDir.empty());
        ASSERT_TRUE(defaults.registry.mode == TextFileMode::WithLineIndex);
        ASSERT_TRUE(defaults.registry.checkpointInterval == kDefaultCheckpointInterval);

        ServerConfig full = parse_server_config(parse(
            "{\"textframe\": {\"allowed_paths\": [\"/srv/texts\", \"/data\"],"
            " \"cache_dir\": \"/var/cache/textframe\", \"line_index\": false, \"checkpoint_interval\": 512}}"));
        ASSERT_TRUE(full.allowedPaths.size() == 2);
        ASSERT_TRUE(full.allowedPaths[1] == "/data");
        ASSERT_TRUE(full.registry.cacheDir == "/var/cache/textframe");
        ASSERT_TRUE(full.registry.mode == TextFileMode::NoLineIndex);
        ASSERT_TRUE(full.registry.checkpointInterval == 512);

        bool threw = false;
        try {
            parse_server_config(parse("{\"textframe\": {\"checkpoint_interval\": 0}}"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        threw = false;
        try {
            parse_server_config(parse("{\"textframe\": {\"allowed_paths\": \"/srv\"}}"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // files: missing means defaults, malformed is an error
        auto tmpDir = std::filesystem::temp_directory_path();
        auto missing = tmpDir / "textframe_config_missing.json";
        std::filesystem::remove(missing);
        ASSERT_TRUE(load_server_config(missing.string()).allowedPaths.empty());

        auto configPath = tmpDir / "textframe_config_test.json";
        {
            std::ofstream ofs(configPath);
            ofs << "{\"textframe\": {\"cache_dir\": \"/tmp/tf\"}}";
        }
        ASSERT_TRUE(load_server_config(configPath.string()).registry.cacheDir == "/tmp/tf");

        {
            std::ofstream ofs(configPath);
            ofs << "{\"textframe\": ";
        }
        threw = false;
        try {
            load_server_config(configPath.string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        std::filesystem::remove(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Server config tests passed" << std::endl;
    return 0;
}
