#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace showgrab {
namespace core {

Config Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    Config config;
    try {
        if (j.contains("feedUrl") && !j["feedUrl"].is_null()) {
            config.feedUrl = j.at("feedUrl").get<std::string>();
        }
        if (j.contains("downloadDir") && !j["downloadDir"].is_null()) {
            config.downloadDir = j.at("downloadDir").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        // No file yet, run with defaults
        return Config{};
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Error reading configuration " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace core
} // namespace showgrab
