#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace showgrab {
namespace core {

struct Config {
    std::string feedUrl;
    std::string downloadDir;

    // JSON serialization
    nlohmann::json toJson() const {
        return nlohmann::json{
            {"feedUrl", feedUrl},
            {"downloadDir", downloadDir}
        };
    }

    // Missing keys keep their defaults; wrong types throw ConfigError
    static Config fromJson(const nlohmann::json& j);

    // Reads a config file. A missing file yields defaults.
    static Config load(const std::string& path);
};

} // namespace core
} // namespace showgrab
