#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace patternedge {

class Config {
public:
    static Config& getInstance();

    // Throws ConfigError when the file is unreadable or a value is invalid
    void load(const std::string& config_path);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getLoadedPath() const { return loaded_path_; }

    // Missing keys keep their defaults
    static engine::EngineConfig parse(const nlohmann::json& j);
    static void validate(const engine::EngineConfig& config);

private:
    Config() = default;
    engine::EngineConfig engine_config_;
    std::string loaded_path_;
};

} // namespace patternedge
