// game_config.cpp
#include "connectfour/core/game_config.h"
#include "connectfour/core/errors.h"
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace connectfour {
namespace core {

using json = nlohmann::json;

void GameConfig::validate() const {
    if (rows <= 0 || columns <= 0) {
        throw GameConstructionError(
            "Board dimensions must be strictly positive, got " +
            std::to_string(rows) + "x" + std::to_string(columns));
    }
    if (maxInvalidAttempts < 1) {
        throw GameConstructionError("max_invalid_attempts must be at least 1");
    }
    // from_str maps unknown names to "off", so check the round trip
    auto level = spdlog::level::from_str(logLevel);
    if (level == spdlog::level::off && logLevel != "off") {
        throw GameConstructionError("Unknown log level: " + logLevel);
    }
}

std::string GameConfig::toJson() const {
    json j;
    j["rows"] = rows;
    j["columns"] = columns;
    j["seed"] = seed;
    j["max_invalid_attempts"] = maxInvalidAttempts;
    j["log_level"] = logLevel;
    return j.dump(4);
}

GameConfig GameConfig::fromJson(const std::string& jsonStr) {
    GameConfig config;
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw GameConstructionError("Game configuration must be a JSON object");
        }

        config.rows = j.value("rows", config.rows);
        config.columns = j.value("columns", config.columns);
        std::int64_t seed = j.value("seed", static_cast<std::int64_t>(config.seed));
        if (seed < 0 || seed > static_cast<std::int64_t>(std::numeric_limits<uint32_t>::max())) {
            throw GameConstructionError("seed must lie within [0, " +
                std::to_string(std::numeric_limits<uint32_t>::max()) + "], got " + std::to_string(seed));
        }
        config.seed = static_cast<uint32_t>(seed);
        config.maxInvalidAttempts = j.value("max_invalid_attempts", config.maxInvalidAttempts);
        config.logLevel = j.value("log_level", config.logLevel);
    } catch (const json::exception& e) {
        throw GameConstructionError("Failed to parse game configuration: " + std::string(e.what()));
    }

    config.validate();
    return config;
}

GameConfig GameConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw GameConstructionError("Could not open configuration file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

} // namespace core
} // namespace connectfour
