/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/PathfindingConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>

namespace HexPath {

namespace {

void readInt(const JsonValue& object, const char* key, int& out) {
    if (auto value = object[key].tryAsInt()) {
        out = *value;
    } else if (object.hasKey(key)) {
        CONFIG_WARN(std::string("Expected a number for '") + key + "', keeping " +
                    std::to_string(out));
    }
}

void readBool(const JsonValue& object, const char* key, bool& out) {
    if (auto value = object[key].tryAsBool()) {
        out = *value;
    } else if (object.hasKey(key)) {
        CONFIG_WARN(std::string("Expected a boolean for '") + key + "', keeping " +
                    (out ? "true" : "false"));
    }
}

// Applies a parsed document to config; false leaves config partially written
bool applyConfig(const JsonValue& root, PathfindingConfig& config) {
    if (!root.isObject()) {
        CONFIG_ERROR("Config root is not a JSON object");
        return false;
    }

    const JsonValue& settings = root["pathfinding"];
    if (settings.isObject()) {
        if (auto name = settings["defaultAlgorithm"].tryAsString()) {
            config.defaultAlgorithm = *name;
        }
        readBool(settings, "enableCaching", config.enableCaching);
        readBool(settings, "logPerformance", config.logPerformance);
        if (auto duration = settings["cacheDurationSeconds"].tryAsNumber()) {
            if (*duration < 0.0) {
                CONFIG_ERROR("cacheDurationSeconds must not be negative");
                return false;
            }
            config.cacheDurationSeconds = static_cast<float>(*duration);
        }
        if (auto maxSize = settings["maxCacheSize"].tryAsInt()) {
            if (*maxSize < 0) {
                CONFIG_ERROR("maxCacheSize must not be negative");
                return false;
            }
            config.maxCacheSize = static_cast<size_t>(*maxSize);
        }
    } else if (!settings.isNull()) {
        CONFIG_WARN("'pathfinding' is not an object, skipping");
    }

    const JsonValue& presets = root["presets"];
    if (const JsonObject* presetObject = presets.tryAsObject()) {
        for (const auto& [name, presetValue] : *presetObject) {
            if (!presetValue.isObject()) {
                CONFIG_WARN("Preset '" + name + "' is not an object, skipping");
                continue;
            }
            auto existing = config.presets.find(name);
            const PathfindingContext base = existing != config.presets.end()
                                                ? existing->second
                                                : PathfindingContext{};
            config.presets[name] = contextFromJson(presetValue, base);
        }
    } else if (!presets.isNull()) {
        CONFIG_WARN("'presets' is not an object, skipping");
    }

    return true;
}

} // namespace

PathfindingConfig PathfindingConfig::createDefault() {
    PathfindingConfig config;

    PathfindingContext infantry;
    infantry.maxMovementPoints = 5;
    config.presets["Infantry"] = infantry;

    PathfindingContext cavalry;
    cavalry.maxMovementPoints = 8;
    cavalry.allowMoveThroughAllies = true;
    cavalry.setTerrainCostMultiplier("Forest", 2.0f);
    cavalry.setTerrainCostMultiplier("Mountains", 3.0f);
    cavalry.setTerrainCostMultiplier("Grassland", 0.5f);
    config.presets["Cavalry"] = cavalry;

    PathfindingContext flying;
    flying.maxMovementPoints = 10;
    flying.allowMoveThroughAllies = true;
    flying.allowMoveThroughEnemies = true;
    flying.requireExplored = false;
    flying.setTerrainCostMultiplier("Forest", 1.0f);
    flying.setTerrainCostMultiplier("Mountains", 1.0f);
    flying.setTerrainCostMultiplier("Ocean", 1.0f);
    config.presets["Flying"] = flying;

    PathfindingContext tactical;
    tactical.maxMovementPoints = 5;
    tactical.allowMoveThroughAllies = true;
    config.presets["TacticalCombat"] = tactical;

    return config;
}

std::optional<PathfindingContext> PathfindingConfig::getPreset(const std::string& name) const {
    auto it = presets.find(name);
    if (it == presets.end()) {
        return std::nullopt;
    }
    return it->second;
}

PathfindingContext contextFromJson(const JsonValue& value, const PathfindingContext& base) {
    PathfindingContext context = base;
    if (!value.isObject()) {
        return context;
    }

    readInt(value, "maxMovementPoints", context.maxMovementPoints);
    readInt(value, "maxSearchNodes", context.maxSearchNodes);
    readBool(value, "requireExplored", context.requireExplored);
    readBool(value, "allowMoveThroughAllies", context.allowMoveThroughAllies);
    readBool(value, "allowMoveThroughEnemies", context.allowMoveThroughEnemies);
    readBool(value, "storeDiagnosticData", context.storeDiagnosticData);
    readBool(value, "useCaching", context.useCaching);

    if (const JsonObject* multipliers = value["terrainCostMultipliers"].tryAsObject()) {
        for (const auto& [terrain, multiplierValue] : *multipliers) {
            auto multiplier = multiplierValue.tryAsNumber();
            if (!multiplier) {
                CONFIG_WARN("Multiplier for terrain '" + terrain + "' is not a number, skipping");
                continue;
            }
            const float clamped = std::clamp(static_cast<float>(*multiplier),
                                             PathfindingConfig::MIN_TERRAIN_MULTIPLIER,
                                             PathfindingConfig::MAX_TERRAIN_MULTIPLIER);
            if (clamped != static_cast<float>(*multiplier)) {
                CONFIG_WARN("Multiplier for terrain '" + terrain + "' clamped to " +
                            std::to_string(clamped));
            }
            context.setTerrainCostMultiplier(terrain, clamped);
        }
    }

    return context;
}

bool parsePathfindingConfig(const std::string& json, PathfindingConfig& config) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR("Failed to parse pathfinding config - " + reader.getLastError());
        return false;
    }

    PathfindingConfig parsed = config;
    if (!applyConfig(reader.getRoot(), parsed)) {
        return false;
    }
    config = std::move(parsed);
    return true;
}

bool loadPathfindingConfig(const std::string& path, PathfindingConfig& config) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR("Failed to load pathfinding config from file: " + path + " - " +
                     reader.getLastError());
        return false;
    }

    PathfindingConfig parsed = config;
    if (!applyConfig(reader.getRoot(), parsed)) {
        CONFIG_ERROR("Rejected pathfinding config file: " + path);
        return false;
    }
    config = std::move(parsed);
    CONFIG_INFO("Loaded pathfinding config from file: " + path + " (" +
                std::to_string(config.presets.size()) + " presets)");
    return true;
}

} // namespace HexPath
