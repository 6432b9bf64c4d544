/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_CONFIG_HPP
#define PATHFINDING_CONFIG_HPP

/**
 * @file PathfindingConfig.hpp
 * @brief Manager defaults and named context presets, loadable from JSON
 *
 * File layout:
 * @code
 * {
 *   "pathfinding": { "defaultAlgorithm": "AStar", "enableCaching": true,
 *                    "cacheDurationSeconds": 5.0, "maxCacheSize": 100,
 *                    "logPerformance": false },
 *   "presets": { "Infantry": { "maxMovementPoints": 5,
 *                              "terrainCostMultipliers": { "Forest": 2.0 } } }
 * }
 * @endcode
 * Missing keys keep their current values.
 */

#include "pathfinding/PathfindingContext.hpp"
#include <map>
#include <optional>
#include <string>

namespace HexPath {

class JsonValue;

struct PathfindingConfig {
    static constexpr float MIN_TERRAIN_MULTIPLIER = 0.1f;
    static constexpr float MAX_TERRAIN_MULTIPLIER = 10.0f;

    std::string defaultAlgorithm{"AStar"};
    bool enableCaching{true};
    float cacheDurationSeconds{5.0f};
    size_t maxCacheSize{100};
    bool logPerformance{false};

    // Named contexts for unit types; file presets override built-ins by name
    std::map<std::string, PathfindingContext> presets;

    // Defaults plus the Infantry, Cavalry, Flying and TacticalCombat presets
    static PathfindingConfig createDefault();

    std::optional<PathfindingContext> getPreset(const std::string& name) const;
    bool hasPreset(const std::string& name) const { return presets.count(name) > 0; }
};

/**
 * @brief Load a config file into config
 *
 * On any error the reason is logged and config is left untouched.
 * @return true if the file was read and applied
 */
bool loadPathfindingConfig(const std::string& path, PathfindingConfig& config);

// Same as loadPathfindingConfig for an in-memory document
bool parsePathfindingConfig(const std::string& json, PathfindingConfig& config);

/**
 * @brief Build a context from a preset object
 *
 * Keys absent from value keep the values of base. Terrain multipliers are
 * clamped to [MIN_TERRAIN_MULTIPLIER, MAX_TERRAIN_MULTIPLIER].
 */
PathfindingContext contextFromJson(const JsonValue& value,
                                   const PathfindingContext& base = PathfindingContext{});

} // namespace HexPath

#endif // PATHFINDING_CONFIG_HPP
