/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "PathCache.hpp"
#include <boost/container_hash/hash.hpp>

namespace HexPath::PathfindingInternal {

PathCache::PathCache(float ttlSeconds, size_t maxEntries)
    : m_ttlSeconds(ttlSeconds), m_maxEntries(maxEntries) {
    m_entries.reserve(maxEntries);
}

size_t PathCache::contextSignature(const PathfindingContext& context) {
    size_t seed = 0;
    boost::hash_combine(seed, context.maxMovementPoints);
    boost::hash_combine(seed, context.maxSearchNodes);
    boost::hash_combine(seed, context.requireExplored);
    boost::hash_combine(seed, context.allowMoveThroughAllies);
    boost::hash_combine(seed, context.allowMoveThroughEnemies);
    boost::hash_combine(seed, context.storeDiagnosticData);
    // flat containers iterate in key order, so equal contents hash equally
    for (CellId cell : context.dynamicObstacles) {
        boost::hash_combine(seed, cell);
    }
    for (const auto& [label, multiplier] : context.terrainCostMultipliers) {
        boost::hash_combine(seed, label);
        boost::hash_combine(seed, multiplier);
    }
    return seed;
}

bool PathCache::isExpired(const CachedPath& entry,
                          std::chrono::steady_clock::time_point now) const {
    const std::chrono::duration<float> age = now - entry.timestamp;
    return age.count() >= m_ttlSeconds;
}

std::optional<PathResult> PathCache::find(CellId start, CellId goal,
                                          const PathfindingContext& context) {
    auto it = m_entries.find(makeKey(start, goal));
    if (it == m_entries.end()) {
        ++m_stats.misses;
        return std::nullopt;
    }

    if (isExpired(it->second, std::chrono::steady_clock::now())) {
        m_entries.erase(it);
        ++m_stats.expired;
        ++m_stats.misses;
        return std::nullopt;
    }

    if (it->second.contextSignature != contextSignature(context)) {
        ++m_stats.misses;
        return std::nullopt;
    }

    ++m_stats.hits;
    return it->second.result;
}

void PathCache::store(const PathResult& result, const PathfindingContext& context) {
    if (!result.isSuccess() || m_maxEntries == 0) {
        return;
    }

    const uint64_t key = makeKey(result.getStartCell(), result.getGoalCell());
    if (m_entries.size() >= m_maxEntries && m_entries.count(key) == 0) {
        m_entries.clear();
        ++m_stats.wipes;
    }

    CachedPath& entry = m_entries[key];
    entry.result = result;
    entry.timestamp = std::chrono::steady_clock::now();
    entry.contextSignature = contextSignature(context);
}

size_t PathCache::invalidate(const std::vector<CellId>& cells) {
    if (cells.empty()) {
        const size_t removed = m_entries.size();
        m_entries.clear();
        m_stats.invalidated += removed;
        return removed;
    }

    auto touches = [&cells](const PathResult& result) {
        for (CellId cell : cells) {
            if (result.getStartCell() == cell || result.getGoalCell() == cell ||
                result.containsCell(cell)) {
                return true;
            }
        }
        return false;
    };

    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (touches(it->second.result)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    m_stats.invalidated += removed;
    return removed;
}

size_t PathCache::evictExpired() {
    const auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (isExpired(it->second, now)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    m_stats.expired += removed;
    return removed;
}

void PathCache::clear() {
    m_entries.clear();
}

} // namespace HexPath::PathfindingInternal
