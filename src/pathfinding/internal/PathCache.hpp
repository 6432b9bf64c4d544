/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_CACHE_HPP
#define PATH_CACHE_HPP

#include "pathfinding/PathResult.hpp"
#include "pathfinding/PathfindingContext.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace HexPath::PathfindingInternal {

/**
 * Cached search result with the time it was stored and a signature of the
 * context it was computed under.
 */
struct CachedPath {
    PathResult result;
    std::chrono::steady_clock::time_point timestamp;
    size_t contextSignature{0};
};

/**
 * Counters for monitoring cache effectiveness.
 */
struct PathCacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t expired = 0;
    size_t invalidated = 0;
    size_t wipes = 0;
};

/**
 * PathCache - Successful search results keyed by (start, goal).
 *
 * Entries live for a fixed time-to-live. When the cache is full it is wiped
 * wholesale before the next insert. Lookups under a different context than
 * the one an entry was computed with are misses.
 *
 * Not thread-safe: owned and touched only by PathfindingManager on the
 * thread that calls update().
 */
class PathCache {
public:
    static constexpr float DEFAULT_TTL_SECONDS = 5.0f;
    static constexpr size_t DEFAULT_MAX_ENTRIES = 100;

    explicit PathCache(float ttlSeconds = DEFAULT_TTL_SECONDS,
                       size_t maxEntries = DEFAULT_MAX_ENTRIES);

    static uint64_t makeKey(CellId start, CellId goal) {
        return (static_cast<uint64_t>(start) << 32) | static_cast<uint64_t>(goal);
    }

    // Hash of every context field that can change a search result
    static size_t contextSignature(const PathfindingContext& context);

    /**
     * Returns the cached result for start/goal when one exists, has not
     * expired and was computed under an equivalent context. Expired entries
     * are dropped on lookup.
     */
    std::optional<PathResult> find(CellId start, CellId goal,
                                   const PathfindingContext& context);

    // Failed results are ignored
    void store(const PathResult& result, const PathfindingContext& context);

    /**
     * Removes every entry whose start, goal or path contains one of the cells.
     * An empty list clears the whole cache.
     * @return Number of entries removed
     */
    size_t invalidate(const std::vector<CellId>& cells);

    // Drops expired entries, returns how many were removed
    size_t evictExpired();

    void clear();
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    void setTimeToLive(float seconds) { m_ttlSeconds = seconds; }
    float getTimeToLive() const { return m_ttlSeconds; }
    void setMaxEntries(size_t maxEntries) { m_maxEntries = maxEntries; }
    size_t getMaxEntries() const { return m_maxEntries; }

    const PathCacheStats& getStats() const { return m_stats; }
    void resetStats() { m_stats = PathCacheStats{}; }

private:
    bool isExpired(const CachedPath& entry,
                   std::chrono::steady_clock::time_point now) const;

    std::unordered_map<uint64_t, CachedPath> m_entries;
    float m_ttlSeconds;
    size_t m_maxEntries;
    PathCacheStats m_stats;
};

} // namespace HexPath::PathfindingInternal

#endif // PATH_CACHE_HPP
