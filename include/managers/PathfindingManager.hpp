/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_MANAGER_HPP
#define PATHFINDING_MANAGER_HPP

/**
 * @file PathfindingManager.hpp
 * @brief Front door of the hex pathfinding service
 *
 * PathfindingManager owns the algorithm registry, the result cache and the
 * observer lists for one hex grid:
 * - Synchronous queries: paths, reachable ranges, multi-turn paths
 * - Async queries run on an attached ThreadSystem when the active algorithm
 *   allows it, otherwise inline; results are delivered by update()
 * - Result caching with a time-to-live and cell-based invalidation
 * - Cell reservation with matching cache invalidation
 *
 * Threading contract:
 * - The manager is used from one owning thread. Only the searches themselves
 *   run on worker threads; cache, statistics and observers are touched by
 *   the owning thread only, inside the public calls and update().
 * - The grid must not be modified while async searches are in flight.
 */

#include "pathfinding/IPathfindingAlgorithm.hpp"
#include "pathfinding/MultiTurnPathResult.hpp"
#include "pathfinding/PathfindingConfig.hpp"
#include "pathfinding/algorithms/DijkstraPathfinding.hpp"
#include "pathfinding/algorithms/FlowFieldPathfinding.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace HexPath {

class ThreadSystem;

namespace PathfindingInternal {
class PathCache;
}

class PathfindingManager {
public:
    enum class AlgorithmType : int {
        AStar = 0,
        Dijkstra,
        BFS,
        BestFirst,
        BidirectionalAStar,
        FlowField
    };
    static constexpr size_t ALGORITHM_COUNT = static_cast<size_t>(AlgorithmType::FlowField) + 1;

    using RequestId = uint64_t;
    using ListenerToken = uint64_t;

    using PathCallback = std::function<void(const PathResult&)>;
    using MultiTurnPathCallback = std::function<void(const MultiTurnPathResult&)>;
    using ReachableCellsCallback = std::function<void(CellId, const std::vector<CellId>&)>;

    /**
     * @brief Statistics snapshot returned by getStats()
     *
     * totalPathsFound counts every search that was actually run, failed ones
     * included; cache hits are counted separately.
     */
    struct PathfindingStats {
        uint64_t totalPathsFound{0};
        uint64_t failedPaths{0};
        uint64_t totalCacheHits{0};
        uint64_t asyncRequests{0};
        double totalComputationTimeMs{0.0};
        double averageComputationTimeMs{0.0};
        float cacheHitRate{0.0f};
        size_t cacheSize{0};
    };

    /**
     * @brief Create a manager bound to a grid
     *
     * @param grid Grid searched by every query; must outlive the manager
     * @param config Algorithm, cache and logging defaults
     * @param threadSystem Optional worker pool for async requests; must
     *        outlive the manager. Without one, async requests run inline.
     */
    explicit PathfindingManager(IHexGrid& grid,
                                const PathfindingConfig& config = PathfindingConfig{},
                                ThreadSystem* threadSystem = nullptr);
    ~PathfindingManager();

    PathfindingManager(const PathfindingManager&) = delete;
    PathfindingManager& operator=(const PathfindingManager&) = delete;

    // ---------------------------------------------------------------
    // Algorithms
    // ---------------------------------------------------------------

    void setAlgorithm(AlgorithmType type);

    /**
     * @brief Select an algorithm by enum name ("BidirectionalAStar") or
     * display name ("Bidirectional A*"), case-insensitive
     * @return false if the name is unknown; the current algorithm is kept
     */
    bool setAlgorithm(const std::string& name);

    /**
     * @brief Replace the active algorithm with a caller-supplied one
     * @throws std::invalid_argument if algorithm is null
     */
    void setCustomAlgorithm(std::shared_ptr<IPathfindingAlgorithm> algorithm);

    const IPathfindingAlgorithm& getCurrentAlgorithm() const { return *m_currentAlgorithm; }
    const IPathfindingAlgorithm& getAlgorithm(AlgorithmType type) const;
    static const char* getAlgorithmTypeName(AlgorithmType type);

    // One line per built-in algorithm, the active one marked
    std::string getAlgorithmInfo() const;

    // ---------------------------------------------------------------
    // Synchronous queries
    // ---------------------------------------------------------------

    PathResult findPath(CellId start, CellId goal);
    PathResult findPath(CellId start, CellId goal, const PathfindingContext& context);

    /**
     * @brief Cells reachable from start within maxMovement effective cost
     *
     * Start included. Sets the grid's reachable flag on every returned cell
     * (after clearing the previous set) and notifies reachable listeners.
     * Empty for an invalid start or a negative budget.
     */
    std::vector<CellId> getReachableCells(CellId start, int maxMovement);
    std::vector<CellId> getReachableCells(CellId start, int maxMovement,
                                          const PathfindingContext& context);

    /**
     * @brief Path to a goal beyond single-turn range, split into turns
     *
     * The context's movement limit is ignored and caching is bypassed.
     */
    MultiTurnPathResult findMultiTurnPath(CellId start, CellId goal, int movementPerTurn);
    MultiTurnPathResult findMultiTurnPath(CellId start, CellId goal, int movementPerTurn,
                                          const PathfindingContext& context);

    /**
     * @brief Cells grouped by the earliest turn they can be reached in
     *
     * Turns are 0-based: turn 0 holds the start and everything reachable with
     * the first turn's allowance, and only turns below maxTurns are listed.
     * Turns follow the same rules as findMultiTurnPath, so an oversized single
     * step fills a turn on its own.
     * Empty for an invalid start, movementPerTurn <= 0 or maxTurns <= 0.
     */
    std::map<int, std::vector<CellId>> getMultiTurnReachableCells(CellId start,
                                                                  int movementPerTurn,
                                                                  int maxTurns);
    std::map<int, std::vector<CellId>> getMultiTurnReachableCells(CellId start,
                                                                  int movementPerTurn,
                                                                  int maxTurns,
                                                                  const PathfindingContext& context);

    // Lower bound from hex distance; -1 for invalid cells or movementPerTurn <= 0
    int estimateTurnsToReach(CellId start, CellId goal, int movementPerTurn) const;

    // Direct access to the specialised algorithms, bypassing the cache
    DijkstraResult findAllPathsFrom(CellId start, const PathfindingContext& context) const;
    FlowField generateFlowField(CellId goal, const PathfindingContext& context,
                                int maxDistance = -1) const;
    std::vector<CellId> getCellsWithinSteps(CellId start, int maxSteps,
                                            const PathfindingContext& context) const;

    // ---------------------------------------------------------------
    // Grid markings
    // ---------------------------------------------------------------

    // Sets the path flag on every cell of path (earlier marks are kept)
    void markPath(const std::vector<CellId>& path);
    void clearPaths();
    void clearReachability();

    /**
     * @brief Reserve or release a cell for other searches
     *
     * Reserving drops cached paths touching the cell; releasing clears the
     * whole cache since a freed cell may shorten any cached path.
     * @return false for an invalid cell
     */
    bool setCellReserved(CellId cell, bool reserved);
    bool isCellReserved(CellId cell) const;

    // ---------------------------------------------------------------
    // Async requests
    // ---------------------------------------------------------------

    RequestId findPathAsync(CellId start, CellId goal, const PathfindingContext& context,
                            PathCallback callback);
    RequestId findMultiTurnPathAsync(CellId start, CellId goal, int movementPerTurn,
                                     const PathfindingContext& context,
                                     MultiTurnPathCallback callback);

    /**
     * @brief Deliver finished async requests on the calling thread
     *
     * For each finished request: cache write, statistics, observers, then
     * the request callback. Unfinished requests stay pending.
     */
    void update();

    // Blocks until every pending request has been delivered
    void flushPendingRequests();

    size_t getPendingRequestCount() const { return m_pendingRequests.size(); }
    bool hasPendingWork() const { return !m_pendingRequests.empty(); }

    // ---------------------------------------------------------------
    // Observers
    // ---------------------------------------------------------------

    ListenerToken addPathFoundListener(PathCallback callback);
    ListenerToken addPathFailedListener(PathCallback callback);
    ListenerToken addReachableCellsListener(ReachableCellsCallback callback);
    // @return false if the token is unknown
    bool removeListener(ListenerToken token);

    // ---------------------------------------------------------------
    // Cache
    // ---------------------------------------------------------------

    void invalidateCache();
    // Drops entries whose start, goal or path touches a listed cell
    void invalidateCache(const std::vector<CellId>& cells);
    void clearCache();
    size_t getCacheSize() const;

    void setCachingEnabled(bool enabled);
    bool isCachingEnabled() const { return m_cachingEnabled; }
    void setCacheDuration(float seconds);
    void setMaxCacheSize(size_t maxEntries);
    void setLogPerformance(bool enabled) { m_logPerformance = enabled; }

    // ---------------------------------------------------------------
    // Statistics
    // ---------------------------------------------------------------

    PathfindingStats getStats() const;
    std::string getStatistics() const;
    void resetStats();

    const PathfindingConfig& getConfig() const { return m_config; }

private:
    struct PendingRequest {
        RequestId id{0};
        CellId start{INVALID_CELL};
        CellId goal{INVALID_CELL};
        PathfindingContext context;
        std::future<PathResult> future;
        bool fromCache{false};
        uint64_t cacheGeneration{0};
        bool multiTurn{false};
        int movementPerTurn{0};
        bool costInSteps{false};
        PathCallback callback;
        MultiTurnPathCallback multiTurnCallback;
    };

    template <typename Callback>
    struct Listener {
        ListenerToken token;
        Callback callback;
    };

    IHexGrid& m_grid;
    ThreadSystem* m_threadSystem;
    PathfindingConfig m_config;

    std::array<std::shared_ptr<IPathfindingAlgorithm>, ALGORITHM_COUNT> m_algorithms;
    std::shared_ptr<IPathfindingAlgorithm> m_currentAlgorithm;

    std::unique_ptr<PathfindingInternal::PathCache> m_cache;
    bool m_cachingEnabled{true};
    bool m_logPerformance{false};
    // Bumped on every invalidation; results dispatched earlier are not cached
    uint64_t m_cacheGeneration{0};

    std::deque<PendingRequest> m_pendingRequests;
    RequestId m_nextRequestId{1};

    std::vector<Listener<PathCallback>> m_pathFoundListeners;
    std::vector<Listener<PathCallback>> m_pathFailedListeners;
    std::vector<Listener<ReachableCellsCallback>> m_reachableListeners;
    ListenerToken m_nextListenerToken{1};

    std::vector<CellId> m_markedPathCells;
    std::vector<CellId> m_markedReachableCells;

    PathfindingStats m_stats;

    void selectAlgorithm(std::shared_ptr<IPathfindingAlgorithm> algorithm);
    bool canCache(const PathfindingContext& context) const;
    std::shared_ptr<IPathfindingAlgorithm> getAlgorithmShared(AlgorithmType type) const;

    // Cache write, statistics and observers for a search that was run
    void recordSearch(const PathResult& result, const PathfindingContext& context,
                      bool cacheable = true);
    void recordCacheHit(const PathResult& result);
    void notifyPathListeners(const PathResult& result);

    std::future<PathResult> dispatchSearch(RequestId id, CellId start, CellId goal,
                                           const PathfindingContext& context);
    RequestId queueRequest(PendingRequest request);
    void deliver(PendingRequest& request);

    static PathfindingContext multiTurnSearchContext(const PathfindingContext& context);
};

} // namespace HexPath

#endif // PATHFINDING_MANAGER_HPP
