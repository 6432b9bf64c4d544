/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PathfindingManager.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "pathfinding/PriorityQueue.hpp"
#include "pathfinding/algorithms/AStarPathfinding.hpp"
#include "pathfinding/algorithms/BestFirstSearch.hpp"
#include "pathfinding/algorithms/BidirectionalAStar.hpp"
#include "pathfinding/algorithms/BreadthFirstSearch.hpp"
#include "../pathfinding/internal/PathCache.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <chrono>
#include <climits>
#include <cstdio>
#include <stdexcept>

namespace HexPath {

using PathfindingInternal::PathCache;

namespace {

// Position inside a multi-turn move: which turn, and how much of it is spent.
// Ordered lexicographically so fewer turns always wins.
struct TurnLabel {
    int turn;
    int used;

    bool operator<(const TurnLabel& other) const {
        return turn != other.turn ? turn < other.turn : used < other.used;
    }
};

constexpr TurnLabel UNREACHED_LABEL{INT_MAX, INT_MAX};

// Same turn rule as MultiTurnPathResult: a step that does not fit starts a
// new turn, and a turn with nothing spent always accepts its first step
TurnLabel advanceLabel(const TurnLabel& from, int stepCost, int movementPerTurn) {
    if (from.used == 0 || from.used + stepCost <= movementPerTurn) {
        return TurnLabel{from.turn, from.used + stepCost};
    }
    return TurnLabel{from.turn + 1, stepCost};
}

template <typename Listeners, typename... Args>
void invokeListeners(const Listeners& listeners, const char* kind, Args&&... args) {
    // Copy so listeners may add or remove listeners while being notified
    auto snapshot = listeners;
    for (const auto& listener : snapshot) {
        try {
            listener.callback(args...);
        } catch (const std::exception& e) {
            PATHFIND_ERROR(std::string("Exception in ") + kind + " listener: " + e.what());
        }
    }
}

template <typename Listeners>
bool eraseListener(Listeners& listeners, PathfindingManager::ListenerToken token) {
    auto it = std::find_if(listeners.begin(), listeners.end(),
                           [token](const auto& listener) { return listener.token == token; });
    if (it == listeners.end()) {
        return false;
    }
    listeners.erase(it);
    return true;
}

} // namespace

PathfindingManager::PathfindingManager(IHexGrid& grid, const PathfindingConfig& config,
                                       ThreadSystem* threadSystem)
    : m_grid(grid),
      m_threadSystem(threadSystem),
      m_config(config),
      m_cache(std::make_unique<PathCache>(config.cacheDurationSeconds, config.maxCacheSize)),
      m_cachingEnabled(config.enableCaching),
      m_logPerformance(config.logPerformance) {
    m_algorithms[static_cast<size_t>(AlgorithmType::AStar)] = std::make_shared<AStarPathfinding>();
    m_algorithms[static_cast<size_t>(AlgorithmType::Dijkstra)] = std::make_shared<DijkstraPathfinding>();
    m_algorithms[static_cast<size_t>(AlgorithmType::BFS)] = std::make_shared<BreadthFirstSearch>();
    m_algorithms[static_cast<size_t>(AlgorithmType::BestFirst)] = std::make_shared<BestFirstSearch>();
    m_algorithms[static_cast<size_t>(AlgorithmType::BidirectionalAStar)] =
        std::make_shared<BidirectionalAStar>();
    m_algorithms[static_cast<size_t>(AlgorithmType::FlowField)] =
        std::make_shared<FlowFieldPathfinding>();
    m_currentAlgorithm = m_algorithms[static_cast<size_t>(AlgorithmType::AStar)];

    if (!setAlgorithm(m_config.defaultAlgorithm)) {
        PATHFIND_WARN("Configured algorithm '" + m_config.defaultAlgorithm +
                      "' unavailable, using " + m_currentAlgorithm->getName());
    }

    PATHFIND_INFO("PathfindingManager initialized - " + std::to_string(m_grid.getCellCount()) +
                  " cells, algorithm: " + m_currentAlgorithm->getName() +
                  ", caching: " + (m_cachingEnabled ? "on" : "off") +
                  ", async: " + (m_threadSystem ? "ThreadSystem" : "inline"));
}

PathfindingManager::~PathfindingManager() {
    // Worker searches reference the grid; never leave them running
    if (!m_pendingRequests.empty()) {
        PATHFIND_DEBUG("Waiting for " + std::to_string(m_pendingRequests.size()) +
                       " undelivered requests before shutdown");
    }
    for (auto& request : m_pendingRequests) {
        if (request.future.valid()) {
            request.future.wait();
        }
    }
    m_pendingRequests.clear();
}

// ---------------------------------------------------------------
// Algorithms
// ---------------------------------------------------------------

const char* PathfindingManager::getAlgorithmTypeName(AlgorithmType type) {
    switch (type) {
    case AlgorithmType::AStar: return "AStar";
    case AlgorithmType::Dijkstra: return "Dijkstra";
    case AlgorithmType::BFS: return "BFS";
    case AlgorithmType::BestFirst: return "BestFirst";
    case AlgorithmType::BidirectionalAStar: return "BidirectionalAStar";
    case AlgorithmType::FlowField: return "FlowField";
    }
    return "Unknown";
}

void PathfindingManager::selectAlgorithm(std::shared_ptr<IPathfindingAlgorithm> algorithm) {
    m_currentAlgorithm = std::move(algorithm);
    clearCache();
    PATHFIND_DEBUG("Active algorithm: " + m_currentAlgorithm->getName());
}

void PathfindingManager::setAlgorithm(AlgorithmType type) {
    selectAlgorithm(getAlgorithmShared(type));
}

bool PathfindingManager::setAlgorithm(const std::string& name) {
    for (size_t i = 0; i < ALGORITHM_COUNT; ++i) {
        const auto type = static_cast<AlgorithmType>(i);
        if (boost::algorithm::iequals(name, getAlgorithmTypeName(type)) ||
            boost::algorithm::iequals(name, m_algorithms[i]->getName())) {
            setAlgorithm(type);
            return true;
        }
    }
    PATHFIND_ERROR("Unknown pathfinding algorithm '" + name + "', keeping " +
                   m_currentAlgorithm->getName());
    return false;
}

void PathfindingManager::setCustomAlgorithm(std::shared_ptr<IPathfindingAlgorithm> algorithm) {
    if (!algorithm) {
        throw std::invalid_argument("PathfindingManager::setCustomAlgorithm: algorithm is null");
    }
    PATHFIND_INFO("Custom algorithm installed: " + algorithm->getName());
    selectAlgorithm(std::move(algorithm));
}

std::shared_ptr<IPathfindingAlgorithm> PathfindingManager::getAlgorithmShared(AlgorithmType type) const {
    return m_algorithms[static_cast<size_t>(type)];
}

const IPathfindingAlgorithm& PathfindingManager::getAlgorithm(AlgorithmType type) const {
    return *m_algorithms[static_cast<size_t>(type)];
}

std::string PathfindingManager::getAlgorithmInfo() const {
    std::string info;
    for (size_t i = 0; i < ALGORITHM_COUNT; ++i) {
        const auto& algorithm = m_algorithms[i];
        info += (algorithm == m_currentAlgorithm) ? "* " : "  ";
        info += algorithm->getName() + " [" +
                getAlgorithmTypeName(static_cast<AlgorithmType>(i)) + "]: " +
                algorithm->getDescription() + "\n";
    }
    if (std::find(m_algorithms.begin(), m_algorithms.end(), m_currentAlgorithm) ==
        m_algorithms.end()) {
        info += "* " + m_currentAlgorithm->getName() + " [Custom]: " +
                m_currentAlgorithm->getDescription() + "\n";
    }
    return info;
}

// ---------------------------------------------------------------
// Synchronous queries
// ---------------------------------------------------------------

bool PathfindingManager::canCache(const PathfindingContext& context) const {
    return m_cachingEnabled && context.useCaching;
}

PathResult PathfindingManager::findPath(CellId start, CellId goal) {
    return findPath(start, goal, PathfindingContext::createDefault());
}

PathResult PathfindingManager::findPath(CellId start, CellId goal,
                                        const PathfindingContext& context) {
    if (!m_grid.isValidCell(start) || !m_grid.isValidCell(goal)) {
        PathResult failure =
            PathResult::createFailure(start, goal, FailureReason::START_OR_GOAL_NULL);
        recordSearch(failure, context);
        return failure;
    }

    if (canCache(context)) {
        if (auto cached = m_cache->find(start, goal, context)) {
            recordCacheHit(*cached);
            return std::move(*cached);
        }
    }

    PathResult result;
    try {
        result = m_currentAlgorithm->findPath(m_grid, start, goal, context);
    } catch (const std::exception& e) {
        PATHFIND_ERROR(m_currentAlgorithm->getName() + " threw: " + std::string(e.what()));
        result = PathResult::createFailure(
            start, goal, std::string(FailureReason::ALGORITHM_ERROR) + ": " + e.what());
    }
    recordSearch(result, context);
    return result;
}

std::vector<CellId> PathfindingManager::getReachableCells(CellId start, int maxMovement) {
    return getReachableCells(start, maxMovement, PathfindingContext::createDefault());
}

std::vector<CellId> PathfindingManager::getReachableCells(CellId start, int maxMovement,
                                                          const PathfindingContext& context) {
    if (!m_grid.isValidCell(start) || maxMovement < 0) {
        return {};
    }

    const size_t cellCount = m_grid.getCellCount();
    std::vector<int> bestCost(cellCount, INT_MAX);
    std::deque<CellId> frontier;
    NeighborList neighbors;

    bestCost[start] = 0;
    frontier.push_back(start);

    // A cell is queued again whenever a cheaper route to it turns up
    while (!frontier.empty()) {
        if (context.isCancellationRequested()) {
            break;
        }
        const CellId current = frontier.front();
        frontier.pop_front();

        m_grid.getNeighbors(current, neighbors);
        for (CellId neighbor : neighbors) {
            if (context.isObstacle(m_grid, neighbor)) {
                continue;
            }
            const int cost = bestCost[current] + context.getEffectiveMovementCost(m_grid, neighbor);
            if (cost > maxMovement || cost >= bestCost[neighbor]) {
                continue;
            }
            bestCost[neighbor] = cost;
            frontier.push_back(neighbor);
        }
    }

    std::vector<CellId> reachable;
    for (size_t i = 0; i < cellCount; ++i) {
        if (bestCost[i] != INT_MAX) {
            reachable.push_back(static_cast<CellId>(i));
        }
    }
    std::stable_sort(reachable.begin(), reachable.end(), [&bestCost](CellId a, CellId b) {
        return bestCost[a] < bestCost[b];
    });

    clearReachability();
    for (CellId cell : reachable) {
        m_grid.setReachableFlag(cell, true);
    }
    m_markedReachableCells = reachable;

    invokeListeners(m_reachableListeners, "reachable cells", start, reachable);
    return reachable;
}

PathfindingContext PathfindingManager::multiTurnSearchContext(const PathfindingContext& context) {
    PathfindingContext searchContext = context;
    searchContext.maxMovementPoints = PathfindingContext::UNLIMITED_MOVEMENT;
    searchContext.useCaching = false;
    return searchContext;
}

MultiTurnPathResult PathfindingManager::findMultiTurnPath(CellId start, CellId goal,
                                                          int movementPerTurn) {
    return findMultiTurnPath(start, goal, movementPerTurn, PathfindingContext::createDefault());
}

MultiTurnPathResult PathfindingManager::findMultiTurnPath(CellId start, CellId goal,
                                                          int movementPerTurn,
                                                          const PathfindingContext& context) {
    if (movementPerTurn <= 0) {
        PATHFIND_WARN("findMultiTurnPath called with movementPerTurn " +
                      std::to_string(movementPerTurn));
        return MultiTurnPathResult::createFailure(start, goal,
                                                  FailureReason::INVALID_MOVEMENT_PER_TURN,
                                                  movementPerTurn);
    }

    const PathfindingContext searchContext = multiTurnSearchContext(context);
    PathResult base = findPath(start, goal, searchContext);
    return MultiTurnPathResult::createFromSinglePath(m_grid, base, movementPerTurn, searchContext,
                                                     m_currentAlgorithm->measuresCostInSteps());
}

std::map<int, std::vector<CellId>>
PathfindingManager::getMultiTurnReachableCells(CellId start, int movementPerTurn, int maxTurns) {
    return getMultiTurnReachableCells(start, movementPerTurn, maxTurns,
                                      PathfindingContext::createDefault());
}

std::map<int, std::vector<CellId>>
PathfindingManager::getMultiTurnReachableCells(CellId start, int movementPerTurn, int maxTurns,
                                               const PathfindingContext& context) {
    std::map<int, std::vector<CellId>> cellsByTurn;
    if (!m_grid.isValidCell(start) || movementPerTurn <= 0 || maxTurns <= 0) {
        return cellsByTurn;
    }

    const size_t cellCount = m_grid.getCellCount();
    std::vector<TurnLabel> labels(cellCount, UNREACHED_LABEL);
    std::vector<bool> settled(cellCount, false);
    PriorityQueue<CellId, TurnLabel> openSet;
    NeighborList neighbors;

    labels[start] = TurnLabel{0, 0};
    openSet.push(start, labels[start]);

    while (!openSet.empty()) {
        if (context.isCancellationRequested()) {
            break;
        }
        const CellId current = openSet.pop();
        settled[current] = true;

        m_grid.getNeighbors(current, neighbors);
        for (CellId neighbor : neighbors) {
            if (settled[neighbor] || context.isObstacle(m_grid, neighbor)) {
                continue;
            }
            const TurnLabel next =
                advanceLabel(labels[current],
                             context.getEffectiveMovementCost(m_grid, neighbor), movementPerTurn);
            if (next.turn >= maxTurns || !(next < labels[neighbor])) {
                continue;
            }
            labels[neighbor] = next;
            openSet.push(neighbor, next);
        }
    }

    for (size_t i = 0; i < cellCount; ++i) {
        if (settled[i]) {
            cellsByTurn[labels[i].turn].push_back(static_cast<CellId>(i));
        }
    }
    return cellsByTurn;
}

int PathfindingManager::estimateTurnsToReach(CellId start, CellId goal, int movementPerTurn) const {
    if (!m_grid.isValidCell(start) || !m_grid.isValidCell(goal) || movementPerTurn <= 0) {
        return -1;
    }
    const int distance = hexDistance(m_grid.getAxialCoord(start), m_grid.getAxialCoord(goal));
    return std::max(1, (distance + movementPerTurn - 1) / movementPerTurn);
}

DijkstraResult PathfindingManager::findAllPathsFrom(CellId start,
                                                    const PathfindingContext& context) const {
    const auto& dijkstra =
        static_cast<const DijkstraPathfinding&>(getAlgorithm(AlgorithmType::Dijkstra));
    return dijkstra.findAllPaths(m_grid, start, context);
}

FlowField PathfindingManager::generateFlowField(CellId goal, const PathfindingContext& context,
                                                int maxDistance) const {
    const auto& flowField =
        static_cast<const FlowFieldPathfinding&>(getAlgorithm(AlgorithmType::FlowField));
    FlowField field = flowField.generateFlowField(m_grid, goal, context, maxDistance);
    if (m_logPerformance) {
        PATHFIND_DEBUG(field.toString() + " in " + std::to_string(field.getGenerationTimeMs()) +
                       "ms");
    }
    return field;
}

std::vector<CellId> PathfindingManager::getCellsWithinSteps(CellId start, int maxSteps,
                                                            const PathfindingContext& context) const {
    const auto& bfs = static_cast<const BreadthFirstSearch&>(getAlgorithm(AlgorithmType::BFS));
    return bfs.getCellsWithinSteps(m_grid, start, maxSteps, context);
}

// ---------------------------------------------------------------
// Grid markings
// ---------------------------------------------------------------

void PathfindingManager::markPath(const std::vector<CellId>& path) {
    for (CellId cell : path) {
        if (m_grid.isValidCell(cell)) {
            m_grid.setPathFlag(cell, true);
            m_markedPathCells.push_back(cell);
        }
    }
}

void PathfindingManager::clearPaths() {
    for (CellId cell : m_markedPathCells) {
        m_grid.setPathFlag(cell, false);
    }
    m_markedPathCells.clear();
}

void PathfindingManager::clearReachability() {
    for (CellId cell : m_markedReachableCells) {
        m_grid.setReachableFlag(cell, false);
    }
    m_markedReachableCells.clear();
}

bool PathfindingManager::setCellReserved(CellId cell, bool reserved) {
    if (!m_grid.isValidCell(cell)) {
        PATHFIND_WARN("setCellReserved called with invalid cell " + std::to_string(cell));
        return false;
    }
    if (m_grid.isReserved(cell) == reserved) {
        return true;
    }

    m_grid.setReserved(cell, reserved);
    if (reserved) {
        invalidateCache({cell});
    } else {
        clearCache();
    }
    return true;
}

bool PathfindingManager::isCellReserved(CellId cell) const {
    return m_grid.isValidCell(cell) && m_grid.isReserved(cell);
}

// ---------------------------------------------------------------
// Async requests
// ---------------------------------------------------------------

std::future<PathResult> PathfindingManager::dispatchSearch(RequestId id, CellId start, CellId goal,
                                                           const PathfindingContext& context) {
    std::shared_ptr<IPathfindingAlgorithm> algorithm = m_currentAlgorithm;

    if (m_threadSystem && m_threadSystem->isRunning() && algorithm->supportsConcurrentExecution()) {
        try {
            const IHexGrid& grid = m_grid;
            return m_threadSystem->enqueueTaskWithResult(
                [algorithm, &grid, start, goal, context]() {
                    return algorithm->findPath(grid, start, goal, context);
                },
                TaskPriority::Normal, "PathRequest " + std::to_string(id));
        } catch (const std::exception& e) {
            PATHFIND_WARN("Request " + std::to_string(id) + " could not be queued, running inline: " +
                          std::string(e.what()));
        }
    }

    std::promise<PathResult> promise;
    try {
        promise.set_value(algorithm->findPath(m_grid, start, goal, context));
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

PathfindingManager::RequestId PathfindingManager::queueRequest(PendingRequest request) {
    const RequestId id = request.id;
    ++m_stats.asyncRequests;
    m_pendingRequests.push_back(std::move(request));
    return id;
}

PathfindingManager::RequestId PathfindingManager::findPathAsync(CellId start, CellId goal,
                                                                const PathfindingContext& context,
                                                                PathCallback callback) {
    PendingRequest request;
    request.id = m_nextRequestId++;
    request.cacheGeneration = m_cacheGeneration;
    request.start = start;
    request.goal = goal;
    request.context = context;
    request.callback = std::move(callback);

    if (!m_grid.isValidCell(start) || !m_grid.isValidCell(goal)) {
        std::promise<PathResult> promise;
        promise.set_value(PathResult::createFailure(start, goal, FailureReason::START_OR_GOAL_NULL));
        request.future = promise.get_future();
        return queueRequest(std::move(request));
    }

    if (canCache(context)) {
        if (auto cached = m_cache->find(start, goal, context)) {
            std::promise<PathResult> promise;
            promise.set_value(std::move(*cached));
            request.future = promise.get_future();
            request.fromCache = true;
            return queueRequest(std::move(request));
        }
    }

    request.future = dispatchSearch(request.id, start, goal, context);
    return queueRequest(std::move(request));
}

PathfindingManager::RequestId
PathfindingManager::findMultiTurnPathAsync(CellId start, CellId goal, int movementPerTurn,
                                           const PathfindingContext& context,
                                           MultiTurnPathCallback callback) {
    PendingRequest request;
    request.id = m_nextRequestId++;
    request.cacheGeneration = m_cacheGeneration;
    request.start = start;
    request.goal = goal;
    request.context = multiTurnSearchContext(context);
    request.multiTurn = true;
    request.costInSteps = m_currentAlgorithm->measuresCostInSteps();
    request.movementPerTurn = movementPerTurn;
    request.multiTurnCallback = std::move(callback);

    if (movementPerTurn <= 0 || !m_grid.isValidCell(start) || !m_grid.isValidCell(goal)) {
        std::promise<PathResult> promise;
        promise.set_value(PathResult::createFailure(start, goal, FailureReason::START_OR_GOAL_NULL));
        request.future = promise.get_future();
        return queueRequest(std::move(request));
    }

    request.future = dispatchSearch(request.id, start, goal, request.context);
    return queueRequest(std::move(request));
}

void PathfindingManager::deliver(PendingRequest& request) {
    if (request.multiTurn && request.movementPerTurn <= 0) {
        if (request.multiTurnCallback) {
            request.multiTurnCallback(MultiTurnPathResult::createFailure(
                request.start, request.goal, FailureReason::INVALID_MOVEMENT_PER_TURN,
                request.movementPerTurn));
        }
        return;
    }

    PathResult result;
    try {
        result = request.future.get();
    } catch (const std::exception& e) {
        PATHFIND_ERROR("Request " + std::to_string(request.id) + " failed: " + std::string(e.what()));
        result = PathResult::createFailure(
            request.start, request.goal,
            std::string(FailureReason::ALGORITHM_ERROR) + ": " + e.what());
    }

    if (request.fromCache) {
        recordCacheHit(result);
    } else {
        // The cache was invalidated after dispatch; the result may be stale
        recordSearch(result, request.context, request.cacheGeneration == m_cacheGeneration);
    }

    if (request.multiTurn) {
        if (request.multiTurnCallback) {
            request.multiTurnCallback(MultiTurnPathResult::createFromSinglePath(
                m_grid, result, request.movementPerTurn, request.context, request.costInSteps));
        }
    } else if (request.callback) {
        request.callback(result);
    }
}

void PathfindingManager::update() {
    // Deliver in request order; anything delivered may queue new requests
    std::deque<PendingRequest> ready;
    for (auto it = m_pendingRequests.begin(); it != m_pendingRequests.end();) {
        if (it->future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            ready.push_back(std::move(*it));
            it = m_pendingRequests.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& request : ready) {
        try {
            deliver(request);
        } catch (const std::exception& e) {
            PATHFIND_ERROR("Exception delivering request " + std::to_string(request.id) + ": " +
                           std::string(e.what()));
        }
    }
}

void PathfindingManager::flushPendingRequests() {
    while (!m_pendingRequests.empty()) {
        PendingRequest request = std::move(m_pendingRequests.front());
        m_pendingRequests.pop_front();
        if (request.future.valid()) {
            request.future.wait();
        }
        try {
            deliver(request);
        } catch (const std::exception& e) {
            PATHFIND_ERROR("Exception delivering request " + std::to_string(request.id) + ": " +
                           std::string(e.what()));
        }
    }
}

// ---------------------------------------------------------------
// Observers
// ---------------------------------------------------------------

PathfindingManager::ListenerToken PathfindingManager::addPathFoundListener(PathCallback callback) {
    const ListenerToken token = m_nextListenerToken++;
    m_pathFoundListeners.push_back({token, std::move(callback)});
    return token;
}

PathfindingManager::ListenerToken PathfindingManager::addPathFailedListener(PathCallback callback) {
    const ListenerToken token = m_nextListenerToken++;
    m_pathFailedListeners.push_back({token, std::move(callback)});
    return token;
}

PathfindingManager::ListenerToken
PathfindingManager::addReachableCellsListener(ReachableCellsCallback callback) {
    const ListenerToken token = m_nextListenerToken++;
    m_reachableListeners.push_back({token, std::move(callback)});
    return token;
}

bool PathfindingManager::removeListener(ListenerToken token) {
    return eraseListener(m_pathFoundListeners, token) ||
           eraseListener(m_pathFailedListeners, token) ||
           eraseListener(m_reachableListeners, token);
}

void PathfindingManager::notifyPathListeners(const PathResult& result) {
    if (result.isSuccess()) {
        invokeListeners(m_pathFoundListeners, "path found", result);
    } else {
        invokeListeners(m_pathFailedListeners, "path failed", result);
    }
}

void PathfindingManager::recordSearch(const PathResult& result, const PathfindingContext& context,
                                      bool cacheable) {
    ++m_stats.totalPathsFound;
    m_stats.totalComputationTimeMs += result.getComputationTimeMs();

    if (result.isSuccess()) {
        if (cacheable && canCache(context)) {
            m_cache->store(result, context);
        }
    } else {
        ++m_stats.failedPaths;
    }

    if (m_logPerformance) {
        PATHFIND_DEBUG(m_currentAlgorithm->getName() + ": " + result.toString());
    }
    notifyPathListeners(result);
}

void PathfindingManager::recordCacheHit(const PathResult& result) {
    ++m_stats.totalCacheHits;
    notifyPathListeners(result);
}

// ---------------------------------------------------------------
// Cache
// ---------------------------------------------------------------

void PathfindingManager::invalidateCache() {
    clearCache();
}

void PathfindingManager::invalidateCache(const std::vector<CellId>& cells) {
    ++m_cacheGeneration;
    const size_t removed = m_cache->invalidate(cells);
    if (removed > 0) {
        PATHFIND_DEBUG("Invalidated " + std::to_string(removed) + " cached paths");
    }
}

void PathfindingManager::clearCache() {
    ++m_cacheGeneration;
    m_cache->clear();
}

size_t PathfindingManager::getCacheSize() const {
    return m_cache->size();
}

void PathfindingManager::setCachingEnabled(bool enabled) {
    m_cachingEnabled = enabled;
    if (!enabled) {
        clearCache();
    }
}

void PathfindingManager::setCacheDuration(float seconds) {
    m_cache->setTimeToLive(std::max(0.0f, seconds));
    m_cache->evictExpired();
}

void PathfindingManager::setMaxCacheSize(size_t maxEntries) {
    m_cache->setMaxEntries(maxEntries);
    if (m_cache->size() > maxEntries) {
        clearCache();
    }
}

// ---------------------------------------------------------------
// Statistics
// ---------------------------------------------------------------

PathfindingManager::PathfindingStats PathfindingManager::getStats() const {
    PathfindingStats stats = m_stats;
    if (stats.totalPathsFound > 0) {
        stats.averageComputationTimeMs =
            stats.totalComputationTimeMs / static_cast<double>(stats.totalPathsFound);
    }
    const uint64_t lookups = stats.totalPathsFound + stats.totalCacheHits;
    if (lookups > 0) {
        stats.cacheHitRate =
            static_cast<float>(stats.totalCacheHits) / static_cast<float>(lookups);
    }
    stats.cacheSize = m_cache->size();
    return stats;
}

std::string PathfindingManager::getStatistics() const {
    const PathfindingStats stats = getStats();
    char buffer[320];
    std::snprintf(buffer, sizeof(buffer),
                  "Pathfinding Statistics [%s]\n"
                  "  Searches: %llu (failed %llu)\n"
                  "  Cache: %llu hits, %.1f%% hit rate, %zu entries\n"
                  "  Async requests: %llu (%zu pending)\n"
                  "  Time: %.2fms total, %.3fms average",
                  m_currentAlgorithm->getName().c_str(),
                  static_cast<unsigned long long>(stats.totalPathsFound),
                  static_cast<unsigned long long>(stats.failedPaths),
                  static_cast<unsigned long long>(stats.totalCacheHits),
                  stats.cacheHitRate * 100.0f, stats.cacheSize,
                  static_cast<unsigned long long>(stats.asyncRequests),
                  m_pendingRequests.size(), stats.totalComputationTimeMs,
                  stats.averageComputationTimeMs);
    return std::string(buffer);
}

void PathfindingManager::resetStats() {
    m_stats = PathfindingStats{};
    m_cache->resetStats();
}

} // namespace HexPath
