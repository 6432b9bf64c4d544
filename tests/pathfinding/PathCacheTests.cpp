/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PathCacheTests
#include <boost/test/unit_test.hpp>

#include "pathfinding/internal/PathCache.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace HexPath;
using HexPath::PathfindingInternal::PathCache;

namespace {

PathResult makePath(CellId start, CellId goal, std::vector<CellId> middle = {}) {
    std::vector<CellId> path{start};
    path.insert(path.end(), middle.begin(), middle.end());
    path.push_back(goal);
    return PathResult::createSuccess(start, goal, path, static_cast<int>(path.size()) - 1,
                                     static_cast<int>(path.size()), 0.2);
}

} // namespace

BOOST_AUTO_TEST_SUITE(PathCacheLookupTests)

BOOST_AUTO_TEST_CASE(KeyPacksStartAndGoal) {
    BOOST_CHECK_EQUAL(PathCache::makeKey(1, 2), (uint64_t{1} << 32) | 2u);
    BOOST_CHECK_NE(PathCache::makeKey(1, 2), PathCache::makeKey(2, 1));
}

BOOST_AUTO_TEST_CASE(StoreAndFind) {
    PathCache cache;
    PathfindingContext context;
    BOOST_CHECK(!cache.find(1, 5, context).has_value());

    cache.store(makePath(1, 5, {2, 3}), context);
    BOOST_CHECK_EQUAL(cache.size(), 1u);

    auto hit = cache.find(1, 5, context);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_EQUAL(hit->getPathLength(), 4u);
    BOOST_CHECK(!cache.find(5, 1, context).has_value());

    BOOST_CHECK_EQUAL(cache.getStats().hits, 1u);
    BOOST_CHECK_EQUAL(cache.getStats().misses, 2u);
    cache.resetStats();
    BOOST_CHECK_EQUAL(cache.getStats().hits, 0u);
}

BOOST_AUTO_TEST_CASE(FailuresAreNotStored) {
    PathCache cache;
    PathfindingContext context;
    cache.store(PathResult::createFailure(1, 5, FailureReason::GOAL_UNREACHABLE, 30), context);
    BOOST_CHECK(cache.empty());
}

BOOST_AUTO_TEST_CASE(DifferentContextIsAMiss) {
    PathCache cache;
    PathfindingContext context;
    cache.store(makePath(1, 5), context);

    PathfindingContext limited = PathfindingContext::createWithMovementLimit(3);
    BOOST_CHECK(!cache.find(1, 5, limited).has_value());

    PathfindingContext weighted;
    weighted.setTerrainCostMultiplier("Forest", 2.0f);
    BOOST_CHECK(!cache.find(1, 5, weighted).has_value());

    PathfindingContext withObstacle;
    withObstacle.addDynamicObstacle(9);
    BOOST_CHECK(!cache.find(1, 5, withObstacle).has_value());

    // A copy of the storing context still hits
    PathfindingContext same = context.clone();
    BOOST_CHECK(cache.find(1, 5, same).has_value());
    // The entry survives mismatched lookups
    BOOST_CHECK_EQUAL(cache.size(), 1u);
}

BOOST_AUTO_TEST_CASE(SignatureIgnoresCancellationToken) {
    PathfindingContext a;
    PathfindingContext b;
    b.cancellationToken = std::make_shared<CancellationToken>();
    BOOST_CHECK_EQUAL(PathCache::contextSignature(a), PathCache::contextSignature(b));
    b.allowMoveThroughEnemies = true;
    BOOST_CHECK_NE(PathCache::contextSignature(a), PathCache::contextSignature(b));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PathCacheLifetimeTests)

BOOST_AUTO_TEST_CASE(EntriesExpireAfterTimeToLive) {
    PathCache cache(0.05f, 10);
    PathfindingContext context;
    cache.store(makePath(1, 5), context);
    BOOST_CHECK(cache.find(1, 5, context).has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    BOOST_CHECK(!cache.find(1, 5, context).has_value());
    BOOST_CHECK(cache.empty());
    BOOST_CHECK_EQUAL(cache.getStats().expired, 1u);
}

BOOST_AUTO_TEST_CASE(ZeroTimeToLiveNeverHits) {
    PathCache cache(0.0f, 10);
    PathfindingContext context;
    cache.store(makePath(1, 5), context);
    BOOST_CHECK(!cache.find(1, 5, context).has_value());
}

BOOST_AUTO_TEST_CASE(EvictExpiredDropsOnlyOldEntries) {
    PathCache cache(0.05f, 10);
    PathfindingContext context;
    cache.store(makePath(1, 5), context);
    cache.store(makePath(2, 6), context);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    cache.store(makePath(3, 7), context);

    BOOST_CHECK_EQUAL(cache.evictExpired(), 2u);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK(cache.find(3, 7, context).has_value());
}

BOOST_AUTO_TEST_CASE(FullCacheIsWipedBeforeInsert) {
    PathCache cache(5.0f, 3);
    PathfindingContext context;
    cache.store(makePath(1, 10), context);
    cache.store(makePath(2, 10), context);
    cache.store(makePath(3, 10), context);
    BOOST_CHECK_EQUAL(cache.size(), 3u);

    // Replacing an existing key does not count as growth
    cache.store(makePath(3, 10, {4}), context);
    BOOST_CHECK_EQUAL(cache.size(), 3u);
    BOOST_CHECK_EQUAL(cache.getStats().wipes, 0u);

    cache.store(makePath(4, 10), context);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK_EQUAL(cache.getStats().wipes, 1u);
    BOOST_CHECK(cache.find(4, 10, context).has_value());
    BOOST_CHECK(!cache.find(1, 10, context).has_value());
}

BOOST_AUTO_TEST_CASE(ZeroCapacityStoresNothing) {
    PathCache cache(5.0f, 0);
    PathfindingContext context;
    cache.store(makePath(1, 5), context);
    BOOST_CHECK(cache.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PathCacheInvalidationTests)

BOOST_AUTO_TEST_CASE(InvalidateByCell) {
    PathCache cache;
    PathfindingContext context;
    cache.store(makePath(1, 5, {2, 3}), context);
    cache.store(makePath(6, 9, {7, 8}), context);
    cache.store(makePath(3, 11), context);
    cache.store(makePath(12, 3), context);

    // Cell 3 is an interior cell, a start and a goal
    BOOST_CHECK_EQUAL(cache.invalidate({3}), 3u);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK(cache.find(6, 9, context).has_value());

    BOOST_CHECK_EQUAL(cache.invalidate({100}), 0u);
    BOOST_CHECK_EQUAL(cache.getStats().invalidated, 3u);
}

BOOST_AUTO_TEST_CASE(InvalidateSeveralCells) {
    PathCache cache;
    PathfindingContext context;
    cache.store(makePath(1, 5, {2}), context);
    cache.store(makePath(6, 9, {7}), context);
    cache.store(makePath(20, 21), context);
    BOOST_CHECK_EQUAL(cache.invalidate({2, 9}), 2u);
    BOOST_CHECK(cache.find(20, 21, context).has_value());
}

BOOST_AUTO_TEST_CASE(EmptyListClearsEverything) {
    PathCache cache;
    PathfindingContext context;
    cache.store(makePath(1, 5), context);
    cache.store(makePath(6, 9), context);
    BOOST_CHECK_EQUAL(cache.invalidate({}), 2u);
    BOOST_CHECK(cache.empty());

    cache.store(makePath(1, 5), context);
    cache.clear();
    BOOST_CHECK(cache.empty());
}

BOOST_AUTO_TEST_SUITE_END()
