/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE DropPoolManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/DropPoolManager.hpp"
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace GlyphRain;

struct DropPoolFixture {
  DropPoolFixture() : pool(10, 12) {}

  DropId spawn(DropOrigin origin = DropOrigin::Ambient,
               const std::string &eventId = {}) {
    AcquireResult result = pool.acquire(origin, nowMs, eventId);
    if (!result.succeeded()) {
      return INVALID_DROP_ID;
    }
    nowMs += 1.0;
    return result.drop->id;
  }

  DropPoolManager pool;
  double nowMs{0.0};
};

BOOST_FIXTURE_TEST_SUITE(DropPoolAcquireTests, DropPoolFixture)

BOOST_AUTO_TEST_CASE(TestAcquireConstructsThenRecycles) {
  AcquireResult first = pool.acquire(DropOrigin::Ambient, 0.0);
  BOOST_REQUIRE(first.succeeded());
  BOOST_CHECK(first.status == AcquireStatus::Constructed);
  BOOST_CHECK(first.drop->isActive());
  BOOST_CHECK_NE(first.drop->id, INVALID_DROP_ID);

  const DropId id = first.drop->id;
  BOOST_CHECK(pool.release(id));
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 0);
  BOOST_CHECK_EQUAL(pool.getIdleCount(), 1);

  AcquireResult second = pool.acquire(DropOrigin::Ambient, 1.0);
  BOOST_REQUIRE(second.succeeded());
  BOOST_CHECK(second.status == AcquireStatus::Recycled);
  BOOST_CHECK_NE(second.drop->id, id);
  BOOST_CHECK_EQUAL(pool.getStats().constructedSlots, 1);
  BOOST_CHECK_EQUAL(pool.getStats().recycledCount, 1);
}

BOOST_AUTO_TEST_CASE(TestCapacityExhaustedAtCeiling) {
  for (int i = 0; i < 10; ++i) {
    BOOST_REQUIRE_NE(spawn(), INVALID_DROP_ID);
  }
  AcquireResult overflow = pool.acquire(DropOrigin::EventDriven, nowMs, "e1");
  BOOST_CHECK(!overflow.succeeded());
  BOOST_CHECK(overflow.status == AcquireStatus::CapacityExhausted);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 10);
  BOOST_CHECK(!pool.hasActiveDropForEvent("e1"));
}

BOOST_AUTO_TEST_CASE(TestReleaseUnknownOrTwice) {
  const DropId id = spawn();
  BOOST_CHECK(!pool.release(INVALID_DROP_ID));
  BOOST_CHECK(!pool.release(id + 100));
  BOOST_CHECK(pool.release(id));
  BOOST_CHECK(!pool.release(id));
  BOOST_CHECK_EQUAL(pool.getStats().releaseCount, 1);
}

BOOST_AUTO_TEST_CASE(TestReleasedDropIsCleared) {
  const DropId id = spawn(DropOrigin::EventDriven, "evt-7");
  Drop *drop = pool.findDrop(id);
  BOOST_REQUIRE(drop != nullptr);
  drop->position = 300.0f;
  drop->cells.resize(5);

  BOOST_CHECK(pool.release(id));
  BOOST_CHECK(pool.findDrop(id) == nullptr);
  BOOST_CHECK(!pool.hasActiveDropForEvent("evt-7"));

  AcquireResult reused = pool.acquire(DropOrigin::Ambient, nowMs);
  BOOST_REQUIRE(reused.succeeded());
  BOOST_CHECK_EQUAL(reused.drop->position, 0.0f);
  BOOST_CHECK(reused.drop->cells.empty());
  BOOST_CHECK(reused.drop->sourceEventId.empty());
}

BOOST_AUTO_TEST_CASE(TestActiveListKeepsSpawnOrder) {
  const DropId a = spawn();
  const DropId b = spawn();
  const DropId c = spawn();
  BOOST_CHECK(pool.release(b));

  const auto &active = pool.listActive();
  BOOST_REQUIRE_EQUAL(active.size(), 2);
  BOOST_CHECK_EQUAL(active[0]->id, a);
  BOOST_CHECK_EQUAL(active[1]->id, c);
}

BOOST_AUTO_TEST_CASE(TestManyReleasesKeepOrderAndCounts) {
  DropPoolManager large(1000, 4);
  std::vector<DropId> ids;
  for (int i = 0; i < 1000; ++i) {
    AcquireResult result = large.acquire(DropOrigin::Ambient, i);
    BOOST_REQUIRE(result.succeeded());
    ids.push_back(result.drop->id);
  }

  for (size_t i = 0; i < ids.size(); i += 2) {
    BOOST_REQUIRE(large.release(ids[i]));
  }
  BOOST_CHECK_EQUAL(large.getActiveCount(), 500);
  BOOST_CHECK_EQUAL(large.getIdleCount(), 500);
  BOOST_CHECK_EQUAL(large.getStats().releaseCount, 500);

  const auto &active = large.listActive();
  BOOST_REQUIRE_EQUAL(active.size(), 500);
  for (size_t i = 0; i < active.size(); ++i) {
    BOOST_CHECK_EQUAL(active[i]->id, ids[2 * i + 1]);
  }

  for (int i = 0; i < 500; ++i) {
    AcquireResult result = large.acquire(DropOrigin::Ambient, 2000.0);
    BOOST_REQUIRE(result.succeeded());
    BOOST_CHECK(result.status == AcquireStatus::Recycled);
  }
  BOOST_CHECK_EQUAL(large.getStats().constructedSlots, 1000);
  BOOST_CHECK_EQUAL(large.getIdleCount(), 0);
  BOOST_CHECK(!large.acquire(DropOrigin::Ambient, 2000.0).succeeded());
}

BOOST_AUTO_TEST_CASE(TestEvictionSkipsReleasedDrops) {
  const DropId a = spawn();
  const DropId b = spawn();
  const DropId c = spawn();
  BOOST_CHECK(pool.release(a));

  BOOST_CHECK(pool.evictOldestAmbient());
  BOOST_CHECK(pool.findDrop(b) == nullptr);
  BOOST_CHECK(pool.findDrop(c) != nullptr);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 1);
  BOOST_CHECK_EQUAL(pool.getStats().evictionCount, 1);
  BOOST_CHECK_EQUAL(pool.getStats().releaseCount, 2);
}

BOOST_AUTO_TEST_CASE(TestSnapshotFollowsChangeGeneration) {
  spawn();
  const uint64_t before = pool.getChangeGeneration();
  BOOST_CHECK_EQUAL(pool.listActive().size(), 1);

  spawn();
  BOOST_CHECK_GT(pool.getChangeGeneration(), before);
  BOOST_CHECK_EQUAL(pool.listActive().size(), 2);
}

BOOST_AUTO_TEST_CASE(TestReleaseAll) {
  for (int i = 0; i < 6; ++i) {
    spawn(DropOrigin::EventDriven, "evt-" + std::to_string(i));
  }
  BOOST_CHECK_EQUAL(pool.releaseAll(), 6);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 0);
  BOOST_CHECK_EQUAL(pool.getIdleCount(), 6);
  BOOST_CHECK(!pool.hasActiveDropForEvent("evt-3"));
  BOOST_CHECK(pool.listActive().empty());
  BOOST_CHECK_EQUAL(pool.releaseAll(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DropPoolCapacityTests, DropPoolFixture)

BOOST_AUTO_TEST_CASE(TestEvictOldestAmbientSkipsEventDrops) {
  const DropId event = spawn(DropOrigin::EventDriven, "evt-1");
  const DropId ambientOld = spawn();
  const DropId ambientNew = spawn();

  BOOST_CHECK(pool.evictOldestAmbient());
  BOOST_CHECK(pool.findDrop(event) != nullptr);
  BOOST_CHECK(pool.findDrop(ambientOld) == nullptr);
  BOOST_CHECK(pool.findDrop(ambientNew) != nullptr);
  BOOST_CHECK_EQUAL(pool.getStats().evictionCount, 1);
}

BOOST_AUTO_TEST_CASE(TestEvictOldestAmbientFailsWithoutAmbient) {
  spawn(DropOrigin::EventDriven, "evt-1");
  BOOST_CHECK(!pool.evictOldestAmbient());
  BOOST_CHECK(pool.evictOldest());
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestShrinkingCapEvictsAmbientFirst) {
  for (int i = 0; i < 4; ++i) {
    spawn(DropOrigin::EventDriven, "evt-" + std::to_string(i));
  }
  for (int i = 0; i < 6; ++i) {
    spawn();
  }

  BOOST_CHECK_EQUAL(pool.setActiveCap(5), 5);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 5);
  for (int i = 0; i < 4; ++i) {
    BOOST_CHECK(pool.hasActiveDropForEvent("evt-" + std::to_string(i)));
  }

  // Only event drops remain to evict once ambient drops are gone
  BOOST_CHECK_EQUAL(pool.setActiveCap(2), 3);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 2);
  BOOST_CHECK(!pool.hasActiveDropForEvent("evt-0"));
  BOOST_CHECK(pool.hasActiveDropForEvent("evt-3"));
}

BOOST_AUTO_TEST_CASE(TestCapIsClampedToCeiling) {
  pool.setActiveCap(0);
  BOOST_CHECK_EQUAL(pool.getActiveCap(), 1);
  pool.setActiveCap(500);
  BOOST_CHECK_EQUAL(pool.getActiveCap(), 10);
}

BOOST_AUTO_TEST_CASE(TestSetCeilingCompactsAndKeepsNewest) {
  for (int i = 0; i < 8; ++i) {
    spawn();
  }
  const DropId newest = pool.listActive().back()->id;

  pool.setCeiling(3);
  BOOST_CHECK_EQUAL(pool.getCeiling(), 3);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 3);
  BOOST_CHECK_EQUAL(pool.getIdleCount(), 0);
  BOOST_CHECK(pool.findDrop(newest) != nullptr);
  BOOST_CHECK_LE(pool.getActiveCap(), 3);

  // Raising the ceiling leaves the cap to the quality level
  pool.setCeiling(20);
  BOOST_CHECK_EQUAL(pool.getActiveCap(), 3);
  pool.setActiveCap(10);
  for (int i = 0; i < 7; ++i) {
    BOOST_CHECK_NE(spawn(), INVALID_DROP_ID);
  }
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 10);
}

BOOST_AUTO_TEST_CASE(TestApplyTrailLengthTruncates) {
  const DropId id = spawn();
  pool.findDrop(id)->cells.resize(12);
  pool.applyTrailLength(6);
  BOOST_CHECK_EQUAL(pool.findDrop(id)->trailLength(), 6);
  BOOST_CHECK_EQUAL(pool.getTotalCellCount(), 6);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DropPoolMemoryTests, DropPoolFixture)

BOOST_AUTO_TEST_CASE(TestEstimateIsZeroWhenEmpty) {
  BOOST_CHECK_EQUAL(pool.estimateMemoryMB(), 0.0);
}

BOOST_AUTO_TEST_CASE(TestEstimateCountsDropsAndCells) {
  const DropId id = spawn();
  pool.findDrop(id)->cells.resize(10);
  const double expected = (1024.0 + 10 * 200.0) / (1024.0 * 1024.0) + 2.0;
  BOOST_CHECK_CLOSE(pool.estimateMemoryMB(), expected, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestMemoryLimitEvictsOldest) {
  for (int i = 0; i < 5; ++i) {
    spawn();
  }
  BOOST_CHECK_EQUAL(pool.enforceMemoryLimit(50.0), 0);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 5);

  // Below the baseline nothing fits
  BOOST_CHECK_EQUAL(pool.enforceMemoryLimit(1.0), 5);
  BOOST_CHECK_EQUAL(pool.getActiveCount(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DropPoolColumnTests, DropPoolFixture)

BOOST_AUTO_TEST_CASE(TestPickColumnAvoidsCooldown) {
  std::mt19937 rng(42);
  pool.setColumnCount(4);
  pool.setColumnCooldown(250.0);

  std::set<uint32_t> picked;
  for (int i = 0; i < 4; ++i) {
    picked.insert(pool.pickColumn(100.0, rng));
  }
  // Four picks inside one cooldown window hit four different columns
  BOOST_CHECK_EQUAL(picked.size(), 4);
}

BOOST_AUTO_TEST_CASE(TestPickColumnFallsBackToLeastRecent) {
  std::mt19937 rng(7);
  pool.setColumnCount(2);
  pool.setColumnCooldown(1000.0);

  const uint32_t first = pool.pickColumn(0.0, rng);
  const uint32_t second = pool.pickColumn(10.0, rng);
  BOOST_CHECK_NE(first, second);

  // Both columns cooling down: the one used longest ago wins
  BOOST_CHECK_EQUAL(pool.pickColumn(20.0, rng), first);
}

BOOST_AUTO_TEST_CASE(TestSessionKeepsItsColumn) {
  std::mt19937 rng(5);
  pool.setColumnCount(8);

  const uint32_t first = pool.assignSessionColumn("session-a", 0.0, rng);
  BOOST_CHECK_EQUAL(pool.assignSessionColumn("session-a", 10.0, rng), first);
  BOOST_CHECK_EQUAL(pool.assignSessionColumn("session-a", 5000.0, rng), first);
  BOOST_REQUIRE(pool.findSessionColumn("session-a").has_value());
  BOOST_CHECK_EQUAL(*pool.findSessionColumn("session-a"), first);

  BOOST_CHECK_NE(pool.assignSessionColumn("session-b", 20.0, rng), first);
  BOOST_CHECK_EQUAL(pool.getSessionCount(), 2);
}

BOOST_AUTO_TEST_CASE(TestSessionsGetDistinctColumns) {
  std::mt19937 rng(5);
  pool.setColumnCount(8);

  std::set<uint32_t> columns;
  for (int i = 0; i < 8; ++i) {
    columns.insert(pool.assignSessionColumn("s-" + std::to_string(i), i, rng));
  }
  BOOST_CHECK_EQUAL(columns.size(), 8);
}

BOOST_AUTO_TEST_CASE(TestLeastRecentSessionForgotten) {
  std::mt19937 rng(5);
  pool.setColumnCount(2);

  const uint32_t one = pool.assignSessionColumn("one", 0.0, rng);
  const uint32_t two = pool.assignSessionColumn("two", 10.0, rng);
  pool.assignSessionColumn("one", 20.0, rng);

  // Both columns are held; "two" was seen longest ago and gives up its column
  BOOST_CHECK_EQUAL(pool.assignSessionColumn("three", 30.0, rng), two);
  BOOST_CHECK(!pool.findSessionColumn("two").has_value());
  BOOST_CHECK_EQUAL(*pool.findSessionColumn("one"), one);
  BOOST_CHECK_EQUAL(pool.getSessionCount(), 2);
}

BOOST_AUTO_TEST_CASE(TestShrinkForgetsSessionsOutsideLayout) {
  std::mt19937 rng(5);
  pool.setColumnCount(8);
  for (int i = 0; i < 8; ++i) {
    pool.assignSessionColumn("s-" + std::to_string(i), i, rng);
  }

  pool.setColumnCount(4);
  BOOST_CHECK_EQUAL(pool.getSessionCount(), 4);
  for (int i = 0; i < 8; ++i) {
    auto column = pool.findSessionColumn("s-" + std::to_string(i));
    if (column) {
      BOOST_CHECK_LT(*column, 4u);
    }
  }
}

BOOST_AUTO_TEST_CASE(TestEmptySessionUsesCooldownPick) {
  std::mt19937 rng(5);
  pool.setColumnCount(4);
  BOOST_CHECK_LT(pool.assignSessionColumn("", 0.0, rng), 4u);
  BOOST_CHECK_EQUAL(pool.getSessionCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestColumnCountHasFloorOfOne) {
  std::mt19937 rng(1);
  pool.setColumnCount(0);
  BOOST_CHECK_EQUAL(pool.getColumnCount(), 1);
  BOOST_CHECK_EQUAL(pool.pickColumn(0.0, rng), 0);
}

BOOST_AUTO_TEST_SUITE_END()
