// IntelligentCacheManager_test.cpp - 핫 키 / 적응형 TTL / 축출 테스트
// Copyright (C) 2025 Strata Project

#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "core/intelligence/IntelligentCacheManager.h"

#include <algorithm>
#include <thread>

using namespace strata::core::intelligence;
using strata::config::StrataConfig;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;
using namespace std::chrono_literals;

class IntelligentCacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.default_expiration = 30min;
        config_.intelligence.hot_key_threshold = 10.0;
        config_.intelligence.min_ttl = 5min;
        config_.intelligence.max_ttl = 24h;
        config_.intelligence.metric_retention = 1h;
        rebuild();
    }

    void rebuild() {
        manager_ = std::make_unique<IntelligentCacheManager>(config_, [this] { return now_; });
    }

    void access(const std::string& key, AccessType type, int times = 1) {
        for (int i = 0; i < times; ++i) {
            manager_->recordAccess(key, type);
        }
    }

    void advance(std::chrono::milliseconds delta) { now_ += delta; }

    StrataConfig config_;
    IntelligentCacheManager::Clock::time_point now_{std::chrono::hours(24 * 365 * 50)};
    std::unique_ptr<IntelligentCacheManager> manager_;
};

TEST_F(IntelligentCacheManagerTest, RecordAccessBuildsMetrics) {
    access("k", AccessType::Set);
    access("k", AccessType::Hit, 2);
    access("k", AccessType::Miss);

    auto metrics = manager_->getKeyMetrics("k");

    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->access_count, 4u);
    EXPECT_EQ(metrics->hit_count, 2u);
    EXPECT_EQ(metrics->miss_count, 1u);
    EXPECT_EQ(metrics->first_access, now_);
    EXPECT_EQ(manager_->getStatistics()["accesses_recorded"], 4u);
}

TEST_F(IntelligentCacheManagerTest, EmptyKeyIgnored) {
    access("", AccessType::Hit);

    EXPECT_EQ(manager_->trackedKeyCount(), 0u);
    EXPECT_EQ(manager_->calculateKeyPriority(""), 0.0);
}

TEST_F(IntelligentCacheManagerTest, HistoryIsBounded) {
    config_.intelligence.access_history_capacity = 5;
    rebuild();

    access("k", AccessType::Hit, 10);

    auto metrics = manager_->getKeyMetrics("k");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->access_count, 10u);
    EXPECT_EQ(metrics->history_size, 5u);
}

TEST_F(IntelligentCacheManagerTest, HistoryIncludesFirstAccess) {
    access("k", AccessType::Miss);
    advance(5s);
    access("k", AccessType::Hit, 2);

    auto metrics = manager_->getKeyMetrics("k");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->access_count, 3u);
    EXPECT_EQ(metrics->history_size, 3u);
}

TEST_F(IntelligentCacheManagerTest, AdaptiveTtlReturnsBaseWithoutMetrics) {
    EXPECT_EQ(manager_->calculateAdaptiveTtl("unknown"), 30min);

    // Set 접근만 있으면 적중 통계가 없음
    access("set-only", AccessType::Set);
    EXPECT_EQ(manager_->calculateAdaptiveTtl("set-only", 7min), 7min);
}

TEST_F(IntelligentCacheManagerTest, AdaptiveTtlGrowsForHotKeyWithHits) {
    // Given: 1분 안에 30회 접근, 적중률 1.0 (분당 30 >= 2 * threshold)
    access("hot", AccessType::Hit, 30);

    // When
    auto ttl = manager_->calculateAdaptiveTtl("hot");

    // Then: base * 2.0 * 1.0
    EXPECT_EQ(ttl, 60min);
    EXPECT_GE(ttl, config_.default_expiration);
}

TEST_F(IntelligentCacheManagerTest, AdaptiveTtlShrinksForColdMissingKey) {
    // Given: 분당 2회, 적중률 0 (가중치 0.5 하한)
    access("cold", AccessType::Miss, 2);

    // base 200분 * 0.2 * 0.5
    EXPECT_EQ(manager_->calculateAdaptiveTtl("cold", 200min), 20min);
}

TEST_F(IntelligentCacheManagerTest, AdaptiveTtlIsClamped) {
    access("cold", AccessType::Miss, 2);
    EXPECT_EQ(manager_->calculateAdaptiveTtl("cold"), config_.intelligence.min_ttl);

    access("hot", AccessType::Hit, 50);
    EXPECT_EQ(manager_->calculateAdaptiveTtl("hot", 20h), config_.intelligence.max_ttl);
}

TEST_F(IntelligentCacheManagerTest, PriorityCombinesRateAndRecency) {
    access("k", AccessType::Hit, 3);

    // 1분 미만: 접근률 = 접근 수, 최근성 1.0
    EXPECT_DOUBLE_EQ(manager_->calculateKeyPriority("k"), 0.7 * 3.0 + 0.3 * 1.0);

    // 30분 후: 접근률 3/30, 최근성 0.5
    advance(30min);
    EXPECT_NEAR(manager_->calculateKeyPriority("k"), 0.7 * 0.1 + 0.3 * 0.5, 1e-9);

    // 60분 이후 최근성 0
    advance(90min);
    EXPECT_NEAR(manager_->calculateKeyPriority("k"), 0.7 * (3.0 / 120.0), 1e-9);
}

TEST_F(IntelligentCacheManagerTest, HotKeysRankedByRate) {
    access("a", AccessType::Hit, 5);
    access("b", AccessType::Hit, 2);
    access("c", AccessType::Hit, 8);

    auto hot = manager_->getHotKeys(10);

    ASSERT_EQ(hot.size(), 3u);
    EXPECT_EQ(hot[0].key, "c");
    EXPECT_EQ(hot[1].key, "a");
    EXPECT_EQ(hot[2].key, "b");
    EXPECT_EQ(hot[0].access_count, 8u);
}

TEST_F(IntelligentCacheManagerTest, HotKeysCappedByCandidateLimit) {
    config_.intelligence.max_hot_key_candidates = 2;
    rebuild();
    access("a", AccessType::Hit, 5);
    access("b", AccessType::Hit, 2);
    access("c", AccessType::Hit, 8);

    EXPECT_EQ(manager_->getHotKeys(10).size(), 2u);
    EXPECT_EQ(manager_->getHotKeys(1).size(), 1u);
    EXPECT_TRUE(manager_->getHotKeys(0).empty());
}

TEST_F(IntelligentCacheManagerTest, HotKeyAverageInterval) {
    access("k", AccessType::Hit);
    advance(10s);
    access("k", AccessType::Hit);
    advance(20s);
    access("k", AccessType::Hit);

    auto hot = manager_->getHotKeys(1);

    ASSERT_EQ(hot.size(), 1u);
    EXPECT_EQ(hot[0].average_interval, 15s);
}

TEST_F(IntelligentCacheManagerTest, StaleKeysExcludedAndSwept) {
    // Given: 보존 기간(1h)보다 오래된 키
    access("old", AccessType::Hit);
    advance(2h);
    access("new", AccessType::Hit, 12);

    // Then: 순위에서 제외
    auto hot = manager_->getHotKeys(10);
    ASSERT_EQ(hot.size(), 1u);
    EXPECT_EQ(hot[0].key, "new");

    // When: 정리
    auto result = manager_->runMaintenanceSweep();

    // Then: old 제거, new는 분당 12회로 핫 키
    EXPECT_EQ(result.purged, 1u);
    ASSERT_EQ(result.hot_keys.size(), 1u);
    EXPECT_EQ(result.hot_keys[0].key, "new");
    EXPECT_FALSE(manager_->getKeyMetrics("old").has_value());
    EXPECT_EQ(manager_->getStatistics()["sweeps"], 1u);
    EXPECT_EQ(manager_->getStatistics()["purged_metrics"], 1u);
}

TEST_F(IntelligentCacheManagerTest, EvictLruOldestAccessFirst) {
    access("a", AccessType::Hit);
    advance(1min);
    access("b", AccessType::Hit);
    advance(1min);
    access("c", AccessType::Hit);

    auto victims = manager_->evictByPolicy(EvictionPolicy::LRU, 2);

    EXPECT_THAT(victims, ElementsAre("a", "b"));
    EXPECT_FALSE(manager_->getKeyMetrics("a").has_value());
    EXPECT_TRUE(manager_->getKeyMetrics("c").has_value());
    EXPECT_EQ(manager_->getStatistics()["evicted_keys"], 2u);
}

TEST_F(IntelligentCacheManagerTest, EvictLfuLeastAccessedFirst) {
    access("a", AccessType::Hit, 5);
    access("b", AccessType::Hit, 1);
    access("c", AccessType::Hit, 3);

    EXPECT_THAT(manager_->evictByPolicy(EvictionPolicy::LFU, 2), ElementsAre("b", "c"));
}

TEST_F(IntelligentCacheManagerTest, EvictFifoUsesFirstAccess) {
    access("a", AccessType::Hit);
    advance(1min);
    access("b", AccessType::Hit);
    advance(1min);
    access("a", AccessType::Hit);

    EXPECT_THAT(manager_->evictByPolicy(EvictionPolicy::FIFO, 1), ElementsAre("a"));
}

TEST_F(IntelligentCacheManagerTest, EvictTtlOnlyIdleKeys) {
    access("idle", AccessType::Hit);
    advance(40min);
    access("fresh", AccessType::Hit);

    EXPECT_THAT(manager_->evictByPolicy(EvictionPolicy::TTL, 10), ElementsAre("idle"));
    EXPECT_TRUE(manager_->getKeyMetrics("fresh").has_value());
}

TEST_F(IntelligentCacheManagerTest, EvictRandomPicksDistinctKeys) {
    access("a", AccessType::Hit);
    access("b", AccessType::Hit);
    access("c", AccessType::Hit);

    auto victims = manager_->evictByPolicy(EvictionPolicy::Random, 2);

    ASSERT_EQ(victims.size(), 2u);
    EXPECT_NE(victims[0], victims[1]);
    EXPECT_EQ(manager_->trackedKeyCount(), 1u);
    EXPECT_TRUE(manager_->evictByPolicy(EvictionPolicy::Random, 0).empty());
}

TEST_F(IntelligentCacheManagerTest, WarmCacheSkipsEmptyKeys) {
    EXPECT_EQ(manager_->warmCache({"k1", "", "k2"}), 2u);
    EXPECT_EQ(manager_->warmCache({}), 0u);

    auto metrics = manager_->getKeyMetrics("k1");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->access_count, 1u);
    EXPECT_EQ(metrics->hit_count, 0u);
}

TEST_F(IntelligentCacheManagerTest, ClearDropsAllMetrics) {
    access("a", AccessType::Hit);
    access("b", AccessType::Miss);

    manager_->clear();

    EXPECT_EQ(manager_->trackedKeyCount(), 0u);
    EXPECT_EQ(manager_->calculateAdaptiveTtl("a"), config_.default_expiration);
}

TEST(IntelligentCacheManagerDetectionTest, StartStopLifecycle) {
    StrataConfig config;
    config.intelligence.detection_interval = 10ms;
    IntelligentCacheManager manager(config);

    EXPECT_TRUE(manager.startHotKeyDetection());
    EXPECT_FALSE(manager.startHotKeyDetection());
    EXPECT_TRUE(manager.isHotKeyDetectionActive());

    for (int i = 0; i < 20; ++i) {
        manager.recordAccess("k", AccessType::Hit);
    }
    std::this_thread::sleep_for(50ms);

    manager.stopHotKeyDetection();
    EXPECT_FALSE(manager.isHotKeyDetectionActive());
    EXPECT_GE(manager.getStatistics()["sweeps"], 1u);

    // 재시작 가능
    EXPECT_TRUE(manager.startHotKeyDetection());
    manager.stopHotKeyDetection();
}
