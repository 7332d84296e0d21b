// CacheEngine_test.cpp - 캐시 엔진 파사드 테스트
// Copyright (C) 2025 Strata Project

#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "core/common/CacheErrors.h"
#include "core/datastore/impl/MemoryKeyValueStore.h"
#include "core/engine/CacheEngine.h"
#include "../../mocks/MockKeyValueStore.h"

#include <filesystem>
#include <fstream>
#include <thread>

using namespace strata::core;
using namespace strata::core::engine;
using strata::config::StrataConfig;
using datastore::MemoryKeyValueStore;
using datastore::MockKeyValueStore;
using invalidation::InvalidationRule;
using invalidation::InvalidationType;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using namespace std::chrono_literals;

namespace {

const char* kRulesYaml = R"(
operations:
  UsersController.GetUser:
    tables: [Users]
    expiration_minutes: 10
  UsersController.UpdateUser:
    invalidation:
      - table: Users
        type: All
      - table: Orders
        type: Pattern
        pattern: "*GetOrders*"
  OrdersController.CreateOrder:
    invalidation:
      - table: Orders
        type: Related
        related_tables: [Users]
)";

} // namespace

/**
 * @brief 저장소 장애 시나리오 (MockKeyValueStore)
 */
class CacheEngineFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.namespace_name = "Test";
        config_.intelligence.enabled = false;
        config_.circuit_breaker.failure_threshold = 3;
        config_.circuit_breaker.timeout = 1min;
        config_.circuit_breaker.health_check_interval = 0ms;
        store_ = std::make_shared<NiceMock<MockKeyValueStore>>();
    }

    std::unique_ptr<CacheEngine> make() {
        return std::make_unique<CacheEngine>(config_, createEngineDependencies(config_, store_));
    }

    StrataConfig config_;
    std::shared_ptr<NiceMock<MockKeyValueStore>> store_;
};

TEST_F(CacheEngineFailureTest, SilentGetFailureIsMiss) {
    // Given: silent fallback + 훅
    int hook_calls = 0;
    std::string hook_message;
    config_.error_handling.silent_fallback = true;
    config_.error_handling.custom_error_handler = [&](const std::exception& e) {
        hook_calls++;
        hook_message = e.what();
    };
    auto engine = make();
    EXPECT_CALL(*store_, get("k")).WillOnce(Throw(StoreError("connection refused")));

    // When
    auto value = engine->get("k");

    // Then: 우회, 훅은 원래 예외를 받음
    EXPECT_FALSE(value.has_value());
    EXPECT_EQ(hook_calls, 1);
    EXPECT_EQ(hook_message, "connection refused");
    auto stats = engine->getStatistics();
    EXPECT_EQ(stats["engine.bypassed"], 1u);
    EXPECT_EQ(stats["engine.misses"], 0u);
}

TEST_F(CacheEngineFailureTest, SilentSetFailureReturnsFalse) {
    config_.error_handling.silent_fallback = true;
    auto engine = make();
    EXPECT_CALL(*store_, set("k", "v", _)).WillOnce(Throw(StoreError("read-only replica")));

    EXPECT_FALSE(engine->set("k", "v", {"Users"}));
    EXPECT_EQ(engine->getStatistics()["engine.sets"], 0u);
}

TEST_F(CacheEngineFailureTest, HookExceptionIsContained) {
    config_.error_handling.silent_fallback = true;
    config_.error_handling.custom_error_handler = [](const std::exception&) {
        throw std::runtime_error("hook bug");
    };
    auto engine = make();
    EXPECT_CALL(*store_, get(_)).WillOnce(Throw(StoreError("down")));

    EXPECT_NO_THROW(engine->get("k"));
}

TEST_F(CacheEngineFailureTest, ErrorsPropagateWhenNotSilent) {
    config_.error_handling.silent_fallback = false;
    auto engine = make();
    EXPECT_CALL(*store_, get(_)).WillOnce(Throw(StoreError("down")));
    EXPECT_CALL(*store_, set(_, _, _)).WillOnce(Throw(StoreError("down")));
    EXPECT_CALL(*store_, remove(_)).WillOnce(Throw(StoreError("down")));

    EXPECT_THROW(engine->get("k"), StoreError);
    EXPECT_THROW(engine->set("k", "v"), StoreError);
    EXPECT_THROW(engine->remove("k"), StoreError);
}

TEST_F(CacheEngineFailureTest, OpenBreakerBypassesStore) {
    // Given: threshold 3 실패로 Breaker Open
    config_.error_handling.silent_fallback = true;
    auto engine = make();
    EXPECT_CALL(*store_, get(_)).Times(3).WillRepeatedly(Throw(StoreError("down")));
    for (int i = 0; i < 3; ++i) {
        engine->get("k");
    }
    ASSERT_TRUE(engine->dependencies().circuit_breaker->isOpen());

    // When: 다음 호출은 저장소에 닿지 않음
    auto value = engine->get("k");

    // Then
    EXPECT_FALSE(value.has_value());
    auto stats = engine->getStatistics();
    EXPECT_EQ(stats["breaker.state"], static_cast<uint64_t>(resilience::CircuitState::Open));
    EXPECT_EQ(stats["breaker.rejected_calls"], 1u);
    EXPECT_EQ(stats["engine.bypassed"], 4u);
}

TEST_F(CacheEngineFailureTest, OpenBreakerThrowsWhenNotSilent) {
    config_.error_handling.silent_fallback = false;
    auto engine = make();
    EXPECT_CALL(*store_, get(_)).Times(3).WillRepeatedly(Throw(StoreError("down")));
    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(engine->get("k"), StoreError);
    }

    EXPECT_THROW(engine->get("k"), CircuitOpenError);
}

/**
 * @brief 메모리 저장소 기반 정상 흐름
 */
class CacheEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.namespace_name = "Test";
        config_.default_expiration = 30min;
        config_.circuit_breaker.health_check_interval = 0ms;
        store_ = std::make_shared<MemoryKeyValueStore>();
    }

    std::unique_ptr<CacheEngine> make() {
        return std::make_unique<CacheEngine>(config_, createEngineDependencies(config_, store_));
    }

    std::unique_ptr<CacheEngine> makeWithRules() {
        auto deps = createEngineDependencies(config_, store_);
        auto rules = std::make_shared<invalidation::InvalidationRuleRegistry>();
        EXPECT_TRUE(rules->loadFromString(kRulesYaml));
        std::weak_ptr<invalidation::InvalidationRuleRegistry> weak_rules = rules;
        deps.tracker->setRelationResolver([weak_rules](const std::string& table) {
            auto registry = weak_rules.lock();
            return registry ? registry->relatedTablesFor(table) : std::vector<std::string>{};
        });
        deps.rules = rules;
        return std::make_unique<CacheEngine>(config_, std::move(deps));
    }

    StrataConfig config_;
    std::shared_ptr<MemoryKeyValueStore> store_;
};

TEST_F(CacheEngineTest, RequiresCoreDependencies) {
    EngineDependencies deps;
    EXPECT_THROW(CacheEngine(config_, deps), std::invalid_argument);
    EXPECT_THROW(createEngineDependencies(config_, nullptr), std::invalid_argument);
}

TEST_F(CacheEngineTest, OptionalComponentsFollowConfig) {
    config_.intelligence.enabled = false;
    config_.distributed.enabled = true;

    // transport 없이 distributed는 로컬 모드로 동작
    auto deps = createEngineDependencies(config_, store_);

    EXPECT_FALSE(deps.hasIntelligence());
    EXPECT_FALSE(deps.hasBroadcaster());
    EXPECT_FALSE(deps.hasRules());
}

TEST_F(CacheEngineTest, MissingRulesFileIsConfigError) {
    config_.invalidation_rules_file = "/nonexistent/strata-rules.yaml";

    EXPECT_THROW(createEngineDependencies(config_, store_), ConfigError);
}

TEST_F(CacheEngineTest, RulesFileWiresRelationGraph) {
    auto path = std::filesystem::temp_directory_path() / "strata_engine_rules_test.yaml";
    {
        std::ofstream out(path);
        out << kRulesYaml;
    }
    config_.invalidation_rules_file = path.string();

    auto deps = createEngineDependencies(config_, store_);
    ASSERT_TRUE(deps.hasRules());
    CacheEngine engine(config_, deps);
    engine.set("P_1", "v", {"Products"});
    engine.set("O_1", "v", {"Orders"});
    engine.set("U_1", "v", {"Users"});

    // Orders -> Users 관계는 규칙 파일에서 tracker로 연결됨
    auto result = engine.invalidateWithRelated("Products", {"Orders"}, 3);

    EXPECT_FALSE(store_->exists("P_1"));
    EXPECT_FALSE(store_->exists("O_1"));
    EXPECT_FALSE(store_->exists("U_1"));
    EXPECT_EQ(result.tables, (std::vector<std::string>{"Products", "Orders", "Users"}));
    std::filesystem::remove(path);
}

TEST_F(CacheEngineTest, GetSetRemoveRoundTrip) {
    auto engine = make();
    auto key = engine->generateKey("UsersController", "GetUser", {{"id", int64_t{1}}});

    EXPECT_FALSE(engine->get(key).has_value());
    EXPECT_TRUE(engine->set(key, "{\"name\":\"alice\"}"));
    EXPECT_EQ(engine->get(key).value_or(""), "{\"name\":\"alice\"}");
    EXPECT_TRUE(engine->remove(key));
    EXPECT_FALSE(engine->remove(key));

    auto stats = engine->getStatistics();
    EXPECT_EQ(stats["engine.hits"], 1u);
    EXPECT_EQ(stats["engine.misses"], 1u);
    EXPECT_EQ(stats["engine.sets"], 1u);
    EXPECT_EQ(stats["engine.removes"], 2u);
    EXPECT_EQ(stats["intelligence.accesses_recorded"], 5u);
}

TEST_F(CacheEngineTest, SetUsesExplicitTtl) {
    auto engine = make();

    engine->set("k", "v", {}, 2min);

    auto remaining = store_->remainingTtl("k");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_LE(*remaining, 2min);
    EXPECT_GT(*remaining, 1min);
}

TEST_F(CacheEngineTest, SetUsesAdaptiveTtlForHotKey) {
    // Given: 1분 안에 30회 적중 (적중률 1.0, 분당 30회)
    auto engine = make();
    engine->set("hot", "v");
    for (int i = 0; i < 30; ++i) {
        engine->get("hot");
    }

    // When: TTL 미지정 저장
    engine->set("hot", "v2");

    // Then: 기본 만료(30분)의 2배
    auto remaining = store_->remainingTtl("hot");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_GT(*remaining, 59min);
}

TEST_F(CacheEngineTest, SetWithoutIntelligenceUsesDefaultExpiration) {
    config_.intelligence.enabled = false;
    auto engine = make();

    engine->set("k", "v");

    auto remaining = store_->remainingTtl("k");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_LE(*remaining, 30min);
    EXPECT_GT(*remaining, 29min);
}

TEST_F(CacheEngineTest, SetTracksTables) {
    auto engine = make();

    engine->set("U_1", "v", {"Users", "Profiles"});

    EXPECT_THAT(engine->dependencies().tracker->getTrackedKeys("Users"), ::testing::ElementsAre("U_1"));
    EXPECT_THAT(engine->dependencies().tracker->getTrackedKeys("Profiles"), ::testing::ElementsAre("U_1"));
}

TEST_F(CacheEngineTest, TrackingOutlivesEntryWithLongerExplicitTtl) {
    // Given: 기본 만료 50ms, 항목은 2초 TTL로 저장
    config_.default_expiration = 50ms;
    auto engine = make();
    engine->set("U_1", "alice", {"Users"}, 2000ms);

    // When: 기본 만료 x2가 지난 뒤 테이블 무효화
    std::this_thread::sleep_for(200ms);
    auto result = engine->invalidate("Users");

    // Then: 추적 집합이 남아 있어 항목이 삭제됨
    EXPECT_EQ(result.invalidated, 1u);
    EXPECT_FALSE(engine->get("U_1").has_value());
}

TEST_F(CacheEngineTest, SetForOperationUsesPolicy) {
    auto engine = makeWithRules();

    engine->setForOperation("UsersController.GetUser", "U_1", "v");
    engine->setForOperation("Unknown.Operation", "X_1", "v");

    EXPECT_THAT(engine->dependencies().tracker->getTrackedKeys("Users"), ::testing::ElementsAre("U_1"));
    auto remaining = store_->remainingTtl("U_1");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_LE(*remaining, 10min);
    EXPECT_TRUE(store_->exists("X_1"));
}

TEST_F(CacheEngineTest, ApplyRuleByType) {
    auto engine = make();
    engine->set("Test_Users_GetUser_1", "v", {"Users"});
    engine->set("Test_Orders_GetOrders_1", "v", {"Orders"});
    engine->set("Test_Products_List", "v", {"Products"});

    InvalidationRule pattern_rule;
    pattern_rule.table_name = "Orders";
    pattern_rule.type = InvalidationType::Pattern;
    pattern_rule.pattern = "*GetOrders*";
    engine->applyRule(pattern_rule);
    EXPECT_FALSE(store_->exists("Test_Orders_GetOrders_1"));
    EXPECT_TRUE(store_->exists("Test_Users_GetUser_1"));

    // 패턴 없는 Pattern 규칙은 테이블 무효화
    InvalidationRule empty_pattern;
    empty_pattern.table_name = "Products";
    empty_pattern.type = InvalidationType::Pattern;
    engine->applyRule(empty_pattern);
    EXPECT_FALSE(store_->exists("Test_Products_List"));

    InvalidationRule all_rule;
    all_rule.table_name = "Users";
    all_rule.type = InvalidationType::All;
    auto result = engine->applyRule(all_rule);
    EXPECT_FALSE(store_->exists("Test_Users_GetUser_1"));
    EXPECT_EQ(result.invalidated, 1u);
}

TEST_F(CacheEngineTest, RelatedRuleUsesConfiguredDepthByDefault) {
    // 깊이 1은 시작 테이블만
    config_.max_related_depth = 1;
    auto engine = make();
    engine->set("A_1", "v", {"A"});
    engine->set("B_1", "v", {"B"});

    InvalidationRule rule;
    rule.table_name = "A";
    rule.type = InvalidationType::Related;
    rule.related_tables = {"B"};
    rule.max_depth = -1;

    auto result = engine->applyRule(rule);

    EXPECT_FALSE(store_->exists("A_1"));
    EXPECT_TRUE(store_->exists("B_1"));
    EXPECT_EQ(result.tables, (std::vector<std::string>{"A"}));

    rule.max_depth = 2;
    engine->applyRule(rule);
    EXPECT_FALSE(store_->exists("B_1"));
}

TEST_F(CacheEngineTest, InvalidateForOperationAppliesAllRules) {
    // Given
    auto engine = makeWithRules();
    engine->set("Test_Users_GetUser_1", "v", {"Users"});
    engine->set("Test_Orders_GetOrders_7", "v");
    engine->set("Test_Orders_Summary", "v");

    // When: UpdateUser = Users(All) + Orders(*GetOrders*)
    auto result = engine->invalidateForOperation("UsersController.UpdateUser");

    // Then
    EXPECT_FALSE(store_->exists("Test_Users_GetUser_1"));
    EXPECT_FALSE(store_->exists("Test_Orders_GetOrders_7"));
    EXPECT_TRUE(store_->exists("Test_Orders_Summary"));
    EXPECT_TRUE(result.success);
}

TEST_F(CacheEngineTest, InvalidateForOperationWithoutPolicyIsNoop) {
    auto engine = make();
    engine->set("U_1", "v", {"Users"});

    auto result = engine->invalidateForOperation("UsersController.UpdateUser");

    EXPECT_EQ(result.attempted, 0u);
    EXPECT_TRUE(store_->exists("U_1"));

    auto with_rules = makeWithRules();
    EXPECT_EQ(with_rules->invalidateForOperation("Unknown.Operation").attempted, 0u);
}

TEST_F(CacheEngineTest, InvalidateForOperationHonorsCancellation) {
    auto engine = makeWithRules();
    engine->set("U_1", "v", {"Users"});
    auto token = CancellationToken::create();
    token.cancel();

    auto result = engine->invalidateForOperation("UsersController.UpdateUser", token);

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(store_->exists("U_1"));
}

TEST_F(CacheEngineTest, StartStopIsIdempotent) {
    config_.intelligence.detection_interval = 10ms;
    auto engine = make();

    engine->start();
    engine->start();
    EXPECT_TRUE(engine->isRunning());
    EXPECT_TRUE(engine->dependencies().intelligence->isHotKeyDetectionActive());

    engine->stop();
    engine->stop();
    EXPECT_FALSE(engine->isRunning());
    EXPECT_FALSE(engine->dependencies().intelligence->isHotKeyDetectionActive());
}
