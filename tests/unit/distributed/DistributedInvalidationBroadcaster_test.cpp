// DistributedInvalidationBroadcaster_test.cpp - 분산 무효화 브로드캐스터 테스트
// Copyright (C) 2025 Strata Project

#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "core/common/CacheErrors.h"
#include "core/datastore/impl/MemoryKeyValueStore.h"
#include "core/distributed/core/DistributedInvalidationBroadcaster.h"
#include "core/distributed/core/InvalidationCodec.h"
#include "core/distributed/core/LocalPubSubTransport.h"
#include "core/invalidation/core/InvalidationTracker.h"
#include "../../mocks/MockCacheInvalidator.h"
#include "../../mocks/MockInvalidationObserver.h"
#include "../../mocks/MockPubSubTransport.h"

#include <nlohmann/json.hpp>

using namespace strata::core;
using namespace strata::core::distributed;
using strata::config::StrataConfig;
using invalidation::InvalidationResult;
using invalidation::MockCacheInvalidator;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;
using namespace std::chrono_literals;

namespace {

InvalidationResult resultFor(std::vector<std::string> tables, size_t count = 1) {
    InvalidationResult result;
    result.tables = std::move(tables);
    result.attempted = count;
    result.invalidated = count;
    return result;
}

std::string envelopeFrom(const std::string& source, InvalidationMessageType type,
                         std::vector<std::string> tables, std::optional<std::string> pattern = std::nullopt) {
    InvalidationEnvelope envelope;
    envelope.source_instance_id = source;
    envelope.message.type = type;
    envelope.message.table_names = std::move(tables);
    envelope.message.pattern = std::move(pattern);
    envelope.message.correlation_id = "corr";
    envelope.timestamp = std::chrono::system_clock::now();
    return InvalidationCodec::encode(envelope);
}

} // namespace

class DistributedInvalidationBroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.namespace_name = "Shop";
        local_ = std::make_shared<NiceMock<MockCacheInvalidator>>();
        transport_ = std::make_shared<NiceMock<MockPubSubTransport>>();
        ON_CALL(*transport_, isConnected()).WillByDefault(Return(true));
        ON_CALL(*transport_, subscribe(_, _)).WillByDefault(Return("sub-1"));
        ON_CALL(*transport_, unsubscribe(_)).WillByDefault(Return(true));
    }

    std::unique_ptr<DistributedInvalidationBroadcaster> make() {
        return std::make_unique<DistributedInvalidationBroadcaster>(config_, local_, transport_);
    }

    StrataConfig config_;
    std::shared_ptr<NiceMock<MockCacheInvalidator>> local_;
    std::shared_ptr<NiceMock<MockPubSubTransport>> transport_;
};

TEST_F(DistributedInvalidationBroadcasterTest, RejectsNullCollaborators) {
    EXPECT_THROW(DistributedInvalidationBroadcaster(config_, nullptr, transport_), std::invalid_argument);
    EXPECT_THROW(DistributedInvalidationBroadcaster(config_, local_, nullptr), std::invalid_argument);
}

TEST_F(DistributedInvalidationBroadcasterTest, ChannelIsNamespaced) {
    auto broadcaster = make();

    EXPECT_EQ(broadcaster->getChannel(), "Shop:invalidation");
    EXPECT_FALSE(broadcaster->getInstanceId().empty());
}

TEST_F(DistributedInvalidationBroadcasterTest, StartListeningSubscribesOnce) {
    EXPECT_CALL(*transport_, subscribe("Shop:invalidation", _)).Times(1).WillOnce(Return("sub-1"));
    EXPECT_CALL(*transport_, unsubscribe("sub-1")).Times(1).WillOnce(Return(true));

    auto broadcaster = make();
    EXPECT_TRUE(broadcaster->startListening());
    EXPECT_TRUE(broadcaster->startListening());
    EXPECT_TRUE(broadcaster->isListening());

    broadcaster->stopListening();
    EXPECT_FALSE(broadcaster->isListening());
}

TEST_F(DistributedInvalidationBroadcasterTest, StartListeningReportsSubscribeFailure) {
    EXPECT_CALL(*transport_, subscribe(_, _)).WillOnce(Throw(TransportError("down")));

    auto broadcaster = make();

    EXPECT_FALSE(broadcaster->startListening());
    EXPECT_FALSE(broadcaster->isListening());
}

TEST_F(DistributedInvalidationBroadcasterTest, InvalidatesLocallyBeforePublishing) {
    // Given
    auto broadcaster = make();
    std::string payload;
    {
        InSequence seq;
        EXPECT_CALL(*local_, invalidate("Users", _)).WillOnce(Return(resultFor({"Users"})));
        EXPECT_CALL(*transport_, publish("Shop:invalidation", _)).WillOnce(SaveArg<1>(&payload));
    }

    // When
    auto result = broadcaster->invalidate("Users");

    // Then: 로컬 결과 반환, Table 메시지 게시
    EXPECT_EQ(result.invalidated, 1u);
    auto envelope = InvalidationCodec::decode(payload);
    EXPECT_EQ(envelope.source_instance_id, broadcaster->getInstanceId());
    EXPECT_EQ(envelope.message.type, InvalidationMessageType::Table);
    EXPECT_THAT(envelope.message.table_names, ElementsAre("Users"));
    EXPECT_FALSE(envelope.message.correlation_id.empty());
    EXPECT_EQ(broadcaster->getStatistics()["published"], 1u);
}

TEST_F(DistributedInvalidationBroadcasterTest, PatternInvalidationPublishesPattern) {
    auto broadcaster = make();
    std::string payload;
    EXPECT_CALL(*local_, invalidateByPattern("*GetOrders*", _)).WillOnce(Return(resultFor({})));
    EXPECT_CALL(*transport_, publish(_, _)).WillOnce(SaveArg<1>(&payload));

    broadcaster->invalidateByPattern("*GetOrders*");

    auto envelope = InvalidationCodec::decode(payload);
    EXPECT_EQ(envelope.message.type, InvalidationMessageType::Pattern);
    EXPECT_EQ(envelope.message.pattern.value_or(""), "*GetOrders*");
    EXPECT_TRUE(envelope.message.table_names.empty());
}

TEST_F(DistributedInvalidationBroadcasterTest, BatchPublishesProcessedTables) {
    auto broadcaster = make();
    std::string payload;
    EXPECT_CALL(*local_, invalidateBatch(ElementsAre("Users", "Orders"), _))
        .WillOnce(Return(resultFor({"Users", "Orders"}, 2)));
    EXPECT_CALL(*transport_, publish(_, _)).WillOnce(SaveArg<1>(&payload));

    broadcaster->invalidateBatch({"Users", "Orders"});

    auto envelope = InvalidationCodec::decode(payload);
    EXPECT_EQ(envelope.message.type, InvalidationMessageType::Batch);
    EXPECT_THAT(envelope.message.table_names, ElementsAre("Users", "Orders"));
}

TEST_F(DistributedInvalidationBroadcasterTest, RelatedPublishesVisitedTablesAsBatch) {
    // Given: 로컬 연쇄 무효화가 Orders -> Users -> Profiles 방문
    auto broadcaster = make();
    std::string payload;
    EXPECT_CALL(*local_, invalidateWithRelated("Orders", ElementsAre("Users"), 2, _))
        .WillOnce(Return(resultFor({"Orders", "Users", "Profiles"}, 3)));
    EXPECT_CALL(*transport_, publish(_, _)).WillOnce(SaveArg<1>(&payload));

    // When
    broadcaster->invalidateWithRelated("Orders", {"Users"}, 2);

    // Then: 피어는 그래프 없이 같은 테이블 집합을 무효화
    auto envelope = InvalidationCodec::decode(payload);
    EXPECT_EQ(envelope.message.type, InvalidationMessageType::Batch);
    EXPECT_THAT(envelope.message.table_names, ElementsAre("Orders", "Users", "Profiles"));
}

TEST_F(DistributedInvalidationBroadcasterTest, PatternBatchPublishesOnePerPattern) {
    auto broadcaster = make();
    EXPECT_CALL(*local_, invalidateByPatternBatch(_, _)).WillOnce(Return(resultFor({})));
    EXPECT_CALL(*transport_, publish(_, _)).Times(2);

    broadcaster->invalidateByPatternBatch({"*a*", "*b*"});
}

TEST_F(DistributedInvalidationBroadcasterTest, CancelledInvalidationIsNotPublished) {
    auto broadcaster = make();
    auto cancelled = resultFor({"Users"});
    cancelled.cancelled = true;
    EXPECT_CALL(*local_, invalidate("Users", _)).WillOnce(Return(cancelled));
    EXPECT_CALL(*transport_, publish(_, _)).Times(0);

    auto token = CancellationToken::create();
    token.cancel();
    auto result = broadcaster->invalidate("Users", token);

    EXPECT_TRUE(result.cancelled);
}

TEST_F(DistributedInvalidationBroadcasterTest, TrackingDelegatesWithoutPublishing) {
    auto broadcaster = make();
    EXPECT_CALL(*local_, trackKey(::testing::Matcher<const std::vector<std::string>&>(ElementsAre("Users")),
                                  "U_1", ::testing::Optional(std::chrono::milliseconds(90000)), _)).Times(1);
    EXPECT_CALL(*local_, trackKey(::testing::Matcher<const std::string&>("Orders"), "O_1",
                                  ::testing::Eq(std::optional<std::chrono::milliseconds>{}), _)).Times(1);
    EXPECT_CALL(*local_, getTrackedKeys("Users", _)).WillOnce(Return(std::vector<std::string>{"U_1"}));
    EXPECT_CALL(*transport_, publish(_, _)).Times(0);

    // 항목 TTL은 그대로 로컬 추적기에 전달
    broadcaster->trackKey(std::vector<std::string>{"Users"}, "U_1", std::chrono::milliseconds(90000));
    broadcaster->trackKey(std::string("Orders"), "O_1");

    EXPECT_THAT(broadcaster->getTrackedKeys("Users"), ElementsAre("U_1"));
}

TEST_F(DistributedInvalidationBroadcasterTest, PublishFailureIsAbsorbedWhenSilent) {
    // Given: silent fallback + 사용자 훅
    int hook_calls = 0;
    config_.error_handling.silent_fallback = true;
    config_.error_handling.custom_error_handler = [&](const std::exception&) { hook_calls++; };
    auto broadcaster = make();
    EXPECT_CALL(*local_, invalidate("Users", _)).WillOnce(Return(resultFor({"Users"})));
    EXPECT_CALL(*transport_, publish(_, _)).WillOnce(Throw(TransportError("broker down")));

    // When
    InvalidationResult result;
    EXPECT_NO_THROW(result = broadcaster->invalidate("Users"));

    // Then: 로컬 무효화는 유지, 실패 집계
    EXPECT_EQ(result.invalidated, 1u);
    EXPECT_EQ(hook_calls, 1);
    EXPECT_EQ(broadcaster->getStatistics()["publish_failures"], 1u);
    EXPECT_EQ(broadcaster->getStatistics()["published"], 0u);
}

TEST_F(DistributedInvalidationBroadcasterTest, PublishFailurePropagatesWhenNotSilent) {
    config_.error_handling.silent_fallback = false;
    auto broadcaster = make();
    EXPECT_CALL(*local_, invalidate("Users", _)).WillOnce(Return(resultFor({"Users"})));
    EXPECT_CALL(*transport_, publish(_, _)).WillOnce(Throw(TransportError("broker down")));

    EXPECT_THROW(broadcaster->invalidate("Users"), TransportError);
    EXPECT_EQ(broadcaster->getStatistics()["publish_failures"], 1u);
}

TEST_F(DistributedInvalidationBroadcasterTest, OwnMessagesAreIgnored) {
    auto broadcaster = make();
    EXPECT_CALL(*local_, invalidate(_, _)).Times(0);

    broadcaster->handleMessage(envelopeFrom(broadcaster->getInstanceId(), InvalidationMessageType::Table, {"Users"}));

    auto stats = broadcaster->getStatistics();
    EXPECT_EQ(stats["received"], 1u);
    EXPECT_EQ(stats["self_echo_suppressed"], 1u);
    EXPECT_EQ(stats["applied"], 0u);
}

TEST_F(DistributedInvalidationBroadcasterTest, PeerTableMessageAppliedWithoutRepublish) {
    // Given
    auto broadcaster = make();
    auto observer = std::make_shared<MockInvalidationObserver>();
    broadcaster->registerObserver(observer);

    EXPECT_CALL(*local_, invalidate("Users", _)).WillOnce(Return(resultFor({"Users"})));
    EXPECT_CALL(*local_, invalidate("Orders", _)).WillOnce(Return(resultFor({"Orders"})));
    EXPECT_CALL(*transport_, publish(_, _)).Times(0);
    EXPECT_CALL(*observer, onInvalidationReceived(_)).Times(1);

    // When
    broadcaster->handleMessage(envelopeFrom("peer", InvalidationMessageType::Table, {"Users", "Orders"}));

    // Then
    EXPECT_EQ(broadcaster->getStatistics()["applied"], 1u);
}

TEST_F(DistributedInvalidationBroadcasterTest, PeerPatternAndBatchMessagesApplied) {
    auto broadcaster = make();
    EXPECT_CALL(*local_, invalidateByPattern("*Users*", _)).WillOnce(Return(resultFor({})));
    EXPECT_CALL(*local_, invalidateBatch(ElementsAre("A", "B"), _)).WillOnce(Return(resultFor({"A", "B"})));

    broadcaster->handleMessage(envelopeFrom("peer", InvalidationMessageType::Pattern, {}, "*Users*"));
    broadcaster->handleMessage(envelopeFrom("peer", InvalidationMessageType::Batch, {"A", "B"}));

    EXPECT_EQ(broadcaster->getStatistics()["applied"], 2u);
}

TEST_F(DistributedInvalidationBroadcasterTest, MalformedMessageIsDropped) {
    auto broadcaster = make();
    auto observer = std::make_shared<MockInvalidationObserver>();
    broadcaster->registerObserver(observer);
    EXPECT_CALL(*observer, onInvalidationReceived(_)).Times(0);

    broadcaster->handleMessage("{not json");

    EXPECT_EQ(broadcaster->getStatistics()["decode_failures"], 1u);
}

TEST_F(DistributedInvalidationBroadcasterTest, ApplyFailureIsCountedAndObserversSkipped) {
    auto broadcaster = make();
    auto observer = std::make_shared<MockInvalidationObserver>();
    broadcaster->registerObserver(observer);
    EXPECT_CALL(*local_, invalidate("Users", _)).WillOnce(Throw(StoreError("store down")));
    EXPECT_CALL(*observer, onInvalidationReceived(_)).Times(0);

    EXPECT_NO_THROW(broadcaster->handleMessage(envelopeFrom("peer", InvalidationMessageType::Table, {"Users"})));

    EXPECT_EQ(broadcaster->getStatistics()["apply_failures"], 1u);
}

TEST_F(DistributedInvalidationBroadcasterTest, ObserverExceptionIsContainedAndUnregisterWorks) {
    auto broadcaster = make();
    auto throwing = std::make_shared<MockInvalidationObserver>();
    auto counting = std::make_shared<MockInvalidationObserver>();
    broadcaster->registerObserver(throwing);
    broadcaster->registerObserver(counting);
    broadcaster->registerObserver(nullptr);

    EXPECT_CALL(*throwing, onInvalidationReceived(_)).WillOnce(Throw(std::runtime_error("observer bug")));
    EXPECT_CALL(*counting, onInvalidationReceived(_)).Times(1);

    broadcaster->handleMessage(envelopeFrom("peer", InvalidationMessageType::Batch, {"A"}));

    broadcaster->unregisterObserver(throwing);
    broadcaster->unregisterObserver(counting);
    broadcaster->handleMessage(envelopeFrom("peer", InvalidationMessageType::Batch, {"A"}));
}

// 실제 트래커 + 로컬 전송으로 구성한 두 노드
TEST(DistributedInvalidationFleetTest, InvalidationPropagatesToPeer) {
    // Given: 같은 전송을 공유하는 두 노드, 각자 저장소 보유
    StrataConfig config;
    config.namespace_name = "Fleet";
    auto transport = std::make_shared<LocalPubSubTransport>();
    transport->start();

    auto keygen = std::make_shared<keygen::CacheKeyGenerator>(config);
    auto store_a = std::make_shared<datastore::MemoryKeyValueStore>();
    auto store_b = std::make_shared<datastore::MemoryKeyValueStore>();
    auto tracker_a = std::make_shared<invalidation::InvalidationTracker>(config, store_a, keygen);
    auto tracker_b = std::make_shared<invalidation::InvalidationTracker>(config, store_b, keygen);

    DistributedInvalidationBroadcaster node_a(config, tracker_a, transport);
    DistributedInvalidationBroadcaster node_b(config, tracker_b, transport);
    ASSERT_TRUE(node_a.startListening());
    ASSERT_TRUE(node_b.startListening());

    auto seed = [](datastore::MemoryKeyValueStore& store, DistributedInvalidationBroadcaster& node) {
        store.set("Fleet_Users_GetUser_1", "v", 10min);
        node.trackKey(std::string("Users"), "Fleet_Users_GetUser_1");
    };
    seed(*store_a, node_a);
    seed(*store_b, node_b);

    // When: A에서 무효화
    node_a.invalidate("Users");
    ASSERT_TRUE(transport->waitUntilIdle(2s));

    // Then: 양쪽 모두 제거, A는 자기 메시지를 적용하지 않음
    EXPECT_FALSE(store_a->exists("Fleet_Users_GetUser_1"));
    EXPECT_FALSE(store_b->exists("Fleet_Users_GetUser_1"));
    EXPECT_EQ(node_a.getStatistics()["self_echo_suppressed"], 1u);
    EXPECT_EQ(node_a.getStatistics()["applied"], 0u);
    EXPECT_EQ(node_b.getStatistics()["applied"], 1u);
    EXPECT_EQ(node_b.getStatistics()["published"], 0u);

    node_a.stopListening();
    node_b.stopListening();
    transport->stop();
}

TEST(DistributedInvalidationFleetTest, DuplicateDeliveryIsIdempotent) {
    // Given: 실제 트래커를 가진 수신 노드
    StrataConfig config;
    auto transport = std::make_shared<NiceMock<MockPubSubTransport>>();
    auto keygen = std::make_shared<keygen::CacheKeyGenerator>(config);
    auto store = std::make_shared<datastore::MemoryKeyValueStore>();
    auto tracker = std::make_shared<invalidation::InvalidationTracker>(config, store, keygen);
    DistributedInvalidationBroadcaster node(config, tracker, transport);

    store->set("U_1", "v", 10min);
    store->set("O_1", "v", 10min);
    tracker->trackKey(std::string("Users"), "U_1");
    auto payload = envelopeFrom("peer", InvalidationMessageType::Table, {"Users"});

    // When: 같은 봉투 두 번 전달
    node.handleMessage(payload);
    node.handleMessage(payload);

    // Then: 같은 최종 상태, 실패 없음
    EXPECT_FALSE(store->exists("U_1"));
    EXPECT_TRUE(store->exists("O_1"));
    EXPECT_TRUE(tracker->getTrackedKeys("Users").empty());
    EXPECT_EQ(node.getStatistics()["applied"], 2u);
    EXPECT_EQ(node.getStatistics()["apply_failures"], 0u);
}
