// LocalPubSubTransport_test.cpp - 프로세스 내 Pub/Sub 테스트
// Copyright (C) 2025 Strata Project

#include "gtest/gtest.h"
#include "core/common/CacheErrors.h"
#include "core/distributed/core/LocalPubSubTransport.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace strata::core;
using namespace strata::core::distributed;
using namespace std::chrono_literals;

class LocalPubSubTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_unique<LocalPubSubTransport>(100);
        transport_->start();
    }

    void TearDown() override {
        transport_->stop();
    }

    std::unique_ptr<LocalPubSubTransport> transport_;
};

TEST_F(LocalPubSubTransportTest, DeliversToChannelSubscribers) {
    // Given: 두 채널 구독
    std::mutex mutex;
    std::vector<std::string> received;
    std::atomic<int> other_count{0};

    transport_->subscribe("ns:invalidation", [&](const std::string&, const std::string& payload) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(payload);
    });
    transport_->subscribe("other", [&](const std::string&, const std::string&) { other_count++; });

    // When
    transport_->publish("ns:invalidation", "m1");
    transport_->publish("ns:invalidation", "m2");
    ASSERT_TRUE(transport_->waitUntilIdle(1s));

    // Then: 발행 순서대로 해당 채널에만 전달
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received, (std::vector<std::string>{"m1", "m2"}));
    EXPECT_EQ(other_count.load(), 0);
}

TEST_F(LocalPubSubTransportTest, UnsubscribeStopsDelivery) {
    std::atomic<int> count{0};
    auto id = transport_->subscribe("ch", [&](const std::string&, const std::string&) { count++; });

    EXPECT_TRUE(transport_->unsubscribe(id));
    EXPECT_FALSE(transport_->unsubscribe(id));

    transport_->publish("ch", "m");
    ASSERT_TRUE(transport_->waitUntilIdle(1s));
    EXPECT_EQ(count.load(), 0);
    EXPECT_EQ(transport_->getSubscriptionCount(), 0u);
}

TEST_F(LocalPubSubTransportTest, HandlerExceptionIsContained) {
    std::atomic<int> good{0};
    transport_->subscribe("ch", [](const std::string&, const std::string&) {
        throw std::runtime_error("handler failure");
    });
    transport_->subscribe("ch", [&](const std::string&, const std::string&) { good++; });

    transport_->publish("ch", "m");
    ASSERT_TRUE(transport_->waitUntilIdle(1s));

    EXPECT_EQ(good.load(), 1);
    EXPECT_EQ(transport_->getStatistics()["failed_callbacks"], 1u);
}

TEST_F(LocalPubSubTransportTest, DisconnectedPublishThrows) {
    transport_->setConnected(false);

    EXPECT_FALSE(transport_->isConnected());
    EXPECT_THROW(transport_->publish("ch", "m"), TransportError);
    EXPECT_THROW(transport_->subscribe("ch", [](const std::string&, const std::string&) {}), TransportError);
}

TEST_F(LocalPubSubTransportTest, PublishAfterStopThrows) {
    transport_->stop();

    EXPECT_THROW(transport_->publish("ch", "m"), TransportError);
}

TEST_F(LocalPubSubTransportTest, EmptyHandlerRejected) {
    EXPECT_THROW(transport_->subscribe("ch", nullptr), std::invalid_argument);
}

TEST(LocalPubSubTransportQueueTest, FullQueueThrows) {
    // Given: 용량 1, 전달이 막혀 있는 구독자
    LocalPubSubTransport transport(1);
    std::atomic<bool> release{false};
    transport.subscribe("ch", [&](const std::string&, const std::string&) {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
    });
    transport.start();

    transport.publish("ch", "first");
    // dispatch 스레드가 첫 메시지를 꺼낼 때까지 대기
    std::this_thread::sleep_for(50ms);
    transport.publish("ch", "second");

    // When / Then: 큐가 가득 차면 TransportError
    EXPECT_THROW(transport.publish("ch", "third"), TransportError);
    EXPECT_EQ(transport.getStatistics()["dropped"], 1u);

    release.store(true);
    transport.stop();
}
