// LocalPubSubTransport.h - 프로세스 내 Pub/Sub 브로커
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_DISTRIBUTED_LOCALPUBSUBTRANSPORT_H
#define STRATA_CORE_DISTRIBUTED_LOCALPUBSUBTRANSPORT_H

#include "core/distributed/interfaces/IPubSubTransport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace strata::core::distributed {

/**
 * @brief 프로세스 내 Pub/Sub 브로커
 *
 * 여러 Broadcaster가 하나의 인스턴스를 공유하면 노드 집합처럼 동작합니다.
 * publish는 큐에 넣기만 하고, 전용 dispatch 스레드가 채널 구독자에게 순서대로 전달합니다.
 * 게시자 자신의 구독에도 전달되므로 echo 억제 경로를 그대로 탑니다.
 *
 * setConnected(false)로 연결 끊김을 재현할 수 있습니다 (publish/subscribe가 TransportError).
 */
class LocalPubSubTransport : public IPubSubTransport {
public:
    explicit LocalPubSubTransport(size_t queue_capacity = 10000);
    ~LocalPubSubTransport() override;

    // 복사/이동 방지
    LocalPubSubTransport(const LocalPubSubTransport&) = delete;
    LocalPubSubTransport& operator=(const LocalPubSubTransport&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    void publish(const std::string& channel, const std::string& payload) override;
    SubscriptionId subscribe(const std::string& channel, MessageHandler handler) override;
    bool unsubscribe(const SubscriptionId& subscription_id) override;
    bool isConnected() const override;

    /// @brief 연결 상태 강제 (장애 재현용)
    void setConnected(bool connected) { connected_.store(connected); }

    /**
     * @brief 큐가 비고 진행 중인 전달이 없을 때까지 대기
     *
     * @return 제한 시간 내에 비워지면 true
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    size_t getSubscriptionCount() const;

    /**
     * @brief 통계 조회
     *
     * @return published, delivered, dropped, failed_callbacks
     */
    std::map<std::string, uint64_t> getStatistics() const;

private:
    struct Subscription {
        SubscriptionId id;
        std::string channel;
        MessageHandler handler;
    };

    struct Envelope {
        std::string channel;
        std::string payload;
    };

    static SubscriptionId generateSubscriptionId();

    void dispatchLoop();
    void deliver(const Envelope& envelope);

    size_t queue_capacity_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{true};
    std::thread dispatch_thread_;

    std::deque<Envelope> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    bool dispatching_ = false;

    std::unordered_map<SubscriptionId, Subscription> subscriptions_;
    mutable std::mutex subscriptions_mutex_;

    // 전달 중에는 보유, unsubscribe 반환 후 콜백이 호출되지 않도록 보장.
    // 핸들러 안에서 unsubscribe할 수 있도록 재진입 허용
    std::recursive_mutex dispatch_mutex_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failed_callbacks_{0};
};

} // namespace strata::core::distributed

#endif // STRATA_CORE_DISTRIBUTED_LOCALPUBSUBTRANSPORT_H
