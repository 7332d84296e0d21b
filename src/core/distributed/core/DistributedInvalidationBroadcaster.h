#pragma once

#include "core/config/StrataConfig.h"
#include "core/distributed/dto/InvalidationMessage.h"
#include "core/distributed/interfaces/IInvalidationObserver.h"
#include "core/distributed/interfaces/IPubSubTransport.h"
#include "core/invalidation/interfaces/ICacheInvalidator.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace strata::core::distributed {

/**
 * @brief 로컬 무효화 + 피어 전파
 *
 * 로컬 ICacheInvalidator를 감싸고, 모든 무효화 호출을 로컬 실행 후
 * `{namespace}:invalidation` 채널에 게시합니다. 로컬 전용 무효화는
 * 피어로부터 받은 메시지를 적용할 때만 사용됩니다.
 *
 * 수신 처리:
 * 1. 역직렬화 (실패 시 로그 후 폐기)
 * 2. source_instance_id가 자신이면 폐기 (echo 루프 방지)
 * 3. 로컬 추적기로만 적용 (재게시 없음)
 * 4. 관찰자 통지
 *
 * 무효화는 멱등이므로 중복/순서 뒤바뀜 메시지를 그대로 적용해도 됩니다.
 * 연결이 끊겼던 노드는 놓친 키를 TTL 만료까지 계속 제공합니다.
 */
class DistributedInvalidationBroadcaster : public invalidation::ICacheInvalidator {
public:
    DistributedInvalidationBroadcaster(const config::StrataConfig& config,
                                       std::shared_ptr<invalidation::ICacheInvalidator> local,
                                       std::shared_ptr<IPubSubTransport> transport);

    ~DistributedInvalidationBroadcaster() override;

    DistributedInvalidationBroadcaster(const DistributedInvalidationBroadcaster&) = delete;
    DistributedInvalidationBroadcaster& operator=(const DistributedInvalidationBroadcaster&) = delete;

    /**
     * @brief 채널 구독 시작 (멱등)
     *
     * @return 구독 중이면 true, 전송 오류 시 false
     */
    bool startListening();

    /**
     * @brief 채널 구독 해제 (멱등)
     */
    void stopListening();

    bool isListening() const;

    /// @brief 로컬 무효화 후 Table 메시지 게시
    invalidation::InvalidationResult broadcastInvalidation(const std::string& table_name,
                                                           const CancellationToken& token = {});

    /// @brief 로컬 패턴 무효화 후 Pattern 메시지 게시
    invalidation::InvalidationResult broadcastInvalidationByPattern(const std::string& pattern,
                                                                    const CancellationToken& token = {});

    /// @brief 로컬 배치 무효화 후 Batch 메시지 게시
    invalidation::InvalidationResult broadcastBatchInvalidation(const std::vector<std::string>& table_names,
                                                                const CancellationToken& token = {});

    // ICacheInvalidator
    void trackKey(const std::vector<std::string>& table_names,
                  const std::string& cache_key,
                  std::optional<std::chrono::milliseconds> entry_ttl = std::nullopt,
                  const CancellationToken& token = {}) override;

    void trackKey(const std::string& table_name,
                  const std::string& cache_key,
                  std::optional<std::chrono::milliseconds> entry_ttl = std::nullopt,
                  const CancellationToken& token = {}) override;

    std::vector<std::string> getTrackedKeys(const std::string& table_name,
                                            const CancellationToken& token = {}) override;

    invalidation::InvalidationResult invalidate(const std::string& table_name,
                                                const CancellationToken& token = {}) override;

    invalidation::InvalidationResult invalidateByPattern(const std::string& pattern,
                                                         const CancellationToken& token = {}) override;

    /**
     * @brief 로컬에서 연쇄 무효화 후 방문한 테이블 전체를 Batch로 게시
     *
     * 피어는 관계 그래프를 다시 탐색하지 않고 같은 최종 상태에 도달합니다.
     */
    invalidation::InvalidationResult invalidateWithRelated(const std::string& table_name,
                                                           const std::vector<std::string>& related_tables,
                                                           int max_depth = -1,
                                                           const CancellationToken& token = {}) override;

    invalidation::InvalidationResult invalidateBatch(const std::vector<std::string>& table_names,
                                                     const CancellationToken& token = {}) override;

    /// @brief 로컬 패턴 배치 무효화 후 패턴별 Pattern 메시지 게시
    invalidation::InvalidationResult invalidateByPatternBatch(const std::vector<std::string>& patterns,
                                                              const CancellationToken& token = {}) override;

    void registerObserver(std::shared_ptr<IInvalidationObserver> observer);
    void unregisterObserver(std::shared_ptr<IInvalidationObserver> observer);

    const std::string& getInstanceId() const { return instance_id_; }
    const std::string& getChannel() const { return channel_; }

    /**
     * @brief 수신 payload 처리
     *
     * 전송 계층 핸들러가 호출합니다. 어떤 입력에도 예외를 던지지 않습니다.
     */
    void handleMessage(const std::string& payload);

    /**
     * @brief 통계 조회
     *
     * @return published, publish_failures, received, applied, self_echo_suppressed,
     *         decode_failures, apply_failures
     */
    std::map<std::string, uint64_t> getStatistics() const;

private:
    void publish(InvalidationMessageType type,
                 const std::vector<std::string>& table_names,
                 const std::optional<std::string>& pattern);

    void applyLocally(const InvalidationMessage& message);
    void notifyObservers(const InvalidationEnvelope& envelope);

    config::StrataConfig config_;
    std::shared_ptr<invalidation::ICacheInvalidator> local_;
    std::shared_ptr<IPubSubTransport> transport_;

    const std::string instance_id_;
    const std::string channel_;

    SubscriptionId subscription_id_;
    mutable std::mutex listen_mutex_;

    std::vector<std::shared_ptr<IInvalidationObserver>> observers_;
    std::mutex observer_mutex_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> publish_failures_{0};
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> self_echo_suppressed_{0};
    std::atomic<uint64_t> decode_failures_{0};
    std::atomic<uint64_t> apply_failures_{0};
};

} // namespace strata::core::distributed
