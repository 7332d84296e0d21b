#pragma once

#include "core/config/StrataConfig.h"
#include "core/datastore/interfaces/IKeyValueStore.h"
#include "core/invalidation/interfaces/ICacheInvalidator.h"
#include "core/keygen/CacheKeyGenerator.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <tbb/concurrent_hash_map.h>

namespace strata::core::invalidation {

/**
 * @brief 테이블 → 연관 테이블 목록 조회 함수
 *
 * 연쇄 무효화에서 시작 테이블 이후의 테이블을 확장할 때 사용됩니다.
 */
using RelationResolver = std::function<std::vector<std::string>(const std::string&)>;

/**
 * @brief 로컬 캐시 무효화 추적기
 *
 * 테이블별 추적 집합(캐시 키 JSON 배열)을 KV 저장소에 보관하고,
 * 테이블 변경 시 연결된 키를 삭제합니다.
 *
 * 주요 기능:
 * - 추적 집합 TTL = max(기본 만료 시간 x2, 항목 TTL), 남은 TTL은 줄이지 않음
 * - 단건/패턴/연쇄/배치 무효화
 * - 연쇄 무효화는 방문 집합으로 순환을 차단하고 max_depth에서 확장 중단
 * - 배치 무효화는 추적 집합 동시 조회 → 중복 제거 → 고정 크기 배치 삭제
 *
 * 스레드 안전성:
 * - 같은 테이블에 대한 trackKey와 무효화(조회 → 삭제 → 추적 집합 제거)는 테이블 단위 accessor로 직렬화
 * - 배치 무효화는 테이블 이름 순으로 accessor를 잡아 교착을 피함
 * - 서로 다른 테이블 간 전역 잠금 없음
 */
class InvalidationTracker : public ICacheInvalidator {
public:
    InvalidationTracker(const config::StrataConfig& config,
                        std::shared_ptr<datastore::IKeyValueStore> store,
                        std::shared_ptr<keygen::CacheKeyGenerator> key_generator);

    ~InvalidationTracker() override = default;

    InvalidationTracker(const InvalidationTracker&) = delete;
    InvalidationTracker& operator=(const InvalidationTracker&) = delete;

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

    InvalidationResult invalidate(const std::string& table_name,
                                  const CancellationToken& token = {}) override;

    InvalidationResult invalidateByPattern(const std::string& pattern,
                                           const CancellationToken& token = {}) override;

    InvalidationResult invalidateWithRelated(const std::string& table_name,
                                             const std::vector<std::string>& related_tables,
                                             int max_depth = -1,
                                             const CancellationToken& token = {}) override;

    InvalidationResult invalidateBatch(const std::vector<std::string>& table_names,
                                       const CancellationToken& token = {}) override;

    InvalidationResult invalidateByPatternBatch(const std::vector<std::string>& patterns,
                                                const CancellationToken& token = {}) override;

    /**
     * @brief 연쇄 무효화용 관계 조회 함수 등록
     *
     * 등록하지 않으면 시작 테이블의 related_tables만 확장됩니다.
     */
    void setRelationResolver(RelationResolver resolver);

    /// @brief 배치 삭제 크기: min(50, 2 x 하드웨어 스레드 수)
    size_t batchSize() const { return batch_size_; }

    /**
     * @brief 통계 조회
     *
     * @return invalidations, keys_invalidated, pattern_invalidations, swallowed_errors
     */
    std::map<std::string, uint64_t> getStatistics() const;

private:
    using TableLockMap = tbb::concurrent_hash_map<std::string, uint64_t>;

    // 추적 집합 조회 (오류 전파)
    std::vector<std::string> fetchTrackedKeys(const std::string& table_name);

    // 추적 집합 JSON 직렬화
    static std::vector<std::string> decodeTrackingSet(const std::string& payload);
    static std::string encodeTrackingSet(const std::vector<std::string>& keys);

    // 추적 집합에 쓸 TTL (0이면 만료 없음)
    std::chrono::milliseconds resolveTrackingTtl(const std::string& tracking_key,
                                                 std::optional<std::chrono::milliseconds> entry_ttl);

    // 키 목록을 배치 단위로 병렬 삭제, 개별 실패는 로그 후 건너뜀
    void removeKeysInBatches(const std::vector<std::string>& keys,
                             const CancellationToken& token,
                             InvalidationResult& result);

    void invalidateRecursive(const std::string& table_name,
                             const std::vector<std::string>& related_tables,
                             int max_depth,
                             int current_depth,
                             std::set<std::string>& processed,
                             const CancellationToken& token,
                             InvalidationResult& result);

    // silent fallback 시 로그 + 사용자 훅, 아니면 호출 측에서 rethrow
    void reportSwallowedError(const std::exception& e, const std::string& context);

    config::StrataConfig config_;
    std::shared_ptr<datastore::IKeyValueStore> store_;
    std::shared_ptr<keygen::CacheKeyGenerator> key_generator_;
    size_t batch_size_;

    // 테이블 단위 잠금 (accessor 보유 동안 read-modify-write 직렬화)
    TableLockMap table_locks_;

    RelationResolver relation_resolver_;
    mutable std::mutex resolver_mutex_;

    std::atomic<uint64_t> invalidations_{0};
    std::atomic<uint64_t> keys_invalidated_{0};
    std::atomic<uint64_t> pattern_invalidations_{0};
    std::atomic<uint64_t> swallowed_errors_{0};
};

} // namespace strata::core::invalidation
