// CacheEngine.h - 키 생성, 보호된 조회/저장, 무효화, 지능형 정책을 묶는 진입점
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_ENGINE_CACHEENGINE_H
#define STRATA_CORE_ENGINE_CACHEENGINE_H

#include "core/config/StrataConfig.h"
#include "core/datastore/interfaces/IKeyValueStore.h"
#include "core/distributed/core/DistributedInvalidationBroadcaster.h"
#include "core/distributed/interfaces/IPubSubTransport.h"
#include "core/intelligence/IntelligentCacheManager.h"
#include "core/invalidation/core/InvalidationRuleRegistry.h"
#include "core/invalidation/core/InvalidationTracker.h"
#include "core/keygen/CacheKeyGenerator.h"
#include "core/resilience/CircuitBreaker.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata::core::engine {

/**
 * @brief 엔진 협력 객체 묶음
 *
 * store, key_generator, tracker, circuit_breaker는 필수입니다.
 * 나머지는 선택이며 has*()로 사용 가능 여부를 확인합니다.
 */
struct EngineDependencies {
    std::shared_ptr<datastore::IKeyValueStore> store;
    std::shared_ptr<keygen::CacheKeyGenerator> key_generator;
    std::shared_ptr<invalidation::InvalidationTracker> tracker;
    std::shared_ptr<resilience::CircuitBreaker> circuit_breaker;

    std::shared_ptr<distributed::DistributedInvalidationBroadcaster> broadcaster;
    std::shared_ptr<intelligence::IntelligentCacheManager> intelligence;
    std::shared_ptr<invalidation::InvalidationRuleRegistry> rules;

    bool hasBroadcaster() const { return broadcaster != nullptr; }
    bool hasIntelligence() const { return intelligence != nullptr; }
    bool hasRules() const { return rules != nullptr; }
};

/**
 * @brief 설정에 따라 협력 객체 구성
 *
 * - distributed.enabled이고 transport가 있으면 broadcaster 생성
 * - intelligence.enabled이면 IntelligentCacheManager 생성
 * - invalidation_rules_file이 지정되면 규칙 로드, 관계 그래프를 tracker에 연결
 *
 * @throws strata::core::ConfigError 규칙 파일 로드 실패 또는 잘못된 설정
 * @throws std::invalid_argument store가 nullptr
 */
EngineDependencies createEngineDependencies(const config::StrataConfig& config,
                                            std::shared_ptr<datastore::IKeyValueStore> store,
                                            std::shared_ptr<distributed::IPubSubTransport> transport = nullptr);

/**
 * @brief 캐시 엔진 파사드
 *
 * 요청 처리 계층이 호출하는 단일 진입점입니다.
 *
 * 흐름:
 * - get/set/remove는 Circuit Breaker를 거쳐 저장소에 접근
 * - silent_fallback이면 저장소 오류와 Breaker Open을 우회(miss, 미저장)로 처리
 * - 지능형 관리자가 있으면 접근을 보고하고, TTL 미지정 set에 적응형 TTL 적용
 * - 무효화는 broadcaster가 있으면 broadcaster, 없으면 로컬 tracker로 위임
 */
class CacheEngine {
public:
    /**
     * @throws std::invalid_argument 필수 협력 객체가 없을 때
     */
    CacheEngine(const config::StrataConfig& config, EngineDependencies dependencies);
    ~CacheEngine();

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    /**
     * @brief 백그라운드 작업 시작 (헬스 체크, 핫 키 감지, 채널 구독)
     */
    void start();

    /**
     * @brief 백그라운드 작업 종료 (멱등)
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    std::string generateKey(const std::string& operation_id,
                            const std::string& action,
                            const keygen::Parameters& parameters = {});

    /**
     * @brief 캐시 조회
     *
     * @return 값, 없거나 우회 시 std::nullopt
     * @throws StoreError, CircuitOpenError silent_fallback이 꺼져 있을 때
     */
    std::optional<std::string> get(const std::string& key);

    /**
     * @brief 캐시 저장 및 테이블 추적
     *
     * @param tables 결과가 의존하는 테이블 (비어 있으면 추적 안 함)
     * @param ttl 미지정 시 적응형 TTL 또는 기본 만료 시간
     * @return 저장되었으면 true, 우회되었으면 false
     */
    bool set(const std::string& key, const std::string& value,
             const std::vector<std::string>& tables = {},
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /**
     * @brief 연산 정책(규칙 레지스트리)에 따라 저장
     *
     * 정책의 tables로 추적하고 expiration이 있으면 TTL로 사용합니다.
     */
    bool setForOperation(const std::string& operation_id, const std::string& key,
                         const std::string& value);

    bool remove(const std::string& key);

    invalidation::InvalidationResult invalidate(const std::string& table_name,
                                                const CancellationToken& token = {});
    invalidation::InvalidationResult invalidateByPattern(const std::string& pattern,
                                                         const CancellationToken& token = {});
    invalidation::InvalidationResult invalidateWithRelated(const std::string& table_name,
                                                           const std::vector<std::string>& related_tables,
                                                           int max_depth = -1,
                                                           const CancellationToken& token = {});
    invalidation::InvalidationResult invalidateBatch(const std::vector<std::string>& table_names,
                                                     const CancellationToken& token = {});
    invalidation::InvalidationResult invalidateByPatternBatch(const std::vector<std::string>& patterns,
                                                              const CancellationToken& token = {});

    /**
     * @brief 단일 무효화 규칙 적용
     *
     * - All: 테이블 무효화
     * - Pattern: 패턴 무효화 (패턴이 비어 있으면 All로 처리)
     * - Related: 연쇄 무효화 (max_depth < 0이면 설정값)
     */
    invalidation::InvalidationResult applyRule(const invalidation::InvalidationRule& rule,
                                               const CancellationToken& token = {});

    /**
     * @brief 연산에 등록된 모든 무효화 규칙 적용
     *
     * 레지스트리가 없거나 정책이 없으면 아무것도 하지 않습니다.
     */
    invalidation::InvalidationResult invalidateForOperation(const std::string& operation_id,
                                                            const CancellationToken& token = {});

    const EngineDependencies& dependencies() const { return deps_; }

    /**
     * @brief 엔진 및 협력 객체 통계
     *
     * 키 접두사: engine.*, tracker.*, breaker.*, distributed.*, intelligence.*
     */
    std::map<std::string, uint64_t> getStatistics() const;

private:
    invalidation::ICacheInvalidator& invalidator();
    void reportAccess(const std::string& key, intelligence::AccessType type);

    // silent_fallback이면 로그 + 사용자 훅 후 true, 아니면 false (호출 측 rethrow)
    bool absorbError(const std::exception& e, const std::string& context);

    config::StrataConfig config_;
    EngineDependencies deps_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> bypassed_{0};
};

} // namespace strata::core::engine

#endif // STRATA_CORE_ENGINE_CACHEENGINE_H
