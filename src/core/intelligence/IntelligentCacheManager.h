// IntelligentCacheManager.h - 핫 키 감지, 적응형 TTL, 축출 대상 선정
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_INTELLIGENCE_INTELLIGENTCACHEMANAGER_H
#define STRATA_CORE_INTELLIGENCE_INTELLIGENTCACHEMANAGER_H

#include "core/config/StrataConfig.h"
#include "core/intelligence/dto/AccessMetrics.h"
#include "core/util/PeriodicTask.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <tbb/concurrent_hash_map.h>

namespace strata::core::intelligence {

/**
 * @brief 접근 패턴 기반 캐시 정책 관리자
 *
 * 모든 캐시 접근을 관찰해 키별 메트릭을 유지하고 다음을 계산합니다:
 * - 핫 키 순위 (분당 접근 수 기준)
 * - 적응형 TTL (접근 빈도와 적중률로 기본 TTL 가감)
 * - 정책별 축출 대상 (LRU, LFU, TTL, Random, FIFO)
 *
 * 이 컴포넌트는 선정만 합니다. 실제 저장소 삭제와 데이터 로딩은 호출자 책임입니다.
 *
 * 스레드 안전:
 * - 키 단위 갱신은 concurrent_hash_map accessor로 보호
 * - 전체 순회(순위, 정리, 축출)는 traversal_mutex_ 배타 잠금
 * - 메트릭 실패는 로그만 남기고 캐시 경로를 막지 않음
 */
class IntelligentCacheManager {
public:
    using Clock = std::chrono::system_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /**
     * @brief 생성자
     *
     * @param config 엔진 설정 (intelligence 섹션과 default_expiration 사용)
     * @param time_source 현재 시각 공급자 (nullptr이면 system_clock::now)
     */
    explicit IntelligentCacheManager(const config::StrataConfig& config,
                                     TimeSource time_source = nullptr);
    ~IntelligentCacheManager();

    IntelligentCacheManager(const IntelligentCacheManager&) = delete;
    IntelligentCacheManager& operator=(const IntelligentCacheManager&) = delete;

    /**
     * @brief 캐시 접근 기록
     *
     * 빈 키는 무시합니다. Hit/Miss는 적중 통계에도 반영됩니다.
     */
    void recordAccess(const std::string& key, AccessType type);

    /**
     * @brief 핫 키 조회
     *
     * 보존 기간 내 접근된 키를 분당 접근 수 내림차순으로 반환합니다.
     *
     * @param top_n 요청 개수 (max_hot_key_candidates로 상한)
     */
    std::vector<HotKeyInfo> getHotKeys(size_t top_n = 10) const;

    /**
     * @brief 적응형 TTL 계산
     *
     * ttl = base * min(rate / threshold, 2.0) * max(hitRatio, 0.5),
     * [min_ttl, max_ttl]로 제한. 메트릭이 없으면 base를 그대로 반환.
     */
    std::chrono::milliseconds calculateAdaptiveTtl(const std::string& key) const;
    std::chrono::milliseconds calculateAdaptiveTtl(const std::string& key,
                                                   std::chrono::milliseconds base_ttl) const;

    /**
     * @brief 키 우선순위 (0.7 * 접근률 + 0.3 * 최근성)
     *
     * @return 메트릭이 없으면 0.0
     */
    double calculateKeyPriority(const std::string& key) const;

    /**
     * @brief 정책에 따라 축출 대상 선정
     *
     * 선정된 키의 메트릭은 즉시 제거됩니다.
     *
     * @return 선정된 키 (최대 max_items개)
     */
    std::vector<std::string> evictByPolicy(EvictionPolicy policy, size_t max_items);

    /**
     * @brief 캐시 워밍
     *
     * 각 키에 Set 접근을 기록해 메트릭을 미리 만듭니다.
     *
     * @return 기록된 키 수
     */
    size_t warmCache(const std::vector<std::string>& keys);

    /**
     * @brief 주기적 핫 키 감지 시작 (detection_interval 간격)
     *
     * @return 이미 실행 중이면 false
     */
    bool startHotKeyDetection();
    void stopHotKeyDetection();
    bool isHotKeyDetectionActive() const;

    /**
     * @brief 보존 기간이 지난 메트릭 정리 후 현재 핫 키 감지
     *
     * 주기 작업의 본문이며 직접 호출할 수 있습니다.
     */
    MaintenanceResult runMaintenanceSweep();

    std::optional<KeyMetricsSnapshot> getKeyMetrics(const std::string& key) const;

    size_t trackedKeyCount() const;

    /**
     * @brief 통계 조회
     *
     * @return accesses_recorded, tracked_keys, sweeps, purged_metrics, evicted_keys
     */
    std::map<std::string, uint64_t> getStatistics() const;

    /// @brief 모든 메트릭 삭제
    void clear();

private:
    using KeyMetricsMap = tbb::concurrent_hash_map<std::string, KeyAccessMetrics>;
    using TtlMetricsMap = tbb::concurrent_hash_map<std::string, TtlMetrics>;

    Clock::time_point now() const;
    double accessRate(const KeyAccessMetrics& metrics, Clock::time_point now) const;
    double priority(const KeyAccessMetrics& metrics, Clock::time_point now) const;
    std::chrono::milliseconds averageInterval(const KeyAccessMetrics& metrics) const;
    HotKeyInfo toHotKeyInfo(const std::string& key, const KeyAccessMetrics& metrics,
                            Clock::time_point now) const;

    std::vector<std::string> selectVictimsLocked(EvictionPolicy policy, size_t max_items,
                                                 Clock::time_point now) const;
    void eraseLocked(const std::string& key);

    config::IntelligenceConfig config_;
    std::chrono::milliseconds default_expiration_;
    TimeSource time_source_;

    KeyMetricsMap key_metrics_;
    TtlMetricsMap ttl_metrics_;
    mutable std::shared_mutex traversal_mutex_;

    mutable std::mutex detection_mutex_;
    std::unique_ptr<util::PeriodicTask> detection_task_;

    std::atomic<uint64_t> accesses_recorded_{0};
    std::atomic<uint64_t> sweeps_{0};
    std::atomic<uint64_t> purged_metrics_{0};
    std::atomic<uint64_t> evicted_keys_{0};
};

} // namespace strata::core::intelligence

#endif // STRATA_CORE_INTELLIGENCE_INTELLIGENTCACHEMANAGER_H
