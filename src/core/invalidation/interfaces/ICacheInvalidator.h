#pragma once

#include "core/common/CancellationToken.h"
#include "core/invalidation/dto/InvalidationResult.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace strata::core::invalidation {

/**
 * @brief 캐시 무효화 인터페이스
 *
 * 로컬 추적기(InvalidationTracker)와 분산 래퍼(DistributedInvalidationBroadcaster)가
 * 같은 계약을 구현하므로 호출자는 배포 모드와 무관하게 이 인터페이스만 사용합니다.
 *
 * 백엔드 오류는 silent fallback 설정 시 로그 후 흡수되고(result.success == false),
 * 그렇지 않으면 StoreError가 호출자에게 전파됩니다.
 */
class ICacheInvalidator {
public:
    virtual ~ICacheInvalidator() = default;

    /**
     * @brief 캐시 키를 여러 테이블에 연결
     *
     * 추적 집합 TTL은 max(기본 만료 x2, entry_ttl)이며 이미 더 길게 남은 TTL은 줄이지 않습니다.
     *
     * @param entry_ttl 추적 대상 항목의 TTL (0 이하이면 만료 없음, nullopt이면 기본 만료)
     */
    virtual void trackKey(const std::vector<std::string>& table_names,
                          const std::string& cache_key,
                          std::optional<std::chrono::milliseconds> entry_ttl = std::nullopt,
                          const CancellationToken& token = {}) = 0;

    virtual void trackKey(const std::string& table_name,
                          const std::string& cache_key,
                          std::optional<std::chrono::milliseconds> entry_ttl = std::nullopt,
                          const CancellationToken& token = {}) = 0;

    /**
     * @brief 테이블에 연결된 캐시 키 조회
     *
     * 백엔드 오류는 항상 로그 후 빈 결과를 반환합니다.
     */
    virtual std::vector<std::string> getTrackedKeys(const std::string& table_name,
                                                    const CancellationToken& token = {}) = 0;

    /**
     * @brief 테이블에 연결된 모든 키와 추적 집합 삭제
     */
    virtual InvalidationResult invalidate(const std::string& table_name,
                                          const CancellationToken& token = {}) = 0;

    /**
     * @brief 글롭 패턴과 일치하는 키 삭제
     */
    virtual InvalidationResult invalidateByPattern(const std::string& pattern,
                                                   const CancellationToken& token = {}) = 0;

    /**
     * @brief 관련 테이블 연쇄 무효화
     *
     * @param max_depth 음수이면 설정된 기본 깊이 사용
     */
    virtual InvalidationResult invalidateWithRelated(const std::string& table_name,
                                                     const std::vector<std::string>& related_tables,
                                                     int max_depth = -1,
                                                     const CancellationToken& token = {}) = 0;

    virtual InvalidationResult invalidateBatch(const std::vector<std::string>& table_names,
                                               const CancellationToken& token = {}) = 0;

    virtual InvalidationResult invalidateByPatternBatch(const std::vector<std::string>& patterns,
                                                        const CancellationToken& token = {}) = 0;
};

} // namespace strata::core::invalidation
