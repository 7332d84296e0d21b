// AccessMetrics.h - 키 접근 메트릭 및 핫 키 정보
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_INTELLIGENCE_DTO_ACCESSMETRICS_H
#define STRATA_CORE_INTELLIGENCE_DTO_ACCESSMETRICS_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace strata::core::intelligence {

/**
 * @brief 캐시 접근 종류
 *
 * Hit/Miss만 적중률(TTL 메트릭)에 반영됩니다.
 * 나머지는 접근 횟수로만 집계됩니다.
 */
enum class AccessType {
    Hit,
    Miss,
    Set,
    Delete,
    Expire
};

inline const char* toString(AccessType type) {
    switch (type) {
        case AccessType::Hit: return "Hit";
        case AccessType::Miss: return "Miss";
        case AccessType::Set: return "Set";
        case AccessType::Delete: return "Delete";
        case AccessType::Expire: return "Expire";
        default: return "Unknown";
    }
}

/**
 * @brief 축출 대상 선정 정책
 */
enum class EvictionPolicy {
    LRU,     ///< 마지막 접근이 가장 오래된 키
    LFU,     ///< 접근 횟수가 가장 적은 키
    TTL,     ///< 기본 만료 시간 이상 접근이 없던 키
    Random,  ///< 균등 무작위 표본
    FIFO     ///< 최초 접근이 가장 오래된 키
};

inline const char* toString(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::LRU: return "LRU";
        case EvictionPolicy::LFU: return "LFU";
        case EvictionPolicy::TTL: return "TTL";
        case EvictionPolicy::Random: return "Random";
        case EvictionPolicy::FIFO: return "FIFO";
        default: return "Unknown";
    }
}

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief 키별 접근 기록
 *
 * recent_accesses는 최근 접근 시각만 보관하며 용량 초과 시 오래된 것부터 버립니다.
 */
struct KeyAccessMetrics {
    TimePoint first_access;
    TimePoint last_access;
    uint64_t access_count = 0;
    std::deque<TimePoint> recent_accesses;
};

/**
 * @brief 적응형 TTL 계산용 적중 통계
 */
struct TtlMetrics {
    uint64_t hit_count = 0;
    uint64_t miss_count = 0;
    uint64_t total_access = 0;

    double hitRatio() const {
        return total_access > 0 ? static_cast<double>(hit_count) / static_cast<double>(total_access) : 0.0;
    }
};

/**
 * @brief 핫 키 조회 결과 (저장되지 않는 파생 값)
 */
struct HotKeyInfo {
    std::string key;
    uint64_t access_count = 0;
    double access_rate = 0.0;                 // 분당 접근 수
    TimePoint first_access;
    TimePoint last_access;
    std::chrono::milliseconds average_interval{0};
    double priority = 0.0;
};

/**
 * @brief 단일 키 메트릭 스냅샷
 */
struct KeyMetricsSnapshot {
    uint64_t access_count = 0;
    TimePoint first_access;
    TimePoint last_access;
    size_t history_size = 0;
    uint64_t hit_count = 0;
    uint64_t miss_count = 0;
};

/**
 * @brief 주기 정리 결과
 */
struct MaintenanceResult {
    size_t purged = 0;
    std::vector<HotKeyInfo> hot_keys;
};

} // namespace strata::core::intelligence

#endif // STRATA_CORE_INTELLIGENCE_DTO_ACCESSMETRICS_H
