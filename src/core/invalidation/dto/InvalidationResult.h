// InvalidationResult.h - 무효화 결과
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_INVALIDATION_INVALIDATIONRESULT_H
#define STRATA_CORE_INVALIDATION_INVALIDATIONRESULT_H

#include <chrono>
#include <string>
#include <vector>

namespace strata::core::invalidation {

/**
 * @brief 무효화 결과 (관측용)
 *
 * attempted는 삭제를 시도한 키 수, invalidated는 실제 삭제 호출이 성공한 수입니다.
 * success가 false이면 오류가 silent fallback으로 흡수된 것입니다.
 */
struct InvalidationResult {
    size_t attempted = 0;
    size_t invalidated = 0;
    std::vector<std::string> tables;   // 처리한 테이블 (방문 순서)
    bool success = true;
    bool cancelled = false;
    std::string error_message;
    std::chrono::milliseconds duration{0};

    void merge(const InvalidationResult& other) {
        attempted += other.attempted;
        invalidated += other.invalidated;
        tables.insert(tables.end(), other.tables.begin(), other.tables.end());
        success = success && other.success;
        cancelled = cancelled || other.cancelled;
        if (error_message.empty()) {
            error_message = other.error_message;
        }
        duration += other.duration;
    }
};

} // namespace strata::core::invalidation

#endif // STRATA_CORE_INVALIDATION_INVALIDATIONRESULT_H
