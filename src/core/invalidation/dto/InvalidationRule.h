// InvalidationRule.h - 테이블 무효화 규칙
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_INVALIDATION_INVALIDATIONRULE_H
#define STRATA_CORE_INVALIDATION_INVALIDATIONRULE_H

#include <optional>
#include <string>
#include <vector>

namespace strata::core::invalidation {

/**
 * @brief 무효화 방식
 */
enum class InvalidationType {
    All,      ///< 테이블에 추적된 모든 키 삭제
    Pattern,  ///< 글롭 패턴과 일치하는 키만 삭제
    Related   ///< 관련 테이블까지 연쇄 삭제
};

inline const char* toString(InvalidationType type) {
    switch (type) {
        case InvalidationType::All: return "All";
        case InvalidationType::Pattern: return "Pattern";
        case InvalidationType::Related: return "Related";
        default: return "Unknown";
    }
}

/**
 * @brief 문자열 → InvalidationType (대소문자 무시)
 */
std::optional<InvalidationType> parseInvalidationType(const std::string& str);

/**
 * @brief 연산에 연결되는 무효화 규칙
 *
 * 엔진은 규칙을 저장하지 않고 무효화 호출 지점에서만 소비합니다.
 */
struct InvalidationRule {
    std::string table_name;
    InvalidationType type = InvalidationType::All;
    std::string pattern;                      // Pattern 타입에서만 사용
    std::vector<std::string> related_tables;  // Related 타입에서만 사용
    int max_depth = -1;                       // 음수이면 설정 기본값 사용
};

} // namespace strata::core::invalidation

#endif // STRATA_CORE_INVALIDATION_INVALIDATIONRULE_H
