// GlobPattern.h - 글롭 패턴 매칭
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_UTIL_GLOBPATTERN_H
#define STRATA_CORE_UTIL_GLOBPATTERN_H

#include <regex>
#include <string>

namespace strata::core::util {

/**
 * @brief 글롭 패턴을 정규식 문자열로 변환
 *
 * `*` → `.*`, `?` → `.`, 그 외 정규식 메타문자는 이스케이프, `^...$`로 전체 고정.
 */
std::string globToRegex(const std::string& glob);

/**
 * @brief 컴파일된 글롭 매처 (대소문자 무시)
 */
class GlobPattern {
public:
    explicit GlobPattern(const std::string& glob);

    bool matches(const std::string& text) const;

    const std::string& pattern() const { return glob_; }

private:
    std::string glob_;
    std::regex regex_;
};

} // namespace strata::core::util

#endif // STRATA_CORE_UTIL_GLOBPATTERN_H
