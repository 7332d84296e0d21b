// ParameterValue.h - 캐시 키 파라미터 값 타입
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_KEYGEN_PARAMETERVALUE_H
#define STRATA_CORE_KEYGEN_PARAMETERVALUE_H

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strata::core::keygen {

/**
 * @brief 요청 파라미터 값
 *
 * std::monostate는 null을 의미하며 해시 계산 시 제외됩니다.
 */
using ParameterValue = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    std::chrono::system_clock::time_point,
    std::vector<std::string>
>;

/// @brief 파라미터 이름 → 값 (삽입 순서는 키에 영향 없음)
using Parameters = std::unordered_map<std::string, ParameterValue>;

} // namespace strata::core::keygen

#endif // STRATA_CORE_KEYGEN_PARAMETERVALUE_H
