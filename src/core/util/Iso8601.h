// Iso8601.h - ISO-8601 타임스탬프 포맷/파싱
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_UTIL_ISO8601_H
#define STRATA_CORE_UTIL_ISO8601_H

#include <chrono>
#include <string>

namespace strata::core::util {

/**
 * @brief UTC 밀리초 정밀도 포맷 (`yyyy-MM-ddTHH:mm:ss.fffZ`)
 */
std::string formatIso8601(std::chrono::system_clock::time_point tp);

/**
 * @brief ISO-8601 파싱
 *
 * 소수 초는 밀리초까지 사용합니다. 접미사는 `Z`, `±HH:MM`, `±HHMM`, `±HH`를 받고
 * 접미사가 없으면 UTC로 간주합니다.
 *
 * @throws std::invalid_argument 형식이 맞지 않을 때
 */
std::chrono::system_clock::time_point parseIso8601(const std::string& str);

} // namespace strata::core::util

#endif // STRATA_CORE_UTIL_ISO8601_H
