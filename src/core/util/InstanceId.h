// InstanceId.h - 프로세스 식별자 생성
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_UTIL_INSTANCEID_H
#define STRATA_CORE_UTIL_INSTANCEID_H

#include <string>

namespace strata::core::util {

/**
 * @brief 소문자 UUID 문자열 생성 (libuuid, time-based)
 */
std::string generateUuid();

/**
 * @brief 프로세스 고유 인스턴스 ID 생성
 *
 * 형식: `{hostname}_{pid}_{uuid 앞 8자리}`
 * 같은 호스트에서 재시작해도 겹치지 않습니다.
 */
std::string generateInstanceId();

} // namespace strata::core::util

#endif // STRATA_CORE_UTIL_INSTANCEID_H
