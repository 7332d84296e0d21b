// CacheKeyGenerator.h - 결정적 캐시 키 생성기
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_KEYGEN_CACHEKEYGENERATOR_H
#define STRATA_CORE_KEYGEN_CACHEKEYGENERATOR_H

#include "core/config/StrataConfig.h"
#include "dto/ParameterValue.h"

#include <atomic>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tbb/concurrent_hash_map.h>

namespace strata::core::keygen {

/**
 * @brief (operationId, action, parameters) → 캐시 키
 *
 * 키 형식: `namespace[sep]version[sep]operation[sep]action[sep]hash`
 * - version이 비어 있으면 생략
 * - operationId의 "Controller" 접미사 제거
 * - 파라미터 해시가 비어 있으면 생략 (끝 구분자 없음)
 *
 * 같은 파라미터 집합은 삽입 순서와 무관하게 같은 키를 냅니다. 해시에 salt가 없으므로
 * 프로세스 재시작 후에도 키가 유지됩니다.
 *
 * 메모이제이션은 용량 상한까지만 채우고, 가득 차면 새 키는 메모 없이 계산합니다.
 * 퇴출(eviction)은 하지 않습니다.
 */
class CacheKeyGenerator {
public:
    explicit CacheKeyGenerator(const config::StrataConfig& config);

    CacheKeyGenerator(const CacheKeyGenerator&) = delete;
    CacheKeyGenerator& operator=(const CacheKeyGenerator&) = delete;

    /**
     * @brief 캐시 키 생성
     *
     * @param operation_id 연산 식별자 (예: "UsersController")
     * @param action 액션 이름 (예: "GetUser")
     * @param parameters 요청 파라미터 (비어 있을 수 있음)
     */
    std::string generateKey(const std::string& operation_id,
                            const std::string& action,
                            const Parameters& parameters = {});

    /**
     * @brief 테이블 추적 키 생성
     *
     * 형식: `namespace[sep]version[sep]trackingPrefix[sep]tableName`
     */
    std::string generateTrackingKey(const std::string& table_name) const;

    /**
     * @brief 파라미터 해시만 계산
     *
     * null, 빈 문자열, 공백 문자열, 빈 컬렉션은 제외합니다. 남은 값이 없으면 빈 문자열.
     */
    std::string generateParameterHash(const Parameters& parameters) const;

    /**
     * @brief 정규화된 파라미터의 canonical JSON
     *
     * 키는 ordinal 정렬, 구분자 없는 compact 형식. 해시 입력과 동일합니다.
     */
    std::string canonicalize(const Parameters& parameters) const;

    size_t memoSize() const { return memo_count_.load(); }
    size_t memoCapacity() const { return memo_capacity_; }

private:
    static nlohmann::json normalize(const ParameterValue& value);
    static bool isEmptyValue(const ParameterValue& value);
    std::string stripControllerSuffix(const std::string& operation_id) const;
    std::string joinParts(const std::vector<std::string>& parts) const;

    std::string namespace_name_;
    std::string version_key_;
    std::string separator_;
    std::string tracking_prefix_;
    bool log_key_generation_;

    using MemoMap = tbb::concurrent_hash_map<std::string, std::string>;
    MemoMap memo_;
    std::atomic<size_t> memo_count_{0};
    size_t memo_capacity_;
};

} // namespace strata::core::keygen

#endif // STRATA_CORE_KEYGEN_CACHEKEYGENERATOR_H
