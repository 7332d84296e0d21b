// InvalidationCodec.h - 무효화 봉투 JSON 코덱
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_DISTRIBUTED_INVALIDATIONCODEC_H
#define STRATA_CORE_DISTRIBUTED_INVALIDATIONCODEC_H

#include "core/distributed/dto/InvalidationMessage.h"

#include <chrono>
#include <string>

namespace strata::core::distributed {

/**
 * @brief InvalidationEnvelope <-> JSON
 *
 * ```json
 * {"sourceInstanceId": "...",
 *  "message": {"type": "Table", "tableNames": ["Users"], "pattern": null, "correlationId": "..."},
 *  "timestamp": "2025-01-01T00:00:00.000Z"}
 * ```
 */
class InvalidationCodec {
public:
    static std::string encode(const InvalidationEnvelope& envelope);

    /**
     * @throws strata::core::SerializationError 형식이 맞지 않을 때
     */
    static InvalidationEnvelope decode(const std::string& payload);

    /**
     * @brief ISO-8601 파싱 (소수 초, `Z`와 `±HH:MM` 오프셋 허용)
     *
     * decode는 파싱 실패 시 수신 시각을 사용합니다.
     *
     * @throws strata::core::SerializationError
     */
    static std::chrono::system_clock::time_point parseTimestamp(const std::string& str);
};

} // namespace strata::core::distributed

#endif // STRATA_CORE_DISTRIBUTED_INVALIDATIONCODEC_H
