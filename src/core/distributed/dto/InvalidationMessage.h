// InvalidationMessage.h - 분산 무효화 메시지
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_DISTRIBUTED_INVALIDATIONMESSAGE_H
#define STRATA_CORE_DISTRIBUTED_INVALIDATIONMESSAGE_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace strata::core::distributed {

enum class InvalidationMessageType {
    Table,    ///< tableNames 각각 무효화
    Pattern,  ///< pattern으로 무효화
    Batch     ///< tableNames 배치 무효화
};

inline const char* toString(InvalidationMessageType type) {
    switch (type) {
        case InvalidationMessageType::Table: return "Table";
        case InvalidationMessageType::Pattern: return "Pattern";
        case InvalidationMessageType::Batch: return "Batch";
        default: return "Unknown";
    }
}

struct InvalidationMessage {
    InvalidationMessageType type = InvalidationMessageType::Table;
    std::vector<std::string> table_names;
    std::optional<std::string> pattern;
    std::string correlation_id;
};

/**
 * @brief 채널에 게시되는 봉투
 *
 * source_instance_id로 자기 메시지(echo)를 걸러냅니다.
 */
struct InvalidationEnvelope {
    std::string source_instance_id;
    InvalidationMessage message;
    std::chrono::system_clock::time_point timestamp;
};

} // namespace strata::core::distributed

#endif // STRATA_CORE_DISTRIBUTED_INVALIDATIONMESSAGE_H
