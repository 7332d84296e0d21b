#include "InvalidationCodec.h"
#include "core/common/CacheErrors.h"

#include "core/util/Iso8601.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace strata::core::distributed {

namespace {

InvalidationMessageType parseType(const std::string& str) {
    if (str == "Table") return InvalidationMessageType::Table;
    if (str == "Pattern") return InvalidationMessageType::Pattern;
    if (str == "Batch") return InvalidationMessageType::Batch;
    throw SerializationError("Unknown invalidation message type: '" + str + "'");
}

} // namespace

std::string InvalidationCodec::encode(const InvalidationEnvelope& envelope) {
    const auto& msg = envelope.message;

    nlohmann::json j;
    j["sourceInstanceId"] = envelope.source_instance_id;
    j["message"] = {
        {"type", toString(msg.type)},
        {"tableNames", msg.table_names},
        {"pattern", msg.pattern ? nlohmann::json(*msg.pattern) : nlohmann::json(nullptr)},
        {"correlationId", msg.correlation_id},
    };
    j["timestamp"] = util::formatIso8601(envelope.timestamp);
    return j.dump();
}

InvalidationEnvelope InvalidationCodec::decode(const std::string& payload) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw SerializationError(std::string("Malformed invalidation envelope: ") + e.what());
    }

    try {
        InvalidationEnvelope envelope;
        envelope.source_instance_id = j.at("sourceInstanceId").get<std::string>();

        const auto& msg = j.at("message");
        envelope.message.type = parseType(msg.at("type").get<std::string>());
        if (msg.contains("tableNames") && !msg["tableNames"].is_null()) {
            envelope.message.table_names = msg["tableNames"].get<std::vector<std::string>>();
        }
        if (msg.contains("pattern") && !msg["pattern"].is_null()) {
            envelope.message.pattern = msg["pattern"].get<std::string>();
        }
        if (msg.contains("correlationId") && !msg["correlationId"].is_null()) {
            envelope.message.correlation_id = msg["correlationId"].get<std::string>();
        }

        // 타임스탬프는 정보용이므로 읽을 수 없어도 메시지는 적용
        envelope.timestamp = std::chrono::system_clock::now();
        if (j.contains("timestamp") && j["timestamp"].is_string()) {
            try {
                envelope.timestamp = parseTimestamp(j["timestamp"].get<std::string>());
            } catch (const SerializationError& e) {
                spdlog::warn("[InvalidationCodec] {}, using receive time", e.what());
            }
        }

        if (envelope.message.type == InvalidationMessageType::Pattern && !envelope.message.pattern) {
            throw SerializationError("Pattern message without pattern");
        }
        return envelope;
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Invalid invalidation envelope: ") + e.what());
    }
}

std::chrono::system_clock::time_point InvalidationCodec::parseTimestamp(const std::string& str) {
    try {
        return util::parseIso8601(str);
    } catch (const std::invalid_argument& e) {
        throw SerializationError(e.what());
    }
}

} // namespace strata::core::distributed
