#include "CacheKeyGenerator.h"
#include "core/util/Base36.h"
#include "core/util/Fnv1a64.h"
#include "core/util/Iso8601.h"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace strata::core::keygen {

namespace {

constexpr const char* kControllerSuffix = "Controller";

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

} // namespace

CacheKeyGenerator::CacheKeyGenerator(const config::StrataConfig& config)
    : namespace_name_(config.namespace_name),
      version_key_(config.version_key),
      separator_(config.key_separator),
      tracking_prefix_(config.tracking_prefix),
      log_key_generation_(config.logging.log_key_generation),
      memo_capacity_(config.key_memo_capacity) {}

std::string CacheKeyGenerator::generateKey(const std::string& operation_id,
                                           const std::string& action,
                                           const Parameters& parameters) {
    std::string hash = generateParameterHash(parameters);
    // 길이 접두로 구분자를 포함한 이름끼리 겹치지 않게 함
    std::string memo_key = fmt::format("{}:{}{}:{}{}", operation_id.size(), operation_id,
                                       action.size(), action, hash);

    {
        MemoMap::const_accessor acc;
        if (memo_.find(acc, memo_key)) {
            return acc->second;
        }
    }

    std::vector<std::string> parts;
    parts.reserve(5);
    parts.push_back(namespace_name_);
    if (!version_key_.empty()) {
        parts.push_back(version_key_);
    }
    parts.push_back(stripControllerSuffix(operation_id));
    parts.push_back(action);
    if (!hash.empty()) {
        parts.push_back(hash);
    }
    std::string key = joinParts(parts);

    // 상한까지만 예약 후 삽입, 초과분은 메모 없이 반환
    if (memo_count_.fetch_add(1) < memo_capacity_) {
        if (!memo_.insert({memo_key, key})) {
            memo_count_.fetch_sub(1);  // 다른 스레드가 먼저 삽입
        }
    } else {
        memo_count_.fetch_sub(1);
    }

    if (log_key_generation_) {
        spdlog::debug("[CacheKeyGenerator] Generated key '{}' for {}.{}", key, operation_id, action);
    }
    return key;
}

std::string CacheKeyGenerator::generateTrackingKey(const std::string& table_name) const {
    std::vector<std::string> parts;
    parts.reserve(4);
    parts.push_back(namespace_name_);
    if (!version_key_.empty()) {
        parts.push_back(version_key_);
    }
    parts.push_back(tracking_prefix_);
    parts.push_back(table_name);
    return joinParts(parts);
}

std::string CacheKeyGenerator::generateParameterHash(const Parameters& parameters) const {
    std::string canonical = canonicalize(parameters);
    if (canonical.empty()) {
        return "";
    }
    return util::toBase36(util::Fnv1a64::hash(canonical));
}

std::string CacheKeyGenerator::canonicalize(const Parameters& parameters) const {
    // nlohmann::json object는 std::map 기반이므로 키가 ordinal 정렬됨
    nlohmann::json canonical = nlohmann::json::object();
    for (const auto& [name, value] : parameters) {
        if (isEmptyValue(value)) {
            continue;
        }
        canonical[name] = normalize(value);
    }

    if (canonical.empty()) {
        return "";
    }
    return canonical.dump();
}

nlohmann::json CacheKeyGenerator::normalize(const ParameterValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return trim(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{:.2f}", v);
        } else if constexpr (std::is_same_v<T, std::chrono::system_clock::time_point>) {
            return util::formatIso8601(v);
        } else {
            return v;
        }
    }, value);
}

bool CacheKeyGenerator::isEmptyValue(const ParameterValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return trim(*s).empty();
    }
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        return list->empty();
    }
    return false;
}

std::string CacheKeyGenerator::stripControllerSuffix(const std::string& operation_id) const {
    const size_t suffix_len = std::char_traits<char>::length(kControllerSuffix);
    if (operation_id.size() > suffix_len &&
        operation_id.compare(operation_id.size() - suffix_len, suffix_len, kControllerSuffix) == 0) {
        return operation_id.substr(0, operation_id.size() - suffix_len);
    }
    return operation_id;
}

std::string CacheKeyGenerator::joinParts(const std::vector<std::string>& parts) const {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator_;
        }
        out += parts[i];
    }
    return out;
}

} // namespace strata::core::keygen
