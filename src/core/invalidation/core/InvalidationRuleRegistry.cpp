// InvalidationRuleRegistry.cpp - 연산별 캐시/무효화 규칙 로더 구현
// Copyright (C) 2025 Strata Project

#include "InvalidationRuleRegistry.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <spdlog/spdlog.h>

namespace strata::core::invalidation {

std::optional<InvalidationType> parseInvalidationType(const std::string& str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "all") return InvalidationType::All;
    if (lower == "pattern") return InvalidationType::Pattern;
    if (lower == "related") return InvalidationType::Related;
    return std::nullopt;
}

bool InvalidationRuleRegistry::loadFromFile(const std::filesystem::path& path) {
    errors_.clear();
    warnings_.clear();

    if (!std::filesystem::exists(path)) {
        errors_.push_back("Rules file not found: " + path.string());
        spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
        return false;
    }

    try {
        return loadFromNode(YAML::LoadFile(path.string()), path.filename().string());
    } catch (const YAML::Exception& e) {
        errors_.push_back("YAML parsing error: " + std::string(e.what()));
        spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
        return false;
    }
}

bool InvalidationRuleRegistry::loadFromString(const std::string& yaml) {
    errors_.clear();
    warnings_.clear();

    try {
        return loadFromNode(YAML::Load(yaml), "<string>");
    } catch (const YAML::Exception& e) {
        errors_.push_back("YAML parsing error: " + std::string(e.what()));
        spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
        return false;
    }
}

bool InvalidationRuleRegistry::loadFromNode(const YAML::Node& root, const std::string& source) {
    if (!root["operations"] || !root["operations"].IsMap()) {
        errors_.push_back("Missing 'operations' section in " + source);
        spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
        return false;
    }

    std::map<std::string, OperationCachePolicy> loaded;

    for (const auto& kv : root["operations"]) {
        OperationCachePolicy policy;
        policy.operation_id = kv.first.as<std::string>();
        const YAML::Node& entry = kv.second;

        if (entry["tables"]) {
            policy.tables = entry["tables"].as<std::vector<std::string>>();
        }
        if (entry["expiration_minutes"]) {
            int minutes = entry["expiration_minutes"].as<int>();
            if (minutes <= 0) {
                errors_.push_back("Operation '" + policy.operation_id +
                                  "': expiration_minutes must be positive");
                spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
            } else {
                policy.expiration = std::chrono::minutes(minutes);
            }
        }

        if (entry["invalidation"]) {
            for (const auto& rule_node : entry["invalidation"]) {
                if (auto rule = parseRule(policy.operation_id, rule_node)) {
                    policy.rules.push_back(std::move(*rule));
                }
            }
        }

        if (policy.tables.empty() && policy.rules.empty()) {
            warnings_.push_back("Operation '" + policy.operation_id + "' has no tables and no rules");
            spdlog::warn("[InvalidationRuleRegistry] {}", warnings_.back());
        }

        spdlog::debug("[InvalidationRuleRegistry] Operation '{}': {} tables, {} rules",
                      policy.operation_id, policy.tables.size(), policy.rules.size());
        loaded[policy.operation_id] = std::move(policy);
    }

    if (!errors_.empty()) {
        spdlog::error("[InvalidationRuleRegistry] {} errors in {}, rules not applied",
                      errors_.size(), source);
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        policies_ = std::move(loaded);
    }

    spdlog::info("[InvalidationRuleRegistry] Loaded {} operation policies from '{}'", size(), source);
    return true;
}

std::optional<InvalidationRule> InvalidationRuleRegistry::parseRule(const std::string& operation_id,
                                                                    const YAML::Node& node) {
    if (!node["table"]) {
        errors_.push_back("Operation '" + operation_id + "': rule without 'table'");
        spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
        return std::nullopt;
    }

    InvalidationRule rule;
    rule.table_name = node["table"].as<std::string>();

    std::string type_str = node["type"] ? node["type"].as<std::string>() : "All";
    auto type = parseInvalidationType(type_str);
    if (!type) {
        errors_.push_back("Operation '" + operation_id + "': unknown invalidation type '" +
                          type_str + "' for table '" + rule.table_name + "'");
        spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
        return std::nullopt;
    }
    rule.type = *type;

    if (node["pattern"]) {
        rule.pattern = node["pattern"].as<std::string>();
    }
    if (node["related_tables"]) {
        rule.related_tables = node["related_tables"].as<std::vector<std::string>>();
    }
    if (node["max_depth"]) {
        rule.max_depth = node["max_depth"].as<int>();
    }

    if (rule.type == InvalidationType::Pattern && rule.pattern.empty()) {
        errors_.push_back("Operation '" + operation_id + "': Pattern rule for table '" +
                          rule.table_name + "' has no pattern");
        spdlog::error("[InvalidationRuleRegistry] {}", errors_.back());
        return std::nullopt;
    }
    if (rule.type == InvalidationType::Related && rule.related_tables.empty()) {
        warnings_.push_back("Operation '" + operation_id + "': Related rule for table '" +
                            rule.table_name + "' has no related_tables");
        spdlog::warn("[InvalidationRuleRegistry] {}", warnings_.back());
    }
    if (rule.max_depth == 0) {
        warnings_.push_back("Operation '" + operation_id + "': max_depth 0 for table '" +
                            rule.table_name + "' invalidates nothing");
        spdlog::warn("[InvalidationRuleRegistry] {}", warnings_.back());
    }

    return rule;
}

void InvalidationRuleRegistry::registerPolicy(const OperationCachePolicy& policy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    policies_[policy.operation_id] = policy;
}

std::optional<OperationCachePolicy> InvalidationRuleRegistry::getPolicy(const std::string& operation_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = policies_.find(operation_id);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> InvalidationRuleRegistry::getOperationIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(policies_.size());
    for (const auto& [id, policy] : policies_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> InvalidationRuleRegistry::relatedTablesFor(const std::string& table_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> related;
    for (const auto& [id, policy] : policies_) {
        for (const auto& rule : policy.rules) {
            if (rule.type != InvalidationType::Related || rule.table_name != table_name) {
                continue;
            }
            for (const auto& table : rule.related_tables) {
                if (std::find(related.begin(), related.end(), table) == related.end()) {
                    related.push_back(table);
                }
            }
        }
    }
    return related;
}

std::vector<std::string> InvalidationRuleRegistry::operationsInvalidatedBy(const std::string& table_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> operations;
    for (const auto& [id, policy] : policies_) {
        bool affected = std::any_of(policy.rules.begin(), policy.rules.end(),
                                    [&](const InvalidationRule& r) { return r.table_name == table_name; }) ||
                        std::find(policy.tables.begin(), policy.tables.end(), table_name) != policy.tables.end();
        if (affected) {
            operations.push_back(id);
        }
    }
    return operations;
}

size_t InvalidationRuleRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return policies_.size();
}

} // namespace strata::core::invalidation
