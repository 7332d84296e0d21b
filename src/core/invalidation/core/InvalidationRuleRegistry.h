// InvalidationRuleRegistry.h - 연산별 캐시/무효화 규칙 로더
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_INVALIDATION_INVALIDATIONRULEREGISTRY_H
#define STRATA_CORE_INVALIDATION_INVALIDATIONRULEREGISTRY_H

#include "core/invalidation/dto/InvalidationRule.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace strata::core::invalidation {

/**
 * @brief 연산(operationId) 단위 캐시 정책
 */
struct OperationCachePolicy {
    std::string operation_id;
    std::vector<std::string> tables;            ///< 결과가 의존하는 테이블 (trackKey 대상)
    std::vector<InvalidationRule> rules;        ///< 테이블 변경 시 적용할 규칙
    std::optional<std::chrono::milliseconds> expiration;  ///< 없으면 기본/적응형 TTL
};

/**
 * @brief 무효화 규칙 레지스트리
 *
 * YAML 파일에서 연산별 정책을 읽어 검증합니다. 오류가 있으면 로드 실패,
 * 경고는 기록만 합니다.
 *
 * 형식:
 * ```yaml
 * operations:
 *   UsersController.GetUser:
 *     tables: [Users]
 *     expiration_minutes: 10
 *     invalidation:
 *       - table: Users
 *         type: All
 *       - table: Orders
 *         type: Related
 *         related_tables: [Users]
 *         max_depth: 2
 *       - table: Products
 *         type: Pattern
 *         pattern: "*Products*"
 * ```
 *
 * Related 규칙들은 연쇄 무효화의 관계 그래프로도 쓰입니다 (relatedTablesFor).
 */
class InvalidationRuleRegistry {
public:
    InvalidationRuleRegistry() = default;
    ~InvalidationRuleRegistry() = default;

    InvalidationRuleRegistry(const InvalidationRuleRegistry&) = delete;
    InvalidationRuleRegistry& operator=(const InvalidationRuleRegistry&) = delete;

    /**
     * @brief YAML 파일에서 정책 로드 (기존 정책 대체)
     *
     * @return 오류 없이 로드되면 true
     */
    bool loadFromFile(const std::filesystem::path& path);

    /**
     * @brief YAML 문자열에서 정책 로드 (기존 정책 대체)
     */
    bool loadFromString(const std::string& yaml);

    /**
     * @brief 코드에서 직접 정책 등록 (같은 operation_id는 대체)
     */
    void registerPolicy(const OperationCachePolicy& policy);

    std::optional<OperationCachePolicy> getPolicy(const std::string& operation_id) const;

    std::vector<std::string> getOperationIds() const;

    /**
     * @brief 테이블의 연관 테이블 (모든 Related 규칙의 합집합, 등장 순서 유지)
     */
    std::vector<std::string> relatedTablesFor(const std::string& table_name) const;

    /**
     * @brief 테이블 변경 시 무효화해야 하는 연산 목록
     */
    std::vector<std::string> operationsInvalidatedBy(const std::string& table_name) const;

    size_t size() const;

    const std::vector<std::string>& getErrors() const { return errors_; }
    const std::vector<std::string>& getWarnings() const { return warnings_; }

private:
    bool loadFromNode(const YAML::Node& root, const std::string& source);
    std::optional<InvalidationRule> parseRule(const std::string& operation_id, const YAML::Node& node);

    std::map<std::string, OperationCachePolicy> policies_;
    mutable std::shared_mutex mutex_;

    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
};

} // namespace strata::core::invalidation

#endif // STRATA_CORE_INVALIDATION_INVALIDATIONRULEREGISTRY_H
