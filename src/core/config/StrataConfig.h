#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <exception>

namespace strata {
namespace config {

/**
 * @brief Logging switches
 *
 * Gates the chatty per-operation logs; errors are always logged.
 */
struct LoggingConfig {
    std::string level = "info";        // trace, debug, info, warn, error, critical, off
    std::string file;                  // Optional log file, console only when empty
    bool log_invalidation = true;
    bool log_cache_hit_miss = true;
    bool log_key_generation = false;
};

/**
 * @brief Error propagation policy for cache-backend failures
 */
struct ErrorHandlingConfig {
    bool silent_fallback = true;       // Swallow and log backend errors, degrade to bypass

    // Invoked for every swallowed backend error (optional)
    std::function<void(const std::exception&)> custom_error_handler;
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;
    std::chrono::milliseconds timeout{std::chrono::minutes(1)};
    std::chrono::milliseconds health_check_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds metric_retention{std::chrono::hours(1)};
};

struct IntelligenceConfig {
    bool enabled = true;
    double hot_key_threshold = 10.0;   // accesses per minute
    std::chrono::milliseconds metric_retention{std::chrono::hours(24)};
    size_t max_hot_key_candidates = 100;
    size_t access_history_capacity = 1000;
    std::chrono::milliseconds min_ttl{std::chrono::minutes(5)};
    std::chrono::milliseconds max_ttl{std::chrono::hours(24)};
    std::chrono::milliseconds detection_interval{std::chrono::minutes(1)};
};

struct DistributedConfig {
    bool enabled = false;
};

/**
 * @brief Settings consumed at construction by every engine component
 *
 * Plain value struct; no reconfiguration after the components are built.
 */
struct StrataConfig {
    std::string namespace_name = "StrataCache";
    std::string version_key;
    std::string key_separator = "_";
    std::string tracking_prefix = "table";
    std::chrono::milliseconds default_expiration{std::chrono::minutes(30)};
    int max_related_depth = 3;
    size_t key_memo_capacity = 1000;
    std::string invalidation_rules_file;

    LoggingConfig logging;
    ErrorHandlingConfig error_handling;
    CircuitBreakerConfig circuit_breaker;
    IntelligenceConfig intelligence;
    DistributedConfig distributed;

    /**
     * @brief Tracking sets outlive the entries they track
     *
     * @return 2x default expiration
     */
    std::chrono::milliseconds trackingTtl() const { return default_expiration * 2; }

    /**
     * @brief Validate all values
     *
     * @throws strata::core::ConfigError on the first invalid value
     */
    void validate() const;
};

/**
 * @brief Load StrataConfig from a JSON file
 *
 * Missing keys keep their defaults. The result is validated.
 *
 * @param file_path Path to JSON configuration file
 * @throws strata::core::ConfigError if the file cannot be parsed or a value is invalid
 */
StrataConfig loadStrataConfig(const std::filesystem::path& file_path);

/**
 * @brief Load StrataConfig from a JSON string
 *
 * @throws strata::core::ConfigError if the string cannot be parsed or a value is invalid
 */
StrataConfig loadStrataConfigFromString(const std::string& json_str);

} // namespace config
} // namespace strata
