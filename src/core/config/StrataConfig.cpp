#include "StrataConfig.h"
#include "ConfigLoader.h"
#include "core/common/CacheErrors.h"
#include <spdlog/spdlog.h>
#include <map>
#include <set>

namespace strata {
namespace config {

namespace {

using strata::core::ConfigError;

// 섹션별 인식 키 (오타 경고용)
const std::map<std::string, std::set<std::string>>& knownKeys() {
    static const std::map<std::string, std::set<std::string>> keys = {
        {"cache", {"namespace", "version_key", "key_separator", "tracking_prefix",
                   "default_expiration_minutes", "max_related_depth", "key_memo_capacity",
                   "invalidation_rules_file"}},
        {"logging", {"level", "file", "log_invalidation", "log_cache_hit_miss", "log_key_generation"}},
        {"error_handling", {"silent_fallback"}},
        {"circuit_breaker", {"failure_threshold", "timeout_ms", "health_check_interval_ms",
                             "metric_retention_minutes"}},
        {"intelligence", {"enabled", "hot_key_threshold_per_minute", "metric_retention_hours",
                          "max_hot_key_candidates", "access_history_capacity", "min_ttl_minutes",
                          "max_ttl_hours", "detection_interval_seconds"}},
        {"distributed", {"enabled"}},
    };
    return keys;
}

void warnUnknownKeys(const ConfigLoader& loader) {
    for (const auto& it : loader.getJson().items()) {
        if (knownKeys().count(it.key()) == 0) {
            spdlog::warn("[StrataConfig] {}: unknown section '{}' ignored", loader.source(), it.key());
        }
    }
    for (const auto& [section, keys] : knownKeys()) {
        for (const auto& key : loader.unknownKeys(section, keys)) {
            spdlog::warn("[StrataConfig] {}: unknown key '{}' ignored", loader.source(), key);
        }
    }
}

StrataConfig fromLoader(const ConfigLoader& loader) {
    using std::chrono::hours;
    using std::chrono::milliseconds;
    using std::chrono::minutes;
    using std::chrono::seconds;

    warnUnknownKeys(loader);
    StrataConfig cfg;

    cfg.namespace_name = loader.getValue<std::string>("cache.namespace", cfg.namespace_name);
    cfg.version_key = loader.getValue<std::string>("cache.version_key", cfg.version_key);
    cfg.key_separator = loader.getValue<std::string>("cache.key_separator", cfg.key_separator);
    cfg.tracking_prefix = loader.getValue<std::string>("cache.tracking_prefix", cfg.tracking_prefix);
    cfg.default_expiration =
        loader.getDuration<minutes>("cache.default_expiration_minutes", cfg.default_expiration);
    cfg.max_related_depth = loader.getValue<int>("cache.max_related_depth", cfg.max_related_depth);
    cfg.key_memo_capacity = loader.getValue<size_t>("cache.key_memo_capacity", cfg.key_memo_capacity);
    cfg.invalidation_rules_file =
        loader.getValue<std::string>("cache.invalidation_rules_file", cfg.invalidation_rules_file);

    cfg.logging.level = loader.getValue<std::string>("logging.level", cfg.logging.level);
    cfg.logging.file = loader.getValue<std::string>("logging.file", cfg.logging.file);
    cfg.logging.log_invalidation =
        loader.getValue<bool>("logging.log_invalidation", cfg.logging.log_invalidation);
    cfg.logging.log_cache_hit_miss =
        loader.getValue<bool>("logging.log_cache_hit_miss", cfg.logging.log_cache_hit_miss);
    cfg.logging.log_key_generation =
        loader.getValue<bool>("logging.log_key_generation", cfg.logging.log_key_generation);

    cfg.error_handling.silent_fallback =
        loader.getValue<bool>("error_handling.silent_fallback", cfg.error_handling.silent_fallback);

    auto& cb = cfg.circuit_breaker;
    cb.failure_threshold = loader.getValue<uint32_t>("circuit_breaker.failure_threshold", cb.failure_threshold);
    cb.timeout = loader.getDuration<milliseconds>("circuit_breaker.timeout_ms", cb.timeout);
    cb.health_check_interval =
        loader.getDuration<milliseconds>("circuit_breaker.health_check_interval_ms", cb.health_check_interval);
    cb.metric_retention = loader.getDuration<minutes>("circuit_breaker.metric_retention_minutes", cb.metric_retention);

    auto& ic = cfg.intelligence;
    ic.enabled = loader.getValue<bool>("intelligence.enabled", ic.enabled);
    ic.hot_key_threshold = loader.getValue<double>("intelligence.hot_key_threshold_per_minute", ic.hot_key_threshold);
    ic.metric_retention = loader.getDuration<hours>("intelligence.metric_retention_hours", ic.metric_retention);
    ic.max_hot_key_candidates =
        loader.getValue<size_t>("intelligence.max_hot_key_candidates", ic.max_hot_key_candidates);
    ic.access_history_capacity =
        loader.getValue<size_t>("intelligence.access_history_capacity", ic.access_history_capacity);
    ic.min_ttl = loader.getDuration<minutes>("intelligence.min_ttl_minutes", ic.min_ttl);
    ic.max_ttl = loader.getDuration<hours>("intelligence.max_ttl_hours", ic.max_ttl);
    ic.detection_interval =
        loader.getDuration<seconds>("intelligence.detection_interval_seconds", ic.detection_interval);

    cfg.distributed.enabled = loader.getValue<bool>("distributed.enabled", cfg.distributed.enabled);

    cfg.validate();
    return cfg;
}

} // namespace

void StrataConfig::validate() const {
    if (namespace_name.empty()) {
        throw ConfigError("cache.namespace must not be empty");
    }
    if (key_separator.empty()) {
        throw ConfigError("cache.key_separator must not be empty");
    }
    if (tracking_prefix.empty()) {
        throw ConfigError("cache.tracking_prefix must not be empty");
    }
    if (default_expiration.count() <= 0) {
        throw ConfigError("cache.default_expiration must be positive");
    }
    if (max_related_depth < 1) {
        throw ConfigError("cache.max_related_depth must be >= 1, got " +
                          std::to_string(max_related_depth));
    }
    if (circuit_breaker.failure_threshold < 1) {
        throw ConfigError("circuit_breaker.failure_threshold must be >= 1");
    }
    if (circuit_breaker.timeout.count() <= 0) {
        throw ConfigError("circuit_breaker.timeout must be positive");
    }
    if (circuit_breaker.health_check_interval.count() < 0) {
        throw ConfigError("circuit_breaker.health_check_interval must not be negative");
    }
    if (intelligence.hot_key_threshold <= 0.0) {
        throw ConfigError("intelligence.hot_key_threshold must be positive");
    }
    if (intelligence.min_ttl > intelligence.max_ttl) {
        throw ConfigError("intelligence.min_ttl must not exceed intelligence.max_ttl");
    }
    if (intelligence.access_history_capacity == 0) {
        throw ConfigError("intelligence.access_history_capacity must be positive");
    }
}

StrataConfig loadStrataConfig(const std::filesystem::path& file_path) {
    ConfigLoader loader;
    if (!loader.loadFromFile(file_path)) {
        throw ConfigError("Failed to load configuration file: " + file_path.string());
    }

    StrataConfig cfg = fromLoader(loader);
    spdlog::info("[StrataConfig] namespace='{}', default_expiration={}ms, breaker threshold={}",
                 cfg.namespace_name, cfg.default_expiration.count(),
                 cfg.circuit_breaker.failure_threshold);
    return cfg;
}

StrataConfig loadStrataConfigFromString(const std::string& json_str) {
    ConfigLoader loader;
    if (!loader.loadFromString(json_str)) {
        throw ConfigError("Failed to parse configuration string");
    }
    return fromLoader(loader);
}

} // namespace config
} // namespace strata
