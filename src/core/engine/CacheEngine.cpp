#include "CacheEngine.h"
#include "core/common/CacheErrors.h"

#include <stdexcept>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace strata::core::engine {

using invalidation::InvalidationResult;
using invalidation::InvalidationType;

EngineDependencies createEngineDependencies(const config::StrataConfig& config,
                                            std::shared_ptr<datastore::IKeyValueStore> store,
                                            std::shared_ptr<distributed::IPubSubTransport> transport) {
    if (!store) {
        throw std::invalid_argument("createEngineDependencies requires a key-value store");
    }
    config.validate();

    EngineDependencies deps;
    deps.store = std::move(store);
    deps.key_generator = std::make_shared<keygen::CacheKeyGenerator>(config);
    deps.tracker = std::make_shared<invalidation::InvalidationTracker>(config, deps.store, deps.key_generator);
    deps.circuit_breaker = std::make_shared<resilience::CircuitBreaker>(config.circuit_breaker);

    if (!config.invalidation_rules_file.empty()) {
        auto rules = std::make_shared<invalidation::InvalidationRuleRegistry>();
        if (!rules->loadFromFile(config.invalidation_rules_file)) {
            std::string reason = rules->getErrors().empty() ? "unknown error" : rules->getErrors().front();
            throw ConfigError(fmt::format("Failed to load invalidation rules from '{}': {}",
                                          config.invalidation_rules_file, reason));
        }
        std::weak_ptr<invalidation::InvalidationRuleRegistry> weak_rules = rules;
        deps.tracker->setRelationResolver([weak_rules](const std::string& table) {
            if (auto registry = weak_rules.lock()) {
                return registry->relatedTablesFor(table);
            }
            return std::vector<std::string>{};
        });
        deps.rules = std::move(rules);
    }

    if (config.distributed.enabled) {
        if (transport) {
            deps.broadcaster = std::make_shared<distributed::DistributedInvalidationBroadcaster>(
                config, deps.tracker, std::move(transport));
        } else {
            spdlog::warn("[CacheEngine] distributed mode enabled without a transport, using local invalidation only");
        }
    }

    if (config.intelligence.enabled) {
        deps.intelligence = std::make_shared<intelligence::IntelligentCacheManager>(config);
    }

    return deps;
}

CacheEngine::CacheEngine(const config::StrataConfig& config, EngineDependencies dependencies)
    : config_(config), deps_(std::move(dependencies)) {
    if (!deps_.store || !deps_.key_generator || !deps_.tracker || !deps_.circuit_breaker) {
        throw std::invalid_argument(
            "CacheEngine requires a store, a key generator, a tracker and a circuit breaker");
    }

    spdlog::info("[CacheEngine] created (namespace='{}', distributed={}, intelligence={}, rules={})",
                 config_.namespace_name, deps_.hasBroadcaster(), deps_.hasIntelligence(),
                 deps_.hasRules() ? deps_.rules->size() : 0);
}

CacheEngine::~CacheEngine() {
    stop();
}

void CacheEngine::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return;
    }

    deps_.circuit_breaker->startHealthCheck();
    if (deps_.hasIntelligence()) {
        deps_.intelligence->startHotKeyDetection();
    }
    if (deps_.hasBroadcaster() && !deps_.broadcaster->startListening()) {
        spdlog::warn("[CacheEngine] failed to subscribe to '{}', peers' invalidations will not be applied",
                     deps_.broadcaster->getChannel());
    }

    running_.store(true);
    spdlog::info("[CacheEngine] started");
}

void CacheEngine::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    if (deps_.hasBroadcaster()) {
        deps_.broadcaster->stopListening();
    }
    if (deps_.hasIntelligence()) {
        deps_.intelligence->stopHotKeyDetection();
    }
    deps_.circuit_breaker->stopHealthCheck();
    spdlog::info("[CacheEngine] stopped");
}

std::string CacheEngine::generateKey(const std::string& operation_id,
                                     const std::string& action,
                                     const keygen::Parameters& parameters) {
    return deps_.key_generator->generateKey(operation_id, action, parameters);
}

std::optional<std::string> CacheEngine::get(const std::string& key) {
    std::optional<std::string> value;
    try {
        value = deps_.circuit_breaker->execute<std::optional<std::string>>(
            "get", [this, &key] { return deps_.store->get(key); });
    } catch (const std::exception& e) {
        if (!absorbError(e, fmt::format("Cache get failed for '{}'", key))) {
            throw;
        }
        return std::nullopt;
    }

    if (value) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        reportAccess(key, intelligence::AccessType::Hit);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
        reportAccess(key, intelligence::AccessType::Miss);
    }

    if (config_.logging.log_cache_hit_miss) {
        spdlog::debug("[CacheEngine] cache {} for '{}'", value ? "hit" : "miss", key);
    }
    return value;
}

bool CacheEngine::set(const std::string& key, const std::string& value,
                      const std::vector<std::string>& tables,
                      std::optional<std::chrono::milliseconds> ttl) {
    std::chrono::milliseconds effective_ttl = config_.default_expiration;
    if (ttl) {
        effective_ttl = *ttl;
    } else if (deps_.hasIntelligence()) {
        try {
            effective_ttl = deps_.intelligence->calculateAdaptiveTtl(key, config_.default_expiration);
        } catch (const std::exception& e) {
            spdlog::warn("[CacheEngine] adaptive TTL failed for '{}', using default: {}", key, e.what());
        }
    }

    try {
        deps_.circuit_breaker->execute<bool>("set", [this, &key, &value, effective_ttl] {
            deps_.store->set(key, value, effective_ttl);
            return true;
        });
    } catch (const std::exception& e) {
        if (!absorbError(e, fmt::format("Cache set failed for '{}'", key))) {
            throw;
        }
        return false;
    }

    sets_.fetch_add(1, std::memory_order_relaxed);
    reportAccess(key, intelligence::AccessType::Set);

    if (!tables.empty()) {
        invalidator().trackKey(tables, key, effective_ttl);
    }

    if (config_.logging.log_cache_hit_miss) {
        spdlog::debug("[CacheEngine] stored '{}' (ttl={}ms, tables={})", key, effective_ttl.count(), tables.size());
    }
    return true;
}

bool CacheEngine::setForOperation(const std::string& operation_id, const std::string& key,
                                  const std::string& value) {
    std::optional<invalidation::OperationCachePolicy> policy;
    if (deps_.hasRules()) {
        policy = deps_.rules->getPolicy(operation_id);
    }
    if (!policy) {
        spdlog::debug("[CacheEngine] no cache policy for operation '{}', storing untracked", operation_id);
        return set(key, value);
    }
    return set(key, value, policy->tables, policy->expiration);
}

bool CacheEngine::remove(const std::string& key) {
    bool removed = false;
    try {
        removed = deps_.circuit_breaker->execute<bool>(
            "remove", [this, &key] { return deps_.store->remove(key); });
    } catch (const std::exception& e) {
        if (!absorbError(e, fmt::format("Cache remove failed for '{}'", key))) {
            throw;
        }
        return false;
    }

    removes_.fetch_add(1, std::memory_order_relaxed);
    reportAccess(key, intelligence::AccessType::Delete);
    return removed;
}

InvalidationResult CacheEngine::invalidate(const std::string& table_name, const CancellationToken& token) {
    return invalidator().invalidate(table_name, token);
}

InvalidationResult CacheEngine::invalidateByPattern(const std::string& pattern, const CancellationToken& token) {
    return invalidator().invalidateByPattern(pattern, token);
}

InvalidationResult CacheEngine::invalidateWithRelated(const std::string& table_name,
                                                      const std::vector<std::string>& related_tables,
                                                      int max_depth,
                                                      const CancellationToken& token) {
    return invalidator().invalidateWithRelated(table_name, related_tables, max_depth, token);
}

InvalidationResult CacheEngine::invalidateBatch(const std::vector<std::string>& table_names,
                                                const CancellationToken& token) {
    return invalidator().invalidateBatch(table_names, token);
}

InvalidationResult CacheEngine::invalidateByPatternBatch(const std::vector<std::string>& patterns,
                                                         const CancellationToken& token) {
    return invalidator().invalidateByPatternBatch(patterns, token);
}

InvalidationResult CacheEngine::applyRule(const invalidation::InvalidationRule& rule,
                                          const CancellationToken& token) {
    switch (rule.type) {
        case InvalidationType::Pattern:
            if (!rule.pattern.empty()) {
                return invalidateByPattern(rule.pattern, token);
            }
            spdlog::warn("[CacheEngine] pattern rule for table '{}' has no pattern, invalidating the table",
                         rule.table_name);
            return invalidate(rule.table_name, token);
        case InvalidationType::Related: {
            int depth = rule.max_depth < 0 ? config_.max_related_depth : rule.max_depth;
            return invalidateWithRelated(rule.table_name, rule.related_tables, depth, token);
        }
        case InvalidationType::All:
        default:
            return invalidate(rule.table_name, token);
    }
}

InvalidationResult CacheEngine::invalidateForOperation(const std::string& operation_id,
                                                       const CancellationToken& token) {
    InvalidationResult combined;
    if (!deps_.hasRules()) {
        spdlog::warn("[CacheEngine] no invalidation rules loaded, nothing to apply for '{}'", operation_id);
        return combined;
    }

    auto policy = deps_.rules->getPolicy(operation_id);
    if (!policy) {
        spdlog::debug("[CacheEngine] operation '{}' has no invalidation rules", operation_id);
        return combined;
    }

    for (const auto& rule : policy->rules) {
        if (token.isCancelled()) {
            combined.cancelled = true;
            break;
        }
        combined.merge(applyRule(rule, token));
    }

    if (config_.logging.log_invalidation) {
        spdlog::info("[CacheEngine] applied {} rules for '{}': {} of {} keys invalidated",
                     policy->rules.size(), operation_id, combined.invalidated, combined.attempted);
    }
    return combined;
}

std::map<std::string, uint64_t> CacheEngine::getStatistics() const {
    std::map<std::string, uint64_t> stats;
    stats["engine.hits"] = hits_.load();
    stats["engine.misses"] = misses_.load();
    stats["engine.sets"] = sets_.load();
    stats["engine.removes"] = removes_.load();
    stats["engine.bypassed"] = bypassed_.load();

    for (const auto& [name, value] : deps_.tracker->getStatistics()) {
        stats["tracker." + name] = value;
    }

    auto breaker = deps_.circuit_breaker->getStatistics();
    stats["breaker.state"] = static_cast<uint64_t>(breaker.state);
    stats["breaker.failure_count"] = breaker.failure_count;
    stats["breaker.total_operations"] = breaker.total_operations;
    stats["breaker.total_failures"] = breaker.total_failures;
    stats["breaker.rejected_calls"] = breaker.rejected_calls;

    if (deps_.hasBroadcaster()) {
        for (const auto& [name, value] : deps_.broadcaster->getStatistics()) {
            stats["distributed." + name] = value;
        }
    }
    if (deps_.hasIntelligence()) {
        for (const auto& [name, value] : deps_.intelligence->getStatistics()) {
            stats["intelligence." + name] = value;
        }
    }
    return stats;
}

invalidation::ICacheInvalidator& CacheEngine::invalidator() {
    if (deps_.hasBroadcaster()) {
        return *deps_.broadcaster;
    }
    return *deps_.tracker;
}

void CacheEngine::reportAccess(const std::string& key, intelligence::AccessType type) {
    if (!deps_.hasIntelligence()) {
        return;
    }
    try {
        deps_.intelligence->recordAccess(key, type);
    } catch (const std::exception& e) {
        spdlog::warn("[CacheEngine] failed to record {} access for '{}': {}",
                     intelligence::toString(type), key, e.what());
    }
}

bool CacheEngine::absorbError(const std::exception& e, const std::string& context) {
    if (!config_.error_handling.silent_fallback) {
        return false;
    }

    bypassed_.fetch_add(1, std::memory_order_relaxed);
    spdlog::error("[CacheEngine] {}: {}", context, e.what());

    const auto& handler = config_.error_handling.custom_error_handler;
    if (handler) {
        try {
            handler(e);
        } catch (const std::exception& hook_error) {
            spdlog::error("[CacheEngine] Custom error handler threw: {}", hook_error.what());
        }
    }
    return true;
}

} // namespace strata::core::engine
