#include "InvalidationTracker.h"
#include "core/common/CacheErrors.h"

#include <algorithm>
#include <future>
#include <list>
#include <optional>
#include <thread>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

namespace strata::core::invalidation {

namespace {

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

InvalidationTracker::InvalidationTracker(const config::StrataConfig& config,
                                         std::shared_ptr<datastore::IKeyValueStore> store,
                                         std::shared_ptr<keygen::CacheKeyGenerator> key_generator)
    : config_(config),
      store_(std::move(store)),
      key_generator_(std::move(key_generator)) {
    if (!store_ || !key_generator_) {
        throw std::invalid_argument("InvalidationTracker requires a store and a key generator");
    }

    size_t hw = std::max(1u, std::thread::hardware_concurrency());
    batch_size_ = std::min<size_t>(50, hw * 2);

    spdlog::debug("[InvalidationTracker] Created (batch_size={}, tracking_ttl={}ms)",
                  batch_size_, config_.trackingTtl().count());
}

void InvalidationTracker::trackKey(const std::vector<std::string>& table_names,
                                   const std::string& cache_key,
                                   std::optional<std::chrono::milliseconds> entry_ttl,
                                   const CancellationToken& token) {
    if (table_names.empty()) {
        return;
    }

    try {
        for (const auto& table_name : table_names) {
            if (token.isCancelled()) {
                spdlog::warn("[InvalidationTracker] Tracking of '{}' cancelled", cache_key);
                return;
            }

            const std::string tracking_key = key_generator_->generateTrackingKey(table_name);

            // 같은 테이블의 read-modify-write 직렬화
            TableLockMap::accessor lock;
            table_locks_.insert(lock, table_name);

            auto payload = store_->get(tracking_key);
            std::vector<std::string> keys = payload ? decodeTrackingSet(*payload)
                                                    : std::vector<std::string>{};
            if (std::find(keys.begin(), keys.end(), cache_key) == keys.end()) {
                keys.push_back(cache_key);
            }

            store_->set(tracking_key, encodeTrackingSet(keys), resolveTrackingTtl(tracking_key, entry_ttl));
            lock->second++;
        }

        if (config_.logging.log_invalidation) {
            spdlog::debug("[InvalidationTracker] Tracked cache key '{}' for tables [{}]",
                          cache_key, fmt::join(table_names, ", "));
        }
    } catch (const std::exception& e) {
        if (!config_.error_handling.silent_fallback) {
            throw;
        }
        reportSwallowedError(e, fmt::format("Failed to track cache key '{}'", cache_key));
    }
}

void InvalidationTracker::trackKey(const std::string& table_name,
                                   const std::string& cache_key,
                                   std::optional<std::chrono::milliseconds> entry_ttl,
                                   const CancellationToken& token) {
    trackKey(std::vector<std::string>{table_name}, cache_key, entry_ttl, token);
}

std::vector<std::string> InvalidationTracker::getTrackedKeys(const std::string& table_name,
                                                             const CancellationToken& token) {
    if (token.isCancelled()) {
        return {};
    }

    try {
        return fetchTrackedKeys(table_name);
    } catch (const std::exception& e) {
        spdlog::warn("[InvalidationTracker] Failed to get tracked keys for table '{}': {}",
                     table_name, e.what());
        return {};
    }
}

InvalidationResult InvalidationTracker::invalidate(const std::string& table_name,
                                                   const CancellationToken& token) {
    auto start = std::chrono::steady_clock::now();
    InvalidationResult result;
    result.tables.push_back(table_name);

    try {
        if (token.isCancelled()) {
            result.cancelled = true;
            return result;
        }

        // 조회부터 추적 집합 제거까지 잡아 두어 그 사이 추적된 키를 잃지 않음
        TableLockMap::accessor lock;
        table_locks_.insert(lock, table_name);

        std::vector<std::string> keys = fetchTrackedKeys(table_name);

        if (keys.empty()) {
            if (config_.logging.log_invalidation) {
                spdlog::info("[InvalidationTracker] No cached keys found for table '{}'", table_name);
            }
        } else {
            // 키 단위 best-effort: 하나의 실패가 나머지를 중단시키지 않음
            for (const auto& key : keys) {
                if (token.isCancelled()) {
                    result.cancelled = true;
                    break;
                }
                result.attempted++;
                try {
                    store_->remove(key);
                    result.invalidated++;
                } catch (const std::exception& e) {
                    spdlog::warn("[InvalidationTracker] Failed to invalidate cache key '{}': {}",
                                 key, e.what());
                }
            }

            // 취소 시 남은 키가 계속 추적되도록 추적 집합 유지
            if (!result.cancelled) {
                store_->remove(key_generator_->generateTrackingKey(table_name));
            }
        }

        result.duration = elapsedSince(start);
        if (config_.logging.log_invalidation && !keys.empty()) {
            spdlog::info("[InvalidationTracker] Invalidated {}/{} cache keys for table '{}' in {}ms",
                         result.invalidated, keys.size(), table_name, result.duration.count());
        }
    } catch (const std::exception& e) {
        if (!config_.error_handling.silent_fallback) {
            throw;
        }
        reportSwallowedError(e, fmt::format("Failed to invalidate cache for table '{}'", table_name));
        result.success = false;
        result.error_message = e.what();
        result.duration = elapsedSince(start);
    }

    invalidations_.fetch_add(1);
    keys_invalidated_.fetch_add(result.invalidated);
    return result;
}

InvalidationResult InvalidationTracker::invalidateByPattern(const std::string& pattern,
                                                            const CancellationToken& token) {
    auto start = std::chrono::steady_clock::now();
    InvalidationResult result;

    try {
        if (token.isCancelled()) {
            result.cancelled = true;
            return result;
        }

        size_t removed = store_->removeByPattern(pattern);
        result.attempted = removed;
        result.invalidated = removed;
        result.duration = elapsedSince(start);

        if (config_.logging.log_invalidation) {
            spdlog::info("[InvalidationTracker] Invalidated {} cache keys matching pattern '{}' in {}ms",
                         removed, pattern, result.duration.count());
        }
    } catch (const std::exception& e) {
        if (!config_.error_handling.silent_fallback) {
            throw;
        }
        reportSwallowedError(e, fmt::format("Failed to invalidate cache by pattern '{}'", pattern));
        result.success = false;
        result.error_message = e.what();
        result.duration = elapsedSince(start);
    }

    pattern_invalidations_.fetch_add(1);
    keys_invalidated_.fetch_add(result.invalidated);
    return result;
}

InvalidationResult InvalidationTracker::invalidateWithRelated(const std::string& table_name,
                                                              const std::vector<std::string>& related_tables,
                                                              int max_depth,
                                                              const CancellationToken& token) {
    auto start = std::chrono::steady_clock::now();
    const int depth_limit = (max_depth < 0) ? config_.max_related_depth : max_depth;

    InvalidationResult result;
    std::set<std::string> processed;
    invalidateRecursive(table_name, related_tables, depth_limit, 0, processed, token, result);
    result.duration = elapsedSince(start);

    if (config_.logging.log_invalidation) {
        spdlog::info("[InvalidationTracker] Related invalidation from '{}' visited [{}] (max_depth={})",
                     table_name, fmt::join(result.tables, ", "), depth_limit);
    }
    return result;
}

void InvalidationTracker::invalidateRecursive(const std::string& table_name,
                                              const std::vector<std::string>& related_tables,
                                              int max_depth,
                                              int current_depth,
                                              std::set<std::string>& processed,
                                              const CancellationToken& token,
                                              InvalidationResult& result) {
    // 이미 처리된 테이블이거나 최대 깊이 도달 시 중단
    if (processed.count(table_name) > 0 || current_depth >= max_depth) {
        return;
    }
    if (token.isCancelled()) {
        result.cancelled = true;
        return;
    }

    processed.insert(table_name);
    result.merge(invalidate(table_name, token));

    if (config_.logging.log_invalidation) {
        spdlog::debug("[InvalidationTracker] Invalidated table '{}' at depth {}", table_name, current_depth);
    }

    RelationResolver resolver;
    {
        std::lock_guard<std::mutex> lock(resolver_mutex_);
        resolver = relation_resolver_;
    }

    for (const auto& related : related_tables) {
        std::vector<std::string> next;
        if (resolver) {
            try {
                next = resolver(related);
            } catch (const std::exception& e) {
                spdlog::warn("[InvalidationTracker] Relation lookup failed for '{}': {}", related, e.what());
            }
        }
        invalidateRecursive(related, next, max_depth, current_depth + 1, processed, token, result);
    }
}

InvalidationResult InvalidationTracker::invalidateBatch(const std::vector<std::string>& table_names,
                                                        const CancellationToken& token) {
    auto start = std::chrono::steady_clock::now();
    InvalidationResult result;

    // 테이블 이름 중복 제거 (순서 유지)
    std::unordered_set<std::string> seen_tables;
    for (const auto& table : table_names) {
        if (seen_tables.insert(table).second) {
            result.tables.push_back(table);
        }
    }
    if (result.tables.empty()) {
        return result;
    }

    try {
        std::vector<std::string> lock_order = result.tables;
        std::sort(lock_order.begin(), lock_order.end());
        std::list<TableLockMap::accessor> locks;
        for (const auto& table : lock_order) {
            locks.emplace_back();
            table_locks_.insert(locks.back(), table);
        }

        // 모든 테이블의 추적 집합 동시 조회
        std::vector<std::future<std::vector<std::string>>> fetches;
        fetches.reserve(result.tables.size());
        for (const auto& table : result.tables) {
            fetches.push_back(std::async(std::launch::async,
                                         [this, table]() { return fetchTrackedKeys(table); }));
        }

        std::vector<std::string> keys;
        std::unordered_set<std::string> seen_keys;
        for (auto& fetch : fetches) {
            for (auto& key : fetch.get()) {
                if (seen_keys.insert(key).second) {
                    keys.push_back(std::move(key));
                }
            }
        }

        if (keys.empty() && config_.logging.log_invalidation) {
            spdlog::info("[InvalidationTracker] No cached keys found for tables [{}]",
                         fmt::join(result.tables, ", "));
        }

        removeKeysInBatches(keys, token, result);

        if (!result.cancelled) {
            for (const auto& table : result.tables) {
                store_->remove(key_generator_->generateTrackingKey(table));
            }
        }

        result.duration = elapsedSince(start);
        if (config_.logging.log_invalidation) {
            spdlog::info("[InvalidationTracker] Batch invalidated {}/{} cache keys for {} tables in {}ms",
                         result.invalidated, keys.size(), result.tables.size(), result.duration.count());
        }
    } catch (const std::exception& e) {
        if (!config_.error_handling.silent_fallback) {
            throw;
        }
        reportSwallowedError(e, fmt::format("Error during batch invalidation for tables [{}]",
                                            fmt::join(result.tables, ", ")));
        result.success = false;
        result.error_message = e.what();
        result.duration = elapsedSince(start);
    }

    invalidations_.fetch_add(result.tables.size());
    keys_invalidated_.fetch_add(result.invalidated);
    return result;
}

InvalidationResult InvalidationTracker::invalidateByPatternBatch(const std::vector<std::string>& patterns,
                                                                 const CancellationToken& token) {
    auto start = std::chrono::steady_clock::now();
    InvalidationResult result;
    if (patterns.empty()) {
        return result;
    }

    // 패턴별 병렬 삭제, 개별 실패는 로그 후 건너뜀
    std::vector<std::future<std::optional<size_t>>> tasks;
    tasks.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        if (token.isCancelled()) {
            result.cancelled = true;
            break;
        }
        tasks.push_back(std::async(std::launch::async, [this, pattern]() -> std::optional<size_t> {
            try {
                return store_->removeByPattern(pattern);
            } catch (const std::exception& e) {
                spdlog::warn("[InvalidationTracker] Failed to invalidate cache keys with pattern '{}': {}",
                             pattern, e.what());
                return std::nullopt;
            }
        }));
    }

    size_t succeeded = 0;
    for (auto& task : tasks) {
        if (auto removed = task.get()) {
            succeeded++;
            result.invalidated += *removed;
        }
    }
    result.attempted = result.invalidated;
    result.duration = elapsedSince(start);

    if (config_.logging.log_invalidation) {
        spdlog::info("[InvalidationTracker] Batch pattern invalidation completed: {}/{} patterns processed in {}ms",
                     succeeded, patterns.size(), result.duration.count());
    }

    pattern_invalidations_.fetch_add(tasks.size());
    keys_invalidated_.fetch_add(result.invalidated);
    return result;
}

void InvalidationTracker::setRelationResolver(RelationResolver resolver) {
    std::lock_guard<std::mutex> lock(resolver_mutex_);
    relation_resolver_ = std::move(resolver);
}

std::map<std::string, uint64_t> InvalidationTracker::getStatistics() const {
    return {
        {"invalidations", invalidations_.load()},
        {"keys_invalidated", keys_invalidated_.load()},
        {"pattern_invalidations", pattern_invalidations_.load()},
        {"swallowed_errors", swallowed_errors_.load()},
    };
}

std::vector<std::string> InvalidationTracker::fetchTrackedKeys(const std::string& table_name) {
    auto payload = store_->get(key_generator_->generateTrackingKey(table_name));
    if (!payload) {
        return {};
    }
    return decodeTrackingSet(*payload);
}

std::vector<std::string> InvalidationTracker::decodeTrackingSet(const std::string& payload) {
    try {
        auto parsed = nlohmann::json::parse(payload);
        if (!parsed.is_array()) {
            spdlog::warn("[InvalidationTracker] Tracking set is not a JSON array, ignoring");
            return {};
        }
        return parsed.get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        // 손상된 추적 집합은 빈 집합으로 취급 (다음 trackKey에서 덮어씀)
        spdlog::warn("[InvalidationTracker] Corrupted tracking set ignored: {}", e.what());
        return {};
    }
}

std::string InvalidationTracker::encodeTrackingSet(const std::vector<std::string>& keys) {
    return nlohmann::json(keys).dump();
}

std::chrono::milliseconds InvalidationTracker::resolveTrackingTtl(const std::string& tracking_key,
                                                                  std::optional<std::chrono::milliseconds> entry_ttl) {
    constexpr auto kNoExpiry = std::chrono::milliseconds::zero();

    std::chrono::milliseconds ttl = config_.trackingTtl();
    if (entry_ttl) {
        if (*entry_ttl <= kNoExpiry) {
            return kNoExpiry;
        }
        ttl = std::max(ttl, *entry_ttl);
    }

    // 앞서 추적된 키가 더 오래 살 수 있으므로 남은 TTL보다 줄이지 않음
    auto remaining = store_->remainingTtl(tracking_key);
    if (remaining) {
        if (*remaining == std::chrono::milliseconds::max()) {
            return kNoExpiry;
        }
        ttl = std::max(ttl, *remaining);
    }
    return ttl;
}

void InvalidationTracker::removeKeysInBatches(const std::vector<std::string>& keys,
                                              const CancellationToken& token,
                                              InvalidationResult& result) {
    for (size_t offset = 0; offset < keys.size(); offset += batch_size_) {
        if (token.isCancelled()) {
            result.cancelled = true;
            spdlog::warn("[InvalidationTracker] Batch invalidation cancelled after {} keys", result.attempted);
            return;
        }

        const size_t end = std::min(keys.size(), offset + batch_size_);
        std::vector<std::future<bool>> removals;
        removals.reserve(end - offset);

        for (size_t i = offset; i < end; ++i) {
            const std::string& key = keys[i];
            removals.push_back(std::async(std::launch::async, [this, &key]() {
                try {
                    store_->remove(key);
                    return true;
                } catch (const std::exception& e) {
                    spdlog::warn("[InvalidationTracker] Failed to invalidate cache key '{}': {}", key, e.what());
                    return false;
                }
            }));
        }

        for (auto& removal : removals) {
            result.attempted++;
            if (removal.get()) {
                result.invalidated++;
            }
        }
    }
}

void InvalidationTracker::reportSwallowedError(const std::exception& e, const std::string& context) {
    swallowed_errors_.fetch_add(1);
    spdlog::error("[InvalidationTracker] {}: {}", context, e.what());

    const auto& handler = config_.error_handling.custom_error_handler;
    if (handler) {
        try {
            handler(e);
        } catch (const std::exception& hook_error) {
            spdlog::error("[InvalidationTracker] Custom error handler threw: {}", hook_error.what());
        }
    }
}

} // namespace strata::core::invalidation
