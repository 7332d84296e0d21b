#include "MemoryKeyValueStore.h"
#include "core/util/GlobPattern.h"
#include <spdlog/spdlog.h>
#include <mutex>
#include <vector>

namespace strata::core::datastore {

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
    std::shared_lock<std::shared_mutex> guard(traversal_mutex_);
    {
        EntryMap::const_accessor acc;
        if (entries_.find(acc, key) && !acc->second.isExpired(Clock::now())) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return acc->second.value;
        }
    }

    // 만료 항목은 조회 시점에 제거 (accessor 해제 후 재확인)
    {
        EntryMap::accessor acc;
        if (entries_.find(acc, key) && acc->second.isExpired(Clock::now())) {
            entries_.erase(acc);
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

void MemoryKeyValueStore::set(const std::string& key, const std::string& value,
                              std::chrono::milliseconds ttl) {
    std::shared_lock<std::shared_mutex> guard(traversal_mutex_);
    Entry entry;
    entry.value = value;
    if (ttl.count() > 0) {
        entry.expires_at = Clock::now() + ttl;
    }

    EntryMap::accessor acc;
    entries_.insert(acc, key);
    acc->second = std::move(entry);
    sets_.fetch_add(1, std::memory_order_relaxed);
}

bool MemoryKeyValueStore::remove(const std::string& key) {
    std::shared_lock<std::shared_mutex> guard(traversal_mutex_);
    EntryMap::accessor acc;
    if (!entries_.find(acc, key)) {
        return false;
    }

    bool live = !acc->second.isExpired(Clock::now());
    entries_.erase(acc);
    removes_.fetch_add(1, std::memory_order_relaxed);
    return live;
}

size_t MemoryKeyValueStore::removeByPattern(const std::string& glob_pattern) {
    util::GlobPattern matcher(glob_pattern);
    std::unique_lock<std::shared_mutex> guard(traversal_mutex_);

    // 순회 중 erase는 안전하지 않으므로 먼저 수집
    std::vector<std::string> matched;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (matcher.matches(it->first)) {
            matched.push_back(it->first);
        }
    }

    size_t removed = 0;
    for (const auto& key : matched) {
        if (entries_.erase(key)) {
            ++removed;
        }
    }
    removes_.fetch_add(removed, std::memory_order_relaxed);

    spdlog::debug("[MemoryKeyValueStore] removeByPattern('{}') removed {} keys", glob_pattern, removed);
    return removed;
}

bool MemoryKeyValueStore::exists(const std::string& key) {
    std::shared_lock<std::shared_mutex> guard(traversal_mutex_);
    EntryMap::const_accessor acc;
    return entries_.find(acc, key) && !acc->second.isExpired(Clock::now());
}

size_t MemoryKeyValueStore::purgeExpired() {
    std::unique_lock<std::shared_mutex> guard(traversal_mutex_);
    auto now = Clock::now();

    std::vector<std::string> expired;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.isExpired(now)) {
            expired.push_back(it->first);
        }
    }

    size_t purged = 0;
    for (const auto& key : expired) {
        EntryMap::accessor acc;
        // 수집 이후 다시 set된 키는 건드리지 않음
        if (entries_.find(acc, key) && acc->second.isExpired(now)) {
            entries_.erase(acc);
            ++purged;
        }
    }

    if (purged > 0) {
        spdlog::debug("[MemoryKeyValueStore] Purged {} expired entries", purged);
    }
    return purged;
}

std::optional<std::chrono::milliseconds> MemoryKeyValueStore::remainingTtl(const std::string& key) const {
    std::shared_lock<std::shared_mutex> guard(traversal_mutex_);
    EntryMap::const_accessor acc;
    if (!entries_.find(acc, key)) {
        return std::nullopt;
    }

    auto now = Clock::now();
    if (acc->second.isExpired(now)) {
        return std::nullopt;
    }
    if (!acc->second.expires_at) {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*acc->second.expires_at - now);
}

std::map<std::string, uint64_t> MemoryKeyValueStore::getStatistics() const {
    std::shared_lock<std::shared_mutex> guard(traversal_mutex_);
    return {
        {"hits", hits_.load()},
        {"misses", misses_.load()},
        {"sets", sets_.load()},
        {"removes", removes_.load()},
        {"entries", static_cast<uint64_t>(entries_.size())},
    };
}

void MemoryKeyValueStore::clear() {
    std::unique_lock<std::shared_mutex> guard(traversal_mutex_);
    entries_.clear();
}

} // namespace strata::core::datastore
