#include "IntelligentCacheManager.h"

#include <algorithm>
#include <random>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace strata::core::intelligence {

namespace {

// 최근성 점수가 0으로 감소하는 구간 (분)
constexpr double kRecencyWindowMinutes = 60.0;
constexpr double kAccessRateWeight = 0.7;
constexpr double kRecencyWeight = 0.3;
constexpr double kMaxAccessWeight = 2.0;
constexpr double kMinHitRateWeight = 0.5;
// 주기 감지 로그에 남길 핫 키 수
constexpr size_t kDetectionLogLimit = 10;

double minutesBetween(IntelligentCacheManager::Clock::time_point from,
                      IntelligentCacheManager::Clock::time_point to) {
    return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

} // namespace

IntelligentCacheManager::IntelligentCacheManager(const config::StrataConfig& config,
                                                 TimeSource time_source)
    : config_(config.intelligence),
      default_expiration_(config.default_expiration),
      time_source_(std::move(time_source)) {
    spdlog::info("[IntelligentCacheManager] initialized (hot_key_threshold={}/min, retention={}ms)",
                 config_.hot_key_threshold, config_.metric_retention.count());
}

IntelligentCacheManager::~IntelligentCacheManager() {
    stopHotKeyDetection();
}

IntelligentCacheManager::Clock::time_point IntelligentCacheManager::now() const {
    return time_source_ ? time_source_() : Clock::now();
}

void IntelligentCacheManager::recordAccess(const std::string& key, AccessType type) {
    if (key.empty()) {
        return;
    }

    const auto timestamp = now();
    std::shared_lock<std::shared_mutex> traversal(traversal_mutex_);

    {
        KeyMetricsMap::accessor acc;
        if (key_metrics_.insert(acc, key)) {
            acc->second.first_access = timestamp;
        }
        acc->second.last_access = timestamp;
        acc->second.access_count++;
        acc->second.recent_accesses.push_back(timestamp);
        while (acc->second.recent_accesses.size() > config_.access_history_capacity) {
            acc->second.recent_accesses.pop_front();
        }
    }

    if (type == AccessType::Hit || type == AccessType::Miss) {
        TtlMetricsMap::accessor acc;
        ttl_metrics_.insert(acc, key);
        if (type == AccessType::Hit) {
            acc->second.hit_count++;
        } else {
            acc->second.miss_count++;
        }
        acc->second.total_access++;
    }

    accesses_recorded_.fetch_add(1, std::memory_order_relaxed);
}

double IntelligentCacheManager::accessRate(const KeyAccessMetrics& metrics,
                                           Clock::time_point now) const {
    const double elapsed_minutes = minutesBetween(metrics.first_access, now);
    if (elapsed_minutes < 1.0) {
        return static_cast<double>(metrics.access_count);
    }
    return static_cast<double>(metrics.access_count) / elapsed_minutes;
}

double IntelligentCacheManager::priority(const KeyAccessMetrics& metrics,
                                         Clock::time_point now) const {
    const double since_last = minutesBetween(metrics.last_access, now);
    const double recency = std::max(0.0, kRecencyWindowMinutes - since_last) / kRecencyWindowMinutes;
    return kAccessRateWeight * accessRate(metrics, now) + kRecencyWeight * recency;
}

std::chrono::milliseconds IntelligentCacheManager::averageInterval(const KeyAccessMetrics& metrics) const {
    if (metrics.access_count <= 1) {
        return std::chrono::milliseconds(0);
    }
    auto total = std::chrono::duration_cast<std::chrono::milliseconds>(
        metrics.last_access - metrics.first_access);
    return total / static_cast<int64_t>(metrics.access_count - 1);
}

HotKeyInfo IntelligentCacheManager::toHotKeyInfo(const std::string& key,
                                                 const KeyAccessMetrics& metrics,
                                                 Clock::time_point now) const {
    HotKeyInfo info;
    info.key = key;
    info.access_count = metrics.access_count;
    info.access_rate = accessRate(metrics, now);
    info.first_access = metrics.first_access;
    info.last_access = metrics.last_access;
    info.average_interval = averageInterval(metrics);
    info.priority = priority(metrics, now);
    return info;
}

std::vector<HotKeyInfo> IntelligentCacheManager::getHotKeys(size_t top_n) const {
    const size_t limit = std::min(top_n, config_.max_hot_key_candidates);
    std::vector<HotKeyInfo> hot_keys;
    if (limit == 0) {
        return hot_keys;
    }

    const auto current = now();
    const auto cutoff = current - config_.metric_retention;
    {
        std::unique_lock<std::shared_mutex> traversal(traversal_mutex_);
        for (const auto& [key, metrics] : key_metrics_) {
            if (metrics.last_access > cutoff) {
                hot_keys.push_back(toHotKeyInfo(key, metrics, current));
            }
        }
    }

    std::sort(hot_keys.begin(), hot_keys.end(),
              [](const HotKeyInfo& a, const HotKeyInfo& b) { return a.access_rate > b.access_rate; });
    if (hot_keys.size() > limit) {
        hot_keys.resize(limit);
    }

    spdlog::debug("[IntelligentCacheManager] retrieved {} hot keys", hot_keys.size());
    return hot_keys;
}

std::chrono::milliseconds IntelligentCacheManager::calculateAdaptiveTtl(const std::string& key) const {
    return calculateAdaptiveTtl(key, default_expiration_);
}

std::chrono::milliseconds IntelligentCacheManager::calculateAdaptiveTtl(
    const std::string& key, std::chrono::milliseconds base_ttl) const {
    if (key.empty()) {
        return base_ttl;
    }

    const auto current = now();
    double rate = 0.0;
    double hit_ratio = 0.0;
    {
        std::shared_lock<std::shared_mutex> traversal(traversal_mutex_);
        KeyMetricsMap::const_accessor key_acc;
        if (!key_metrics_.find(key_acc, key)) {
            return base_ttl;
        }
        TtlMetricsMap::const_accessor ttl_acc;
        if (!ttl_metrics_.find(ttl_acc, key)) {
            return base_ttl;
        }
        rate = accessRate(key_acc->second, current);
        hit_ratio = ttl_acc->second.hitRatio();
    }

    const double access_weight = std::min(rate / config_.hot_key_threshold, kMaxAccessWeight);
    const double hit_rate_weight = std::max(hit_ratio, kMinHitRateWeight);

    auto adjusted = std::chrono::milliseconds(static_cast<int64_t>(
        static_cast<double>(base_ttl.count()) * access_weight * hit_rate_weight));
    adjusted = std::clamp(adjusted, config_.min_ttl, config_.max_ttl);

    spdlog::debug("[IntelligentCacheManager] adaptive TTL for {}: {}ms (rate={:.2f}/min, hit_ratio={:.2f})",
                  key, adjusted.count(), rate, hit_ratio);
    return adjusted;
}

double IntelligentCacheManager::calculateKeyPriority(const std::string& key) const {
    if (key.empty()) {
        return 0.0;
    }

    std::shared_lock<std::shared_mutex> traversal(traversal_mutex_);
    KeyMetricsMap::const_accessor acc;
    if (!key_metrics_.find(acc, key)) {
        return 0.0;
    }
    return priority(acc->second, now());
}

std::vector<std::string> IntelligentCacheManager::selectVictimsLocked(EvictionPolicy policy,
                                                                      size_t max_items,
                                                                      Clock::time_point now) const {
    using Candidate = std::pair<std::string, KeyAccessMetrics>;
    std::vector<Candidate> candidates;
    candidates.reserve(key_metrics_.size());
    for (const auto& [key, metrics] : key_metrics_) {
        if (policy == EvictionPolicy::TTL && now - metrics.last_access <= default_expiration_) {
            continue;
        }
        candidates.emplace_back(key, metrics);
    }

    switch (policy) {
        case EvictionPolicy::LRU:
            std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
                return a.second.last_access < b.second.last_access;
            });
            break;
        case EvictionPolicy::LFU:
            std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
                return a.second.access_count < b.second.access_count;
            });
            break;
        case EvictionPolicy::FIFO:
            std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
                return a.second.first_access < b.second.first_access;
            });
            break;
        case EvictionPolicy::Random: {
            std::mt19937 rng{std::random_device{}()};
            std::shuffle(candidates.begin(), candidates.end(), rng);
            break;
        }
        case EvictionPolicy::TTL:
            break;
    }

    std::vector<std::string> victims;
    for (size_t i = 0; i < candidates.size() && victims.size() < max_items; ++i) {
        victims.push_back(candidates[i].first);
    }
    return victims;
}

void IntelligentCacheManager::eraseLocked(const std::string& key) {
    key_metrics_.erase(key);
    ttl_metrics_.erase(key);
}

std::vector<std::string> IntelligentCacheManager::evictByPolicy(EvictionPolicy policy, size_t max_items) {
    if (max_items == 0) {
        return {};
    }

    std::vector<std::string> victims;
    {
        std::unique_lock<std::shared_mutex> traversal(traversal_mutex_);
        victims = selectVictimsLocked(policy, max_items, now());
        for (const auto& key : victims) {
            eraseLocked(key);
        }
    }

    evicted_keys_.fetch_add(victims.size(), std::memory_order_relaxed);
    spdlog::info("[IntelligentCacheManager] evicted {} keys using {} policy",
                 victims.size(), toString(policy));
    return victims;
}

size_t IntelligentCacheManager::warmCache(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return 0;
    }

    spdlog::info("[IntelligentCacheManager] warming {} keys", keys.size());
    size_t warmed = 0;
    for (const auto& key : keys) {
        if (key.empty()) {
            continue;
        }
        try {
            recordAccess(key, AccessType::Set);
            ++warmed;
        } catch (const std::exception& e) {
            spdlog::warn("[IntelligentCacheManager] failed to warm key {}: {}", key, e.what());
        }
    }
    spdlog::info("[IntelligentCacheManager] cache warming completed ({}/{})", warmed, keys.size());
    return warmed;
}

bool IntelligentCacheManager::startHotKeyDetection() {
    std::lock_guard<std::mutex> lock(detection_mutex_);
    if (detection_task_ && detection_task_->isRunning()) {
        return false;
    }

    detection_task_ = std::make_unique<util::PeriodicTask>(
        "HotKeyDetection", config_.detection_interval, [this] { runMaintenanceSweep(); });
    if (!detection_task_->start()) {
        return false;
    }
    spdlog::info("[IntelligentCacheManager] hot key detection started (interval={}ms)",
                 config_.detection_interval.count());
    return true;
}

void IntelligentCacheManager::stopHotKeyDetection() {
    std::unique_ptr<util::PeriodicTask> task;
    {
        std::lock_guard<std::mutex> lock(detection_mutex_);
        task = std::move(detection_task_);
    }
    if (task) {
        task->stop();
        spdlog::info("[IntelligentCacheManager] hot key detection stopped");
    }
}

bool IntelligentCacheManager::isHotKeyDetectionActive() const {
    std::lock_guard<std::mutex> lock(detection_mutex_);
    return detection_task_ && detection_task_->isRunning();
}

MaintenanceResult IntelligentCacheManager::runMaintenanceSweep() {
    MaintenanceResult result;
    const auto current = now();
    const auto cutoff = current - config_.metric_retention;

    {
        std::unique_lock<std::shared_mutex> traversal(traversal_mutex_);

        std::vector<std::string> expired;
        for (const auto& [key, metrics] : key_metrics_) {
            if (metrics.last_access < cutoff) {
                expired.push_back(key);
            }
        }
        for (const auto& key : expired) {
            eraseLocked(key);
        }
        result.purged = expired.size();

        for (const auto& [key, metrics] : key_metrics_) {
            if (accessRate(metrics, current) >= config_.hot_key_threshold) {
                result.hot_keys.push_back(toHotKeyInfo(key, metrics, current));
            }
        }
    }

    std::sort(result.hot_keys.begin(), result.hot_keys.end(),
              [](const HotKeyInfo& a, const HotKeyInfo& b) { return a.access_rate > b.access_rate; });

    sweeps_.fetch_add(1, std::memory_order_relaxed);
    purged_metrics_.fetch_add(result.purged, std::memory_order_relaxed);

    if (!result.hot_keys.empty()) {
        std::string summary;
        for (size_t i = 0; i < result.hot_keys.size() && i < kDetectionLogLimit; ++i) {
            if (!summary.empty()) {
                summary += ", ";
            }
            summary += fmt::format("{}({:.1f}/min)", result.hot_keys[i].key, result.hot_keys[i].access_rate);
        }
        spdlog::info("[IntelligentCacheManager] detected {} hot keys: {}", result.hot_keys.size(), summary);
    }
    spdlog::debug("[IntelligentCacheManager] sweep completed: purged={}, hot={}",
                  result.purged, result.hot_keys.size());
    return result;
}

std::optional<KeyMetricsSnapshot> IntelligentCacheManager::getKeyMetrics(const std::string& key) const {
    std::shared_lock<std::shared_mutex> traversal(traversal_mutex_);
    KeyMetricsMap::const_accessor key_acc;
    if (!key_metrics_.find(key_acc, key)) {
        return std::nullopt;
    }

    KeyMetricsSnapshot snapshot;
    snapshot.access_count = key_acc->second.access_count;
    snapshot.first_access = key_acc->second.first_access;
    snapshot.last_access = key_acc->second.last_access;
    snapshot.history_size = key_acc->second.recent_accesses.size();

    TtlMetricsMap::const_accessor ttl_acc;
    if (ttl_metrics_.find(ttl_acc, key)) {
        snapshot.hit_count = ttl_acc->second.hit_count;
        snapshot.miss_count = ttl_acc->second.miss_count;
    }
    return snapshot;
}

size_t IntelligentCacheManager::trackedKeyCount() const {
    return key_metrics_.size();
}

std::map<std::string, uint64_t> IntelligentCacheManager::getStatistics() const {
    std::map<std::string, uint64_t> stats;
    stats["accesses_recorded"] = accesses_recorded_.load();
    stats["tracked_keys"] = key_metrics_.size();
    stats["sweeps"] = sweeps_.load();
    stats["purged_metrics"] = purged_metrics_.load();
    stats["evicted_keys"] = evicted_keys_.load();
    return stats;
}

void IntelligentCacheManager::clear() {
    std::unique_lock<std::shared_mutex> traversal(traversal_mutex_);
    key_metrics_.clear();
    ttl_metrics_.clear();
}

} // namespace strata::core::intelligence
