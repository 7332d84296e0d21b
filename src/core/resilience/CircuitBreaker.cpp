#include "CircuitBreaker.h"

#include <shared_mutex>
#include <spdlog/spdlog.h>

namespace strata::core::resilience {

CircuitBreaker::CircuitBreaker(const config::CircuitBreakerConfig& config)
    : config_(config) {
    if (config_.failure_threshold < 1) {
        throw ConfigError("Circuit breaker failure_threshold must be >= 1");
    }
    if (config_.timeout.count() <= 0) {
        throw ConfigError("Circuit breaker timeout must be positive");
    }

    spdlog::info("[CircuitBreaker] Initialized with threshold: {}, timeout: {}ms",
                 config_.failure_threshold, config_.timeout.count());
}

CircuitBreaker::~CircuitBreaker() {
    stopHealthCheck();
}

bool CircuitBreaker::canExecute() {
    std::vector<CircuitStateChange> pending;
    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        switch (state_) {
            case CircuitState::Closed:
            case CircuitState::HalfOpen:
                allowed = true;
                break;
            case CircuitState::Open:
                if (last_failure_time_ && Clock::now() - *last_failure_time_ >= config_.timeout) {
                    transitionLocked(CircuitState::HalfOpen, pending);
                    allowed = true;
                }
                break;
        }
    }

    notifyListeners(pending);
    return allowed;
}

void CircuitBreaker::recordSuccess(const std::string& operation_name, std::chrono::nanoseconds latency) {
    std::vector<CircuitStateChange> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_success_wall_ = std::chrono::system_clock::now();

        if (state_ == CircuitState::HalfOpen) {
            failure_count_ = 0;
            transitionLocked(CircuitState::Closed, pending);
        } else if (state_ == CircuitState::Closed && failure_count_ > 0) {
            failure_count_--;
        }
    }

    updateMetrics(operation_name, latency, true, "");
    notifyListeners(pending);

    spdlog::trace("[CircuitBreaker] Operation succeeded: {} in {}us", operation_name,
                  std::chrono::duration_cast<std::chrono::microseconds>(latency).count());
}

void CircuitBreaker::recordFailure(const std::string& operation_name, std::chrono::nanoseconds latency,
                                   const std::string& reason) {
    std::vector<CircuitStateChange> pending;
    uint32_t failures = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_failure_time_ = Clock::now();
        last_failure_wall_ = std::chrono::system_clock::now();
        failure_count_++;
        failures = failure_count_;

        if (state_ == CircuitState::HalfOpen) {
            transitionLocked(CircuitState::Open, pending);
        } else if (state_ == CircuitState::Closed && failure_count_ >= config_.failure_threshold) {
            transitionLocked(CircuitState::Open, pending);
        }
    }

    updateMetrics(operation_name, latency, false, reason);
    notifyListeners(pending);

    spdlog::warn("[CircuitBreaker] Operation failed: {} in {}us (Failure #{}): {}", operation_name,
                 std::chrono::duration_cast<std::chrono::microseconds>(latency).count(), failures, reason);
}

CircuitState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

uint32_t CircuitBreaker::getFailureCount() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_count_;
}

void CircuitBreaker::reset() {
    std::vector<CircuitStateChange> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        failure_count_ = 0;
        last_failure_time_.reset();
        if (state_ != CircuitState::Closed) {
            transitionLocked(CircuitState::Closed, pending);
        }
    }
    notifyListeners(pending);
    spdlog::info("[CircuitBreaker] Reset to Closed");
}

bool CircuitBreaker::startHealthCheck() {
    if (config_.health_check_interval.count() <= 0) {
        spdlog::debug("[CircuitBreaker] Health check disabled (interval 0)");
        return false;
    }
    if (!health_task_) {
        health_task_ = std::make_unique<util::PeriodicTask>(
            "CircuitBreakerHealthCheck", config_.health_check_interval, [this]() { runHealthCheck(); });
    }
    return health_task_->start();
}

void CircuitBreaker::stopHealthCheck() {
    if (health_task_) {
        health_task_->stop();
    }
}

void CircuitBreaker::runHealthCheck() {
    size_t swept = sweepIdleMetrics();

    // Safety valve for a missed lazy Open -> HalfOpen check
    std::vector<CircuitStateChange> pending;
    CircuitState state;
    uint32_t failures;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == CircuitState::Open && last_failure_time_ &&
            Clock::now() - *last_failure_time_ >= config_.timeout * 2) {
            spdlog::info("[CircuitBreaker] Auto-recovery triggered: changing to HalfOpen");
            transitionLocked(CircuitState::HalfOpen, pending);
        }
        state = state_;
        failures = failure_count_;
    }
    notifyListeners(pending);

    spdlog::debug("[CircuitBreaker] Health check completed. State: {}, Failures: {}, Swept metrics: {}",
                  toString(state), failures, swept);
}

size_t CircuitBreaker::sweepIdleMetrics() {
    auto cutoff = Clock::now() - config_.metric_retention;

    std::unique_lock<std::shared_mutex> traversal(metrics_traversal_mutex_);
    std::vector<std::string> expired;
    for (auto it = metrics_.begin(); it != metrics_.end(); ++it) {
        if (it->second.last_access < cutoff) {
            expired.push_back(it->first);
        }
    }
    for (const auto& name : expired) {
        metrics_.erase(name);
    }
    return expired.size();
}

CircuitBreakerStatistics CircuitBreaker::getStatistics() const {
    CircuitBreakerStatistics stats;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats.state = state_;
        stats.failure_count = failure_count_;
        stats.last_failure_time = last_failure_wall_;
        stats.last_success_time = last_success_wall_;
    }
    stats.rejected_calls = rejected_calls_.load();

    double latency_sum = 0.0;
    std::unique_lock<std::shared_mutex> traversal(metrics_traversal_mutex_);
    for (auto it = metrics_.begin(); it != metrics_.end(); ++it) {
        const auto& m = it->second;
        OperationMetricsSnapshot snap;
        snap.operation_name = it->first;
        snap.total_operations = m.total_operations;
        snap.failure_count = m.failure_count;
        snap.success_count = m.success_count;
        snap.average_latency_ms = m.total_operations > 0
            ? std::chrono::duration<double, std::milli>(m.cumulative_latency).count() / m.total_operations
            : 0.0;
        snap.last_error = m.last_error;
        snap.last_access = m.last_access_wall;

        stats.total_operations += snap.total_operations;
        stats.total_failures += snap.failure_count;
        latency_sum += snap.average_latency_ms;
        stats.operations.push_back(std::move(snap));
    }

    if (!stats.operations.empty()) {
        stats.average_latency_ms = latency_sum / static_cast<double>(stats.operations.size());
    }
    return stats;
}

uint64_t CircuitBreaker::addStateChangedListener(StateChangedCallback callback) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(callback));
    return id;
}

void CircuitBreaker::removeStateChangedListener(uint64_t listener_id) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(listener_id);
}

void CircuitBreaker::transitionLocked(CircuitState new_state, std::vector<CircuitStateChange>& pending) {
    CircuitState old_state = state_;
    if (old_state == new_state) {
        return;
    }
    state_ = new_state;

    spdlog::info("[CircuitBreaker] State changed from {} to {} (failures: {})",
                 toString(old_state), toString(new_state), failure_count_);

    pending.push_back(CircuitStateChange{old_state, new_state, failure_count_,
                                         std::chrono::system_clock::now()});
}

void CircuitBreaker::notifyListeners(const std::vector<CircuitStateChange>& changes) {
    if (changes.empty()) {
        return;
    }

    std::vector<StateChangedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        for (const auto& [id, callback] : listeners_) {
            callbacks.push_back(callback);
        }
    }

    for (const auto& change : changes) {
        for (const auto& callback : callbacks) {
            try {
                callback(change);
            } catch (const std::exception& e) {
                spdlog::error("[CircuitBreaker] State listener exception: {}", e.what());
            }
        }
    }
}

void CircuitBreaker::updateMetrics(const std::string& operation_name, std::chrono::nanoseconds latency,
                                   bool success, const std::string& error) {
    std::shared_lock<std::shared_mutex> traversal(metrics_traversal_mutex_);
    MetricsMap::accessor acc;
    metrics_.insert(acc, operation_name);
    auto& m = acc->second;
    m.total_operations++;
    if (success) {
        m.success_count++;
    } else {
        m.failure_count++;
        m.last_error = error;
    }
    m.cumulative_latency += latency;
    m.last_access = Clock::now();
    m.last_access_wall = std::chrono::system_clock::now();
}

} // namespace strata::core::resilience
