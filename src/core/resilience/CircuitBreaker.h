#pragma once

#include "core/common/CacheErrors.h"
#include "core/config/StrataConfig.h"
#include "core/util/PeriodicTask.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <tbb/concurrent_hash_map.h>

namespace strata::core::resilience {

/**
 * @brief Circuit breaker state
 *
 * - Closed: all calls pass through
 * - Open: calls are rejected (fallback or CircuitOpenError)
 * - HalfOpen: the next call is a trial call; success closes, failure reopens
 */
enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

inline const char* toString(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "Closed";
        case CircuitState::Open: return "Open";
        case CircuitState::HalfOpen: return "HalfOpen";
        default: return "Unknown";
    }
}

/**
 * @brief State transition record delivered to listeners
 */
struct CircuitStateChange {
    CircuitState old_state;
    CircuitState new_state;
    uint32_t failure_count;
    std::chrono::system_clock::time_point timestamp;
};

using StateChangedCallback = std::function<void(const CircuitStateChange&)>;

/**
 * @brief Per-operation metrics snapshot (observability only)
 */
struct OperationMetricsSnapshot {
    std::string operation_name;
    uint64_t total_operations = 0;
    uint64_t failure_count = 0;
    uint64_t success_count = 0;
    double average_latency_ms = 0.0;
    std::string last_error;
    std::chrono::system_clock::time_point last_access;
};

struct CircuitBreakerStatistics {
    CircuitState state = CircuitState::Closed;
    uint32_t failure_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    std::optional<std::chrono::system_clock::time_point> last_success_time;
    std::vector<OperationMetricsSnapshot> operations;
    uint64_t total_operations = 0;
    uint64_t total_failures = 0;
    uint64_t rejected_calls = 0;
    double average_latency_ms = 0.0;
};

/**
 * @brief Circuit breaker guarding cache-store operations
 *
 * State transitions:
 * - Closed -> Open (failure_count >= threshold)
 * - Open -> HalfOpen (timeout elapsed since last failure, checked on the next call)
 * - HalfOpen -> Closed (next success, failure count reset)
 * - HalfOpen -> Open (next failure)
 *
 * A success in Closed decrements the failure count toward 0, so failures decay
 * instead of requiring consecutive runs.
 *
 * The trip decision uses one breaker-wide failure counter. Per-operation metrics are
 * kept for observability and swept by the health check after the retention period.
 * The health check also forces Open -> HalfOpen after 2x timeout.
 *
 * Thread safety:
 * - State and failure counter are mutated under a single short critical section
 * - The wrapped operation and fallback are never called with the lock held
 * - Listeners are notified after the lock is released
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @throws strata::core::ConfigError if threshold < 1 or timeout is not positive
     */
    explicit CircuitBreaker(const config::CircuitBreakerConfig& config);
    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Execute an operation through the breaker
     *
     * @param operation_name Name used for per-operation metrics
     * @param operation Primary operation
     * @param fallback Optional fallback, used when the breaker is open or the operation fails
     * @return Result of the operation or the fallback
     * @throws CircuitOpenError if open and no fallback
     * @throws FallbackFailedError if the fallback fails
     * @throws The operation's own exception if it fails and no fallback
     */
    template<typename T>
    T execute(const std::string& operation_name,
              const std::function<T()>& operation,
              const std::function<T()>& fallback = nullptr);

    /**
     * @brief Asynchronous variant of execute() on a separate thread
     */
    template<typename T>
    std::future<T> executeAsync(const std::string& operation_name,
                                std::function<T()> operation,
                                std::function<T()> fallback = nullptr);

    /**
     * @brief Whether a call may proceed now (lazily moves Open -> HalfOpen)
     */
    bool canExecute();

    void recordSuccess(const std::string& operation_name, std::chrono::nanoseconds latency);
    void recordFailure(const std::string& operation_name, std::chrono::nanoseconds latency,
                       const std::string& reason);

    CircuitState getState() const;
    uint32_t getFailureCount() const;
    bool isOpen() const { return getState() == CircuitState::Open; }

    /**
     * @brief Force Closed and clear the failure counter
     */
    void reset();

    /**
     * @brief Start the periodic health check (interval from config)
     *
     * @return false if already running or the interval is 0
     */
    bool startHealthCheck();
    void stopHealthCheck();

    /**
     * @brief Health check body: sweep idle metrics, force HalfOpen after 2x timeout
     */
    void runHealthCheck();

    CircuitBreakerStatistics getStatistics() const;

    /**
     * @brief Register a state transition listener
     *
     * @return Listener id for removeStateChangedListener()
     */
    uint64_t addStateChangedListener(StateChangedCallback callback);
    void removeStateChangedListener(uint64_t listener_id);

private:
    struct OperationMetrics {
        uint64_t total_operations = 0;
        uint64_t failure_count = 0;
        uint64_t success_count = 0;
        std::chrono::nanoseconds cumulative_latency{0};
        std::string last_error;
        Clock::time_point last_access;
        std::chrono::system_clock::time_point last_access_wall;
    };

    using MetricsMap = tbb::concurrent_hash_map<std::string, OperationMetrics>;

    template<typename T>
    T runFallback(const std::string& operation_name,
                  const std::function<T()>& fallback,
                  const std::string& primary_cause);

    // Caller holds state_mutex_. Appends to pending for notification after unlock.
    void transitionLocked(CircuitState new_state, std::vector<CircuitStateChange>& pending);
    void notifyListeners(const std::vector<CircuitStateChange>& changes);

    // Remove per-operation metrics idle past the retention period
    size_t sweepIdleMetrics();

    void updateMetrics(const std::string& operation_name, std::chrono::nanoseconds latency,
                       bool success, const std::string& error);

    config::CircuitBreakerConfig config_;

    mutable std::mutex state_mutex_;
    CircuitState state_ = CircuitState::Closed;
    uint32_t failure_count_ = 0;
    std::optional<Clock::time_point> last_failure_time_;
    std::optional<std::chrono::system_clock::time_point> last_failure_wall_;
    std::optional<std::chrono::system_clock::time_point> last_success_wall_;

    MetricsMap metrics_;
    // Shared for per-key updates, exclusive while iterating
    mutable std::shared_mutex metrics_traversal_mutex_;
    std::atomic<uint64_t> rejected_calls_{0};

    std::map<uint64_t, StateChangedCallback> listeners_;
    std::mutex listener_mutex_;
    uint64_t next_listener_id_ = 1;

    std::unique_ptr<util::PeriodicTask> health_task_;
};

// Template implementation
template<typename T>
T CircuitBreaker::execute(const std::string& operation_name,
                          const std::function<T()>& operation,
                          const std::function<T()>& fallback) {
    if (!canExecute()) {
        rejected_calls_.fetch_add(1, std::memory_order_relaxed);
        if (!fallback) {
            throw CircuitOpenError(operation_name);
        }
        return runFallback(operation_name, fallback, "circuit breaker is open");
    }

    auto start = Clock::now();
    try {
        T result = operation();
        recordSuccess(operation_name, Clock::now() - start);
        return result;
    } catch (const std::exception& e) {
        recordFailure(operation_name, Clock::now() - start, e.what());
        if (!fallback) {
            throw;
        }
        return runFallback(operation_name, fallback, e.what());
    }
}

template<typename T>
std::future<T> CircuitBreaker::executeAsync(const std::string& operation_name,
                                            std::function<T()> operation,
                                            std::function<T()> fallback) {
    return std::async(std::launch::async,
                      [this, operation_name, operation = std::move(operation), fallback = std::move(fallback)]() {
                          return execute<T>(operation_name, operation, fallback);
                      });
}

template<typename T>
T CircuitBreaker::runFallback(const std::string& operation_name,
                              const std::function<T()>& fallback,
                              const std::string& primary_cause) {
    try {
        return fallback();
    } catch (const std::exception& e) {
        throw FallbackFailedError(operation_name, primary_cause, e.what());
    }
}

} // namespace strata::core::resilience
