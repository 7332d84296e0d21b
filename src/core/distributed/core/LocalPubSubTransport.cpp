// LocalPubSubTransport.cpp - 프로세스 내 Pub/Sub 브로커 구현
// Copyright (C) 2025 Strata Project

#include "LocalPubSubTransport.h"
#include "core/common/CacheErrors.h"

#include <random>
#include <sstream>
#include <spdlog/spdlog.h>

namespace strata::core::distributed {

LocalPubSubTransport::LocalPubSubTransport(size_t queue_capacity)
    : queue_capacity_(queue_capacity) {
    spdlog::debug("[LocalPubSubTransport] Created with queue capacity: {}", queue_capacity_);
}

LocalPubSubTransport::~LocalPubSubTransport() {
    if (running_.load(std::memory_order_acquire)) {
        stop();
    }
}

void LocalPubSubTransport::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_release)) {
        spdlog::warn("[LocalPubSubTransport] Already running");
        return;
    }

    dispatch_thread_ = std::thread([this]() {
        dispatchLoop();
    });
    spdlog::info("[LocalPubSubTransport] Started");
}

void LocalPubSubTransport::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false, std::memory_order_release)) {
            return;
        }
    }
    queue_cv_.notify_all();

    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }

    spdlog::info("[LocalPubSubTransport] Stopped. Published: {}, Delivered: {}, Dropped: {}, FailedCallbacks: {}",
                 published_.load(), delivered_.load(), dropped_.load(), failed_callbacks_.load());
}

void LocalPubSubTransport::publish(const std::string& channel, const std::string& payload) {
    if (!isConnected()) {
        throw TransportError("Transport not connected, cannot publish to '" + channel + "'");
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= queue_capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            throw TransportError("Transport queue full, dropped message for '" + channel + "'");
        }
        queue_.push_back(Envelope{channel, payload});
    }
    published_.fetch_add(1, std::memory_order_relaxed);
    queue_cv_.notify_one();
}

SubscriptionId LocalPubSubTransport::subscribe(const std::string& channel, MessageHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Subscription handler must not be empty");
    }
    if (!connected_.load()) {
        throw TransportError("Transport not connected, cannot subscribe to '" + channel + "'");
    }

    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    SubscriptionId id = generateSubscriptionId();
    subscriptions_.emplace(id, Subscription{id, channel, std::move(handler)});

    spdlog::debug("[LocalPubSubTransport] Subscription {} added for channel '{}'", id, channel);
    return id;
}

bool LocalPubSubTransport::unsubscribe(const SubscriptionId& subscription_id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        removed = subscriptions_.erase(subscription_id) > 0;
    }

    // 진행 중인 전달이 끝날 때까지 대기
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);

    if (removed) {
        spdlog::debug("[LocalPubSubTransport] Subscription removed: {}", subscription_id);
    } else {
        spdlog::warn("[LocalPubSubTransport] Failed to remove subscription (not found): {}", subscription_id);
    }
    return removed;
}

bool LocalPubSubTransport::isConnected() const {
    return connected_.load() && running_.load(std::memory_order_acquire);
}

bool LocalPubSubTransport::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !dispatching_;
    });
}

size_t LocalPubSubTransport::getSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.size();
}

std::map<std::string, uint64_t> LocalPubSubTransport::getStatistics() const {
    return {
        {"published", published_.load()},
        {"delivered", delivered_.load()},
        {"dropped", dropped_.load()},
        {"failed_callbacks", failed_callbacks_.load()},
    };
}

SubscriptionId LocalPubSubTransport::generateSubscriptionId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::atomic<uint64_t> counter{0};

    std::stringstream ss;
    ss << "sub_" << counter.fetch_add(1, std::memory_order_relaxed) << "_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

void LocalPubSubTransport::dispatchLoop() {
    spdlog::debug("[LocalPubSubTransport] Dispatch loop started");

    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] {
            return !queue_.empty() || !running_.load(std::memory_order_acquire);
        });

        // 종료 시 남은 메시지까지 모두 전달
        if (queue_.empty() && !running_.load(std::memory_order_acquire)) {
            break;
        }

        Envelope envelope = std::move(queue_.front());
        queue_.pop_front();
        dispatching_ = true;
        lock.unlock();

        deliver(envelope);

        lock.lock();
        dispatching_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }

    idle_cv_.notify_all();
    spdlog::debug("[LocalPubSubTransport] Dispatch loop stopped");
}

void LocalPubSubTransport::deliver(const Envelope& envelope) {
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);

    std::vector<Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (sub.channel == envelope.channel) {
                targets.push_back(sub);
            }
        }
    }

    for (const auto& sub : targets) {
        {
            // 앞선 핸들러가 구독을 해제했을 수 있음
            std::lock_guard<std::mutex> lock(subscriptions_mutex_);
            if (subscriptions_.find(sub.id) == subscriptions_.end()) {
                continue;
            }
        }

        try {
            sub.handler(envelope.channel, envelope.payload);
            delivered_.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            failed_callbacks_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[LocalPubSubTransport] Subscriber {} threw on channel '{}': {}",
                          sub.id, envelope.channel, e.what());
        }
    }
}

} // namespace strata::core::distributed
