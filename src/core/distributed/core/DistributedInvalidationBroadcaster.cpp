#include "DistributedInvalidationBroadcaster.h"
#include "InvalidationCodec.h"
#include "core/common/CacheErrors.h"
#include "core/util/InstanceId.h"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

namespace strata::core::distributed {

using invalidation::InvalidationResult;

DistributedInvalidationBroadcaster::DistributedInvalidationBroadcaster(
    const config::StrataConfig& config,
    std::shared_ptr<invalidation::ICacheInvalidator> local,
    std::shared_ptr<IPubSubTransport> transport)
    : config_(config),
      local_(std::move(local)),
      transport_(std::move(transport)),
      instance_id_(util::generateInstanceId()),
      channel_(config.namespace_name + ":invalidation") {
    if (!local_ || !transport_) {
        throw std::invalid_argument("DistributedInvalidationBroadcaster requires a local invalidator and a transport");
    }
    spdlog::info("[DistributedInvalidationBroadcaster] Instance '{}' on channel '{}'", instance_id_, channel_);
}

DistributedInvalidationBroadcaster::~DistributedInvalidationBroadcaster() {
    stopListening();
}

bool DistributedInvalidationBroadcaster::startListening() {
    std::lock_guard<std::mutex> lock(listen_mutex_);
    if (!subscription_id_.empty()) {
        return true;
    }

    try {
        subscription_id_ = transport_->subscribe(
            channel_, [this](const std::string&, const std::string& payload) { handleMessage(payload); });
    } catch (const std::exception& e) {
        spdlog::error("[DistributedInvalidationBroadcaster] Failed to subscribe to '{}': {}", channel_, e.what());
        return false;
    }

    spdlog::info("[DistributedInvalidationBroadcaster] Started listening on '{}'", channel_);
    return true;
}

void DistributedInvalidationBroadcaster::stopListening() {
    std::lock_guard<std::mutex> lock(listen_mutex_);
    if (subscription_id_.empty()) {
        return;
    }

    try {
        if (!transport_->unsubscribe(subscription_id_)) {
            spdlog::warn("[DistributedInvalidationBroadcaster] Subscription {} was already gone", subscription_id_);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[DistributedInvalidationBroadcaster] Unsubscribe from '{}' failed: {}", channel_, e.what());
    }
    subscription_id_.clear();

    spdlog::info("[DistributedInvalidationBroadcaster] Stopped listening on '{}'", channel_);
}

bool DistributedInvalidationBroadcaster::isListening() const {
    std::lock_guard<std::mutex> lock(listen_mutex_);
    return !subscription_id_.empty();
}

InvalidationResult DistributedInvalidationBroadcaster::broadcastInvalidation(const std::string& table_name,
                                                                             const CancellationToken& token) {
    auto result = local_->invalidate(table_name, token);
    if (!result.cancelled) {
        publish(InvalidationMessageType::Table, {table_name}, std::nullopt);
    }
    return result;
}

InvalidationResult DistributedInvalidationBroadcaster::broadcastInvalidationByPattern(const std::string& pattern,
                                                                                      const CancellationToken& token) {
    auto result = local_->invalidateByPattern(pattern, token);
    if (!result.cancelled) {
        publish(InvalidationMessageType::Pattern, {}, pattern);
    }
    return result;
}

InvalidationResult DistributedInvalidationBroadcaster::broadcastBatchInvalidation(
    const std::vector<std::string>& table_names, const CancellationToken& token) {
    auto result = local_->invalidateBatch(table_names, token);
    if (!result.cancelled && !result.tables.empty()) {
        publish(InvalidationMessageType::Batch, result.tables, std::nullopt);
    }
    return result;
}

void DistributedInvalidationBroadcaster::trackKey(const std::vector<std::string>& table_names,
                                                  const std::string& cache_key,
                                                  std::optional<std::chrono::milliseconds> entry_ttl,
                                                  const CancellationToken& token) {
    local_->trackKey(table_names, cache_key, entry_ttl, token);
}

void DistributedInvalidationBroadcaster::trackKey(const std::string& table_name,
                                                  const std::string& cache_key,
                                                  std::optional<std::chrono::milliseconds> entry_ttl,
                                                  const CancellationToken& token) {
    local_->trackKey(table_name, cache_key, entry_ttl, token);
}

std::vector<std::string> DistributedInvalidationBroadcaster::getTrackedKeys(const std::string& table_name,
                                                                            const CancellationToken& token) {
    return local_->getTrackedKeys(table_name, token);
}

InvalidationResult DistributedInvalidationBroadcaster::invalidate(const std::string& table_name,
                                                                  const CancellationToken& token) {
    return broadcastInvalidation(table_name, token);
}

InvalidationResult DistributedInvalidationBroadcaster::invalidateByPattern(const std::string& pattern,
                                                                           const CancellationToken& token) {
    return broadcastInvalidationByPattern(pattern, token);
}

InvalidationResult DistributedInvalidationBroadcaster::invalidateWithRelated(
    const std::string& table_name,
    const std::vector<std::string>& related_tables,
    int max_depth,
    const CancellationToken& token) {
    auto result = local_->invalidateWithRelated(table_name, related_tables, max_depth, token);
    if (!result.cancelled && !result.tables.empty()) {
        publish(InvalidationMessageType::Batch, result.tables, std::nullopt);
    }
    return result;
}

InvalidationResult DistributedInvalidationBroadcaster::invalidateBatch(const std::vector<std::string>& table_names,
                                                                       const CancellationToken& token) {
    return broadcastBatchInvalidation(table_names, token);
}

InvalidationResult DistributedInvalidationBroadcaster::invalidateByPatternBatch(
    const std::vector<std::string>& patterns, const CancellationToken& token) {
    auto result = local_->invalidateByPatternBatch(patterns, token);
    if (!result.cancelled) {
        for (const auto& pattern : patterns) {
            publish(InvalidationMessageType::Pattern, {}, pattern);
        }
    }
    return result;
}

void DistributedInvalidationBroadcaster::registerObserver(std::shared_ptr<IInvalidationObserver> observer) {
    if (!observer) {
        spdlog::warn("[DistributedInvalidationBroadcaster] Attempted to register null observer");
        return;
    }

    std::lock_guard<std::mutex> lock(observer_mutex_);
    observers_.push_back(std::move(observer));
}

void DistributedInvalidationBroadcaster::unregisterObserver(std::shared_ptr<IInvalidationObserver> observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    auto it = std::find(observers_.begin(), observers_.end(), observer);
    if (it != observers_.end()) {
        observers_.erase(it);
    }
}

void DistributedInvalidationBroadcaster::handleMessage(const std::string& payload) {
    received_.fetch_add(1, std::memory_order_relaxed);

    InvalidationEnvelope envelope;
    try {
        envelope = InvalidationCodec::decode(payload);
    } catch (const SerializationError& e) {
        decode_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[DistributedInvalidationBroadcaster] Dropped malformed message: {}", e.what());
        return;
    }

    // 자기 메시지는 적용도 재게시도 하지 않음
    if (envelope.source_instance_id == instance_id_) {
        self_echo_suppressed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::trace("[DistributedInvalidationBroadcaster] Ignored own message {}",
                      envelope.message.correlation_id);
        return;
    }

    try {
        applyLocally(envelope.message);
        applied_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        apply_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[DistributedInvalidationBroadcaster] Failed to apply message {} from '{}': {}",
                      envelope.message.correlation_id, envelope.source_instance_id, e.what());
        return;
    }

    if (config_.logging.log_invalidation) {
        spdlog::info("[DistributedInvalidationBroadcaster] Applied {} invalidation from '{}' (tables: [{}], pattern: '{}')",
                     toString(envelope.message.type), envelope.source_instance_id,
                     fmt::join(envelope.message.table_names, ", "),
                     envelope.message.pattern.value_or(""));
    }

    notifyObservers(envelope);
}

std::map<std::string, uint64_t> DistributedInvalidationBroadcaster::getStatistics() const {
    return {
        {"published", published_.load()},
        {"publish_failures", publish_failures_.load()},
        {"received", received_.load()},
        {"applied", applied_.load()},
        {"self_echo_suppressed", self_echo_suppressed_.load()},
        {"decode_failures", decode_failures_.load()},
        {"apply_failures", apply_failures_.load()},
    };
}

void DistributedInvalidationBroadcaster::publish(InvalidationMessageType type,
                                                 const std::vector<std::string>& table_names,
                                                 const std::optional<std::string>& pattern) {
    InvalidationEnvelope envelope;
    envelope.source_instance_id = instance_id_;
    envelope.message.type = type;
    envelope.message.table_names = table_names;
    envelope.message.pattern = pattern;
    envelope.message.correlation_id = util::generateUuid();
    envelope.timestamp = std::chrono::system_clock::now();

    try {
        transport_->publish(channel_, InvalidationCodec::encode(envelope));
        published_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[DistributedInvalidationBroadcaster] Published {} message {}",
                      toString(type), envelope.message.correlation_id);
    } catch (const std::exception& e) {
        publish_failures_.fetch_add(1, std::memory_order_relaxed);
        if (!config_.error_handling.silent_fallback) {
            throw;
        }

        // 로컬 무효화는 이미 완료됨, 피어는 TTL 만료까지 기존 값을 제공
        spdlog::error("[DistributedInvalidationBroadcaster] Failed to publish {} message: {}",
                      toString(type), e.what());
        const auto& handler = config_.error_handling.custom_error_handler;
        if (handler) {
            try {
                handler(e);
            } catch (const std::exception& hook_error) {
                spdlog::error("[DistributedInvalidationBroadcaster] Custom error handler threw: {}",
                              hook_error.what());
            }
        }
    }
}

void DistributedInvalidationBroadcaster::applyLocally(const InvalidationMessage& message) {
    switch (message.type) {
        case InvalidationMessageType::Table:
            for (const auto& table : message.table_names) {
                local_->invalidate(table);
            }
            break;
        case InvalidationMessageType::Pattern:
            if (message.pattern) {
                local_->invalidateByPattern(*message.pattern);
            }
            break;
        case InvalidationMessageType::Batch:
            local_->invalidateBatch(message.table_names);
            break;
    }
}

void DistributedInvalidationBroadcaster::notifyObservers(const InvalidationEnvelope& envelope) {
    std::vector<std::shared_ptr<IInvalidationObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            observer->onInvalidationReceived(envelope);
        } catch (const std::exception& e) {
            spdlog::error("[DistributedInvalidationBroadcaster] Observer exception in onInvalidationReceived: {}",
                          e.what());
        }
    }
}

} // namespace strata::core::distributed
