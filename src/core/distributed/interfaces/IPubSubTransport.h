#pragma once

#include <functional>
#include <string>

namespace strata::core::distributed {

using SubscriptionId = std::string;

/// @brief 수신 핸들러 (channel, payload)
using MessageHandler = std::function<void(const std::string&, const std::string&)>;

/**
 * @brief Pub/Sub 전송 계약
 *
 * publish는 여러 스레드에서 동시에 호출될 수 있으며 구현체가 하위 계층에서 직렬화합니다.
 * 메시지는 중복되거나 순서가 바뀌어 도착할 수 있습니다.
 *
 * 실패 시 strata::core::TransportError를 던집니다.
 */
class IPubSubTransport {
public:
    virtual ~IPubSubTransport() = default;

    virtual void publish(const std::string& channel, const std::string& payload) = 0;

    /**
     * @brief 채널 구독
     *
     * @return 구독 해제에 사용할 ID
     */
    virtual SubscriptionId subscribe(const std::string& channel, MessageHandler handler) = 0;

    /**
     * @brief 구독 해제
     *
     * 반환 후에는 해당 핸들러가 더 이상 호출되지 않습니다.
     *
     * @return 구독이 존재했으면 true
     */
    virtual bool unsubscribe(const SubscriptionId& subscription_id) = 0;

    virtual bool isConnected() const = 0;
};

} // namespace strata::core::distributed
