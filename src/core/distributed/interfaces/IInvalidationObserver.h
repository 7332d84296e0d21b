#pragma once

#include "core/distributed/dto/InvalidationMessage.h"

namespace strata::core::distributed {

/**
 * @brief 피어로부터 받은 무효화가 로컬에 적용된 뒤 호출되는 관찰자
 *
 * 자기 자신이 보낸 메시지(echo)는 전달되지 않습니다.
 * 관찰자에서 발생한 예외는 로그 후 무시됩니다.
 */
class IInvalidationObserver {
public:
    virtual ~IInvalidationObserver() = default;

    virtual void onInvalidationReceived(const InvalidationEnvelope& envelope) = 0;
};

} // namespace strata::core::distributed
