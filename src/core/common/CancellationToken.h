// CancellationToken.h - 저장소 호출 취소/타임아웃 컨텍스트
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_COMMON_CANCELLATIONTOKEN_H
#define STRATA_CORE_COMMON_CANCELLATIONTOKEN_H

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace strata::core {

/**
 * @brief 공유 취소 플래그 + 선택적 deadline
 *
 * 복사본은 같은 플래그를 공유합니다. 기본 생성된 토큰은 절대 취소되지 않습니다.
 * 무효화 배치 도중 취소되면 이미 발행된 삭제는 되돌리지 않습니다.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /// @brief 취소 가능한 토큰 생성
    static CancellationToken create() {
        CancellationToken token;
        token.flag_ = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    /// @brief 지정 시간 후 만료되는 토큰 생성
    static CancellationToken withTimeout(std::chrono::milliseconds timeout) {
        CancellationToken token = create();
        token.deadline_ = Clock::now() + timeout;
        return token;
    }

    void cancel() const {
        if (flag_) {
            flag_->store(true, std::memory_order_release);
        }
    }

    bool isCancelled() const {
        if (flag_ && flag_->load(std::memory_order_acquire)) {
            return true;
        }
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace strata::core

#endif // STRATA_CORE_COMMON_CANCELLATIONTOKEN_H
