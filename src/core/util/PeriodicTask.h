// PeriodicTask.h - 주기 실행 백그라운드 작업
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_UTIL_PERIODICTASK_H
#define STRATA_CORE_UTIL_PERIODICTASK_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace strata::core::util {

/**
 * @brief 전용 스레드에서 주어진 작업을 일정 간격으로 실행
 *
 * stop()은 condition variable로 대기를 즉시 깨우고 스레드를 join합니다.
 * 진행 중인 한 번의 tick만 기다리며, 그 이후의 실행은 없습니다.
 * tick에서 발생한 예외는 로그로 남기고 다음 주기를 계속합니다.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief 스레드 시작
     *
     * @return 이미 실행 중이면 false
     */
    bool start();

    /**
     * @brief 스레드 종료 (멱등)
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /// @brief 완료된 tick 수
    uint64_t tickCount() const { return tick_count_.load(); }

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> tick_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tick_count_{0};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace strata::core::util

#endif // STRATA_CORE_UTIL_PERIODICTASK_H
