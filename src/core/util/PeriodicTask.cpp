#include "PeriodicTask.h"
#include <spdlog/spdlog.h>

namespace strata::core::util {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start() {
    if (running_.exchange(true)) {
        spdlog::warn("[PeriodicTask] {} already running", name_);
        return false;
    }

    thread_ = std::thread(&PeriodicTask::loop, this);
    spdlog::debug("[PeriodicTask] {} started (interval={}ms)", name_, interval_.count());
    return true;
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::debug("[PeriodicTask] {} stopped after {} ticks", name_, tick_count_.load());
}

void PeriodicTask::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) {
            break;
        }

        lock.unlock();
        try {
            tick_();
        } catch (const std::exception& e) {
            spdlog::error("[PeriodicTask] {} tick failed: {}", name_, e.what());
        }
        tick_count_.fetch_add(1);
        lock.lock();
    }
}

} // namespace strata::core::util
