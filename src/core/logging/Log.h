#pragma once

#include "core/config/StrataConfig.h"

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <memory>
#include <vector>

namespace strata::core::logging {

/**
 * 비동기 로거 초기화
 *
 * 목적: spdlog async_logger를 생성하고 전역 기본 로거로 설정
 *
 * 전제조건:
 * - main() 시작 직후 한 번만 호출
 *
 * 후행조건:
 * - spdlog::default_logger()가 비동기 로거로 설정됨
 * - config.file이 지정되면 해당 파일에도 기록
 * - 3초 간격 주기적 flush
 *
 * 예외:
 * - spdlog::spdlog_ex: 로그 파일 생성 실패 시
 */
inline void initialize_logger(const config::LoggingConfig& config) {
    try {
        // spdlog thread pool 초기화 (큐 크기 8192, 스레드 1개)
        spdlog::init_thread_pool(8192, 1);

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!config.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, true));
        }

        auto async_logger = std::make_shared<spdlog::async_logger>(
            "strata_logger",
            sinks.begin(),
            sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::block
        );

        async_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        async_logger->set_level(spdlog::level::from_str(config.level));

        // ERROR 이상은 즉시 플러시
        async_logger->flush_on(spdlog::level::err);

        async_logger->set_error_handler([](const std::string& msg) {
            std::cerr << "Logger error: " << msg << std::endl;
        });

        spdlog::set_default_logger(async_logger);
        spdlog::flush_every(std::chrono::seconds(3));

        spdlog::info("[Log] Async logger initialized (level={})", config.level);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        throw;
    }
}

/**
 * 로거 종료
 *
 * 큐에 남은 메시지를 모두 처리하고 스레드 풀을 정리합니다.
 * 애플리케이션 종료 직전 호출.
 */
inline void shutdown_logger() {
    spdlog::shutdown();
}

}  // namespace strata::core::logging
