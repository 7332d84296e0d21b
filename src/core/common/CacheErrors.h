// CacheErrors.h - 캐시 엔진 예외 계층
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_COMMON_CACHEERRORS_H
#define STRATA_CORE_COMMON_CACHEERRORS_H

#include <stdexcept>
#include <string>

namespace strata::core {

/**
 * @brief 오류 분류
 *
 * 호출자가 예외 타입 대신 kind로 분기할 수 있도록 제공합니다.
 */
enum class ErrorKind {
    Backend,          ///< KV 저장소 또는 전송 계층 오류 (복구 가능)
    BreakerOpen,      ///< Circuit Breaker가 열려 있어 호출하지 않음
    FallbackFailure,  ///< 기본 작업과 fallback이 모두 실패
    Serialization,    ///< 메시지 인코딩/디코딩 실패
    Configuration     ///< 잘못된 설정 값
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Backend: return "Backend";
        case ErrorKind::BreakerOpen: return "BreakerOpen";
        case ErrorKind::FallbackFailure: return "FallbackFailure";
        case ErrorKind::Serialization: return "Serialization";
        case ErrorKind::Configuration: return "Configuration";
        default: return "Unknown";
    }
}

/**
 * @brief 모든 캐시 엔진 예외의 기반 클래스
 */
class CacheError : public std::runtime_error {
public:
    CacheError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// @brief KV 저장소 호출 실패
class StoreError : public CacheError {
public:
    explicit StoreError(const std::string& message)
        : CacheError(ErrorKind::Backend, message) {}
};

/// @brief Pub/Sub 전송 실패
class TransportError : public CacheError {
public:
    explicit TransportError(const std::string& message)
        : CacheError(ErrorKind::Backend, message) {}
};

/// @brief Circuit Breaker Open 상태에서 fallback 없이 호출됨
class CircuitOpenError : public CacheError {
public:
    explicit CircuitOpenError(const std::string& operation_name)
        : CacheError(ErrorKind::BreakerOpen,
                     "Circuit breaker is open for operation '" + operation_name +
                     "' and no fallback provided"),
          operation_name_(operation_name) {}

    const std::string& operationName() const noexcept { return operation_name_; }

private:
    std::string operation_name_;
};

/**
 * @brief 기본 작업과 fallback이 모두 실패
 *
 * 두 원인을 모두 보존합니다.
 */
class FallbackFailedError : public CacheError {
public:
    FallbackFailedError(const std::string& operation_name,
                        const std::string& primary_cause,
                        const std::string& fallback_cause)
        : CacheError(ErrorKind::FallbackFailure,
                     "Both primary operation and fallback failed for '" + operation_name +
                     "' (primary: " + primary_cause + ", fallback: " + fallback_cause + ")"),
          primary_cause_(primary_cause),
          fallback_cause_(fallback_cause) {}

    const std::string& primaryCause() const noexcept { return primary_cause_; }
    const std::string& fallbackCause() const noexcept { return fallback_cause_; }

private:
    std::string primary_cause_;
    std::string fallback_cause_;
};

/// @brief 무효화 메시지 직렬화/역직렬화 실패
class SerializationError : public CacheError {
public:
    explicit SerializationError(const std::string& message)
        : CacheError(ErrorKind::Serialization, message) {}
};

/// @brief 설정 검증 실패 (생성 시점에 즉시 발생)
class ConfigError : public CacheError {
public:
    explicit ConfigError(const std::string& message)
        : CacheError(ErrorKind::Configuration, message) {}
};

} // namespace strata::core

#endif // STRATA_CORE_COMMON_CACHEERRORS_H
