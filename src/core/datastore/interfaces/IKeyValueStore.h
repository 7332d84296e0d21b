#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace strata::core::datastore {

/**
 * @brief 캐시 엔진이 소비하는 키-값 저장소 계약
 *
 * 값은 불투명한 직렬화 blob으로 다룹니다. 직렬화 형식은 구현체의 관심사입니다.
 * 구현체는 여러 요청 스레드에서 동시에 호출되어도 안전해야 합니다.
 *
 * 모든 메서드는 백엔드 오류 시 strata::core::StoreError를 던집니다.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /**
     * @brief 값 조회
     *
     * @return 값, 없거나 만료되었으면 std::nullopt
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief 값 저장 (덮어쓰기)
     *
     * @param ttl 0 이하이면 만료 없음
     */
    virtual void set(const std::string& key, const std::string& value,
                     std::chrono::milliseconds ttl) = 0;

    /**
     * @brief 키 삭제
     *
     * @return 키가 존재했으면 true (없는 키 삭제는 no-op)
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief 글롭 패턴과 일치하는 모든 키 삭제
     *
     * `*`는 임의 문자열, `?`는 임의 한 문자. 전체 키에 대해 매칭합니다.
     *
     * @return 삭제된 키 개수
     */
    virtual size_t removeByPattern(const std::string& glob_pattern) = 0;

    virtual bool exists(const std::string& key) = 0;

    /**
     * @brief 남은 TTL 조회
     *
     * @return 없거나 만료되었으면 std::nullopt, 만료 없음이면 milliseconds::max()
     */
    virtual std::optional<std::chrono::milliseconds> remainingTtl(const std::string& key) const = 0;
};

} // namespace strata::core::datastore
