// Fnv1a64.h - FNV-1a 64비트 해시
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_UTIL_FNV1A64_H
#define STRATA_CORE_UTIL_FNV1A64_H

#include <cstdint>
#include <string_view>

namespace strata::core::util {

/**
 * @brief 비암호화 64비트 해시 (FNV-1a)
 *
 * 플랫폼/프로세스에 무관하게 동일한 값을 냅니다. std::hash는 이 보장이 없으므로
 * 캐시 키에 사용하지 않습니다.
 */
class Fnv1a64 {
public:
    static constexpr uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr uint64_t kPrime = 0x100000001b3ULL;

    void update(std::string_view data) noexcept {
        for (unsigned char c : data) {
            state_ ^= c;
            state_ *= kPrime;
        }
    }

    uint64_t digest() const noexcept { return state_; }

    static uint64_t hash(std::string_view data) noexcept {
        Fnv1a64 h;
        h.update(data);
        return h.digest();
    }

private:
    uint64_t state_ = kOffsetBasis;
};

} // namespace strata::core::util

#endif // STRATA_CORE_UTIL_FNV1A64_H
