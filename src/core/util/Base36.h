// Base36.h - 64비트 정수의 base-36 인코딩
// Copyright (C) 2025 Strata Project

#ifndef STRATA_CORE_UTIL_BASE36_H
#define STRATA_CORE_UTIL_BASE36_H

#include <algorithm>
#include <cstdint>
#include <string>

namespace strata::core::util {

/**
 * @brief `0-9a-z` 알파벳으로 인코딩, 0은 "0"
 */
inline std::string toBase36(uint64_t value) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    if (value == 0) {
        return "0";
    }

    std::string out;
    out.reserve(13);  // 36^13 > 2^64
    while (value > 0) {
        out.push_back(kAlphabet[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace strata::core::util

#endif // STRATA_CORE_UTIL_BASE36_H
