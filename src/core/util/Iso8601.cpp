// Iso8601.cpp - ISO-8601 타임스탬프 포맷/파싱 구현
// Copyright (C) 2025 Strata Project

#include "Iso8601.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace strata::core::util {

namespace {

bool isDigits(const std::string& s, size_t pos, size_t count) {
    if (pos + count > s.size()) {
        return false;
    }
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

// UTC 기준 오프셋, 형식 오류 시 예외
std::chrono::minutes parseOffset(const std::string& zone, const std::string& original) {
    if (zone.empty() || zone == "Z" || zone == "z") {
        return std::chrono::minutes(0);
    }

    const char sign = zone[0];
    if ((sign != '+' && sign != '-') || !isDigits(zone, 1, 2)) {
        throw std::invalid_argument("Invalid timestamp offset: '" + original + "'");
    }

    int hours = std::stoi(zone.substr(1, 2));
    int minutes = 0;
    if (zone.size() == 6 && zone[3] == ':' && isDigits(zone, 4, 2)) {
        minutes = std::stoi(zone.substr(4, 2));
    } else if (zone.size() == 5 && isDigits(zone, 3, 2)) {
        minutes = std::stoi(zone.substr(3, 2));
    } else if (zone.size() != 3) {
        throw std::invalid_argument("Invalid timestamp offset: '" + original + "'");
    }

    if (hours > 18 || minutes > 59) {
        throw std::invalid_argument("Timestamp offset out of range: '" + original + "'");
    }

    std::chrono::minutes offset(hours * 60 + minutes);
    return sign == '-' ? -offset : offset;
}

} // namespace

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

std::chrono::system_clock::time_point parseIso8601(const std::string& str) {
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        throw std::invalid_argument("Invalid timestamp: '" + str + "'");
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    // 소수 초 (앞 3자리만 사용)
    int millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (str[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    auto offset = parseOffset(str.substr(pos), str);

    std::time_t local_secs = timegm(&tm);
    return std::chrono::system_clock::from_time_t(local_secs) - offset + std::chrono::milliseconds(millis);
}

} // namespace strata::core::util
