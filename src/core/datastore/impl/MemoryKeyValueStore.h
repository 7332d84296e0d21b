#pragma once

#include "core/datastore/interfaces/IKeyValueStore.h"

#include <atomic>
#include <chrono>
#include <map>
#include <shared_mutex>
#include <string>
#include <tbb/concurrent_hash_map.h>

namespace strata::core::datastore {

/**
 * @brief 프로세스 내 키-값 저장소
 *
 * 테스트와 데모용 참조 구현입니다. concurrent_hash_map 기반으로 키 단위 잠금을 사용합니다.
 *
 * 주요 기능:
 * - 항목별 TTL (조회 시 지연 만료, purgeExpired()로 일괄 정리)
 * - 글롭 패턴 삭제 (대소문자 무시)
 * - hit/miss 카운터 (lock-free atomic)
 */
class MemoryKeyValueStore : public IKeyValueStore {
public:
    using Clock = std::chrono::steady_clock;

    MemoryKeyValueStore() = default;
    ~MemoryKeyValueStore() override = default;

    MemoryKeyValueStore(const MemoryKeyValueStore&) = delete;
    MemoryKeyValueStore& operator=(const MemoryKeyValueStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::chrono::milliseconds ttl) override;
    bool remove(const std::string& key) override;
    size_t removeByPattern(const std::string& glob_pattern) override;
    bool exists(const std::string& key) override;
    std::optional<std::chrono::milliseconds> remainingTtl(const std::string& key) const override;

    /**
     * @brief 만료된 항목 일괄 삭제
     *
     * @return 삭제된 항목 수
     */
    size_t purgeExpired();

    /// @brief 저장된 항목 수 (만료되었으나 아직 정리되지 않은 항목 포함)
    size_t size() const { return entries_.size(); }

    /**
     * @brief 통계 조회
     *
     * @return hits, misses, sets, removes, entries
     */
    std::map<std::string, uint64_t> getStatistics() const;

    void clear();

private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expires_at;

        bool isExpired(Clock::time_point now) const {
            return expires_at.has_value() && now >= *expires_at;
        }
    };

    using EntryMap = tbb::concurrent_hash_map<std::string, Entry>;

    EntryMap entries_;

    // 키 단위 연산은 shared, 전체 순회(패턴 삭제/정리)는 exclusive.
    // concurrent_hash_map 순회는 동시 insert/erase와 안전하지 않음
    mutable std::shared_mutex traversal_mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> removes_{0};
};

} // namespace strata::core::datastore
