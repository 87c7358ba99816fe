#pragma once

// ---------------------------------------------------------------------------
// verdict_cache.hpp
//
// (principal, operation, resource) → 판정 결과 메모이제이션.
//
// [동시성 모델]
// - insert() 는 엔진의 "읽기" 락만 보유한 다수 스레드에서 동시에 호출된다.
//   따라서 캐시 자체가 동시 삽입에 안전해야 한다.
// - 키 해시로 고정 개수의 shard 를 고르고, shard 마다 mutex 하나를 둔다.
//   서로 다른 shard 에 대한 lookup/insert 는 경합하지 않는다.
// - clear() 는 엔진 쓰기 락 아래에서만 호출되지만, shard 락을 모두 잡으므로
//   단독으로 호출해도 안전하다.
//
// [수명]
// 스냅샷 교체 시 전체 무효화만 지원한다 (키 단위 무효화 없음).
// 용량 제한이 없다: 크기는 서로 다른 요청 형태의 수에 비례한다.
// ---------------------------------------------------------------------------

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// ---------------------------------------------------------------------------
// make_cache_key
//   네 필드를 각각 "<바이트 길이>:<값>" 으로 이어 붙인다.
//   예: ("Topic:orders", "Read", "alice", "User")
//       → "12:Topic:orders4:Read5:alice4:User"
//   principal 이나 리소스 이름에 구분자 문자가 들어 있어도
//   서로 다른 4-tuple 은 서로 다른 키가 된다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string make_cache_key(std::string_view resource,
                                         std::string_view operation,
                                         std::string_view principal_name,
                                         std::string_view principal_type);

class VerdictCache {
public:
    // shard 개수 (2의 거듭제곱)
    static constexpr std::size_t kShardCount = 16;

    VerdictCache() = default;
    ~VerdictCache() = default;

    // 복사/이동 금지 (mutex 보유, 스냅샷들이 shared_ptr 로 공유)
    VerdictCache(const VerdictCache&)            = delete;
    VerdictCache& operator=(const VerdictCache&) = delete;
    VerdictCache(VerdictCache&&)                 = delete;
    VerdictCache& operator=(VerdictCache&&)      = delete;

    // lookup
    //   적중 시 판정 값, 미적중 시 std::nullopt. hit/miss 카운터를 갱신한다.
    [[nodiscard]] std::optional<bool> lookup(const std::string& key);

    // insert
    //   이미 있는 키는 덮어쓴다 (같은 스냅샷 안에서는 값이 항상 같다).
    void insert(const std::string& key, bool verdict);

    // clear
    //   모든 항목을 제거한다. 카운터는 유지한다.
    void clear();

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::uint64_t hits() const noexcept {
        return hits_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t misses() const noexcept {
        return misses_.load(std::memory_order_relaxed);
    }

private:
    struct Shard {
        mutable std::mutex                    mutex;
        std::unordered_map<std::string, bool> entries;
    };

    [[nodiscard]] Shard&       shard_for(const std::string& key);
    [[nodiscard]] const Shard& shard_for(const std::string& key) const;

    std::array<Shard, kShardCount> shards_{};
    std::atomic<std::uint64_t>     hits_{0};
    std::atomic<std::uint64_t>     misses_{0};
};
