#pragma once

// ---------------------------------------------------------------------------
// rule_store.hpp
//
// 현재 활성 규칙 스냅샷과 그에 짝지어진 판정 캐시를 보유한다.
//
// [스냅샷 불변식]
// - 게시된 RuleSnapshot 은 변경되지 않는다. 리로드는 새 스냅샷을 만들어
//   통째로 교체한다 (in-place 수정 없음).
// - 어느 시점에나 "현재" 스냅샷은 정확히 하나. reader 는 만들어지는 중인
//   스냅샷을 볼 수 없다.
// - rules 와 cache 는 같은 스냅샷 객체 안에서 함께 교체된다. 다른 규칙
//   집합을 위해 채워진 캐시와 짝지어지는 일은 없다.
//
// [단일 writer]
// maybe_reload() 는 엔진 쓰기 락을 보유한 호출자만 부를 수 있다.
// RuleStore 는 자체 락을 갖지 않는다.
//
// [캐시 정책]
// 규칙 수 > cache_threshold 이면 빈 캐시를 붙이고, 이하이면 캐시 없음.
// 규칙이 적으면 전체 스캔이 충분히 싸고, 캐시는 요청 형태마다 커지기만 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "acl/acl_rule.hpp"
#include "acl/config_source.hpp"
#include "acl/verdict_cache.hpp"
#include "common/types.hpp"

// ---------------------------------------------------------------------------
// RuleSnapshot
//   cache == nullptr 이면 이 스냅샷에서는 캐시를 사용하지 않는다.
// ---------------------------------------------------------------------------
struct RuleSnapshot {
    std::vector<AclRule>          rules{};
    std::shared_ptr<VerdictCache> cache{};
};

class RuleStore {
public:
    static constexpr std::size_t kDefaultCacheThreshold = 10;

    // 생성 직후 스냅샷은 규칙 0개, 캐시 없음 (모든 요청 차단).
    explicit RuleStore(std::size_t cache_threshold = kDefaultCacheThreshold);

    // maybe_reload
    //   1. source 의 변경 마커 조회
    //   2. 직전 마커와 같으면 false
    //   3. 전체 레코드 로드 + 검증 (하나라도 실패하면 전체 거부)
    //   4. 캐시 정책 결정
    //   5. 새 스냅샷 게시, 마커 갱신 → true
    //   실패 시: 로그, 스냅샷/마커 유지, last_error() 설정 → false
    [[nodiscard]] bool maybe_reload(ConfigSource& source);

    // 현재 스냅샷. 호출자는 엔진 락을 보유한 동안에만 역참조할 것.
    [[nodiscard]] const std::shared_ptr<const RuleSnapshot>& snapshot() const noexcept {
        return snapshot_;
    }

    [[nodiscard]] std::size_t rule_count() const noexcept { return snapshot_->rules.size(); }

    [[nodiscard]] bool caching_enabled() const noexcept { return snapshot_->cache != nullptr; }

    [[nodiscard]] std::size_t cache_threshold() const noexcept { return cache_threshold_; }

    // 한 번도 성공하지 않았으면 std::nullopt
    [[nodiscard]] const std::optional<ModificationMarker>& last_known_marker() const noexcept {
        return last_known_marker_;
    }

    // 규칙 파일을 한 번이라도 성공적으로 게시했는가
    [[nodiscard]] bool has_snapshot() const noexcept { return last_known_marker_.has_value(); }

    // 마지막 maybe_reload() 가 실패했으면 그 원인, 아니면 std::nullopt
    [[nodiscard]] const std::optional<ConfigError>& last_error() const noexcept {
        return last_error_;
    }

private:
    std::size_t                         cache_threshold_;
    std::shared_ptr<const RuleSnapshot> snapshot_;
    std::optional<ModificationMarker>   last_known_marker_{};
    std::optional<ConfigError>          last_error_{};
};
