// ---------------------------------------------------------------------------
// rule_store.cpp
//
// [Fail-safe 원칙]
// 리로드 실패(읽기/파싱/검증)는 직전 스냅샷을 그대로 둔다.
// 모든 요청을 차단하거나 프로세스를 종료하지 않는다.
// 새 grant/revoke 가 반영되지 않을 뿐 기존 동작은 유지된다.
//
// [마커 갱신 시점]
// 실패 시 마커를 갱신하지 않는다. 파일이 그대로면 다음 확인 주기에
// 다시 시도하고 다시 실패를 기록한다. 운영자는 로그로 이를 감지한다.
// ---------------------------------------------------------------------------

#include "acl/rule_store.hpp"

#include <utility>

#include <spdlog/spdlog.h>

RuleStore::RuleStore(std::size_t cache_threshold)
    : cache_threshold_(cache_threshold)
    , snapshot_(std::make_shared<const RuleSnapshot>()) {}

bool RuleStore::maybe_reload(ConfigSource& source) {
    // Step 1: 변경 마커 조회
    const auto marker = source.modification_marker();
    if (!marker) {
        spdlog::error("rule_store: cannot check '{}' for changes ({}): {}",
                      source.describe(), to_string(marker.error().code), marker.error().message);
        last_error_ = marker.error();
        return false;
    }

    // Step 2: 변경 없음
    if (last_known_marker_.has_value() && *last_known_marker_ == *marker) {
        last_error_.reset();
        return false;
    }

    spdlog::info("rule_store: reloading ACL configuration '{}'", source.describe());

    // Step 3: 전체 로드 + 검증. 원본 순서 유지, 중복 제거/정렬 없음.
    auto raw_records = source.load_rules();
    if (!raw_records) {
        spdlog::error("rule_store: failed to read '{}' ({}): {}, keeping {} active rules",
                      source.describe(), to_string(raw_records.error().code),
                      raw_records.error().message, snapshot_->rules.size());
        last_error_ = std::move(raw_records.error());
        return false;
    }

    auto next = std::make_shared<RuleSnapshot>();
    next->rules.reserve(raw_records->size());
    for (std::size_t i = 0; i < raw_records->size(); ++i) {
        auto rule = make_acl_rule((*raw_records)[i]);
        if (!rule) {
            ConfigError err = std::move(rule.error());
            err.message     = fmt::format("rule #{}: {}", i, err.message);
            spdlog::error("rule_store: rejecting '{}': {} [{}], keeping {} active rules",
                          source.describe(), err.message, err.context, snapshot_->rules.size());
            last_error_ = std::move(err);
            return false;
        }
        next->rules.push_back(std::move(*rule));
    }

    // Step 4: 캐시 정책. 기존 캐시 객체가 있으면 비워서 재사용한다.
    // 쓰기 락 아래이므로 기존 스냅샷을 보고 있는 reader 는 없다.
    if (next->rules.size() > cache_threshold_) {
        if (snapshot_->cache) {
            snapshot_->cache->clear();
            next->cache = snapshot_->cache;
        } else {
            next->cache = std::make_shared<VerdictCache>();
        }
    }

    // Step 5: 게시
    spdlog::info("rule_store: activated {} rules from '{}' (verdict cache {})",
                 next->rules.size(), source.describe(), next->cache ? "enabled" : "disabled");
    snapshot_          = std::move(next);
    last_known_marker_ = *marker;
    last_error_.reset();
    return true;
}
