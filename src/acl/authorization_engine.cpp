// ---------------------------------------------------------------------------
// authorization_engine.cpp
//
// [요청 1건의 상태 전이]
//   CHECK_FRESHNESS ─┬─ (주기 아님) ─ HIT(cache) ─────────── DONE
//                    │                └ MISS ─ SCAN ─ 캐시 기록 ─ DONE
//                    └─ (주기 도래) ─ RELOAD (쓰기 락) ─ CHECK_FRESHNESS
//
// 쓰기 경로를 한 번 거친 요청은 다음 반복에서 주기와 무관하게 평가한다.
// 방금 이 스레드나 다른 스레드가 확인을 마쳤으므로 상태는 최신이다.
// (freshness_window == 0 일 때 무한 루프가 되지 않는 이유이기도 하다.)
//
// [로그 레벨]
// ALLOW 는 debug, DENY 는 info. "(cached)" 는 캐시 적중 표시.
// ---------------------------------------------------------------------------

#include "acl/authorization_engine.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

using Clock = StalenessGovernor::Clock;

// 요청 문자열을 한 번만 파싱하고 첫 일치에서 멈춘다
bool scan_rules(const RuleSnapshot& snapshot,
                std::string_view    principal_type,
                std::string_view    principal_name,
                std::string_view    operation,
                std::string_view    resource) {
    const AclOperation   op     = operation_from_string(operation);
    const ParsedResource parsed = parse_resource(resource);
    return std::any_of(snapshot.rules.begin(), snapshot.rules.end(),
                       [&](const AclRule& rule) {
                           return rule.matches(principal_type, principal_name, op, parsed);
                       });
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
AuthorizationEngine::AuthorizationEngine(std::shared_ptr<ConfigSource>   source,
                                         AuthorizerOptions               options,
                                         std::shared_ptr<AuditSink>      audit,
                                         std::shared_ptr<StatsCollector> stats)
    : source_(std::move(source))
    , store_(options.cache_threshold)
    , governor_(options.freshness_window)
    , audit_(std::move(audit))
    , stats_(stats ? std::move(stats) : std::make_shared<StatsCollector>()) {
    if (!source_) {
        throw std::invalid_argument("authorization_engine: config source must not be null");
    }
    if (options.freshness_window.count() < 0) {
        throw std::invalid_argument("authorization_engine: freshness window must not be negative");
    }
}

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------
bool AuthorizationEngine::initialize() {
    const std::unique_lock<std::shared_mutex> lock(mutex_);
    governor_.record_check(Clock::now());
    const bool loaded = reload_locked(false);
    if (store_.rule_count() == 0) {
        spdlog::warn("authorization_engine: no ACL rules active after initial load of '{}', "
                     "all requests will be denied", source_->describe());
    }
    return loaded;
}

// ---------------------------------------------------------------------------
// reload_locked
//   호출자가 쓰기 락을 보유한 상태에서만 호출된다.
//   주기 확인의 "변경 없음" 은 window 마다 생기므로 기록하지 않는다.
//   운영자가 요청한 리로드는 결과가 무엇이든 기록한다.
// ---------------------------------------------------------------------------
bool AuthorizationEngine::reload_locked(bool manual) noexcept {
    try {
        const bool changed = store_.maybe_reload(*source_);
        const bool failed  = store_.last_error().has_value();
        stats_->on_reload(changed, failed);

        if ((changed || failed || manual) && audit_) {
            ReloadLog entry{};
            entry.source     = source_->describe();
            entry.outcome    = failed    ? ReloadOutcome::kFailed
                             : changed   ? ReloadOutcome::kReloaded
                                         : ReloadOutcome::kUnchanged;
            entry.rule_count = store_.rule_count();
            entry.caching    = store_.caching_enabled();
            entry.error      = failed ? store_.last_error()->message : std::string{};
            entry.timestamp  = std::chrono::system_clock::now();
            audit_->log_reload(entry);
        }
        return changed;
    } catch (const std::exception& e) {
        // 직전 스냅샷 유지
        spdlog::error("authorization_engine: reload of '{}' aborted: {}",
                      source_->describe(), e.what());
        stats_->on_reload(false, true);
        return false;
    }
}

// ---------------------------------------------------------------------------
// force_reload
// ---------------------------------------------------------------------------
bool AuthorizationEngine::force_reload() noexcept {
    try {
        const std::unique_lock<std::shared_mutex> lock(mutex_);
        governor_.record_check(Clock::now());
        const bool changed = reload_locked(true);
        spdlog::info("authorization_engine: manual reload of '{}': {}",
                     source_->describe(), changed ? "rules replaced" : "no change");
        return changed;
    } catch (const std::system_error& e) {
        spdlog::error("authorization_engine: manual reload failed to lock: {}", e.what());
        return false;
    }
}

// ---------------------------------------------------------------------------
// check_access
// ---------------------------------------------------------------------------
bool AuthorizationEngine::check_access(std::string_view principal_type,
                                       std::string_view principal_name,
                                       std::string_view operation,
                                       std::string_view resource) noexcept {
    try {
        const auto now = Clock::now();

        // named user 요청만 캐시한다
        std::optional<std::string> cache_key;
        if (principal_type == kUserPrincipalType) {
            cache_key = make_cache_key(resource, operation, principal_name, principal_type);
        }

        bool refreshed = false;
        for (;;) {
            // Step 1: 읽기 락 아래에서 최신이면 바로 평가 (핫패스)
            {
                const std::shared_lock<std::shared_mutex> lock(mutex_);
                if (refreshed || !governor_.should_check_now(now)) {
                    const RuleSnapshot& snapshot = *store_.snapshot();

                    if (cache_key && snapshot.cache) {
                        if (const auto cached = snapshot.cache->lookup(*cache_key)) {
                            record_decision(principal_type, principal_name, operation, resource,
                                            *cached, true);
                            return *cached;
                        }
                    }

                    const bool verdict = scan_rules(snapshot, principal_type, principal_name,
                                                    operation, resource);
                    if (cache_key && snapshot.cache) {
                        snapshot.cache->insert(*cache_key, verdict);
                    }
                    record_decision(principal_type, principal_name, operation, resource,
                                    verdict, false);
                    return verdict;
                }
            }

            // Step 2: 확인 주기 도래 → 쓰기 락으로 승격, 재확인 후 리로드
            {
                const std::unique_lock<std::shared_mutex> lock(mutex_);
                if (governor_.should_check_now(now)) {
                    governor_.record_check(now);
                    reload_locked(false);
                }
            }
            refreshed = true;
        }
    } catch (const std::exception& e) {
        spdlog::error("authorization_engine: internal error evaluating {} on {} by {} {}, "
                      "denying (fail-close): {}",
                      operation, resource, principal_type, principal_name, e.what());
        return false;
    }
}

bool AuthorizationEngine::check_access(const AccessRequest& request) noexcept {
    return check_access(request.principal_type, request.principal_name,
                        request.operation, request.resource);
}

// ---------------------------------------------------------------------------
// authorize
//   세션에 principal 이 없으면 익명 사용자로 평가한다.
// ---------------------------------------------------------------------------
bool AuthorizationEngine::authorize(const AccessRequest& request) noexcept {
    if (request.principal_name.empty() || request.principal_type.empty()) {
        return check_access(kUserPrincipalType, kAnonymousPrincipalName,
                            request.operation, request.resource);
    }
    return check_access(request);
}

// ---------------------------------------------------------------------------
// record_decision
//   로그 실패가 판정 결과를 바꾸지 않도록 여기서 예외를 흡수하고 기록한다.
// ---------------------------------------------------------------------------
void AuthorizationEngine::record_decision(std::string_view principal_type,
                                          std::string_view principal_name,
                                          std::string_view operation,
                                          std::string_view resource,
                                          bool             allowed,
                                          bool             cached) noexcept {
    stats_->on_decision(allowed, cached);
    try {
        if (audit_) {
            DecisionLog entry{};
            entry.principal_type = std::string(principal_type);
            entry.principal_name = std::string(principal_name);
            entry.operation      = std::string(operation);
            entry.resource       = std::string(resource);
            entry.allowed        = allowed;
            entry.cached         = cached;
            entry.timestamp      = std::chrono::system_clock::now();
            audit_->log_decision(entry);
            return;
        }
        if (allowed) {
            spdlog::debug("[ALLOW] Auth request {} on {} by {} {}{}",
                          operation, resource, principal_type, principal_name,
                          cached ? " (cached)" : "");
        } else {
            spdlog::info("[DENY] Auth request {} on {} by {} {}{}",
                         operation, resource, principal_type, principal_name,
                         cached ? " (cached)" : "");
        }
    } catch (const std::exception& e) {
        spdlog::warn("authorization_engine: failed to record decision: {}", e.what());
    }
}

// ---------------------------------------------------------------------------
// 조회
// ---------------------------------------------------------------------------
std::size_t AuthorizationEngine::rule_count() const {
    const std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_.rule_count();
}

bool AuthorizationEngine::caching_enabled() const {
    const std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_.caching_enabled();
}

std::size_t AuthorizationEngine::cache_size() const {
    const std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& cache = store_.snapshot()->cache;
    return cache ? cache->size() : 0;
}

std::uint64_t AuthorizationEngine::cache_hits() const noexcept {
    return stats_->snapshot().cache_hits;
}
