#pragma once

// ---------------------------------------------------------------------------
// authorization_engine.hpp
//
// 브로커의 요청별 인가 훅이 호출하는 판정 엔진.
// (principal 타입, principal 이름, 오퍼레이션, 리소스) → 허용/차단.
//
// [Fail-close 원칙]
// 1. 일치하는 규칙 없음 → 차단 (default deny)
// 2. 규칙 0개 (초기 로드 실패 포함) → 모든 요청 차단
// 3. 엔진 내부 예외 → 차단 (check_access 는 예외를 던지지 않는다)
// 4. 허용은 명시적 허용 규칙이 일치할 때만 반환
//
// [락 규약]
// - shared_mutex 하나가 RuleStore 스냅샷과 판정 캐시를 한 단위로 보호한다.
// - reader (캐시 조회, 규칙 스캔, 캐시 삽입) 는 읽기 락만 보유한다.
//   캐시 삽입이 읽기 락 아래에서 일어나므로 VerdictCache 는 자체적으로
//   동시 삽입에 안전하다.
// - writer (리로드) 는 쓰기 락을 단독 보유한다.
// - 확인 주기가 되면: 읽기 락 해제 → 쓰기 락 획득 → 주기 재확인
//   (다른 스레드가 이미 리로드했을 수 있음) → 필요 시 리로드 → 해제 →
//   새 상태로 재평가. 경합 시 중복 파일 읽기를 막는 double-checked locking.
//
// [블로킹]
// 읽기 경로에는 I/O 가 없다. 리로드는 쓰기 락을 쥔 채 파일을 읽으므로
// 그동안 모든 reader 가 대기한다. 리로드는 freshness window 당 최대 1회.
//
// [인스턴스 독립성]
// 프로세스 전역 상태 없음. 엔진 인스턴스끼리 아무것도 공유하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string_view>

#include "acl/config_source.hpp"
#include "acl/rule_store.hpp"
#include "acl/staleness_governor.hpp"
#include "common/types.hpp"
#include "logger/audit_sink.hpp"
#include "stats/stats_collector.hpp"

// ---------------------------------------------------------------------------
// AuthorizerOptions
//   freshness_window : 규칙 파일 변경 확인 주기. 0 이면 매 요청 확인.
//   cache_threshold  : 규칙 수가 이 값을 초과할 때만 판정 캐시 사용.
// ---------------------------------------------------------------------------
struct AuthorizerOptions {
    std::chrono::milliseconds freshness_window{StalenessGovernor::kDefaultWindow};
    std::size_t               cache_threshold{RuleStore::kDefaultCacheThreshold};
};

class AuthorizationEngine {
public:
    // 생성자
    //   source : 규칙 저장소 (nullptr 불가 → std::invalid_argument)
    //   audit  : 판정/리로드 기록 출력. nullptr 이면 spdlog 로만 기록.
    //   stats  : 통계 수집기. nullptr 이면 엔진이 자체 인스턴스를 만든다.
    //
    //   생성만으로는 규칙을 읽지 않는다. 요청을 받기 전에 initialize() 호출.
    explicit AuthorizationEngine(std::shared_ptr<ConfigSource>   source,
                                 AuthorizerOptions               options = {},
                                 std::shared_ptr<AuditSink>      audit   = nullptr,
                                 std::shared_ptr<StatsCollector> stats   = nullptr);

    ~AuthorizationEngine() = default;

    // 복사/이동 금지 (mutex 보유)
    AuthorizationEngine(const AuthorizationEngine&)            = delete;
    AuthorizationEngine& operator=(const AuthorizationEngine&) = delete;
    AuthorizationEngine(AuthorizationEngine&&)                 = delete;
    AuthorizationEngine& operator=(AuthorizationEngine&&)      = delete;

    // initialize
    //   첫 요청 전에 동기 리로드 1회. 규칙을 게시했으면 true.
    //   실패해도 엔진은 사용 가능하다 (규칙 0개 → 전부 차단, 다음 주기 재시도).
    bool initialize();

    // check_access
    //   판정 1건. 항상 결과를 반환하며 예외를 던지지 않는다.
    //   resource 형식: "<resourceType>:<resourceName>"
    [[nodiscard]] bool check_access(std::string_view principal_type,
                                    std::string_view principal_name,
                                    std::string_view operation,
                                    std::string_view resource) noexcept;

    [[nodiscard]] bool check_access(const AccessRequest& request) noexcept;

    // authorize
    //   브로커 세션 훅. principal 타입이나 이름이 비어 있으면 User:ANONYMOUS 로 평가한다.
    [[nodiscard]] bool authorize(const AccessRequest& request) noexcept;

    // force_reload
    //   운영자 트리거. 확인 주기와 무관하게 쓰기 락 아래에서 리로드.
    //   스냅샷이 실제로 바뀌었으면 true.
    //   결과(kReloaded / kUnchanged / kFailed)는 항상 AuditSink 에 기록된다.
    bool force_reload() noexcept;

    // 운영/테스트용 조회. 읽기 락을 잡는다.
    [[nodiscard]] std::size_t   rule_count() const;
    [[nodiscard]] bool          caching_enabled() const;
    [[nodiscard]] std::size_t   cache_size() const;
    [[nodiscard]] std::uint64_t cache_hits() const noexcept;

    [[nodiscard]] const std::shared_ptr<StatsCollector>& stats() const noexcept { return stats_; }

private:
    // reload_locked
    //   호출자는 쓰기 락을 보유해야 한다. 예외를 밖으로 내보내지 않는다.
    //   manual 이면 변경 없음(kUnchanged)도 AuditSink 에 기록한다.
    bool reload_locked(bool manual) noexcept;

    void record_decision(std::string_view principal_type,
                         std::string_view principal_name,
                         std::string_view operation,
                         std::string_view resource,
                         bool             allowed,
                         bool             cached) noexcept;

    mutable std::shared_mutex       mutex_;
    std::shared_ptr<ConfigSource>   source_;
    RuleStore                       store_;
    StalenessGovernor               governor_;
    std::shared_ptr<AuditSink>      audit_;
    std::shared_ptr<StatsCollector> stats_;
};
