#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 판정/리로드 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_decision / on_reload:
//   판정 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   조회 경로에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 판정 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   qps       : 생성 이후 누적 판정 수 / 경과 시간
//   deny_rate : denied / total_checks (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_checks{0};
    std::uint64_t                              allowed{0};
    std::uint64_t                              denied{0};
    std::uint64_t                              cache_hits{0};
    std::uint64_t                              reloads{0};
    std::uint64_t                              reload_failures{0};
    double                                     qps{0.0};
    double                                     deny_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
//   판정 경로 이벤트를 집계하고 StatsSnapshot 을 제공한다.
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : total_checks_{0}
        , allowed_{0}
        , denied_{0}
        , cache_hits_{0}
        , reloads_{0}
        , reload_failures_{0}
        , window_start_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_decision
    //   checkAccess 판정 1건마다 호출 (판정 경로).
    //   cached: 판정 캐시 적중이면 true
    void on_decision(bool allowed, bool cached) noexcept {
        total_checks_.fetch_add(1, std::memory_order_relaxed);
        if (allowed) {
            allowed_.fetch_add(1, std::memory_order_relaxed);
        } else {
            denied_.fetch_add(1, std::memory_order_relaxed);
        }
        if (cached) {
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_reload
    //   변경 확인 결과마다 호출. 변경 없음(changed=false, failed=false)은 집계하지 않는다.
    void on_reload(bool changed, bool failed) noexcept {
        if (failed) {
            reload_failures_.fetch_add(1, std::memory_order_relaxed);
        } else if (changed) {
            reloads_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다 (조회 경로).
    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now          = std::chrono::system_clock::now();
        const auto total        = total_checks_.load(std::memory_order_relaxed);
        const auto allowed      = allowed_.load(std::memory_order_relaxed);
        const auto denied       = denied_.load(std::memory_order_relaxed);
        const auto hits         = cache_hits_.load(std::memory_order_relaxed);
        const auto reloads      = reloads_.load(std::memory_order_relaxed);
        const auto failures     = reload_failures_.load(std::memory_order_relaxed);
        const auto window_start = window_start_.load();

        const double elapsed_sec = std::chrono::duration<double>(
            now - window_start).count();

        double qps = 0.0;
        if (elapsed_sec > 0.0) {
            qps = static_cast<double>(total) / elapsed_sec;
        }

        double deny_rate = 0.0;
        if (total > 0) {
            deny_rate = static_cast<double>(denied) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_checks    = total,
            .allowed         = allowed,
            .denied          = denied,
            .cache_hits      = hits,
            .reloads         = reloads,
            .reload_failures = failures,
            .qps             = qps,
            .deny_rate       = deny_rate,
            .captured_at     = now,
        };
    }

private:
    std::atomic<std::uint64_t>                              total_checks_;
    std::atomic<std::uint64_t>                              allowed_;
    std::atomic<std::uint64_t>                              denied_;
    std::atomic<std::uint64_t>                              cache_hits_;
    std::atomic<std::uint64_t>                              reloads_;
    std::atomic<std::uint64_t>                              reload_failures_;
    std::atomic<std::chrono::system_clock::time_point>      window_start_;
};
