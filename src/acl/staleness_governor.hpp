#pragma once

// ---------------------------------------------------------------------------
// staleness_governor.hpp
//
// "지금 규칙 파일 변경 여부를 확인할 때인가" 를 결정한다. 헤더 전용.
// "실제로 변경되었는가" 는 RuleStore 가 ConfigSource 마커로 판단한다.
//
// [정책]
//   확인 필요 ⇔ now - last_check_at >= window
//   → 요청량과 무관하게 파일 메타데이터 조회는 window 당 최대 1회.
//   → 제공되는 규칙의 최대 지연은 window + 리로드 소요 시간.
//
// [window 상한]
//   window 는 Clock::duration 으로 변환되어 비교된다. 변환이 넘치지 않도록
//   kMaxWindow (Clock::duration 최대값의 절반) 로 잘라서 보관한다.
//
// [스레드 안전성]
// 내부 동기화 없음. should_check_now() 는 엔진 읽기 락 아래에서,
// record_check() 는 쓰기 락 아래에서만 호출된다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <chrono>

class StalenessGovernor {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr std::chrono::milliseconds kDefaultWindow{10'000};
    static constexpr std::chrono::milliseconds kMaxWindow =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()) / 2;

    explicit StalenessGovernor(std::chrono::milliseconds window = kDefaultWindow) noexcept
        : window_(std::min(window, kMaxWindow)) {}

    // 한 번도 확인하지 않았으면 항상 true.
    [[nodiscard]] bool should_check_now(TimePoint now) const noexcept {
        return !checked_ || now - last_check_at_ >= window_;
    }

    // record_check
    //   last_check_at_ 은 앞으로만 진행한다. 과거 시각은 무시.
    void record_check(TimePoint now) noexcept {
        if (!checked_ || now > last_check_at_) {
            last_check_at_ = now;
        }
        checked_ = true;
    }

    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }

    [[nodiscard]] TimePoint last_check_at() const noexcept { return last_check_at_; }

private:
    std::chrono::milliseconds window_;
    TimePoint                 last_check_at_{};
    bool                      checked_{false};
};
