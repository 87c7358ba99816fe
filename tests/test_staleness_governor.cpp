// ---------------------------------------------------------------------------
// test_staleness_governor.cpp
//
// StalenessGovernor 단위 테스트. 시각은 직접 주입한다 (sleep 없음).
//
// [테스트 범위]
// - 최초 호출은 항상 확인 필요
// - window 안에서는 확인 불필요, 경계(now == last + window)에서 확인 필요
// - record_check 는 과거 시각으로 되돌아가지 않는다
// - window == 0 이면 매번 확인
// - 아주 큰 window 는 kMaxWindow 로 잘리고 확인 주기가 오지 않는다
// ---------------------------------------------------------------------------

#include "acl/staleness_governor.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace std::chrono_literals;

TEST(StalenessGovernor, DefaultWindowIsTenSeconds) {
    const StalenessGovernor governor;
    EXPECT_EQ(governor.window(), 10'000ms);
}

TEST(StalenessGovernor, NeverCheckedIsDue) {
    const StalenessGovernor governor(10'000ms);
    EXPECT_TRUE(governor.should_check_now(StalenessGovernor::Clock::now()));
    EXPECT_TRUE(governor.should_check_now(StalenessGovernor::TimePoint{}));
}

TEST(StalenessGovernor, NotDueInsideWindow) {
    StalenessGovernor governor(10'000ms);
    const auto t0 = StalenessGovernor::Clock::now();
    governor.record_check(t0);

    EXPECT_FALSE(governor.should_check_now(t0));
    EXPECT_FALSE(governor.should_check_now(t0 + 9'999ms));
    EXPECT_TRUE(governor.should_check_now(t0 + 10'000ms));
    EXPECT_TRUE(governor.should_check_now(t0 + 30s));
}

TEST(StalenessGovernor, RecordCheckNeverMovesBackwards) {
    StalenessGovernor governor(10'000ms);
    const auto t0 = StalenessGovernor::Clock::now();
    governor.record_check(t0 + 5s);
    governor.record_check(t0);

    EXPECT_EQ(governor.last_check_at(), t0 + 5s);
    EXPECT_FALSE(governor.should_check_now(t0 + 14s));
    EXPECT_TRUE(governor.should_check_now(t0 + 15s));
}

TEST(StalenessGovernor, ZeroWindowAlwaysDue) {
    StalenessGovernor governor(0ms);
    const auto t0 = StalenessGovernor::Clock::now();
    governor.record_check(t0);
    EXPECT_TRUE(governor.should_check_now(t0));
}

TEST(StalenessGovernor, HugeWindowIsClampedAndNeverDue) {
    StalenessGovernor governor(
        std::chrono::milliseconds{std::numeric_limits<std::int64_t>::max()});
    EXPECT_EQ(governor.window(), StalenessGovernor::kMaxWindow);

    const auto t0 = StalenessGovernor::Clock::now();
    governor.record_check(t0);
    EXPECT_FALSE(governor.should_check_now(t0));
    EXPECT_FALSE(governor.should_check_now(t0 + std::chrono::hours{24 * 365}));
}
