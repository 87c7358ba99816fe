// ---------------------------------------------------------------------------
// test_authorization_engine.cpp
//
// AuthorizationEngine 단위/통합 테스트.
//
// [테스트 범위]
// - Fail-close: 규칙 없음, 초기 로드 실패, 알 수 없는 오퍼레이션/리소스
// - 기본 판정: 명시 허용만 허용, 네 필드 모두 일치해야 함
// - 와일드카드 / 접두사 규칙
// - 판정 캐시: 규칙 > 10 일 때만, User 타입만, 리로드 시 무효화,
//   이름에 구분자 문자가 들어 있어도 다른 요청과 항목을 공유하지 않음
// - Hot reload: force_reload(), freshness window 경과 후 자동 반영,
//   window 안에서는 마커 조회 없음
// - 잘못된 규칙 파일로 리로드 → 직전 규칙 유지
// - authorize(): principal 없으면 User:ANONYMOUS
// - AuditSink / StatsCollector 로 판정과 리로드가 전달됨
//   (수동 리로드는 변경 없음도 기록, 주기 확인은 변경/실패만 기록)
// - 아주 큰 freshness window: 주기 확인 없음, 수동 리로드는 동작
// - 다수 스레드의 check_access 와 리로드 동시 실행
// - 실제 파일(FileConfigSource) 기반 end-to-end
//
// [알려진 한계]
// - freshness 테스트는 sleep 을 사용한다. window 를 짧게(50ms) 잡고
//   그 두 배 이상 대기하여 부하 환경에서도 여유를 둔다.
// ---------------------------------------------------------------------------

#include "acl/acl_loader.hpp"
#include "acl/authorization_engine.hpp"
#include "fake_config_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;

namespace {

// alice 는 orders 를 읽을 수 있다 + filler 규칙으로 규칙 수를 맞춘다
std::vector<RawAclRecord> rules_with_alice(std::size_t total) {
    std::vector<RawAclRecord> rules;
    rules.push_back(make_record("alice", "Read", "Topic", "orders"));
    while (rules.size() < total) {
        rules.push_back(make_record("filler-" + std::to_string(rules.size()),
                                    "Read", "Topic", "unused"));
    }
    return rules;
}

std::vector<RawAclRecord> filler_rules(std::size_t total) {
    std::vector<RawAclRecord> rules;
    while (rules.size() < total) {
        rules.push_back(make_record("filler-" + std::to_string(rules.size()),
                                    "Read", "Topic", "unused"));
    }
    return rules;
}

AuthorizerOptions options_with_window(std::chrono::milliseconds window) {
    AuthorizerOptions options;
    options.freshness_window = window;
    return options;
}

// 판정/리로드 기록을 메모리에 모으는 AuditSink
class RecordingSink : public AuditSink {
public:
    void log_decision(const DecisionLog& entry) override {
        const std::lock_guard<std::mutex> lock(mutex_);
        decisions_.push_back(entry);
    }

    void log_reload(const ReloadLog& entry) override {
        const std::lock_guard<std::mutex> lock(mutex_);
        reloads_.push_back(entry);
    }

    std::vector<DecisionLog> decisions() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return decisions_;
    }

    std::vector<ReloadLog> reloads() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return reloads_;
    }

private:
    mutable std::mutex       mutex_;
    std::vector<DecisionLog> decisions_;
    std::vector<ReloadLog>   reloads_;
};

std::filesystem::path temp_acl_path(const char* tag) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("test_engine_" + std::to_string(::getpid()) + "_" +
            std::to_string(counter.fetch_add(1)) + "_" + tag + ".json");
}

void write_acl_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::file_time_type previous{};
    const bool existed = std::filesystem::exists(path);
    if (existed) {
        previous = std::filesystem::last_write_time(path);
    }
    {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }
    // mtime 해상도와 무관하게 변경이 보이도록 앞당긴다
    if (existed) {
        std::filesystem::last_write_time(path, previous + 2s);
    }
}

}  // namespace

// ===========================================================================
// Fail-close
// ===========================================================================

TEST(AuthorizationEngine, NullSource_Throws) {
    EXPECT_THROW(AuthorizationEngine(nullptr), std::invalid_argument);
}

TEST(AuthorizationEngine, NoRules_DeniesEverything) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules({});

    AuthorizationEngine engine(source);
    engine.initialize();

    EXPECT_EQ(engine.rule_count(), 0u);
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "ops-admin", "Alter", "Cluster:kafka-cluster"));
}

TEST(AuthorizationEngine, InitialLoadFailure_DeniesEverything) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_load_error(ConfigError{ConfigErrorCode::kUnreadable, "missing", "fake://acl"});

    AuthorizationEngine engine(source);
    EXPECT_FALSE(engine.initialize());
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(engine.stats()->snapshot().reload_failures, 1u);
}

TEST(AuthorizationEngine, ChecksBeforeInitialize_LoadOnDemand) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(1));

    // initialize() 없이도 첫 요청이 확인 주기로 간주되어 로드된다
    AuthorizationEngine engine(source);
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
}

// ===========================================================================
// 기본 판정
// ===========================================================================

TEST(AuthorizationEngine, ExplicitGrantOnly) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(1));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());

    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "alice", "Write", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "bob", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:payments"));
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Group:orders"));
    EXPECT_FALSE(engine.check_access("ServiceAccount", "alice", "Read", "Topic:orders"));
}

TEST(AuthorizationEngine, UnknownRequestValues_Denied) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules({make_record("ops-admin", "*", "*", "*")});

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());

    EXPECT_TRUE(engine.check_access("User", "ops-admin", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "ops-admin", "Publish", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "ops-admin", "Read", "Queue:orders"));
    EXPECT_FALSE(engine.check_access("User", "ops-admin", "Read", "orders"));
}

TEST(AuthorizationEngine, WildcardAndPrefixRules) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules({
        make_record("*",           "Describe", "Topic", "public"),
        make_record("billing-svc", "Write",    "Topic", "billing.*"),
    });

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());

    EXPECT_TRUE(engine.check_access("User", "anyone", "Describe", "Topic:public"));
    EXPECT_FALSE(engine.check_access("User", "anyone", "Read", "Topic:public"));
    EXPECT_TRUE(engine.check_access("User", "billing-svc", "Write", "Topic:billing.invoices"));
    EXPECT_FALSE(engine.check_access("User", "billing-svc", "Write", "Topic:audit"));
}

TEST(AuthorizationEngine, AccessRequestOverload) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(1));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());

    EXPECT_TRUE(engine.check_access(AccessRequest{"User", "alice", "Read", "Topic:orders"}));
    EXPECT_FALSE(engine.check_access(AccessRequest{"User", "alice", "Delete", "Topic:orders"}));
}

// ===========================================================================
// authorize: 익명 fallback
// ===========================================================================

TEST(AuthorizationEngine, Authorize_EmptyPrincipalIsAnonymous) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules({make_record("ANONYMOUS", "Read", "Topic", "public")});

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());

    EXPECT_TRUE(engine.authorize(AccessRequest{"", "", "Read", "Topic:public"}));
    EXPECT_FALSE(engine.authorize(AccessRequest{"", "", "Read", "Topic:orders"}));
    EXPECT_FALSE(engine.authorize(AccessRequest{"User", "alice", "Read", "Topic:public"}));
}

// ===========================================================================
// 판정 캐시
// ===========================================================================

TEST(AuthorizationEngine, AtThreshold_NoCaching) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(10));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());

    EXPECT_FALSE(engine.caching_enabled());
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(engine.cache_hits(), 0u);
    EXPECT_EQ(engine.cache_size(), 0u);
}

TEST(AuthorizationEngine, AboveThreshold_RepeatedRequestIsCached) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(11));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());

    EXPECT_TRUE(engine.caching_enabled());
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(engine.cache_hits(), 0u);
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(engine.cache_hits(), 1u);

    // 차단 판정도 캐시된다
    EXPECT_FALSE(engine.check_access("User", "bob", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "bob", "Read", "Topic:orders"));
    EXPECT_EQ(engine.cache_hits(), 2u);
    EXPECT_EQ(engine.cache_size(), 2u);
}

TEST(AuthorizationEngine, NonUserPrincipal_NotCached) {
    auto source = std::make_shared<FakeConfigSource>();
    auto rules  = filler_rules(11);
    rules.push_back(make_record("etl", "Read", "Topic", "orders", "ServiceAccount"));
    source->set_rules(std::move(rules));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());
    ASSERT_TRUE(engine.caching_enabled());

    EXPECT_TRUE(engine.check_access("ServiceAccount", "etl", "Read", "Topic:orders"));
    EXPECT_TRUE(engine.check_access("ServiceAccount", "etl", "Read", "Topic:orders"));
    EXPECT_EQ(engine.cache_hits(), 0u);
    EXPECT_EQ(engine.cache_size(), 0u);
}

// 필드 경계만 다른 요청이 다른 요청의 캐시된 허용 판정을 받으면 안 된다
TEST(AuthorizationEngine, SeparatorInNames_DoesNotShareCachedVerdict) {
    auto source = std::make_shared<FakeConfigSource>();
    auto rules  = filler_rules(11);
    rules.push_back(make_record("y", "Write", "Group", "a*"));
    source->set_rules(std::move(rules));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());
    ASSERT_TRUE(engine.caching_enabled());

    EXPECT_TRUE(engine.check_access("User", "y", "Write", "Group:a|Read|x"));
    EXPECT_FALSE(engine.check_access("User", "x|Write|y", "Read", "Group:a"));
    EXPECT_EQ(engine.cache_hits(), 0u);
    EXPECT_EQ(engine.cache_size(), 2u);

    // 각각의 캐시 항목은 자기 판정을 그대로 돌려준다
    EXPECT_FALSE(engine.check_access("User", "x|Write|y", "Read", "Group:a"));
    EXPECT_TRUE(engine.check_access("User", "y", "Write", "Group:a|Read|x"));
    EXPECT_EQ(engine.cache_hits(), 2u);
}

TEST(AuthorizationEngine, Reload_InvalidatesCachedVerdicts) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(11));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());
    ASSERT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    ASSERT_EQ(engine.cache_size(), 1u);

    // alice 권한 회수 (규칙 수는 그대로 > 10)
    source->set_rules(filler_rules(11));
    ASSERT_TRUE(engine.force_reload());

    EXPECT_EQ(engine.cache_size(), 0u);
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));
}

// ===========================================================================
// Hot reload
// ===========================================================================

TEST(AuthorizationEngine, ForceReload_ReportsChange) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(filler_rules(1));

    AuthorizationEngine engine(source);
    ASSERT_TRUE(engine.initialize());
    EXPECT_FALSE(engine.force_reload());  // 마커 동일
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));

    source->set_rules(rules_with_alice(2));
    EXPECT_TRUE(engine.force_reload());
    EXPECT_EQ(engine.rule_count(), 2u);
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
}

TEST(AuthorizationEngine, WithinWindow_NoMarkerQueries) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(filler_rules(1));

    AuthorizationEngine engine(source, options_with_window(10'000ms));
    ASSERT_TRUE(engine.initialize());
    const int queries_after_init = source->marker_queries();

    source->set_rules(rules_with_alice(2));
    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    }
    EXPECT_EQ(source->marker_queries(), queries_after_init);
    EXPECT_EQ(engine.rule_count(), 1u);
}

TEST(AuthorizationEngine, AfterWindow_ChangeBecomesVisible) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(filler_rules(1));

    AuthorizationEngine engine(source, options_with_window(50ms));
    ASSERT_TRUE(engine.initialize());

    source->set_rules(rules_with_alice(2));
    std::this_thread::sleep_for(150ms);

    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(engine.rule_count(), 2u);
    EXPECT_EQ(engine.stats()->snapshot().reloads, 2u);
}

TEST(AuthorizationEngine, ZeroWindow_EveryRequestSeesLatestRules) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(filler_rules(1));

    AuthorizationEngine engine(source, options_with_window(0ms));
    ASSERT_TRUE(engine.initialize());
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));

    source->set_rules(rules_with_alice(2));
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));

    source->set_rules(filler_rules(2));
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));
}

TEST(AuthorizationEngine, MalformedReload_KeepsServingPreviousRules) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(3));

    AuthorizationEngine engine(source, options_with_window(0ms));
    ASSERT_TRUE(engine.initialize());

    // 잘못된 레코드가 섞인 후보 → 전체 거부
    auto broken = rules_with_alice(3);
    broken.push_back(make_record("bob", "Read", "Topic", "ord*ers"));
    source->set_rules(std::move(broken));

    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "bob", "Read", "Topic:ordXers"));
    EXPECT_EQ(engine.rule_count(), 3u);
    EXPECT_GE(engine.stats()->snapshot().reload_failures, 1u);

    // 읽기 실패도 마찬가지
    source->set_load_error(ConfigError{ConfigErrorCode::kUnreadable, "io", "fake://acl"});
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(engine.rule_count(), 3u);
}

// ===========================================================================
// Audit / stats
// ===========================================================================

TEST(AuthorizationEngine, DecisionsAndReloadsReachAuditSink) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(11));
    auto sink  = std::make_shared<RecordingSink>();
    auto stats = std::make_shared<StatsCollector>();

    AuthorizationEngine engine(source, AuthorizerOptions{}, sink, stats);
    ASSERT_TRUE(engine.initialize());

    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "bob", "Write", "Topic:orders"));

    const auto decisions = sink->decisions();
    ASSERT_EQ(decisions.size(), 3u);
    EXPECT_TRUE(decisions[0].allowed);
    EXPECT_FALSE(decisions[0].cached);
    EXPECT_TRUE(decisions[1].allowed);
    EXPECT_TRUE(decisions[1].cached);
    EXPECT_FALSE(decisions[2].allowed);
    EXPECT_EQ(decisions[2].principal_name, "bob");
    EXPECT_EQ(decisions[2].operation, "Write");
    EXPECT_EQ(decisions[2].resource, "Topic:orders");

    const auto reloads = sink->reloads();
    ASSERT_EQ(reloads.size(), 1u);
    EXPECT_EQ(reloads[0].outcome, ReloadOutcome::kReloaded);
    EXPECT_EQ(reloads[0].rule_count, 11u);
    EXPECT_TRUE(reloads[0].caching);
    EXPECT_EQ(reloads[0].source, "fake://acl");

    const auto snap = stats->snapshot();
    EXPECT_EQ(snap.total_checks, 3u);
    EXPECT_EQ(snap.allowed, 2u);
    EXPECT_EQ(snap.denied, 1u);
    EXPECT_EQ(snap.cache_hits, 1u);
    EXPECT_EQ(snap.reloads, 1u);
}

TEST(AuthorizationEngine, FailedReloadIsAudited) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(1));
    auto sink = std::make_shared<RecordingSink>();

    AuthorizationEngine engine(source, AuthorizerOptions{}, sink);
    ASSERT_TRUE(engine.initialize());

    source->set_load_error(ConfigError{ConfigErrorCode::kMalformed, "bad json", "fake://acl"});
    EXPECT_FALSE(engine.force_reload());

    const auto reloads = sink->reloads();
    ASSERT_EQ(reloads.size(), 2u);
    EXPECT_EQ(reloads[1].outcome, ReloadOutcome::kFailed);
    EXPECT_EQ(reloads[1].rule_count, 1u);
    EXPECT_NE(reloads[1].error.find("bad json"), std::string::npos);
}

TEST(AuthorizationEngine, ManualReloadWithoutChangeIsAudited) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(3));
    auto sink  = std::make_shared<RecordingSink>();
    auto stats = std::make_shared<StatsCollector>();

    AuthorizationEngine engine(source, AuthorizerOptions{}, sink, stats);
    ASSERT_TRUE(engine.initialize());
    EXPECT_FALSE(engine.force_reload());

    const auto reloads = sink->reloads();
    ASSERT_EQ(reloads.size(), 2u);
    EXPECT_EQ(reloads[0].outcome, ReloadOutcome::kReloaded);
    EXPECT_EQ(reloads[1].outcome, ReloadOutcome::kUnchanged);
    EXPECT_EQ(reloads[1].rule_count, 3u);
    EXPECT_TRUE(reloads[1].error.empty());

    // 변경 없는 리로드는 통계의 리로드/실패 횟수에 들어가지 않는다
    const auto snap = stats->snapshot();
    EXPECT_EQ(snap.reloads, 1u);
    EXPECT_EQ(snap.reload_failures, 0u);
}

TEST(AuthorizationEngine, PeriodicCheckWithoutChangeIsNotAudited) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(1));
    auto sink = std::make_shared<RecordingSink>();

    AuthorizationEngine engine(source, options_with_window(0ms), sink);
    ASSERT_TRUE(engine.initialize());
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));

    EXPECT_GE(source->marker_queries(), 3);
    ASSERT_EQ(sink->reloads().size(), 1u);
}

TEST(AuthorizationEngine, HugeFreshnessWindow_NoPeriodicChecks) {
    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(rules_with_alice(1));

    const std::chrono::milliseconds huge{std::numeric_limits<std::int64_t>::max()};
    AuthorizationEngine engine(source, options_with_window(huge));
    ASSERT_TRUE(engine.initialize());
    const int queries_after_init = source->marker_queries();

    source->set_rules(filler_rules(1));
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(source->marker_queries(), queries_after_init);

    // 수동 리로드는 window 와 무관하다
    EXPECT_TRUE(engine.force_reload());
    EXPECT_FALSE(engine.check_access("User", "alice", "Read", "Topic:orders"));
}

// ===========================================================================
// 인스턴스 독립성 / 동시성
// ===========================================================================

TEST(AuthorizationEngine, IndependentInstances) {
    auto source_a = std::make_shared<FakeConfigSource>();
    auto source_b = std::make_shared<FakeConfigSource>();
    source_a->set_rules(rules_with_alice(1));
    source_b->set_rules(filler_rules(1));

    AuthorizationEngine engine_a(source_a);
    AuthorizationEngine engine_b(source_b);
    ASSERT_TRUE(engine_a.initialize());
    ASSERT_TRUE(engine_b.initialize());

    EXPECT_TRUE(engine_a.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_FALSE(engine_b.check_access("User", "alice", "Read", "Topic:orders"));
}

TEST(AuthorizationEngine, ConcurrentChecksDuringReloads) {
    constexpr int kReaders          = 8;
    constexpr int kChecksPerReader  = 2000;
    constexpr int kReloads          = 50;

    // alice 는 두 규칙 집합 모두에서 허용, bob 은 집합 B 에서만 허용
    auto set_a = rules_with_alice(12);
    auto set_b = rules_with_alice(12);
    set_b.push_back(make_record("bob", "Read", "Topic", "orders"));

    auto source = std::make_shared<FakeConfigSource>();
    source->set_rules(set_a);

    AuthorizationEngine engine(source, options_with_window(1ms));
    ASSERT_TRUE(engine.initialize());

    std::atomic<bool> alice_denied{false};
    std::atomic<bool> stop{false};

    std::vector<std::thread> readers;
    readers.reserve(kReaders);
    for (int t = 0; t < kReaders; ++t) {
        readers.emplace_back([&engine, &alice_denied]() {
            for (int i = 0; i < kChecksPerReader; ++i) {
                if (!engine.check_access("User", "alice", "Read", "Topic:orders")) {
                    alice_denied.store(true);
                }
                // bob 의 결과는 어느 집합이 활성인지에 따라 달라진다
                (void)engine.check_access("User", "bob", "Read", "Topic:orders");
                (void)engine.check_access("User", "carol", "Write", "Topic:orders");
            }
        });
    }

    std::thread writer([&]() {
        for (int i = 0; i < kReloads && !stop.load(); ++i) {
            source->set_rules((i % 2) == 0 ? set_b : set_a);
            engine.force_reload();
            std::this_thread::sleep_for(1ms);
        }
    });

    for (auto& th : readers) { th.join(); }
    stop.store(true);
    writer.join();

    EXPECT_FALSE(alice_denied.load());
    EXPECT_FALSE(engine.check_access("User", "carol", "Write", "Topic:orders"));
    EXPECT_EQ(engine.stats()->snapshot().total_checks,
              static_cast<std::uint64_t>(kReaders * kChecksPerReader * 3 + 1));
}

// ===========================================================================
// 실제 파일 end-to-end
// ===========================================================================

TEST(AuthorizationEngine, FileBacked_HotReload) {
    const auto path = temp_acl_path("e2e");
    write_acl_file(path, R"([
      {"principal_type": "User", "principal": "alice", "operation": "Read",
       "resource_type": "Topic", "resource_pattern": "orders"}
    ])");

    AuthorizationEngine engine(std::make_shared<FileConfigSource>(path),
                               options_with_window(0ms));
    ASSERT_TRUE(engine.initialize());
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_FALSE(engine.check_access("User", "bob", "Read", "Topic:orders"));

    // bob 추가
    write_acl_file(path, R"([
      {"principal_type": "User", "principal": "alice", "operation": "Read",
       "resource_type": "Topic", "resource_pattern": "orders"},
      {"principal_type": "User", "principal": "bob", "operation": "Read",
       "resource_type": "Topic", "resource_pattern": "orders"}
    ])");
    EXPECT_TRUE(engine.check_access("User", "bob", "Read", "Topic:orders"));

    // 잘린 파일 → 직전 규칙 유지
    write_acl_file(path, R"([{"principal_type": "User", )");
    EXPECT_TRUE(engine.check_access("User", "bob", "Read", "Topic:orders"));
    EXPECT_EQ(engine.rule_count(), 2u);

    // 파일 삭제 → 직전 규칙 유지
    std::filesystem::remove(path);
    EXPECT_TRUE(engine.check_access("User", "alice", "Read", "Topic:orders"));
    EXPECT_EQ(engine.rule_count(), 2u);
}
