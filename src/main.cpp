#include "acl/acl_loader.hpp"
#include "acl/authorization_engine.hpp"
#include "config/authorizer_config.hpp"
#include "logger/structured_logger.hpp"
#include "stats/stats_collector.hpp"
#include "stats/uds_server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <utility>

// ---------------------------------------------------------------------------
// main
//   사용법: aclgate [config.yaml]
//   설정 파일을 주면 acl.authorizer.* 키를 읽고, 없으면 환경변수를 읽는다.
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 ───────────────────────────────────────────────────────
    AuthorizerConfig config;
    if (argc > 1) {
        auto loaded = AuthorizerConfig::from_file(argv[1]);
        if (!loaded) {
            spdlog::critical("aclgate: invalid configuration: {}", loaded.error());
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    } else {
        config = AuthorizerConfig::from_env();
    }

    spdlog::info("Starting aclgate authorizer");
    spdlog::info("ACL file: {}", config.acl_path.string());
    spdlog::info("Freshness window: {} ms, cache threshold: {} rules",
                 config.freshness_window_ms, config.cache_threshold);
    spdlog::info("UDS socket: {}", config.uds_socket_path.string());
    spdlog::info("Log level: {}", config.log_level);

    try {
        // ── 로깅 / 통계 ─────────────────────────────────────────────────
        auto audit = std::make_shared<StructuredLogger>(parse_log_level(config.log_level),
                                                        config.log_path);
        auto stats = std::make_shared<StatsCollector>();

        // ── 판정 엔진 ───────────────────────────────────────────────────
        AuthorizerOptions options;
        options.freshness_window = std::chrono::milliseconds{config.freshness_window_ms};
        options.cache_threshold  = config.cache_threshold;

        auto engine = std::make_shared<AuthorizationEngine>(
            std::make_shared<FileConfigSource>(config.acl_path), options, audit, stats);
        engine->initialize();

        // ── 운영 소켓 + 시그널 ──────────────────────────────────────────
        boost::asio::io_context ioc;
        UdsServer uds{config.uds_socket_path, stats, engine, ioc};

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signo);
            uds.stop();
            ioc.stop();
        });

        boost::asio::co_spawn(ioc, uds.run(), boost::asio::detached);
        ioc.run();
    } catch (const std::exception& e) {
        spdlog::critical("aclgate failed: {}", e.what());
        return EXIT_FAILURE;
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("aclgate stopped");

    return EXIT_SUCCESS;
}
