#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// Unix Domain Socket 운영 서버. 운영 CLI 에 통계, 수동 리로드, 판정 진단을 노출한다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임:
//     [4byte LE 길이][JSON 본문]
//     예: {"command": "stats", "version": 1}
//
//   응답 프레임:
//     [4byte LE 길이][JSON 본문]
//     성공: {"ok": true,  "payload": { ... }}
//     실패: {"ok": false, "error": "<메시지>"}
//
// [지원 커맨드]
//   "stats"      : StatsSnapshot 반환
//   "acl_reload" : AuthorizationEngine::force_reload() 호출
//                  payload: {"changed":bool,"rules":N}
//   "check"      : 필드 principal_type, principal, operation, resource 로 판정 1건
//                  payload: {"allowed":bool}
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입.
//   run() 은 co_return 까지 accept 루프를 유지한다.
//   stop() 은 acceptor 를 닫아 run() 을 종료시킨다.
//
// [격리 원칙]
//   UDS I/O 실패는 판정 경로로 전파되지 않는다.
//   engine 이 nullptr 이면 acl_reload / check 는 오류 응답.
// ---------------------------------------------------------------------------

#include "stats_collector.hpp"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace asio = boost::asio;

class AuthorizationEngine;

// ---------------------------------------------------------------------------
// parse_string_field
//   JSON 요청 문자열에서 "<key>":"<value>" 를 단순 파싱한다.
//   키가 없거나 값이 문자열이 아니면 빈 문자열.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string parse_string_field(std::string_view json, std::string_view key);

class UdsServer {
public:
    // 생성자
    //   socket_path : Unix Domain Socket 파일 경로
    //   stats       : 공유 통계 수집기 (read-only 접근만 수행)
    //   engine      : 판정 엔진 (nullptr 허용)
    //   ioc         : 외부에서 주입된 Asio io_context
    UdsServer(const std::filesystem::path&         socket_path,
              std::shared_ptr<StatsCollector>      stats,
              std::shared_ptr<AuthorizationEngine> engine,
              asio::io_context&                    ioc);

    ~UdsServer();

    UdsServer(const UdsServer&)            = delete;
    UdsServer& operator=(const UdsServer&) = delete;
    UdsServer(UdsServer&&)                 = delete;
    UdsServer& operator=(UdsServer&&)      = delete;

    // run
    //   UDS 소켓 바인드/리슨 후 accept 루프를 실행한다.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 의 accept 루프를 종료한다.
    void stop();

    // dispatch
    //   요청 JSON 1건 → 응답 JSON. 소켓과 무관하게 호출 가능.
    [[nodiscard]] std::string dispatch(std::string_view request_json);

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    std::filesystem::path                  socket_path_;
    std::shared_ptr<StatsCollector>        stats_;
    std::shared_ptr<AuthorizationEngine>   engine_;
    asio::io_context&                      ioc_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
