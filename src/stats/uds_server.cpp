// ---------------------------------------------------------------------------
// uds_server.cpp
//
// UdsServer 구현. 요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
// ---------------------------------------------------------------------------

#include "stats/uds_server.hpp"

#include "acl/authorization_engine.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace {

// ---------------------------------------------------------------------------
// json_escape
//   JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환).
// ---------------------------------------------------------------------------
std::string json_escape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]{};
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// captured_at 는 Unix epoch 밀리초
std::string serialize_snapshot(const StatsSnapshot& s) {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    return fmt::format(
        R"({{"total_checks":{},"allowed":{},"denied":{},"cache_hits":{},"reloads":{},"reload_failures":{},"qps":{:.4f},"deny_rate":{:.4f},"captured_at_ms":{}}})",
        s.total_checks,
        s.allowed,
        s.denied,
        s.cache_hits,
        s.reloads,
        s.reload_failures,
        s.qps,
        s.deny_rate,
        epoch_ms
    );
}

std::string make_ok_response(std::string_view data) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", data);
}

std::string make_error_response(std::string_view msg) {
    return fmt::format(R"({{"ok":false,"error":"{}"}})", json_escape(msg));
}

std::array<uint8_t, 4> encode_le4(uint32_t val) {
    return {
        static_cast<uint8_t>(val),
        static_cast<uint8_t>(val >> 8),
        static_cast<uint8_t>(val >> 16),
        static_cast<uint8_t>(val >> 24),
    };
}

uint32_t decode_le4(const std::array<uint8_t, 4>& buf) {
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

// 단일 클라이언트에서 수신할 최대 메시지 크기 (4MiB)
constexpr uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

} // namespace

// ---------------------------------------------------------------------------
// parse_string_field
//   "<key>":"<value>" 패턴만 지원. 키 앞뒤 공백, 콜론 뒤 공백 허용.
// ---------------------------------------------------------------------------
std::string parse_string_field(std::string_view json, std::string_view key) {
    const std::string quoted = fmt::format(R"("{}")", key);
    std::size_t pos = json.find(quoted);
    if (pos == std::string_view::npos) {
        return {};
    }
    pos += quoted.size();
    while (pos < json.size() && json[pos] == ' ') { ++pos; }
    if (pos >= json.size() || json[pos] != ':') {
        return {};
    }
    ++pos;
    while (pos < json.size() && json[pos] == ' ') { ++pos; }
    if (pos >= json.size() || json[pos] != '"') {
        return {};
    }
    ++pos; // 여는 따옴표
    std::string value;
    while (pos < json.size()) {
        const char c = json[pos++];
        if (c == '"') { break; }
        if (c == '\\' && pos < json.size()) {
            value += json[pos++]; // 단순 escape 처리
        } else {
            value += c;
        }
    }
    return value;
}

// ---------------------------------------------------------------------------
// UdsServer 생성자/소멸자
// ---------------------------------------------------------------------------
UdsServer::UdsServer(const std::filesystem::path&         socket_path,
                     std::shared_ptr<StatsCollector>      stats,
                     std::shared_ptr<AuthorizationEngine> engine,
                     asio::io_context&                    ioc)
    : socket_path_{socket_path}
    , stats_{std::move(stats)}
    , engine_{std::move(engine)}
    , ioc_{ioc}
    , acceptor_{ioc}
{}

UdsServer::~UdsServer() {
    stop();
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------
void UdsServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor cancel error: {}", cancel_ec.message());
        }

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor close error: {}", close_ec.message());
        }
    };

    // acceptor 소유 스레드(io_context)에서 정리해 TSan 경합을 방지한다.
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

// ---------------------------------------------------------------------------
// run
//   기존 소켓 파일 제거 → bind/listen → accept 루프.
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[uds_server] failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[uds_server] open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("[uds_server] bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[uds_server] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[uds_server] listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[uds_server] accept loop stopped");
            } else {
                spdlog::error("[uds_server] accept error: {}", accept_ec.message());
            }
            co_return;
        }

        asio::co_spawn(
            ioc_,
            handle_client(std::move(client_socket)),
            asio::detached
        );
    }
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
std::string UdsServer::dispatch(std::string_view request_json) {
    const std::string cmd = parse_string_field(request_json, "command");

    if (cmd == "stats") {
        return make_ok_response(serialize_snapshot(stats_->snapshot()));
    }

    if (cmd == "acl_reload") {
        if (!engine_) {
            return make_error_response("authorization engine not attached");
        }
        const bool changed = engine_->force_reload();
        spdlog::info("[uds_server] acl_reload requested: changed={}", changed);
        return make_ok_response(fmt::format(R"({{"changed":{},"rules":{}}})",
                                            changed, engine_->rule_count()));
    }

    if (cmd == "check") {
        if (!engine_) {
            return make_error_response("authorization engine not attached");
        }
        const std::string principal_type = parse_string_field(request_json, "principal_type");
        const std::string principal      = parse_string_field(request_json, "principal");
        const std::string operation      = parse_string_field(request_json, "operation");
        const std::string resource       = parse_string_field(request_json, "resource");
        if (principal_type.empty() || principal.empty() || operation.empty() || resource.empty()) {
            return make_error_response(
                "check requires principal_type, principal, operation, resource");
        }
        const bool allowed = engine_->check_access(principal_type, principal, operation, resource);
        return make_ok_response(fmt::format(R"({{"allowed":{}}})", allowed));
    }

    if (cmd.empty()) {
        spdlog::warn("[uds_server] missing or malformed 'command' field");
        return make_error_response("missing or malformed 'command' field");
    }

    spdlog::warn("[uds_server] unknown command '{}'", cmd);
    return make_error_response(fmt::format("unknown command '{}'", cmd));
}

// ---------------------------------------------------------------------------
// handle_client
//   1. 4바이트 LE 헤더로 요청 크기 읽기
//   2. JSON 바디 읽기
//   3. 커맨드 디스패치
//   4. 4바이트 LE 헤더 + JSON 바디 응답 송신
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::handle_client(
    asio::local::stream_protocol::socket socket)
{
    // ── 요청 헤더 읽기 ──────────────────────────────────────────────────
    std::array<uint8_t, 4>    req_hdr{};
    boost::system::error_code hdr_ec;
    const std::size_t hdr_n = co_await asio::async_read(
        socket, asio::buffer(req_hdr),
        asio::redirect_error(asio::use_awaitable, hdr_ec));

    if (hdr_ec) {
        if (hdr_ec != asio::error::eof) {
            spdlog::warn("[uds_server] handle_client: read header error: {}", hdr_ec.message());
        }
        co_return;
    }
    if (hdr_n != 4) {
        spdlog::warn("[uds_server] handle_client: short header ({} bytes)", hdr_n);
        co_return;
    }

    const uint32_t body_len = decode_le4(req_hdr);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("[uds_server] handle_client: invalid body length {}", body_len);
        co_return;
    }

    // ── 요청 바디 읽기 ──────────────────────────────────────────────────
    std::vector<char>         body_buf(body_len);
    boost::system::error_code body_ec;
    const std::size_t body_n = co_await asio::async_read(
        socket, asio::buffer(body_buf),
        asio::redirect_error(asio::use_awaitable, body_ec));

    if (body_ec) {
        spdlog::warn("[uds_server] handle_client: read body error: {}", body_ec.message());
        co_return;
    }
    if (body_n != body_len) {
        spdlog::warn("[uds_server] handle_client: short body ({}/{} bytes)", body_n, body_len);
        co_return;
    }

    // ── 커맨드 디스패치 ─────────────────────────────────────────────────
    const std::string response_body = dispatch(std::string_view{body_buf.data(), body_n});

    // ── 응답 송신 ───────────────────────────────────────────────────────
    const auto resp_hdr = encode_le4(static_cast<uint32_t>(response_body.size()));
    std::array<asio::const_buffer, 2> bufs{
        asio::buffer(resp_hdr),
        asio::buffer(response_body),
    };
    boost::system::error_code write_ec;
    const std::size_t write_n = co_await asio::async_write(
        socket, bufs, asio::redirect_error(asio::use_awaitable, write_ec));

    if (write_ec) {
        spdlog::warn("[uds_server] handle_client: write error: {}", write_ec.message());
        co_return;
    }

    spdlog::debug("[uds_server] handled response_bytes={}", write_n);
}
