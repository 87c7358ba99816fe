#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 고빈도 로그 경로(log_decision)에서 불필요한 문자열 복사를 줄이기 위해
//   const-ref 파라미터를 사용한다.
// - ALLOW 판정은 kDebug, DENY 판정은 kWarn 으로 기록한다.
//   운영 기본값(kInfo)에서는 DENY 와 리로드만 남는다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "audit_sink.hpp"
#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   DecisionLog / ReloadLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger : public AuditSink {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   초기화 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger() override;

    // 복사/이동 금지 (spdlog 레지스트리에 등록된 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    // log_decision
    //   [고빈도 호출 경로] checkAccess 마다 호출된다.
    void log_decision(const DecisionLog& entry) override;

    // log_reload
    //   리로드 성공/실패를 JSON 으로 기록한다. 실패는 kError.
    void log_reload(const ReloadLog& entry) override;

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    [[nodiscard]] int to_spdlog_level(LogLevel level) const;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
