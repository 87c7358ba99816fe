#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - acl/ 헤더를 include 하지 않는다. 엔진이 문자열로 변환하여 채운다.
//
// [민감정보 취급 주의]
// - principal_name 은 인증된 사용자 이름이다. 운영 환경의 로그 보존 정책을
//   별도로 적용할 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// DecisionLog
//   checkAccess 판정 1건.
//   cached: 판정 캐시에서 제공되었으면 true ("(cached)" 표기와 동일)
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::string                           principal_type{};
    std::string                           principal_name{};
    std::string                           operation{};
    std::string                           resource{};
    bool                                  allowed{false};
    bool                                  cached{false};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// ReloadOutcome
//   kReloaded  : 새 스냅샷 게시
//   kUnchanged : 마커 동일, 아무것도 하지 않음 (수동 리로드에서만 기록)
//   kFailed    : 읽기/파싱 실패, 직전 스냅샷 유지
// ---------------------------------------------------------------------------
enum class ReloadOutcome : std::uint8_t {
    kReloaded  = 0,
    kUnchanged = 1,
    kFailed    = 2,
};

// ---------------------------------------------------------------------------
// ReloadLog
//   규칙 리로드 시도 1건. 주기 확인의 kUnchanged 는 기록하지 않는다 (window 마다 발생).
//   error: kFailed 일 때만 채워진다.
// ---------------------------------------------------------------------------
struct ReloadLog {
    std::string                           source{};       // 규칙 파일 경로 등
    ReloadOutcome                         outcome{ReloadOutcome::kUnchanged};
    std::size_t                           rule_count{0};  // 게시 후 활성 규칙 수
    bool                                  caching{false}; // 판정 캐시 활성 여부
    std::string                           error{};
    std::chrono::system_clock::time_point timestamp{};
};
