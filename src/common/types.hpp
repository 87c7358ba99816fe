#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// 공통 상수
//   kUserPrincipalType      : 판정 캐시 대상이 되는 "named user" principal 타입
//   kAnonymousPrincipalName : principal 이 비어 있을 때 사용하는 이름
//   kWildcard               : 규칙 필드의 와일드카드 표기
// ---------------------------------------------------------------------------
inline constexpr std::string_view kUserPrincipalType      = "User";
inline constexpr std::string_view kAnonymousPrincipalName = "ANONYMOUS";
inline constexpr std::string_view kWildcard               = "*";

// ---------------------------------------------------------------------------
// AccessRequest
//   브로커가 요청마다 추출하여 엔진에 전달하는 불변 튜플.
//   resource 형식: "<resourceType>:<resourceName>" (예: "Topic:orders")
// ---------------------------------------------------------------------------
struct AccessRequest {
    std::string principal_type{};   // 예: "User"
    std::string principal_name{};   // 인증된 사용자 이름
    std::string operation{};        // 예: "Read", "Write"
    std::string resource{};         // "<type>:<name>"
};

// ---------------------------------------------------------------------------
// ConfigErrorCode
//   규칙 파일 로드/파싱 단계의 오류 분류.
//   두 경우 모두 엔진은 직전 스냅샷을 유지한다 (fail-safe).
// ---------------------------------------------------------------------------
enum class ConfigErrorCode : std::uint8_t {
    kUnreadable = 0,  // 파일 없음, 권한 거부, I/O 오류
    kMalformed  = 1,  // 문법 오류, 필수 필드 누락, 알 수 없는 값
};

// ---------------------------------------------------------------------------
// ConfigError
//   std::expected<T, ConfigError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ConfigError {
    ConfigErrorCode code{ConfigErrorCode::kMalformed};
    std::string     message{};  // 사람이 읽을 수 있는 오류 설명
    std::string     context{};  // 오류 위치 (파일 경로, 레코드 인덱스 등)
};

[[nodiscard]] inline std::string_view to_string(ConfigErrorCode code) noexcept {
    switch (code) {
        case ConfigErrorCode::kUnreadable: return "unreadable";
        case ConfigErrorCode::kMalformed:  return "malformed";
    }
    return "unknown";
}
