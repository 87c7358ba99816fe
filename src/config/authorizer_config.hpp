#pragma once

// ---------------------------------------------------------------------------
// authorizer_config.hpp
//
// 인가 데몬 설정.
//
// [설정 소스]
// - from_properties : 브로커 설정의 key/value 맵 (acl.authorizer.*)
// - from_file       : 위 key/value 를 담은 YAML 매핑 파일 (데몬 argv[1])
// - from_env        : 설정 파일 없이 단독 실행 시 환경변수
//
// 규칙 파일 위치는 필수. 나머지는 기본값을 갖는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "acl/staleness_governor.hpp"
#include "logger/log_types.hpp"

inline constexpr std::string_view kPropAclPath         = "acl.authorizer.configuration";
inline constexpr std::string_view kPropFreshnessMs     = "acl.authorizer.freshness.ms";
inline constexpr std::string_view kPropCacheThreshold  = "acl.authorizer.cache.threshold";
inline constexpr std::string_view kPropUdsPath         = "acl.authorizer.uds.path";
inline constexpr std::string_view kPropLogPath         = "acl.authorizer.log.path";
inline constexpr std::string_view kPropLogLevel        = "acl.authorizer.log.level";

// freshness window 허용 상한 (ms)
inline constexpr std::int64_t kMaxFreshnessWindowMs = StalenessGovernor::kMaxWindow.count();

struct AuthorizerConfig {
    std::filesystem::path acl_path{};
    std::int64_t          freshness_window_ms{10'000};
    std::size_t           cache_threshold{10};
    std::filesystem::path uds_socket_path{"/tmp/aclgate.sock"};
    std::filesystem::path log_path{"/tmp/aclgate.log"};
    std::string           log_level{"info"};

    // from_properties
    //   acl.authorizer.configuration 누락 또는 숫자 값 오류 → 오류 문자열.
    //   freshness 는 0 이상 kMaxFreshnessWindowMs 이하여야 한다.
    [[nodiscard]] static std::expected<AuthorizerConfig, std::string>
    from_properties(const std::map<std::string, std::string, std::less<>>& props);

    // from_file
    //   최상위가 스칼라 값만 가진 YAML 매핑인 파일을 읽어 from_properties 로 넘긴다.
    //   예)  acl.authorizer.configuration: /etc/aclgate/acl.json
    //        acl.authorizer.freshness.ms: 5000
    //   파일 읽기/파싱 실패, 매핑이 아님, 스칼라가 아닌 값 → 오류 문자열.
    [[nodiscard]] static std::expected<AuthorizerConfig, std::string>
    from_file(const std::filesystem::path& path);

    // from_env
    //   ACL_PATH, ACL_FRESHNESS_MS, ACL_CACHE_THRESHOLD,
    //   UDS_SOCKET_PATH, LOG_PATH, LOG_LEVEL
    //   잘못된 숫자 값은 경고 후 기본값 사용.
    [[nodiscard]] static AuthorizerConfig from_env();
};

// "debug" | "info" | "warn" | "error" (대소문자 무시). 그 외 → kInfo
[[nodiscard]] LogLevel parse_log_level(std::string_view text) noexcept;
