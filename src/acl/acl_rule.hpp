#pragma once

// ---------------------------------------------------------------------------
// acl_rule.hpp
//
// 단일 ACL 규칙(AclRule)과 그 매칭 술어 정의.
//
// [규칙 의미]
// - 명시적 허용 규칙만 존재한다 (deny 규칙 없음). 일치하는 규칙이 하나라도
//   있으면 허용, 없으면 차단 (default deny).
// - AclRule 은 make_acl_rule() 로만 생성되며 생성 후 변경되지 않는다.
//
// [resource_pattern 문법]
//   "*"        → kAny     : 모든 리소스 이름
//   "orders-*" → kPrefix  : "orders-" 로 시작하는 이름 (마지막 '*' 1개)
//   "orders"   → kLiteral : 정확히 일치 (대소문자 구분)
//   그 외 위치의 '*', 빈 패턴 → 규칙 파일 오류 (kMalformed)
//
// [순환 의존성]
// acl_rule.hpp → common/types.hpp (단방향)
// ❌ acl_rule.hpp → rule_store.hpp 금지
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// AclOperation
//   브로커 오퍼레이션. kAny 는 규칙 쪽 와일드카드("*")에만 사용된다.
//   kUnknown 은 요청에서 인식하지 못한 값으로, 어떤 규칙과도 일치하지 않는다.
// ---------------------------------------------------------------------------
enum class AclOperation : std::uint8_t {
    kRead            = 0,
    kWrite           = 1,
    kCreate          = 2,
    kDelete          = 3,
    kAlter           = 4,
    kDescribe        = 5,
    kClusterAction   = 6,
    kDescribeConfigs = 7,
    kAlterConfigs    = 8,
    kIdempotentWrite = 9,
    kAny             = 10,
    kUnknown         = 11,
};

// ---------------------------------------------------------------------------
// ResourceType
//   kAny / kUnknown 의 의미는 AclOperation 과 같다.
// ---------------------------------------------------------------------------
enum class ResourceType : std::uint8_t {
    kTopic           = 0,
    kGroup           = 1,
    kCluster         = 2,
    kTransactionalId = 3,
    kDelegationToken = 4,
    kAny             = 5,
    kUnknown         = 6,
};

enum class PatternMode : std::uint8_t {
    kLiteral = 0,
    kPrefix  = 1,
    kAny     = 2,
};

[[nodiscard]] AclOperation     operation_from_string(std::string_view s) noexcept;
[[nodiscard]] std::string_view operation_to_string(AclOperation op) noexcept;
[[nodiscard]] ResourceType     resource_type_from_string(std::string_view s) noexcept;
[[nodiscard]] std::string_view resource_type_to_string(ResourceType type) noexcept;

// ---------------------------------------------------------------------------
// ParsedResource
//   "<type>:<name>" 을 첫 번째 ':' 기준으로 분리한 결과.
//   ':' 가 없거나 타입을 인식하지 못하면 type == kUnknown.
// ---------------------------------------------------------------------------
struct ParsedResource {
    ResourceType type{ResourceType::kUnknown};
    std::string  name{};
};

[[nodiscard]] ParsedResource parse_resource(std::string_view resource);

// ---------------------------------------------------------------------------
// RawAclRecord
//   ConfigSource 가 돌려주는 검증 전 레코드. 필드는 규칙 파일 키와 1:1.
// ---------------------------------------------------------------------------
struct RawAclRecord {
    std::string principal_type{};
    std::string principal{};
    std::string operation{};
    std::string resource_type{};
    std::string resource_pattern{};
};

// ---------------------------------------------------------------------------
// AclRule
//   검증이 끝난 불변 규칙.
//
//   [스레드 안전성]
//   matches() 는 const 이며 공유 상태를 변경하지 않는다. 읽기 락만 보유한
//   여러 스레드에서 동시에 호출해도 안전하다.
// ---------------------------------------------------------------------------
class AclRule {
public:
    // matches
    //   네 가지 비교(principal 타입/이름, 오퍼레이션, 리소스)가 모두 일치하면 true.
    [[nodiscard]] bool matches(std::string_view principal_type,
                               std::string_view principal_name,
                               std::string_view operation,
                               std::string_view resource) const;

    // 핫패스용: 요청 문자열을 한 번만 파싱하고 규칙 전체에 재사용한다.
    [[nodiscard]] bool matches(std::string_view      principal_type,
                               std::string_view      principal_name,
                               AclOperation          operation,
                               const ParsedResource& resource) const noexcept;

    [[nodiscard]] const std::string& principal_type() const noexcept { return principal_type_; }
    [[nodiscard]] const std::string& principal() const noexcept { return principal_; }
    [[nodiscard]] AclOperation       operation() const noexcept { return operation_; }
    [[nodiscard]] ResourceType       resource_type() const noexcept { return resource_type_; }
    [[nodiscard]] PatternMode        pattern_mode() const noexcept { return pattern_mode_; }

    // kPrefix 이면 끝의 '*' 를 뗀 접두사, kAny 이면 "*"
    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

    // 로그용 "User:alice Write Topic:orders*" 형태
    [[nodiscard]] std::string describe() const;

private:
    friend std::expected<AclRule, ConfigError> make_acl_rule(const RawAclRecord& raw);

    AclRule() = default;

    [[nodiscard]] bool pattern_matches(std::string_view name) const noexcept;

    std::string  principal_type_{};
    std::string  principal_{};
    AclOperation operation_{AclOperation::kUnknown};
    ResourceType resource_type_{ResourceType::kUnknown};
    PatternMode  pattern_mode_{PatternMode::kLiteral};
    std::string  pattern_{};
};

// ---------------------------------------------------------------------------
// make_acl_rule
//   RawAclRecord 를 검증하여 AclRule 을 만든다.
//
//   실패 (kMalformed):
//   - 빈 필드
//   - principal_type 이 "*" (타입 와일드카드 미지원)
//   - 알 수 없는 operation / resource_type
//   - 잘못된 resource_pattern ('*' 위치 오류)
//
//   호출자(RuleStore)는 한 레코드라도 실패하면 후보 스냅샷 전체를 버린다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<AclRule, ConfigError> make_acl_rule(const RawAclRecord& raw);
