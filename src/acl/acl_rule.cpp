// ---------------------------------------------------------------------------
// acl_rule.cpp
//
// AclRule 검증 및 매칭 구현.
//
// [매칭 순서]
// 비용이 낮고 탈락 확률이 높은 비교부터 수행한다:
//   enum 비교 (operation, resource_type) → principal_type → principal → pattern
// 순서는 결과에 영향을 주지 않는다 (모든 비교의 AND).
//
// [대소문자]
// principal / pattern 비교는 대소문자를 구분한다. 브로커 principal 과
// 토픽 이름이 대소문자를 구분하기 때문이다.
// ---------------------------------------------------------------------------

#include "acl/acl_rule.hpp"

#include <array>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace {

// enum 값 순서와 일치해야 한다 (kAny / kUnknown 제외)
constexpr std::array<std::pair<std::string_view, AclOperation>, 10> kOperationNames{{
    {"Read",            AclOperation::kRead},
    {"Write",           AclOperation::kWrite},
    {"Create",          AclOperation::kCreate},
    {"Delete",          AclOperation::kDelete},
    {"Alter",           AclOperation::kAlter},
    {"Describe",        AclOperation::kDescribe},
    {"ClusterAction",   AclOperation::kClusterAction},
    {"DescribeConfigs", AclOperation::kDescribeConfigs},
    {"AlterConfigs",    AclOperation::kAlterConfigs},
    {"IdempotentWrite", AclOperation::kIdempotentWrite},
}};

constexpr std::array<std::pair<std::string_view, ResourceType>, 5> kResourceTypeNames{{
    {"Topic",           ResourceType::kTopic},
    {"Group",           ResourceType::kGroup},
    {"Cluster",         ResourceType::kCluster},
    {"TransactionalId", ResourceType::kTransactionalId},
    {"DelegationToken", ResourceType::kDelegationToken},
}};

ConfigError malformed(std::string message, const RawAclRecord& raw) {
    return ConfigError{
        ConfigErrorCode::kMalformed,
        std::move(message),
        fmt::format("{}:{} {} {}:{}",
                    raw.principal_type, raw.principal, raw.operation,
                    raw.resource_type, raw.resource_pattern)
    };
}

}  // namespace

AclOperation operation_from_string(std::string_view s) noexcept {
    if (s == kWildcard) {
        return AclOperation::kAny;
    }
    for (const auto& [name, op] : kOperationNames) {
        if (name == s) {
            return op;
        }
    }
    return AclOperation::kUnknown;
}

std::string_view operation_to_string(AclOperation op) noexcept {
    switch (op) {
        case AclOperation::kAny:     return kWildcard;
        case AclOperation::kUnknown: return "Unknown";
        default:
            return kOperationNames[static_cast<std::size_t>(op)].first;
    }
}

ResourceType resource_type_from_string(std::string_view s) noexcept {
    if (s == kWildcard) {
        return ResourceType::kAny;
    }
    for (const auto& [name, type] : kResourceTypeNames) {
        if (name == s) {
            return type;
        }
    }
    return ResourceType::kUnknown;
}

std::string_view resource_type_to_string(ResourceType type) noexcept {
    switch (type) {
        case ResourceType::kAny:     return kWildcard;
        case ResourceType::kUnknown: return "Unknown";
        default:
            return kResourceTypeNames[static_cast<std::size_t>(type)].first;
    }
}

// ---------------------------------------------------------------------------
// parse_resource
//   "Topic:orders" → {kTopic, "orders"}
//   이름에 ':' 가 포함될 수 있으므로 첫 번째 ':' 에서만 분리한다.
//   요청 쪽 "*" 타입은 와일드카드가 아니라 알 수 없는 값이다.
// ---------------------------------------------------------------------------
ParsedResource parse_resource(std::string_view resource) {
    const auto colon = resource.find(':');
    if (colon == std::string_view::npos) {
        return ParsedResource{ResourceType::kUnknown, std::string(resource)};
    }

    ResourceType type = resource_type_from_string(resource.substr(0, colon));
    if (type == ResourceType::kAny) {
        type = ResourceType::kUnknown;
    }
    return ParsedResource{type, std::string(resource.substr(colon + 1))};
}

bool AclRule::pattern_matches(std::string_view name) const noexcept {
    switch (pattern_mode_) {
        case PatternMode::kAny:
            return true;
        case PatternMode::kPrefix:
            return name.starts_with(pattern_);
        case PatternMode::kLiteral:
            return name == pattern_;
    }
    return false;
}

bool AclRule::matches(std::string_view      principal_type,
                      std::string_view      principal_name,
                      AclOperation          operation,
                      const ParsedResource& resource) const noexcept {
    if (operation == AclOperation::kUnknown || operation == AclOperation::kAny) {
        return false;
    }
    if (operation_ != AclOperation::kAny && operation_ != operation) {
        return false;
    }
    if (resource.type == ResourceType::kUnknown || resource.type == ResourceType::kAny) {
        return false;
    }
    if (resource_type_ != ResourceType::kAny && resource_type_ != resource.type) {
        return false;
    }
    if (principal_type_ != principal_type) {
        return false;
    }
    if (principal_ != kWildcard && principal_ != principal_name) {
        return false;
    }
    return pattern_matches(resource.name);
}

bool AclRule::matches(std::string_view principal_type,
                      std::string_view principal_name,
                      std::string_view operation,
                      std::string_view resource) const {
    return matches(principal_type, principal_name,
                   operation_from_string(operation), parse_resource(resource));
}

std::string AclRule::describe() const {
    return fmt::format("{}:{} {} {}:{}{}",
                       principal_type_, principal_,
                       operation_to_string(operation_),
                       resource_type_to_string(resource_type_), pattern_,
                       pattern_mode_ == PatternMode::kPrefix ? "*" : "");
}

// ---------------------------------------------------------------------------
// make_acl_rule 구현
//
// [All-or-nothing]
// 이 함수는 레코드 하나만 판단한다. 후보 스냅샷 전체 거부는 RuleStore 소관.
// ---------------------------------------------------------------------------
std::expected<AclRule, ConfigError> make_acl_rule(const RawAclRecord& raw) {
    if (raw.principal_type.empty() || raw.principal.empty() || raw.operation.empty() ||
        raw.resource_type.empty()  || raw.resource_pattern.empty()) {
        return std::unexpected(malformed("acl_rule: required field is empty", raw));
    }

    // principal 타입은 와일드카드를 허용하지 않는다
    if (raw.principal_type == kWildcard) {
        return std::unexpected(malformed("acl_rule: principal_type must not be a wildcard", raw));
    }

    const AclOperation op = operation_from_string(raw.operation);
    if (op == AclOperation::kUnknown) {
        return std::unexpected(malformed(
            fmt::format("acl_rule: unknown operation '{}'", raw.operation), raw));
    }

    const ResourceType type = resource_type_from_string(raw.resource_type);
    if (type == ResourceType::kUnknown) {
        return std::unexpected(malformed(
            fmt::format("acl_rule: unknown resource_type '{}'", raw.resource_type), raw));
    }

    AclRule rule;
    rule.principal_type_ = raw.principal_type;
    rule.principal_      = raw.principal;
    rule.operation_      = op;
    rule.resource_type_  = type;

    const std::string& pattern = raw.resource_pattern;
    const auto star = pattern.find('*');
    if (pattern == kWildcard) {
        rule.pattern_mode_ = PatternMode::kAny;
        rule.pattern_      = pattern;
    } else if (star == std::string::npos) {
        rule.pattern_mode_ = PatternMode::kLiteral;
        rule.pattern_      = pattern;
    } else if (star == pattern.size() - 1) {
        rule.pattern_mode_ = PatternMode::kPrefix;
        rule.pattern_      = pattern.substr(0, star);
    } else {
        return std::unexpected(malformed(
            fmt::format("acl_rule: '*' is only allowed as the last character of "
                        "resource_pattern '{}'", pattern), raw));
    }

    return rule;
}
