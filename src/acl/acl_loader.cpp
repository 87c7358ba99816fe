// ---------------------------------------------------------------------------
// acl_loader.cpp
//
// ACL 규칙 파일을 RawAclRecord 목록으로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 레코드 하나라도 구조가 잘못되면 전체 실패.
// - 필드 누락은 빈 문자열로 두고 make_acl_rule() 에서 거부되게 한다.
//   단, 필드가 스칼라가 아니면 (리스트/맵) 여기서 바로 kMalformed.
// - yaml-cpp 예외는 이 파일 밖으로 전파하지 않는다.
//
// [알려진 한계]
// - 파일 mtime 해상도는 파일시스템에 의존한다. 같은 해상도 구간 안에서
//   두 번 수정되면 두 번째 변경은 다음 mtime 변경 때까지 감지되지 않는다.
// ---------------------------------------------------------------------------

#include "acl/acl_loader.hpp"

#include <chrono>
#include <optional>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// 규칙 파일 키
constexpr const char* kPrincipalTypeKey   = "principal_type";
constexpr const char* kPrincipalKey       = "principal";
constexpr const char* kOperationKey       = "operation";
constexpr const char* kResourceTypeKey    = "resource_type";
constexpr const char* kResourcePatternKey = "resource_pattern";

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 필드 읽기.
// 없거나 null 이면 빈 문자열 (검증은 make_acl_rule 에서).
// 스칼라가 아니면 std::nullopt → 호출자가 kMalformed 처리.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> read_field(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::string{};
    }
    if (!node.IsScalar()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

[[nodiscard]] std::expected<RawAclRecord, ConfigError>
parse_record(const YAML::Node& node, std::size_t index, std::string_view origin) {
    if (!node.IsMap()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kMalformed,
            fmt::format("acl_loader: rule #{} is not a map", index),
            std::string(origin)
        });
    }

    RawAclRecord record{};
    const std::pair<const char*, std::string*> fields[] = {
        {kPrincipalTypeKey,   &record.principal_type},
        {kPrincipalKey,       &record.principal},
        {kOperationKey,       &record.operation},
        {kResourceTypeKey,    &record.resource_type},
        {kResourcePatternKey, &record.resource_pattern},
    };

    for (const auto& [key, target] : fields) {
        auto value = read_field(node[key]);
        if (!value.has_value()) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kMalformed,
                fmt::format("acl_loader: rule #{} field '{}' is not a scalar", index, key),
                std::string(origin)
            });
        }
        *target = std::move(*value);
    }
    return record;
}

[[nodiscard]] std::expected<std::vector<RawAclRecord>, ConfigError>
parse_root(const YAML::Node& root, std::string_view origin) {
    // 빈 문서는 빈 규칙 목록이 아니라 오류로 본다 (잘린 파일 방지)
    if (!root || !root.IsSequence()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kMalformed,
            "acl_loader: top-level element must be a sequence of rules",
            std::string(origin)
        });
    }

    std::vector<RawAclRecord> records;
    records.reserve(root.size());
    std::size_t index = 0;
    for (const auto& node : root) {
        auto record = parse_record(node, index, origin);
        if (!record) {
            return std::unexpected(std::move(record.error()));
        }
        records.push_back(std::move(*record));
        ++index;
    }
    return records;
}

}  // namespace

// ---------------------------------------------------------------------------
// AclLoader::parse 구현
// ---------------------------------------------------------------------------
std::expected<std::vector<RawAclRecord>, ConfigError>
AclLoader::parse(std::string_view text, std::string_view origin) {
    try {
        const YAML::Node root = YAML::Load(std::string(text));
        return parse_root(root, origin);
    } catch (const YAML::ParserException& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kMalformed,
            fmt::format("acl_loader: parse error at line {}, col {}: {}",
                        e.mark.line + 1,   // yaml-cpp는 0-based
                        e.mark.column + 1,
                        e.msg),
            std::string(origin)
        });
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kMalformed,
            fmt::format("acl_loader: YAML error: {}", e.what()),
            std::string(origin)
        });
    }
}

// ---------------------------------------------------------------------------
// AclLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<std::vector<RawAclRecord>, ConfigError>
AclLoader::load(const std::filesystem::path& acl_path) {
    // 1. 경로 정규화 (path traversal 방지 목적)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(acl_path, ec);
    if (ec) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kUnreadable,
            fmt::format("acl_loader: cannot resolve path '{}': {}",
                        acl_path.string(), ec.message()),
            acl_path.string()
        });
    }

    spdlog::debug("acl_loader: loading rules from '{}'", canonical_path.string());

    // 2. 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kUnreadable,
            fmt::format("acl_loader: cannot open file '{}': {}",
                        canonical_path.string(), e.what()),
            canonical_path.string()
        });
    } catch (const YAML::ParserException& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kMalformed,
            fmt::format("acl_loader: parse error in '{}' at line {}, col {}: {}",
                        canonical_path.string(),
                        e.mark.line + 1,
                        e.mark.column + 1,
                        e.msg),
            canonical_path.string()
        });
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kMalformed,
            fmt::format("acl_loader: YAML error in '{}': {}",
                        canonical_path.string(), e.what()),
            canonical_path.string()
        });
    }

    // 3. 구조 파싱
    try {
        auto records = parse_root(root, canonical_path.string());
        if (records) {
            spdlog::info("acl_loader: read {} rules from '{}'",
                         records->size(), canonical_path.string());
        }
        return records;
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kMalformed,
            fmt::format("acl_loader: error reading rules in '{}': {}",
                        canonical_path.string(), e.what()),
            canonical_path.string()
        });
    }
}

// ---------------------------------------------------------------------------
// FileConfigSource
// ---------------------------------------------------------------------------
FileConfigSource::FileConfigSource(std::filesystem::path acl_path)
    : acl_path_(std::move(acl_path)) {}

std::expected<ModificationMarker, ConfigError> FileConfigSource::modification_marker() {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(acl_path_, ec);
    if (ec) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kUnreadable,
            fmt::format("acl_loader: cannot stat '{}': {}", acl_path_.string(), ec.message()),
            acl_path_.string()
        });
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        mtime.time_since_epoch()).count();
}

std::expected<std::vector<RawAclRecord>, ConfigError> FileConfigSource::load_rules() {
    return AclLoader::load(acl_path_);
}

std::string FileConfigSource::describe() const {
    return acl_path_.string();
}
