#pragma once

// ---------------------------------------------------------------------------
// acl_loader.hpp
//
// ACL 규칙 파일을 로드하는 로더와, 이를 ConfigSource 로 노출하는
// FileConfigSource.
//
// [파일 형식]
// 최상위가 시퀀스인 YAML 문서. JSON 은 YAML 의 부분집합이므로 JSON 배열
// 파일도 그대로 읽힌다.
//
//   [
//     {"principal_type": "User", "principal": "alice",
//      "operation": "Write", "resource_type": "Topic",
//      "resource_pattern": "orders"}
//   ]
//
// [설계 원칙]
// - load()/parse() 실패 시 std::unexpected(ConfigError) 반환.
//   부분적으로 파싱된 목록을 반환하지 않는다.
// - 필드 값 검증(operation 이름 등)은 make_acl_rule() 소관. 로더는 구조만 본다.
// - 파일 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// acl_loader.hpp → config_source.hpp → acl_rule.hpp (단방향)
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "acl/config_source.hpp"

// ---------------------------------------------------------------------------
// AclLoader
//   상태 없는 정적 로더.
// ---------------------------------------------------------------------------
class AclLoader {
public:
    // load
    //   경로를 정규화한 뒤 파일을 읽어 파싱한다.
    //   파일 없음 / 열기 실패 → kUnreadable
    //   문법 오류 / 구조 오류 → kMalformed (라인/컬럼 포함)
    [[nodiscard]] static std::expected<std::vector<RawAclRecord>, ConfigError>
    load(const std::filesystem::path& acl_path);

    // parse
    //   메모리상의 문서를 파싱한다. origin 은 오류 메시지에 쓰인다.
    [[nodiscard]] static std::expected<std::vector<RawAclRecord>, ConfigError>
    parse(std::string_view text, std::string_view origin = "<memory>");
};

// ---------------------------------------------------------------------------
// FileConfigSource
//   파일 mtime 을 변경 마커로 사용하는 ConfigSource 구현.
// ---------------------------------------------------------------------------
class FileConfigSource : public ConfigSource {
public:
    explicit FileConfigSource(std::filesystem::path acl_path);

    [[nodiscard]] std::expected<ModificationMarker, ConfigError> modification_marker() override;

    [[nodiscard]] std::expected<std::vector<RawAclRecord>, ConfigError> load_rules() override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return acl_path_; }

private:
    std::filesystem::path acl_path_;
};
