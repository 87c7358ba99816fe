#pragma once

// ---------------------------------------------------------------------------
// config_source.hpp
//
// 규칙 저장소(파일 등)에 대한 추상 인터페이스.
//
// [계약]
// - modification_marker(): 변경 감지용 불투명 비교 값 (예: 파일 mtime).
//   값이 직전과 같으면 엔진은 load_rules() 를 호출하지 않는다.
// - load_rules(): 원본 순서를 유지한 레코드 목록 또는 ConfigError.
//   부분 목록을 반환해서는 안 된다 (all-or-nothing).
//
// [스레드 안전성]
// 엔진은 쓰기 락을 보유한 상태에서만 두 함수를 호출한다 (단일 writer).
// 구현체가 별도 동기화를 가질 필요는 없다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "acl/acl_rule.hpp"   // RawAclRecord
#include "common/types.hpp"   // ConfigError

using ModificationMarker = std::int64_t;

class ConfigSource {
public:
    virtual ~ConfigSource() = default;

    [[nodiscard]] virtual std::expected<ModificationMarker, ConfigError>
    modification_marker() = 0;

    [[nodiscard]] virtual std::expected<std::vector<RawAclRecord>, ConfigError>
    load_rules() = 0;

    // 로그 출력용 식별자 (예: 파일 경로)
    [[nodiscard]] virtual std::string describe() const = 0;
};
