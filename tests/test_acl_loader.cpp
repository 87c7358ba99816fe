// ---------------------------------------------------------------------------
// test_acl_loader.cpp
//
// AclLoader / FileConfigSource 단위 테스트.
//
// [테스트 범위]
// - JSON 배열 규칙 파일 파싱 (원본 형식 그대로)
// - YAML 블록 시퀀스 파싱
// - 빈 배열 → 규칙 0개 (오류 아님), 빈 문서 → kMalformed
// - 구조 오류: 최상위 맵, 맵이 아닌 원소, 스칼라가 아닌 필드, 문법 오류
// - 누락 필드는 빈 문자열로 남는다 (검증은 make_acl_rule 소관)
// - 파일 없음 → kUnreadable
// - FileConfigSource: mtime 마커, 파일 수정 시 마커 변경
// - config/acl.json 샘플 파일 로딩
// ---------------------------------------------------------------------------

#include "acl/acl_loader.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

std::filesystem::path temp_acl_path(const char* tag) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("test_acl_loader_" + std::to_string(::getpid()) + "_" +
            std::to_string(counter.fetch_add(1)) + "_" + tag + ".json");
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

constexpr const char* kTwoRulesJson = R"([
  {"principal_type": "User", "principal": "alice", "operation": "Read",
   "resource_type": "Topic", "resource_pattern": "orders"},
  {"principal_type": "User", "principal": "*", "operation": "Describe",
   "resource_type": "Topic", "resource_pattern": "public.*"}
])";

}  // namespace

// ===========================================================================
// parse
// ===========================================================================

TEST(AclLoaderParse, JsonArray) {
    const auto records = AclLoader::parse(kTwoRulesJson);
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records->size(), 2u);

    EXPECT_EQ((*records)[0].principal_type, "User");
    EXPECT_EQ((*records)[0].principal, "alice");
    EXPECT_EQ((*records)[0].operation, "Read");
    EXPECT_EQ((*records)[0].resource_type, "Topic");
    EXPECT_EQ((*records)[0].resource_pattern, "orders");

    // 원본 순서 유지
    EXPECT_EQ((*records)[1].principal, "*");
    EXPECT_EQ((*records)[1].resource_pattern, "public.*");
}

TEST(AclLoaderParse, YamlBlockSequence) {
    const auto records = AclLoader::parse(
        "- principal_type: User\n"
        "  principal: bob\n"
        "  operation: Write\n"
        "  resource_type: Topic\n"
        "  resource_pattern: \"payments\"\n");
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].principal, "bob");
    EXPECT_EQ((*records)[0].operation, "Write");
}

TEST(AclLoaderParse, EmptyArray_ZeroRules) {
    const auto records = AclLoader::parse("[]");
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE(records->empty());
}

TEST(AclLoaderParse, EmptyDocument_Malformed) {
    const auto records = AclLoader::parse("");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, ConfigErrorCode::kMalformed);
}

TEST(AclLoaderParse, TopLevelMap_Malformed) {
    const auto records = AclLoader::parse(R"({"principal": "alice"})");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, ConfigErrorCode::kMalformed);
}

TEST(AclLoaderParse, NonMapElement_Malformed) {
    const auto records = AclLoader::parse(R"(["alice", "bob"])");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, ConfigErrorCode::kMalformed);
    EXPECT_NE(records.error().message.find("rule #0"), std::string::npos);
}

TEST(AclLoaderParse, NonScalarField_Malformed) {
    const auto records = AclLoader::parse(
        R"([{"principal_type": "User", "principal": ["alice", "bob"], "operation": "Read",
             "resource_type": "Topic", "resource_pattern": "orders"}])");
    ASSERT_FALSE(records.has_value());
    EXPECT_NE(records.error().message.find("principal"), std::string::npos);
}

TEST(AclLoaderParse, SyntaxError_MalformedWithPosition) {
    const auto records = AclLoader::parse(R"([{"principal_type": "User", )", "broken.json");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, ConfigErrorCode::kMalformed);
    EXPECT_NE(records.error().message.find("line"), std::string::npos);
    EXPECT_EQ(records.error().context, "broken.json");
}

TEST(AclLoaderParse, MissingField_LeftEmpty) {
    const auto records = AclLoader::parse(
        R"([{"principal_type": "User", "principal": "alice", "operation": "Read",
             "resource_type": "Topic"}])");
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE((*records)[0].resource_pattern.empty());
}

TEST(AclLoaderParse, AllOrNothing_OneBadRecordFailsAll) {
    const auto records = AclLoader::parse(
        R"([{"principal_type": "User", "principal": "alice", "operation": "Read",
             "resource_type": "Topic", "resource_pattern": "orders"},
            42])");
    ASSERT_FALSE(records.has_value());
    EXPECT_NE(records.error().message.find("rule #1"), std::string::npos);
}

// ===========================================================================
// load
// ===========================================================================

TEST(AclLoaderLoad, MissingFile_Unreadable) {
    const auto records = AclLoader::load("/nonexistent/dir/acl.json");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, ConfigErrorCode::kUnreadable);
}

TEST(AclLoaderLoad, ReadsFile) {
    const auto path = temp_acl_path("read");
    write_file(path, kTwoRulesJson);

    const auto records = AclLoader::load(path);
    ASSERT_TRUE(records.has_value()) << records.error().message;
    EXPECT_EQ(records->size(), 2u);

    std::filesystem::remove(path);
}

TEST(AclLoaderLoad, SampleConfigFile) {
    const std::filesystem::path sample = std::filesystem::path(ACLGATE_SOURCE_DIR) / "config/acl.json";
    const auto records = AclLoader::load(sample);
    ASSERT_TRUE(records.has_value()) << records.error().message;
    EXPECT_FALSE(records->empty());
}

// ===========================================================================
// FileConfigSource
// ===========================================================================

TEST(FileConfigSource, MissingFile_MarkerUnreadable) {
    FileConfigSource source("/nonexistent/dir/acl.json");
    const auto marker = source.modification_marker();
    ASSERT_FALSE(marker.has_value());
    EXPECT_EQ(marker.error().code, ConfigErrorCode::kUnreadable);
}

TEST(FileConfigSource, MarkerChangesWhenFileIsModified) {
    const auto path = temp_acl_path("marker");
    write_file(path, "[]");

    FileConfigSource source(path);
    const auto first = source.modification_marker();
    ASSERT_TRUE(first.has_value());

    // 같은 파일 → 같은 마커
    const auto again = source.modification_marker();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*first, *again);

    // mtime 해상도와 무관하게 변경이 보이도록 명시적으로 앞당긴다
    write_file(path, kTwoRulesJson);
    std::filesystem::last_write_time(
        path, std::filesystem::last_write_time(path) + std::chrono::seconds{2});

    const auto second = source.modification_marker();
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);

    const auto records = source.load_rules();
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(records->size(), 2u);
    EXPECT_EQ(source.describe(), path.string());

    std::filesystem::remove(path);
}
