// ---------------------------------------------------------------------------
// authorizer_config.cpp
// ---------------------------------------------------------------------------

#include "config/authorizer_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// 공백 없는 10진 정수 전체가 소비되어야 성공
template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

const std::string* find_prop(const std::map<std::string, std::string, std::less<>>& props,
                             std::string_view key) {
    const auto it = props.find(key);
    return it == props.end() ? nullptr : &it->second;
}

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

template <typename T>
T env_num(const char* name, T default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    auto parsed = parse_number<T>(val);
    if constexpr (std::is_signed_v<T>) {
        if (parsed && *parsed < 0) {
            parsed.reset();
        }
    }
    if (!parsed) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
    return *parsed;
}

} // namespace

// ---------------------------------------------------------------------------
// from_properties
// ---------------------------------------------------------------------------
std::expected<AuthorizerConfig, std::string>
AuthorizerConfig::from_properties(const std::map<std::string, std::string, std::less<>>& props) {
    AuthorizerConfig config;

    const auto* acl_path = find_prop(props, kPropAclPath);
    if (acl_path == nullptr || acl_path->empty()) {
        return std::unexpected(std::string("missing required property '") +
                               std::string(kPropAclPath) + "'");
    }
    config.acl_path = *acl_path;

    if (const auto* v = find_prop(props, kPropFreshnessMs)) {
        const auto ms = parse_number<std::int64_t>(*v);
        if (!ms || *ms < 0) {
            return std::unexpected(std::string(kPropFreshnessMs) +
                                   ": expected non-negative integer, got '" + *v + "'");
        }
        if (*ms > kMaxFreshnessWindowMs) {
            return std::unexpected(std::string(kPropFreshnessMs) + ": value '" + *v +
                                   "' exceeds maximum " + std::to_string(kMaxFreshnessWindowMs));
        }
        config.freshness_window_ms = *ms;
    }

    if (const auto* v = find_prop(props, kPropCacheThreshold)) {
        const auto threshold = parse_number<std::size_t>(*v);
        if (!threshold) {
            return std::unexpected(std::string(kPropCacheThreshold) +
                                   ": expected non-negative integer, got '" + *v + "'");
        }
        config.cache_threshold = *threshold;
    }

    if (const auto* v = find_prop(props, kPropUdsPath); v != nullptr && !v->empty()) {
        config.uds_socket_path = *v;
    }
    if (const auto* v = find_prop(props, kPropLogPath); v != nullptr && !v->empty()) {
        config.log_path = *v;
    }
    if (const auto* v = find_prop(props, kPropLogLevel); v != nullptr && !v->empty()) {
        config.log_level = *v;
    }

    return config;
}

// ---------------------------------------------------------------------------
// from_file
// ---------------------------------------------------------------------------
std::expected<AuthorizerConfig, std::string>
AuthorizerConfig::from_file(const std::filesystem::path& path) {
    std::map<std::string, std::string, std::less<>> props;
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return std::unexpected("config file '" + path.string() +
                                   "': top level must be a mapping");
        }
        for (const auto& entry : root) {
            const auto key = entry.first.as<std::string>();
            if (!entry.second.IsScalar()) {
                return std::unexpected("config file '" + path.string() + "': value of '" +
                                       key + "' must be a scalar");
            }
            props.insert_or_assign(key, entry.second.as<std::string>());
        }
    } catch (const YAML::BadFile& e) {
        return std::unexpected("cannot open config file '" + path.string() + "': " + e.what());
    } catch (const YAML::Exception& e) {
        return std::unexpected("config file '" + path.string() + "': " + e.what());
    }

    spdlog::debug("authorizer_config: read {} properties from '{}'", props.size(), path.string());
    return from_properties(props);
}

// ---------------------------------------------------------------------------
// from_env
// ---------------------------------------------------------------------------
AuthorizerConfig AuthorizerConfig::from_env() {
    AuthorizerConfig config;
    config.acl_path            = env_str("ACL_PATH",        "config/acl.json");
    config.freshness_window_ms = env_num<std::int64_t>("ACL_FRESHNESS_MS", 10'000);
    if (config.freshness_window_ms > kMaxFreshnessWindowMs) {
        spdlog::warn("env ACL_FRESHNESS_MS: {} exceeds maximum {}, using default 10000",
                     config.freshness_window_ms, kMaxFreshnessWindowMs);
        config.freshness_window_ms = 10'000;
    }
    config.cache_threshold     = env_num<std::size_t>("ACL_CACHE_THRESHOLD", 10);
    config.uds_socket_path     = env_str("UDS_SOCKET_PATH", "/tmp/aclgate.sock");
    config.log_path            = env_str("LOG_PATH",        "/tmp/aclgate.log");
    config.log_level           = env_str("LOG_LEVEL",       "info");
    return config;
}

LogLevel parse_log_level(std::string_view text) noexcept {
    auto equals = [text](std::string_view name) {
        return std::equal(text.begin(), text.end(), name.begin(), name.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    };
    if (equals("debug")) { return LogLevel::kDebug; }
    if (equals("warn"))  { return LogLevel::kWarn; }
    if (equals("error")) { return LogLevel::kError; }
    return LogLevel::kInfo;
}
