// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "aclgate";

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

const char* outcome_to_string(ReloadOutcome outcome) {
    switch (outcome) {
        case ReloadOutcome::kReloaded:  return "reloaded";
        case ReloadOutcome::kUnchanged: return "unchanged";
        case ReloadOutcome::kFailed:    return "failed";
    }
    return "unknown";
}

}  // namespace

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
int StructuredLogger::to_spdlog_level(LogLevel level) const {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
        default:
            return static_cast<int>(spdlog::level::info);
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크 생성: stdout + rotating file
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;  // 100MB
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 로거 생성 (스레드 안전)
        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (!logger_) {
        return;
    }
    try {
        logger_->flush();
        spdlog::drop(kLoggerName);
    } catch (const std::exception& ex) {
        // 소멸자 밖으로 예외를 내보내지 않는다
        std::fprintf(stderr, "structured_logger: shutdown error: %s\n", ex.what());
    }
}

// ---------------------------------------------------------------------------
// log_decision: JSON 직렬화
//   ALLOW → debug, DENY → warn
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const DecisionLog& entry) {
    const LogLevel level = entry.allowed ? LogLevel::kDebug : LogLevel::kWarn;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << (entry.allowed ? "acl_allow" : "acl_deny")
         << R"(","principal_type":")" << escape_json_string(entry.principal_type)
         << R"(","principal_name":")" << escape_json_string(entry.principal_name)
         << R"(","operation":")" << escape_json_string(entry.operation)
         << R"(","resource":")" << escape_json_string(entry.resource)
         << R"(","cached":)" << (entry.cached ? "true" : "false")
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (entry.allowed) {
        logger_->debug(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_reload: JSON 직렬화
//   kFailed → error, 그 외 → info
// ---------------------------------------------------------------------------
void StructuredLogger::log_reload(const ReloadLog& entry) {
    const bool     failed = entry.outcome == ReloadOutcome::kFailed;
    const LogLevel level  = failed ? LogLevel::kError : LogLevel::kInfo;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"acl_reload","source":")" << escape_json_string(entry.source)
         << R"(","outcome":")" << outcome_to_string(entry.outcome)
         << R"(","rule_count":)" << entry.rule_count
         << R"(,"caching":)" << (entry.caching ? "true" : "false")
         << R"(,"error":")" << escape_json_string(entry.error)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (failed) {
        logger_->error(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
