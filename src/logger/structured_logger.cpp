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
// Helper: JSON 문자열 이스케이프 (기본적인 구현)
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
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

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        default:               return spdlog::level::info;
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   std::size_t                  sql_preview_length)
    : min_level_(min_level)
    , log_path_(log_path)
    , sql_preview_length_(sql_preview_length)
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

        // 로거 생성 (스레드 안전). 레지스트리에는 등록하지 않는다.
        logger_ = std::make_shared<spdlog::logger>("querygate_audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        try {
            logger_->flush();
        } catch (const spdlog::spdlog_ex& ex) {
            // 소멸 중에는 다시 던지지 않는다. 기본 로거로만 알린다.
            spdlog::error("structured_logger: flush on shutdown failed: {}", ex.what());
        }
    }
}

std::string_view StructuredLogger::preview(std::string_view sql) const noexcept {
    if (sql.size() <= sql_preview_length_) {
        return sql;
    }
    return sql.substr(0, sql_preview_length_);
}

// ---------------------------------------------------------------------------
// log_validation: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_validation(const ValidationLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"query_validated","request_id":)" << entry.request_id
         << R"(,"tool_name":")" << escape_json_string(entry.tool_name)
         << R"(","operation_class":")" << escape_json_string(entry.operation_class)
         << R"(","sql_preview":")" << escape_json_string(preview(entry.raw_sql))
         << R"(","executed":)" << (entry.executed ? "true" : "false")
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_block: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"query_blocked","request_id":)" << entry.request_id
         << R"(,"tool_name":")" << escape_json_string(entry.tool_name)
         << R"(","operation_class":")" << escape_json_string(entry.operation_class)
         << R"(","sql_preview":")" << escape_json_string(preview(entry.raw_sql))
         << R"(","error_code":")" << escape_json_string(entry.error_code)
         << R"(","matched_rule":")" << escape_json_string(entry.matched_rule)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->warn(json.str());
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

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
