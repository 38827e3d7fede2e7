#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - PolicyEngine/ToolDispatcher 헤더를 include 하지 않는다.
// - operation_class, error_code 는 호출자가 operation_class_name() /
//   error_code_name() 으로 변환한 문자열을 넣는다.
//
// [민감정보 취급 주의]
// - raw_sql 은 원문 SQL 을 포함한다. StructuredLogger 가 sql_preview_length
//   만큼만 잘라서 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "trace"/"debug" → kDebug, "info" → kInfo, "warn" → kWarn,
// "error"/"critical" → kError. 그 외는 kInfo.
[[nodiscard]] inline LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace" || name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error" || name == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// ValidationLog
//   검증 통과 후 실행까지 진행된 요청 로그.
//   executed: 실행기 호출 성공 여부 (실행 실패도 기록한다)
// ---------------------------------------------------------------------------
struct ValidationLog {
    std::uint64_t                         request_id{0};
    std::string                           tool_name{};
    std::string                           operation_class{};
    std::string                           raw_sql{};      // 원문 SQL (미리보기로 잘림)
    bool                                  executed{false};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};    // 검증 소요 시간
};

// ---------------------------------------------------------------------------
// BlockLog
//   거부 이벤트 로그.
//   error_code  : error_code_name() 결과 ("denied_keyword" 등)
//   matched_rule: 발동한 키워드/규칙 이름 (없으면 빈 문자열)
//   reason      : ValidationResult::reason 또는 디스패처 거부 사유
// ---------------------------------------------------------------------------
struct BlockLog {
    std::uint64_t                         request_id{0};
    std::string                           tool_name{};
    std::string                           operation_class{};
    std::string                           raw_sql{};      // 원문 SQL (미리보기로 잘림)
    std::string                           error_code{};
    std::string                           matched_rule{};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};
