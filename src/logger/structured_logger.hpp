#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - spdlog 레지스트리에 등록하지 않는다. 여러 인스턴스(테스트 등)가 같은
//   이름으로 충돌하지 않게 하기 위함이다.
// - 원문 SQL 은 sql_preview_length 바이트까지만 기록한다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// StructuredLogger
//   ValidationLog / BlockLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
//
//   [스레드 안전성]
//   stdout_sink_mt / rotating_file_sink_mt 를 사용하므로 동시 호출 안전.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level          : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path           : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   sql_preview_length : 기록할 SQL 최대 길이
    //   실패 시 std::runtime_error
    explicit StructuredLogger(LogLevel                     min_level,
                              const std::filesystem::path& log_path,
                              std::size_t                  sql_preview_length = 200);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_validation
    //   검증 통과 요청을 JSON 으로 기록한다 (info).
    void log_validation(const ValidationLog& entry);

    // log_block
    //   거부 이벤트를 JSON 으로 기록한다 (warn).
    void log_block(const BlockLog& entry);

    // 내부 진단용 spdlog 래퍼
    //   클라이언트 데이터(SQL 등)를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // 버퍼에 남은 로그를 파일로 내보낸다.
    void flush();

private:
    [[nodiscard]] std::string_view preview(std::string_view sql) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::size_t                     sql_preview_length_;
    std::shared_ptr<spdlog::logger> logger_;
};
