#pragma once

// ---------------------------------------------------------------------------
// tool_dispatcher.hpp
//
// 도구(capability) 이름을 작업 분류로 매핑하고, 검증을 통과한 SQL 원문만
// 실행기(QueryExecutor)로 전달하는 디스패치 계층.
//
// [처리 흐름]
//   1. tool_name → ToolBinding 조회 (없으면 UNKNOWN_TOOL)
//   2. 읽기 전용 모드에서 변경 도구 → READ_ONLY_MODE (검증 전에 거부)
//   3. PolicyEngine::validate (바인딩의 PolicyOverrides 적용)
//   4. 거부 → SECURITY_VALIDATION_FAILED, 실행기를 호출하지 않는다
//   5. 허용 → 원문 SQL 을 실행기로 전달 (정규화 텍스트가 아님)
//   6. 실행 실패/예외 → QUERY_EXECUTION_FAILED
//   모든 요청은 감사 로그와 통계에 남는다.
//
// [fail-close 원칙]
// is_valid=false 인 요청은 어떤 경로로도 실행기에 도달하지 않는다.
//
// [스레드 안전성]
// dispatch() 는 동시 호출 안전하다. 단, 실행기 구현의 스레드 안전성은
// 실행기 소관이다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_engine.hpp"
#include "policy/validation_policy.hpp"
#include "stats/stats_collector.hpp"

// 응답 오류 코드 문자열
inline constexpr std::string_view kErrorSecurityValidation = "SECURITY_VALIDATION_FAILED";
inline constexpr std::string_view kErrorQueryExecution     = "QUERY_EXECUTION_FAILED";
inline constexpr std::string_view kErrorReadOnlyMode       = "READ_ONLY_MODE";
inline constexpr std::string_view kErrorUnknownTool        = "UNKNOWN_TOOL";

// ---------------------------------------------------------------------------
// ExecutionOutcome / ExecutionError
//   실행기 결과. payload 는 실행기가 정한 형식의 결과 텍스트(행 데이터 등).
// ---------------------------------------------------------------------------
struct ExecutionOutcome {
    std::uint64_t affected_rows{0};
    std::string   payload{};
};

struct ExecutionError {
    std::string message{};
};

// ---------------------------------------------------------------------------
// QueryExecutor
//   데이터베이스 실행 협력자. 연결 관리/결과 직렬화는 구현체 소관.
// ---------------------------------------------------------------------------
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    // execute
    //   검증을 통과한 원문 SQL 을 실행한다.
    //   실패는 std::unexpected(ExecutionError) 로 반환한다.
    [[nodiscard]] virtual std::expected<ExecutionOutcome, ExecutionError>
    execute(OperationClass op, const std::string& sql) = 0;
};

// ---------------------------------------------------------------------------
// ToolBinding
//   tool_name  : 호출자에게 노출되는 도구 이름
//   overrides  : 이 도구에만 적용되는 정책 덮어쓰기 (예: DELETE 동사)
//   mutates    : true 면 읽기 전용 모드에서 거부
// ---------------------------------------------------------------------------
struct ToolBinding {
    std::string     tool_name{};
    OperationClass  operation_class{OperationClass::kReadOnlyQuery};
    PolicyOverrides overrides{};
    bool            mutates{false};
};

// 기본 바인딩:
//   read_data     → kReadOnlyQuery
//   update_data   → kGuardedMutation
//   delete_data   → kGuardedMutation (선행 동사 DELETE)
//   execute_ddl   → kDataDefinition
//   dba_read_data → kDiagnosticBatch
[[nodiscard]] std::vector<ToolBinding> default_tool_bindings();

struct ToolRequest {
    std::string tool_name{};
    std::string sql{};
};

// ---------------------------------------------------------------------------
// ToolResponse
//   success == false 이면 error 에 오류 코드 문자열, message 에 사용자용 설명.
//   validation 은 검증 단계까지 진행된 경우에만 채워진다.
// ---------------------------------------------------------------------------
struct ToolResponse {
    std::uint64_t                   request_id{0};
    bool                            success{false};
    std::string                     error{};
    std::string                     message{};
    ExecutionOutcome                outcome{};
    std::optional<ValidationResult> validation{};
};

class ToolDispatcher {
public:
    // 생성자
    //   engine/executor/logger/stats 는 nullptr 이면 std::invalid_argument.
    //   read_only: 원래 프로세스 전역 설정이던 읽기 전용 스위치를 주입받는다.
    ToolDispatcher(std::shared_ptr<const PolicyEngine>     engine,
                   std::shared_ptr<QueryExecutor>          executor,
                   std::shared_ptr<StructuredLogger>       logger,
                   std::shared_ptr<StatsCollector>         stats,
                   bool                                    read_only = false,
                   std::vector<ToolBinding>                bindings  = default_tool_bindings());

    ~ToolDispatcher() = default;

    // 복사/이동 금지 (request id 카운터 atomic)
    ToolDispatcher(const ToolDispatcher&)            = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;
    ToolDispatcher(ToolDispatcher&&)                 = delete;
    ToolDispatcher& operator=(ToolDispatcher&&)      = delete;

    // dispatch
    //   요청 하나를 처리한다. 예외를 던지지 않고 항상 ToolResponse 를 반환한다.
    [[nodiscard]] ToolResponse dispatch(const ToolRequest& request);

    // 읽기 전용 모드에서는 mutates 바인딩이 목록에서 빠진다.
    [[nodiscard]] std::vector<std::string> available_tools() const;

    [[nodiscard]] const ToolBinding* find_binding(std::string_view tool_name) const noexcept;

    [[nodiscard]] bool read_only() const noexcept { return read_only_; }

private:
    [[nodiscard]] ToolResponse reject(std::uint64_t            request_id,
                                      const ToolRequest&        request,
                                      const ToolBinding*        binding,
                                      std::string_view          error,
                                      std::string               message,
                                      const ValidationResult*   validation,
                                      std::chrono::microseconds duration);

    std::shared_ptr<const PolicyEngine> engine_;
    std::shared_ptr<QueryExecutor>      executor_;
    std::shared_ptr<StructuredLogger>   logger_;
    std::shared_ptr<StatsCollector>     stats_;
    bool                                read_only_;
    std::vector<ToolBinding>            bindings_;
    std::atomic<std::uint64_t>          next_request_id_{1};
};

// sanitize_execution_error
//   실행기 오류 메시지 중 사용자에게 그대로 보여도 되는 것(잘못된 객체/컬럼
//   이름)만 통과시키고, 나머지는 일반 메시지로 바꾼다.
[[nodiscard]] std::string sanitize_execution_error(std::string_view message);
