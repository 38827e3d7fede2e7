// ---------------------------------------------------------------------------
// tool_dispatcher.cpp
//
// 도구 요청 → 검증 → 실행 파이프라인.
//
// [감사 로그]
// - 거부(UNKNOWN_TOOL / READ_ONLY_MODE / SECURITY_VALIDATION_FAILED) → log_block
// - 검증 통과 → log_validation (executed 에 실행 성공 여부)
// - 실행 실패 상세는 spdlog::error 로만 남기고 응답에는 정리된 메시지만 넣는다.
//
// [통계]
// - 분류가 정해진 요청만 on_validation 에 집계한다 (UNKNOWN_TOOL 제외).
// - READ_ONLY_MODE 거부는 rejected 로 집계한다.
// ---------------------------------------------------------------------------

#include "dispatch/tool_dispatcher.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "parser/sql_normalizer.hpp"  // to_upper_ascii

namespace {

constexpr std::string_view kGenericExecutionError = "Database operation failed";

[[nodiscard]] std::chrono::microseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

std::vector<ToolBinding> default_tool_bindings() {
    std::vector<ToolBinding> bindings;

    bindings.push_back(ToolBinding{"read_data", OperationClass::kReadOnlyQuery, {}, false});
    bindings.push_back(ToolBinding{"update_data", OperationClass::kGuardedMutation, {}, true});

    PolicyOverrides delete_overrides{};
    delete_overrides.required_leading_verbs = std::vector<std::string>{"DELETE"};
    bindings.push_back(ToolBinding{"delete_data", OperationClass::kGuardedMutation,
                                   std::move(delete_overrides), true});

    bindings.push_back(ToolBinding{"execute_ddl", OperationClass::kDataDefinition, {}, true});
    bindings.push_back(ToolBinding{"dba_read_data", OperationClass::kDiagnosticBatch, {}, false});
    return bindings;
}

std::string sanitize_execution_error(std::string_view message) {
    const std::string upper = to_upper_ascii(message);
    if (upper.find("INVALID OBJECT NAME") != std::string::npos ||
        upper.find("INVALID COLUMN NAME") != std::string::npos) {
        return std::string(message);
    }
    return std::string(kGenericExecutionError);
}

// ---------------------------------------------------------------------------
// ToolDispatcher 생성자
// ---------------------------------------------------------------------------
ToolDispatcher::ToolDispatcher(std::shared_ptr<const PolicyEngine> engine,
                               std::shared_ptr<QueryExecutor>      executor,
                               std::shared_ptr<StructuredLogger>   logger,
                               std::shared_ptr<StatsCollector>     stats,
                               bool                                read_only,
                               std::vector<ToolBinding>            bindings)
    : engine_{std::move(engine)}
    , executor_{std::move(executor)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
    , read_only_{read_only}
    , bindings_{std::move(bindings)}
{
    if (!engine_ || !executor_ || !logger_ || !stats_) {
        throw std::invalid_argument("ToolDispatcher: engine, executor, logger and stats are required");
    }
    spdlog::info("tool_dispatcher: {} tools bound, read_only={}", bindings_.size(), read_only_);
}

const ToolBinding* ToolDispatcher::find_binding(std::string_view tool_name) const noexcept {
    for (const auto& binding : bindings_) {
        if (binding.tool_name == tool_name) {
            return &binding;
        }
    }
    return nullptr;
}

std::vector<std::string> ToolDispatcher::available_tools() const {
    std::vector<std::string> names;
    for (const auto& binding : bindings_) {
        if (read_only_ && binding.mutates) {
            continue;
        }
        names.push_back(binding.tool_name);
    }
    return names;
}

// ---------------------------------------------------------------------------
// reject: 거부 응답 생성 + 감사 로그 + 통계
// ---------------------------------------------------------------------------
ToolResponse ToolDispatcher::reject(std::uint64_t             request_id,
                                    const ToolRequest&        request,
                                    const ToolBinding*        binding,
                                    std::string_view          error,
                                    std::string               message,
                                    const ValidationResult*   validation,
                                    std::chrono::microseconds duration) {
    BlockLog entry{};
    entry.request_id = request_id;
    entry.tool_name  = request.tool_name;
    entry.raw_sql    = request.sql;
    entry.timestamp  = std::chrono::system_clock::now();
    entry.duration   = duration;
    if (binding) {
        entry.operation_class = std::string(operation_class_name(binding->operation_class));
    }
    if (validation) {
        entry.error_code   = std::string(error_code_name(validation->error_code));
        entry.matched_rule = validation->matched_rule;
        entry.reason       = validation->reason.value_or("");
    } else {
        entry.error_code = std::string(error);
        entry.reason     = message;
    }
    logger_->log_block(entry);

    if (binding) {
        stats_->on_validation(binding->operation_class, true);
    }

    ToolResponse response{};
    response.request_id = request_id;
    response.success    = false;
    response.error      = std::string(error);
    response.message    = std::move(message);
    if (validation) {
        response.validation = *validation;
    }
    return response;
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
ToolResponse ToolDispatcher::dispatch(const ToolRequest& request) {
    const auto request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    const auto start      = std::chrono::steady_clock::now();

    // Step 1: 도구 조회
    const ToolBinding* binding = find_binding(request.tool_name);
    if (!binding) {
        spdlog::warn("tool_dispatcher: [request {}] unknown tool '{}'", request_id, request.tool_name);
        return reject(request_id, request, nullptr, kErrorUnknownTool,
                      fmt::format("Unknown tool '{}'", request.tool_name), nullptr,
                      elapsed_since(start));
    }

    // Step 2: 읽기 전용 모드
    if (read_only_ && binding->mutates) {
        spdlog::warn("tool_dispatcher: [request {}] tool '{}' refused in read-only mode",
                     request_id, request.tool_name);
        return reject(request_id, request, binding, kErrorReadOnlyMode,
                      fmt::format("Tool '{}' is not available in read-only mode", request.tool_name),
                      nullptr, elapsed_since(start));
    }

    // Step 3: 검증 (noexcept, fail-close)
    const ValidationResult validation =
        engine_->validate(binding->operation_class, request.sql, binding->overrides);
    const auto validate_duration = elapsed_since(start);

    // Step 4: 거부 → 실행기 미호출
    if (!validation.is_valid) {
        const std::string reason = validation.reason.value_or("unknown reason");
        spdlog::warn("tool_dispatcher: [request {}] security validation failed: {} sql={}",
                     request_id, reason,
                     request.sql.size() > 100 ? request.sql.substr(0, 100) + "..." : request.sql);
        return reject(request_id, request, binding, kErrorSecurityValidation,
                      "Security validation failed: " + reason, &validation, validate_duration);
    }

    // Step 5: 원문 SQL 실행
    ToolResponse response{};
    response.request_id = request_id;
    response.validation = validation;

    std::expected<ExecutionOutcome, ExecutionError> outcome =
        std::unexpected(ExecutionError{std::string(kGenericExecutionError)});
    try {
        outcome = executor_->execute(binding->operation_class, request.sql);
    } catch (const std::exception& e) {
        outcome = std::unexpected(ExecutionError{e.what()});
    }

    if (outcome) {
        response.success = true;
        response.outcome = std::move(*outcome);
    } else {
        // Step 6: 실행 실패 (상세는 로그에만)
        spdlog::error("tool_dispatcher: [request {}] {} failed: {}",
                      request_id, request.tool_name, outcome.error().message);
        response.success = false;
        response.error   = std::string(kErrorQueryExecution);
        response.message = sanitize_execution_error(outcome.error().message);
        stats_->on_execution_failure();
    }

    logger_->log_validation(ValidationLog{
        .request_id      = request_id,
        .tool_name       = request.tool_name,
        .operation_class = std::string(operation_class_name(binding->operation_class)),
        .raw_sql         = request.sql,
        .executed        = response.success,
        .timestamp       = std::chrono::system_clock::now(),
        .duration        = validate_duration,
    });
    stats_->on_validation(binding->operation_class, false);

    return response;
}
