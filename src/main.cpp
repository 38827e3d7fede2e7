#include "common/types.hpp"
#include "dispatch/tool_dispatcher.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_engine.hpp"
#include "policy/policy_loader.hpp"
#include "stats/stats_collector.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// querygate_check
//
//   사용법: querygate_check <operation-class | tool-name> < query.sql
//
//   operation-class: read_only_query | guarded_mutation | data_definition |
//                    diagnostic_batch  → PolicyEngine::validate 만 수행
//   tool-name      : read_data | update_data | delete_data | execute_ddl |
//                    dba_read_data     → ToolDispatcher 경유 (실행은 dry-run)
//
//   출력: ACCEPTED 또는 "REJECTED: <reason>"
//   종료 코드: 0 허용, 1 거부, 2 사용법/설정 오류
//
//   환경변수: POLICY_PATH, LOG_PATH, LOG_LEVEL, SQL_PREVIEW_LENGTH, READONLY
// ---------------------------------------------------------------------------

namespace {

constexpr int kExitAccepted = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage    = 2;

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

// 음수나 UINT32_MAX 초과 값은 잘라 넣지 않고 경고 후 기본값을 쓴다.
std::uint32_t env_u32(const char* name, std::uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    auto parsed = PolicyLoader::parse_u32(val);
    if (!parsed) {
        spdlog::warn("env {}: {}, using default {}", name, parsed.error(), default_val);
        return default_val;
    }
    return *parsed;
}

bool env_bool(const char* name) {
    const std::string val = env_str(name, "");
    return val == "true" || val == "1";
}

// ---------------------------------------------------------------------------
// DryRunExecutor
//   검증 결과 확인용 실행기. 데이터베이스에 연결하지 않는다.
// ---------------------------------------------------------------------------
class DryRunExecutor final : public QueryExecutor {
public:
    std::expected<ExecutionOutcome, ExecutionError>
    execute(OperationClass op, const std::string& sql) override {
        spdlog::debug("dry-run: {} ({} bytes) not executed", operation_class_name(op), sql.size());
        return ExecutionOutcome{0, "dry-run"};
    }
};

void print_usage(const char* prog) {
    std::fprintf(stderr,
                 "usage: %s <operation-class|tool-name> < query.sql\n"
                 "  operation classes: read_only_query guarded_mutation data_definition "
                 "diagnostic_batch\n"
                 "  tools: read_data update_data delete_data execute_ddl dba_read_data\n",
                 prog);
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    // 진단 로그는 stderr 로 보내 결과 출력(stdout)과 섞이지 않게 한다.
    spdlog::set_default_logger(spdlog::stderr_color_mt("querygate"));

    if (argc != 2) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    const std::string target = argv[1];

    // ── 설정 로드 (파일 → 환경변수 덮어쓰기) ─────────────────────────────
    const char*       policy_env  = std::getenv("POLICY_PATH");  // NOLINT(concurrency-mt-unsafe)
    const std::string policy_path = env_str("POLICY_PATH", "config/policy.yaml");

    ValidatorConfig config{};
    std::error_code ec;
    if (std::filesystem::exists(policy_path, ec)) {
        auto loaded = PolicyLoader::load(policy_path);
        if (!loaded) {
            std::fprintf(stderr, "configuration error: %s\n", loaded.error().c_str());
            return kExitUsage;
        }
        config = std::move(*loaded);
    } else if (policy_env != nullptr && policy_env[0] != '\0') {
        // 명시적으로 지정한 파일이 없으면 기본 정책으로 넘어가지 않는다.
        std::fprintf(stderr, "configuration error: POLICY_PATH '%s' does not exist\n",
                     policy_path.c_str());
        return kExitUsage;
    } else {
        spdlog::debug("no configuration file at '{}', using built-in policies", policy_path);
    }

    config.global.log_level          = env_str("LOG_LEVEL", config.global.log_level);
    config.global.log_path           = env_str("LOG_PATH",  config.global.log_path);
    config.global.sql_preview_length = env_u32("SQL_PREVIEW_LENGTH", config.global.sql_preview_length);
    const bool read_only             = env_bool("READONLY");

    spdlog::set_level(spdlog::level::from_str(config.global.log_level));

    // ── 입력 읽기 ───────────────────────────────────────────────────────
    const std::string sql{std::istreambuf_iterator<char>(std::cin),
                          std::istreambuf_iterator<char>()};

    auto engine = std::make_shared<const PolicyEngine>(config);

    // ── 분류 직접 검증 ──────────────────────────────────────────────────
    if (const auto op = parse_operation_class(target)) {
        const ValidationResult result = engine->validate(*op, sql);
        if (result.is_valid) {
            std::printf("ACCEPTED\n");
            return kExitAccepted;
        }
        std::printf("REJECTED: %s\n", result.reason.value_or("unknown reason").c_str());
        return kExitRejected;
    }

    // ── 도구 경유 (감사 로그 + 통계 포함) ────────────────────────────────
    std::shared_ptr<StructuredLogger> audit;
    try {
        audit = std::make_shared<StructuredLogger>(parse_log_level(config.global.log_level),
                                                   config.global.log_path,
                                                   config.global.sql_preview_length);
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "configuration error: %s\n", e.what());
        return kExitUsage;
    }

    auto stats = std::make_shared<StatsCollector>();
    ToolDispatcher dispatcher{engine, std::make_shared<DryRunExecutor>(), audit, stats, read_only};

    if (dispatcher.find_binding(target) == nullptr) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const ToolResponse response = dispatcher.dispatch(ToolRequest{target, sql});
    audit->flush();
    if (response.success) {
        std::printf("ACCEPTED\n");
        return kExitAccepted;
    }
    std::printf("REJECTED: %s\n", response.message.c_str());
    return kExitRejected;
}
