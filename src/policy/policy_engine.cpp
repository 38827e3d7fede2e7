// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// 작업 분류별 정책으로 SQL 원문을 검증하는 엔진.
//
// [Fail-close 원칙: 절대 위반 금지]
// 1. 등록되지 않은 분류 → kInternalError
// 2. 내부 예외(메모리 부족, regex 실행 오류 등) → kInternalError
// 3. 탐지기 fail-close 상태(잘못된 정규식) → kInternalError
// 4. is_valid=true 는 파이프라인 끝에 도달했을 때만 반환
//
// [CompiledPolicy]
// 정책 데이터에서 매 호출마다 다시 계산할 필요가 없는 것들(대문자 변환된
// 동사/객체 유형 목록, 키워드 스캐너, 컴파일된 정규식)을 미리 만들어 둔다.
// 탐지기는 shared_ptr<const> 로 보관하여 호출 단위 덮어쓰기에서 재사용한다.
//
// [오탐/미탐 트레이드오프]
// - 가드 절은 대문자 정규화 텍스트에 guard_token(" WHERE ")이 포함되는지만 본다.
//   문자열 리터럴 안의 WHERE 도 가드로 인정된다 (알려진 약점, 의도적으로 유지).
// - 객체 유형 검사는 구문 전체에서 토큰을 찾는다. CREATE PROCEDURE p AS ... TABLE
//   처럼 본문에 허용 토큰이 있으면 통과한다. 키워드/패턴 스캔이 뒤에서 보완한다.
// - 키워드 스캔은 선행 동사뿐 아니라 그 첫 단어도 제외한다. "SET STATISTICS" 를
//   허용하는 정책에서 SET 이 거부 키워드로 잡히지 않게 하기 위함이다.
//
// [정규식 실행 입력]
// - std::regex 실행기는 반복 한 번마다 재귀하므로 긴 공백 열에 \s* 를 적용하면
//   스택이 넘친다. 패턴과 보호 대상 규칙은 원문이 아니라 정규화 텍스트에 적용한다.
//   정규화 텍스트에는 연속 공백이 없다.
// - 길이 제한(원문 기준)은 정규화 직후, 어떤 정규식보다 먼저 검사한다.
//
// [알려진 한계]
// - 주석 범위 규칙은 주석 내용 원문에 적용된다. 설정으로 추가하는 주석 규칙은
//   공백/숫자에 대한 무제한 반복(\s*, \d+)을 쓰지 않아야 한다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "parser/injection_detector.hpp"
#include "parser/keyword_scanner.hpp"
#include "parser/sql_normalizer.hpp"
#include "parser/statement_splitter.hpp"
#include "policy/builtin_policies.hpp"

struct PolicyEngine::CompiledPolicy {
    ValidationPolicy         policy;
    std::vector<std::string> upper_verbs;
    std::vector<std::string> upper_object_types;
    std::vector<std::string> upper_object_type_verbs;
    std::string              upper_guard_token;
    KeywordScanner           keywords;
    std::shared_ptr<const InjectionDetector> patterns;
    std::shared_ptr<const InjectionDetector> protected_targets;
};

namespace {

constexpr const char* kInternalErrorReason = "internal validation error";

[[nodiscard]] std::vector<std::string> upper_trimmed(const std::vector<std::string>& items) {
    std::vector<std::string> result;
    result.reserve(items.size());
    for (const auto& item : items) {
        const auto trimmed = trim_view(item);
        if (!trimmed.empty()) {
            result.push_back(to_upper_ascii(trimmed));
        }
    }
    return result;
}

[[nodiscard]] std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            out.append(sep);
        }
        out.append(items[i]);
    }
    return out;
}

[[nodiscard]] bool list_contains(const std::vector<std::string>& items, std::string_view value) {
    for (const auto& item : items) {
        if (item == value) {
            return true;
        }
    }
    return false;
}

// 거부 키워드에서 선행 동사와 각 동사 구문의 첫 단어를 뺀다.
[[nodiscard]] std::vector<std::string> effective_denylist(const std::vector<std::string>& denied,
                                                          const std::vector<std::string>& upper_verbs) {
    std::vector<std::string> excluded = upper_verbs;
    for (const auto& verb : upper_verbs) {
        const auto space = verb.find(' ');
        if (space != std::string::npos) {
            excluded.push_back(verb.substr(0, space));
        }
    }

    std::vector<std::string> result;
    for (const auto& kw : upper_trimmed(denied)) {
        if (!list_contains(excluded, kw)) {
            result.push_back(kw);
        }
    }
    return result;
}

// statement 가 시작하는 동사 구문. 가장 긴 것을 우선한다 ("SET STATISTICS" > "SET").
[[nodiscard]] std::optional<std::string> leading_verb(std::string_view                upper_statement,
                                                      const std::vector<std::string>& upper_verbs) {
    std::optional<std::string> best;
    for (const auto& verb : upper_verbs) {
        if (starts_with_phrase(upper_statement, verb) &&
            (!best || verb.size() > best->size())) {
            best = verb;
        }
    }
    return best;
}

[[nodiscard]] ValidationResult rejected(ValidationErrorCode                code,
                                        std::string                        reason,
                                        std::string                        matched_rule,
                                        const std::optional<std::string>&  normalized) {
    ValidationResult r{};
    r.is_valid         = false;
    r.error_code       = code;
    r.reason           = std::move(reason);
    r.normalized_query = normalized;
    r.matched_rule     = std::move(matched_rule);
    return r;
}

[[nodiscard]] ValidationResult internal_error(std::string matched_rule = "internal-error") {
    return rejected(ValidationErrorCode::kInternalError, kInternalErrorReason,
                    std::move(matched_rule), std::nullopt);
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyEngine::compile
// ---------------------------------------------------------------------------
std::shared_ptr<const PolicyEngine::CompiledPolicy>
PolicyEngine::compile(ValidationPolicy                         policy,
                      std::shared_ptr<const InjectionDetector> reuse_patterns,
                      std::shared_ptr<const InjectionDetector> reuse_protected) {
    auto upper_verbs = upper_trimmed(policy.required_leading_verbs);
    auto denylist    = effective_denylist(policy.denied_keywords, upper_verbs);

    if (!reuse_patterns) {
        reuse_patterns = std::make_shared<const InjectionDetector>(policy.denied_patterns);
    }
    if (!reuse_protected) {
        reuse_protected = std::make_shared<const InjectionDetector>(policy.protected_qualifiers);
    }

    std::vector<std::string> object_types;
    if (policy.allowed_object_types) {
        object_types = upper_trimmed(*policy.allowed_object_types);
    }
    auto object_type_verbs = upper_trimmed(policy.object_type_verbs);
    auto guard             = to_upper_ascii(policy.guard_token);

    return std::make_shared<const CompiledPolicy>(CompiledPolicy{
        std::move(policy),
        std::move(upper_verbs),
        std::move(object_types),
        std::move(object_type_verbs),
        std::move(guard),
        KeywordScanner(std::move(denylist)),
        std::move(reuse_patterns),
        std::move(reuse_protected),
    });
}

// ---------------------------------------------------------------------------
// run_pipeline
//   평가 순서는 policy_engine.hpp 의 설명을 따른다.
//   예외는 호출자(validate)가 kInternalError 로 변환한다.
// ---------------------------------------------------------------------------
ValidationResult PolicyEngine::run_pipeline(const CompiledPolicy& cp, std::string_view sql) {
    const ValidationPolicy& policy = cp.policy;

    if (cp.patterns->fail_close_active() || cp.protected_targets->fail_close_active()) {
        spdlog::error("policy_engine: policy '{}' has invalid pattern rules, rejecting (fail-close)",
                      policy.name);
        return internal_error("invalid-pattern-rules");
    }

    // Step 1: 정규화
    if (trim_view(sql).empty()) {
        return rejected(ValidationErrorCode::kEmptyInput, "empty query", "", std::nullopt);
    }

    static const SqlNormalizer     normalizer{};
    static const StatementSplitter splitter{};

    NormalizedSql normalized = normalizer.normalize(sql);
    if (normalized.text.empty()) {
        return rejected(ValidationErrorCode::kEmptyInput,
                        "empty query after removing comments", "", std::nullopt);
    }
    const std::optional<std::string> normalized_query{normalized.text};

    // Step 2: 원문 길이. 정규식이 하나라도 실행되기 전에 상한을 건다.
    if (sql.size() > policy.max_length) {
        return rejected(ValidationErrorCode::kInputTooLong,
                        fmt::format("Query is too long: {} characters exceeds the maximum of {}",
                                    sql.size(), policy.max_length),
                        "", normalized_query);
    }

    const std::string upper = to_upper_ascii(normalized.text);

    // Step 3: 분할 + 선행 동사 / 객체 유형
    const auto statements = splitter.split(upper);
    if (statements.empty()) {
        // ";;;" 처럼 구분자만 있는 입력
        return rejected(ValidationErrorCode::kEmptyInput, "empty query", "", normalized_query);
    }

    const std::size_t checked =
        policy.allow_multiple_statements ? statements.size() : std::size_t{1};

    std::optional<std::string> first_verb;
    for (std::size_t i = 0; i < checked; ++i) {
        const auto stmt = statements[i];
        auto verb       = leading_verb(stmt, cp.upper_verbs);
        if (!verb) {
            std::string reason =
                (statements.size() > 1 && policy.allow_multiple_statements)
                    ? fmt::format("Statement {} must start with one of: {}", i + 1,
                                  join(cp.upper_verbs, ", "))
                    : fmt::format("Statement must start with one of: {}",
                                  join(cp.upper_verbs, ", "));
            return rejected(ValidationErrorCode::kInvalidLeadingVerb, std::move(reason), "",
                            normalized_query);
        }

        if (policy.allowed_object_types) {
            const auto space      = verb->find(' ');
            const auto first_word = verb->substr(0, space);
            if (list_contains(cp.upper_object_type_verbs, first_word)) {
                bool allowed = false;
                for (const auto& type : cp.upper_object_types) {
                    if (contains_token(stmt, type)) {
                        allowed = true;
                        break;
                    }
                }
                if (!allowed) {
                    return rejected(ValidationErrorCode::kDisallowedObjectType,
                                    fmt::format("Object type must be one of: {}",
                                                join(cp.upper_object_types, ", ")),
                                    "", normalized_query);
                }
            }
        }

        if (i == 0) {
            first_verb = std::move(verb);
        }
    }

    // Step 4: 가드 절 (단순 포함 검사)
    if (policy.requires_guard_clause && upper.find(cp.upper_guard_token) == std::string::npos) {
        const auto guard_word = trim_view(cp.upper_guard_token);
        return rejected(ValidationErrorCode::kMissingGuardClause,
                        fmt::format("{} queries must include a {} clause",
                                    first_verb.value_or("Mutation"), guard_word),
                        std::string(guard_word), normalized_query);
    }

    // Step 5: 거부 키워드
    if (auto kw = cp.keywords.scan(upper)) {
        return rejected(ValidationErrorCode::kDeniedKeyword,
                        fmt::format("Dangerous keyword '{}' detected in query", *kw),
                        *kw, normalized_query);
    }

    // Step 6: 구조적 패턴 (정규화 텍스트 + 주석 내용)
    const auto pattern_hit = cp.patterns->check(normalized.text, normalized.comment_bodies);
    if (pattern_hit.detected) {
        return rejected(ValidationErrorCode::kDeniedPattern,
                        fmt::format("Potentially malicious SQL pattern detected ({}): {}",
                                    pattern_hit.rule_name, pattern_hit.reason),
                        pattern_hit.rule_name, normalized_query);
    }

    // Step 7: 단일 구문 정책
    if (!policy.allow_multiple_statements && statements.size() > 1) {
        return rejected(ValidationErrorCode::kMultipleStatementsNotAllowed,
                        "Multiple SQL statements are not allowed", "", normalized_query);
    }

    // Step 8: 보호 대상 (시스템 DB / 카탈로그)
    const auto protected_hit = cp.protected_targets->check(normalized.text);
    if (protected_hit.detected) {
        return rejected(ValidationErrorCode::kProtectedTarget, protected_hit.reason,
                        protected_hit.rule_name, normalized_query);
    }

    ValidationResult ok{};
    ok.is_valid         = true;
    ok.error_code       = ValidationErrorCode::kNone;
    ok.normalized_query = normalized_query;
    return ok;
}

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
PolicyEngine::PolicyEngine()
    : PolicyEngine(ValidatorConfig{}) {}

PolicyEngine::PolicyEngine(const ValidatorConfig& config)
    : PolicyEngine([&config] {
          auto policies = builtin_policies();
          for (auto& policy : policies) {
              const auto it = config.policy_overrides.find(policy.operation_class);
              if (it != config.policy_overrides.end()) {
                  policy = apply_overrides(std::move(policy), it->second);
              }
          }
          return policies;
      }()) {}

PolicyEngine::PolicyEngine(std::vector<ValidationPolicy> policies) {
    for (auto& policy : policies) {
        const auto op = policy.operation_class;
        if (policies_.count(op) != 0) {
            spdlog::warn("policy_engine: duplicate policy for '{}', replacing earlier definition",
                         operation_class_name(op));
        }
        auto compiled = compile(std::move(policy), nullptr, nullptr);
        if (compiled->patterns->fail_close_active() ||
            compiled->protected_targets->fail_close_active()) {
            spdlog::warn("policy_engine: policy '{}' has invalid rules, all its queries will be "
                         "rejected (fail-close)", compiled->policy.name);
        }
        policies_[op] = std::move(compiled);
    }
    spdlog::info("policy_engine: initialized with {} policies", policies_.size());
}

// ---------------------------------------------------------------------------
// PolicyEngine::validate
// ---------------------------------------------------------------------------
ValidationResult PolicyEngine::validate(OperationClass op, std::string_view sql) const noexcept {
    try {
        const auto it = policies_.find(op);
        if (it == policies_.end()) {
            spdlog::error("policy_engine: no policy registered for operation class {}, "
                          "rejecting (fail-close)", static_cast<int>(op));
            return internal_error("no-policy");
        }
        return run_pipeline(*it->second, sql);
    } catch (const std::exception& e) {
        try {
            spdlog::error("policy_engine: exception during validation, rejecting (fail-close): {}",
                          e.what());
            return internal_error();
        } catch (...) {
            return ValidationResult{};  // 기본값이 거부 상태
        }
    } catch (...) {
        return ValidationResult{};
    }
}

ValidationResult PolicyEngine::validate(OperationClass         op,
                                        std::string_view       sql,
                                        const PolicyOverrides& overrides) const noexcept {
    if (overrides.empty()) {
        return validate(op, sql);
    }

    try {
        const auto it = policies_.find(op);
        if (it == policies_.end()) {
            spdlog::error("policy_engine: no policy registered for operation class {}, "
                          "rejecting (fail-close)", static_cast<int>(op));
            return internal_error("no-policy");
        }

        const CompiledPolicy& base = *it->second;
        auto compiled = compile(
            apply_overrides(base.policy, overrides),
            overrides.touches_patterns() ? nullptr : base.patterns,
            overrides.protected_qualifiers ? nullptr : base.protected_targets
        );
        return run_pipeline(*compiled, sql);
    } catch (const std::exception& e) {
        try {
            spdlog::error("policy_engine: exception during validation, rejecting (fail-close): {}",
                          e.what());
            return internal_error();
        } catch (...) {
            return ValidationResult{};
        }
    } catch (...) {
        return ValidationResult{};
    }
}

const ValidationPolicy* PolicyEngine::find_policy(OperationClass op) const noexcept {
    const auto it = policies_.find(op);
    if (it == policies_.end()) {
        return nullptr;
    }
    return &it->second->policy;
}
