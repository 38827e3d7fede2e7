// ---------------------------------------------------------------------------
// builtin_policies.cpp
//
// 네 가지 기본 정책 데이터.
//
// [규칙 작성 원칙]
// - 모든 정규식은 ECMAScript + icase 로 컴파일된다 (InjectionDetector).
// - .* 같은 무제한 반복을 쓰지 않는다. 입력 길이 N 에 선형에 가깝게 유지.
// - 숫자 열처럼 정규화로 짧아지지 않는 대상에는 {m,n} 상한을 둔다.
// - 단어 경계 \b 를 붙여 식별자 내부 부분 문자열(VARCHAR 의 CHAR 등)을 피한다.
//
// [오탐/미탐 트레이드오프]
// - char-conversion-function 은 읽기 정책에만 있다. CHAR( 호출 자체를 거부하므로
//   CHAR(10) 같은 무해한 사용도 거부된다.
// - 정의(DDL) 정책은 SELECT 를 거부 키워드에 포함한다. CREATE VIEW ... AS SELECT
//   는 통과하지 못한다 (알려진 한계).
// - 진단 정책의 credential-access 는 PASSWORD 라는 컬럼 이름도 거부한다.
//
// [알려진 한계]
// - kText 규칙은 정규화 텍스트에 적용되므로 \s* 는 공백 한 글자까지만 반복한다.
// - 문자 코드 인자는 \d{1,12} 로 자릿수를 제한한다. CHAR(0000000000065)+ 처럼
//   0 을 길게 붙인 인자는 이 대안에 걸리지 않는다. 읽기 정책에서는
//   char-conversion-function 이 대신 거부한다.
// ---------------------------------------------------------------------------

#include "policy/builtin_policies.hpp"

#include <string>
#include <utility>
#include <vector>

namespace {

// 규칙 공통 정의 -------------------------------------------------------------

constexpr const char* kReadChainVerbs =
    "DELETE|DROP|UPDATE|INSERT|ALTER|CREATE|TRUNCATE|EXEC|EXECUTE|MERGE|REPLACE|GRANT|REVOKE";

[[nodiscard]] PatternRuleSpec statement_chaining(const std::string& verbs) {
    return PatternRuleSpec{
        "statement-chaining",
        R"(;\s*()" + verbs + R"()\b)",
        "statement terminator followed by a forbidden statement",
        PatternScope::kText,
    };
}

[[nodiscard]] PatternRuleSpec union_injection() {
    return PatternRuleSpec{
        "union-injection",
        R"(\bUNION\s+(?:ALL\s+)?SELECT\b)",
        "UNION SELECT is not allowed",
        PatternScope::kText,
    };
}

// 주석 내용에만 적용된다. 정규화기가 제거한 주석 안에 동사가 숨어 있으면 거부.
[[nodiscard]] PatternRuleSpec comment_smuggled_keyword(const std::string& verbs) {
    return PatternRuleSpec{
        "comment-smuggled-keyword",
        R"(\b()" + verbs + R"()\b)",
        "forbidden statement keyword hidden inside a comment",
        PatternScope::kComments,
    };
}

[[nodiscard]] PatternRuleSpec dynamic_execution() {
    return PatternRuleSpec{
        "dynamic-execution",
        R"(\bEXEC(?:UTE)?\s*\(|\bsp_|\bxp_)",
        "dynamic SQL execution or system/extended stored procedure call",
        PatternScope::kText,
    };
}

[[nodiscard]] PatternRuleSpec bulk_external_data() {
    return PatternRuleSpec{
        "bulk-external-data",
        R"(\bBULK\s+INSERT\b|\bOPEN(?:ROWSET|DATASOURCE|QUERY|XML)\b)",
        "bulk load or external data source access",
        PatternScope::kText,
    };
}

[[nodiscard]] PatternRuleSpec system_probe() {
    return PatternRuleSpec{
        "system-probe",
        R"(@@|\b(?:SYSTEM_USER|USER_NAME|DB_NAME|HOST_NAME))",
        "system or session introspection",
        PatternScope::kText,
    };
}

[[nodiscard]] PatternRuleSpec timing_attack() {
    return PatternRuleSpec{
        "timing-attack",
        R"(\bWAITFOR\s+(?:DELAY|TIME)\b|\bSLEEP\s*\(|\bBENCHMARK\s*\(|\bPG_SLEEP\s*\()",
        "time-based delay primitive",
        PatternScope::kText,
    };
}

[[nodiscard]] PatternRuleSpec obfuscation_via_char_codes() {
    return PatternRuleSpec{
        "obfuscation-via-char-codes",
        R"(\+\s*(?:N?CHAR|ASCII)\s*\(|\b(?:N?CHAR|ASCII)\s*\(\s*\d{1,12}\s*\)\s*\+|\|\|\s*(?:N?CHAR|CHR)\s*\()",
        "string concatenation with character-code conversion",
        PatternScope::kText,
    };
}

[[nodiscard]] PatternRuleSpec char_conversion_function() {
    return PatternRuleSpec{
        "char-conversion-function",
        R"(\b(?:N?CHAR|ASCII)\s*\()",
        "character-code conversion function",
        PatternScope::kText,
    };
}

[[nodiscard]] PatternRuleSpec credential_access() {
    return PatternRuleSpec{
        "credential-access",
        R"(PASSWORD|\bLOGIN)",
        "credential or login information access",
        PatternScope::kText,
    };
}

// 정책별 데이터 --------------------------------------------------------------

[[nodiscard]] std::vector<std::string> read_denied_keywords() {
    return {
        "DELETE", "DROP", "INSERT", "ALTER", "CREATE", "TRUNCATE", "EXEC", "EXECUTE",
        "MERGE", "REPLACE", "GRANT", "REVOKE", "COMMIT", "ROLLBACK", "TRANSACTION",
        "BEGIN", "DECLARE", "SET", "USE", "BACKUP", "RESTORE", "KILL", "SHUTDOWN",
        "WAITFOR", "OPENROWSET", "OPENDATASOURCE", "OPENQUERY", "OPENXML", "BULK",
    };
}

[[nodiscard]] ValidationPolicy read_only_query_policy() {
    ValidationPolicy p{};
    p.operation_class        = OperationClass::kReadOnlyQuery;
    p.name                   = "read_only_query";
    p.required_leading_verbs = {"SELECT"};
    p.denied_keywords        = read_denied_keywords();
    p.denied_patterns        = {
        statement_chaining(kReadChainVerbs),
        union_injection(),
        comment_smuggled_keyword("DELETE|DROP|UPDATE|INSERT|ALTER|CREATE|TRUNCATE|EXEC|EXECUTE"),
        dynamic_execution(),
        bulk_external_data(),
        system_probe(),
        timing_attack(),
        obfuscation_via_char_codes(),
        char_conversion_function(),
    };
    p.max_length = 10000;
    return p;
}

[[nodiscard]] ValidationPolicy guarded_mutation_policy() {
    ValidationPolicy p{};
    p.operation_class        = OperationClass::kGuardedMutation;
    p.name                   = "guarded_mutation";
    p.required_leading_verbs = {"UPDATE"};
    p.requires_guard_clause  = true;

    // UPDATE ... SET 이 정상 구문이므로 SET 은 제외
    for (auto& kw : read_denied_keywords()) {
        if (kw != "SET") {
            p.denied_keywords.push_back(std::move(kw));
        }
    }

    p.denied_patterns = {
        statement_chaining(kReadChainVerbs),
        comment_smuggled_keyword("DROP|INSERT|ALTER|CREATE|TRUNCATE|EXEC|EXECUTE|MERGE|GRANT|REVOKE"),
        dynamic_execution(),
        bulk_external_data(),
        timing_attack(),
        obfuscation_via_char_codes(),
    };
    p.max_length = 10000;
    return p;
}

[[nodiscard]] ValidationPolicy data_definition_policy() {
    ValidationPolicy p{};
    p.operation_class        = OperationClass::kDataDefinition;
    p.name                   = "data_definition";
    p.required_leading_verbs = {"CREATE", "ALTER", "DROP", "TRUNCATE"};
    p.denied_keywords        = {
        "EXEC", "EXECUTE", "INSERT", "UPDATE", "DELETE", "SELECT", "MERGE", "REPLACE",
        "GRANT", "REVOKE", "COMMIT", "ROLLBACK", "TRANSACTION", "BEGIN", "DECLARE", "SET",
        "USE", "BACKUP", "RESTORE", "KILL", "SHUTDOWN", "WAITFOR", "OPENROWSET",
        "OPENDATASOURCE", "OPENQUERY", "OPENXML", "BULK", "DBCC",
    };
    p.denied_patterns = {
        statement_chaining("EXEC|EXECUTE|INSERT|UPDATE|DELETE|SELECT|MERGE|GRANT|REVOKE|KILL|SHUTDOWN"),
        comment_smuggled_keyword("EXEC|EXECUTE|INSERT|UPDATE|DELETE|MERGE|GRANT|REVOKE|SHUTDOWN|KILL"),
        dynamic_execution(),
        bulk_external_data(),
        timing_attack(),
        obfuscation_via_char_codes(),
    };
    p.allowed_object_types = std::vector<std::string>{
        "TABLE", "INDEX", "VIEW", "TRIGGER", "CONSTRAINT",
        "DEFAULT", "RULE", "SCHEMA", "SEQUENCE", "SYNONYM",
    };
    p.allow_multiple_statements = true;
    p.max_length                = 50000;
    p.protected_qualifiers      = {
        PatternRuleSpec{
            "system-database",
            R"(\b(master|msdb|model|tempdb)\.)",
            "Operations on system databases (master, msdb, model, tempdb) are not allowed",
            PatternScope::kText,
        },
        PatternRuleSpec{
            "system-catalog",
            R"(\b(sys|INFORMATION_SCHEMA)\.)",
            "Operations on system catalog schemas (sys, INFORMATION_SCHEMA) are not allowed",
            PatternScope::kText,
        },
    };
    return p;
}

[[nodiscard]] ValidationPolicy diagnostic_batch_policy() {
    ValidationPolicy p{};
    p.operation_class        = OperationClass::kDiagnosticBatch;
    p.name                   = "diagnostic_batch";
    p.required_leading_verbs = {
        "SELECT", "SET STATISTICS", "SET SHOWPLAN_XML", "SET SHOWPLAN_ALL", "SET SHOWPLAN_TEXT",
    };
    p.denied_keywords = {
        "DELETE", "DROP", "UPDATE", "INSERT", "ALTER", "CREATE", "TRUNCATE", "MERGE",
        "REPLACE", "GRANT", "REVOKE", "BACKUP", "RESTORE", "KILL", "SHUTDOWN",
        "OPENROWSET", "OPENDATASOURCE", "OPENQUERY", "OPENXML", "BULK", "EXEC",
        "EXECUTE", "DECLARE", "USE", "DBCC",
    };
    p.denied_patterns = {
        statement_chaining(
            "DELETE|DROP|UPDATE|INSERT|ALTER|CREATE|TRUNCATE|EXEC|EXECUTE|MERGE|REPLACE|"
            "GRANT|REVOKE|KILL|SHUTDOWN|DBCC"),
        union_injection(),
        comment_smuggled_keyword("DELETE|DROP|UPDATE|INSERT|ALTER|CREATE|TRUNCATE|EXEC|EXECUTE"),
        dynamic_execution(),
        bulk_external_data(),
        timing_attack(),
        credential_access(),
        obfuscation_via_char_codes(),
    };
    p.allow_multiple_statements = true;
    p.max_length                = 50000;
    return p;
}

// 목록 끝에 중복 없이 추가
void append_unique(std::vector<std::string>& target, const std::vector<std::string>& extra) {
    for (const auto& item : extra) {
        bool exists = false;
        for (const auto& current : target) {
            if (current == item) {
                exists = true;
                break;
            }
        }
        if (!exists) {
            target.push_back(item);
        }
    }
}

}  // namespace

std::vector<ValidationPolicy> builtin_policies() {
    return {
        read_only_query_policy(),
        guarded_mutation_policy(),
        data_definition_policy(),
        diagnostic_batch_policy(),
    };
}

std::optional<ValidationPolicy> builtin_policy(OperationClass op) {
    switch (op) {
        case OperationClass::kReadOnlyQuery:   return read_only_query_policy();
        case OperationClass::kGuardedMutation: return guarded_mutation_policy();
        case OperationClass::kDataDefinition:  return data_definition_policy();
        case OperationClass::kDiagnosticBatch: return diagnostic_batch_policy();
        default:                               return std::nullopt;
    }
}

ValidationPolicy apply_overrides(ValidationPolicy base, const PolicyOverrides& overrides) {
    if (overrides.required_leading_verbs) {
        base.required_leading_verbs = *overrides.required_leading_verbs;
    }
    if (overrides.requires_guard_clause) {
        base.requires_guard_clause = *overrides.requires_guard_clause;
    }
    if (overrides.guard_token) {
        base.guard_token = *overrides.guard_token;
    }
    if (overrides.denied_keywords) {
        base.denied_keywords = *overrides.denied_keywords;
    }
    if (overrides.denied_patterns) {
        base.denied_patterns = *overrides.denied_patterns;
    }
    if (overrides.allowed_object_types) {
        base.allowed_object_types = *overrides.allowed_object_types;
    }
    if (overrides.allow_multiple_statements) {
        base.allow_multiple_statements = *overrides.allow_multiple_statements;
    }
    if (overrides.max_length) {
        base.max_length = *overrides.max_length;
    }
    if (overrides.protected_qualifiers) {
        base.protected_qualifiers = *overrides.protected_qualifiers;
    }

    append_unique(base.denied_keywords, overrides.extra_denied_keywords);

    if (!overrides.extra_allowed_object_types.empty()) {
        if (!base.allowed_object_types) {
            base.allowed_object_types = std::vector<std::string>{};
        }
        append_unique(*base.allowed_object_types, overrides.extra_allowed_object_types);
    }

    base.denied_patterns.insert(base.denied_patterns.end(),
                                overrides.extra_denied_patterns.begin(),
                                overrides.extra_denied_patterns.end());
    return base;
}
