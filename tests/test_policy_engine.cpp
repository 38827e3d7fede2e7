// ---------------------------------------------------------------------------
// test_policy_engine.cpp
//
// PolicyEngine 단위 테스트.
//
// [테스트 범위]
// - 네 가지 기본 정책의 허용/거부 경계
// - 평가 순서 (첫 번째 실패가 결과를 결정)
// - 거부 키워드: 대소문자/공백 무관, 식별자 내부 부분 문자열 무시
// - 주석 숨김 키워드, 문자 코드 변환 함수
// - max_length 경계 (정확히 같으면 허용, 1자 초과 거부)
// - 긴 공백/숫자 열: 상한 이내면 정상 판정, 상한 초과면 정규식 실행 전 길이 거부
// - 구조적 패턴 규칙 이름 (statement-chaining, dynamic-execution, bulk-external-data)
// - 보호 대상 (시스템 DB / 시스템 카탈로그)
// - 호출 단위 덮어쓰기 / 설정 덮어쓰기 (DELETE 동사, 객체 유형 추가)
// - Fail-close: 빈 입력, 주석만 있는 입력, 미등록 분류, 잘못된 정규식
// - 동시 호출: 공유 엔진의 validate() 결과 일관성
//
// [오탐/미탐 트레이드오프]
// - 가드 절은 텍스트 포함 검사다. 문자열 리터럴 안의 WHERE 도 통과한다.
//   약점을 그대로 유지하는지 테스트로 고정한다.
// ---------------------------------------------------------------------------

#include "policy/builtin_policies.hpp"
#include "policy/policy_engine.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

const PolicyEngine& engine() {
    static const PolicyEngine instance{};
    return instance;
}

ValidationResult check(OperationClass op, std::string_view sql) {
    return engine().validate(op, sql);
}

}  // namespace

// ---------------------------------------------------------------------------
// 구성
// ---------------------------------------------------------------------------

TEST(PolicyEngine, DefaultConstruction_RegistersFourPolicies) {
    EXPECT_EQ(engine().policy_count(), 4u);
    for (const auto op : {OperationClass::kReadOnlyQuery, OperationClass::kGuardedMutation,
                          OperationClass::kDataDefinition, OperationClass::kDiagnosticBatch}) {
        ASSERT_NE(engine().find_policy(op), nullptr);
        EXPECT_EQ(engine().find_policy(op)->operation_class, op);
    }
}

// ---------------------------------------------------------------------------
// ReadOnlyQuery
// ---------------------------------------------------------------------------

TEST(PolicyEngineRead, SimpleSelect_Accepted) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT * FROM users");
    EXPECT_TRUE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kNone);
    ASSERT_TRUE(r.normalized_query.has_value());
    EXPECT_EQ(*r.normalized_query, "SELECT * FROM users");
    EXPECT_FALSE(r.reason.has_value());
}

TEST(PolicyEngineRead, ChainedDrop_RejectedByKeyword) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT * FROM users; DROP TABLE users;");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedKeyword);
    EXPECT_EQ(r.matched_rule, "DROP");
    ASSERT_TRUE(r.reason.has_value());
    EXPECT_NE(r.reason->find("DROP"), std::string::npos);
}

TEST(PolicyEngineRead, DeniedKeyword_CaseAndWhitespaceInsensitive) {
    const auto r = check(OperationClass::kReadOnlyQuery, "select *\n\tfrom t;\n   dRoP    table t");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedKeyword);
    EXPECT_EQ(r.matched_rule, "DROP");
}

TEST(PolicyEngineRead, KeywordInsideIdentifier_Accepted) {
    const auto r = check(OperationClass::kReadOnlyQuery,
                         "SELECT last_update, created_at FROM executions WHERE dropped = 0");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

TEST(PolicyEngineRead, UnionSelect_RejectedByPattern) {
    const auto r = check(OperationClass::kReadOnlyQuery,
                         "SELECT * FROM a UNION SELECT * FROM passwords");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "union-injection");
    ASSERT_TRUE(r.reason.has_value());
    EXPECT_NE(r.reason->find("UNION SELECT is not allowed"), std::string::npos);
}

TEST(PolicyEngineRead, NonSelectVerb_Rejected) {
    const auto r = check(OperationClass::kReadOnlyQuery, "UPDATE users SET a = 1 WHERE id = 1");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInvalidLeadingVerb);
    EXPECT_EQ(*r.reason, "Statement must start with one of: SELECT");
}

// 주석으로 키워드를 합치려는 시도는 동사 검사에서 막힌다
TEST(PolicyEngineRead, CommentSplitKeyword_Rejected) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SEL/**/ECT * FROM users");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInvalidLeadingVerb);
}

TEST(PolicyEngineRead, KeywordHiddenInComment_RejectedByPattern) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT * FROM users /* DROP TABLE users */");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "comment-smuggled-keyword");
}

TEST(PolicyEngineRead, HarmlessComment_Accepted) {
    const auto r = check(OperationClass::kReadOnlyQuery, "-- monthly report\nSELECT id FROM orders");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
    EXPECT_EQ(*r.normalized_query, "SELECT id FROM orders");
}

TEST(PolicyEngineRead, CharConversion_Rejected) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT CHAR(65) FROM t");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "char-conversion-function");
}

TEST(PolicyEngineRead, CharCodeConcatenation_Rejected) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT 'a' + CHAR(68) FROM t");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.matched_rule, "obfuscation-via-char-codes");
}

TEST(PolicyEngineRead, VarcharCast_Accepted) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT CAST(id AS VARCHAR(10)) FROM t");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

TEST(PolicyEngineRead, TimingPrimitive_Rejected) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT SLEEP(5)");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.matched_rule, "timing-attack");
}

TEST(PolicyEngineRead, SystemProbe_Rejected) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT @@version");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.matched_rule, "system-probe");
}

TEST(PolicyEngineRead, TwoSelects_RejectedAsMultipleStatements) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT 1; SELECT 2");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kMultipleStatementsNotAllowed);
    EXPECT_EQ(*r.reason, "Multiple SQL statements are not allowed");
}

TEST(PolicyEngineRead, TrailingSemicolon_Accepted) {
    EXPECT_TRUE(check(OperationClass::kReadOnlyQuery, "SELECT 1;").is_valid);
}

// ---------------------------------------------------------------------------
// 구조적 패턴 규칙 (matched_rule 이 규칙 이름이어야 한다)
// ---------------------------------------------------------------------------

// UPDATE 는 읽기 정책 거부 키워드가 아니므로 체이닝 규칙이 먼저 잡는다
TEST(PolicyEngineRead, ChainedUpdateWithoutSpace_RejectedAsStatementChaining) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT 1;UPDATE t");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "statement-chaining");
}

TEST(PolicyEngineRead, ExtendedProcedureName_RejectedAsDynamicExecution) {
    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT * FROM xp_dirs");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "dynamic-execution");
}

// 거부 키워드 목록을 DROP 하나로 바꾸면 OPENROWSET 은 패턴 규칙에서 잡힌다
TEST(PolicyEngineRead, OpenRowsetWithoutKeywordDeny_RejectedAsBulkExternalData) {
    PolicyOverrides overrides{};
    overrides.denied_keywords = std::vector<std::string>{"DROP"};

    const auto r = engine().validate(OperationClass::kReadOnlyQuery,
                                     "SELECT * FROM OPENROWSET('SQLNCLI', 'x', 'SELECT 1')",
                                     overrides);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "bulk-external-data");
}

// 패턴은 정규화 텍스트에 적용된다. 주석으로 쪼갠 UNION/**/SELECT 도 잡힌다.
TEST(PolicyEngineRead, UnionSplitByComment_RejectedAsUnionInjection) {
    const auto r = check(OperationClass::kReadOnlyQuery,
                         "SELECT id FROM a UNION/**/SELECT id FROM b");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "union-injection");
}

// ---------------------------------------------------------------------------
// max_length 경계
// ---------------------------------------------------------------------------

TEST(PolicyEngineLength, ExactlyMaxLength_Accepted) {
    const auto* policy = engine().find_policy(OperationClass::kReadOnlyQuery);
    ASSERT_NE(policy, nullptr);
    const std::string prefix = "SELECT ";
    const std::string sql    = prefix + std::string(policy->max_length - prefix.size(), 'a');
    ASSERT_EQ(sql.size(), policy->max_length);

    EXPECT_TRUE(check(OperationClass::kReadOnlyQuery, sql).is_valid);
}

TEST(PolicyEngineLength, OneOverMaxLength_Rejected) {
    const auto* policy = engine().find_policy(OperationClass::kReadOnlyQuery);
    ASSERT_NE(policy, nullptr);
    const std::string prefix = "SELECT ";
    const std::string sql    = prefix + std::string(policy->max_length - prefix.size() + 1, 'a');

    const auto r = check(OperationClass::kReadOnlyQuery, sql);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInputTooLong);
}

// 길이는 정규화 전 원문 기준이다 (공백이 접혀도 원문 길이로 판단)
TEST(PolicyEngineLength, MeasuredOnOriginalText) {
    PolicyOverrides overrides{};
    overrides.max_length = 20;
    const std::string sql = "SELECT 1" + std::string(30, ' ');

    const auto r = engine().validate(OperationClass::kReadOnlyQuery, sql, overrides);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInputTooLong);
    EXPECT_EQ(*r.normalized_query, "SELECT 1");
}

// ---------------------------------------------------------------------------
// 긴 공백/숫자 열
//   정규식 실행기가 반복마다 재귀하므로, 상한 이내의 긴 공백 열도
//   패턴 스캔 단계에서 스택을 소모하지 않고 정상 판정되어야 한다.
// ---------------------------------------------------------------------------

TEST(PolicyEngineLength, LongNewlineRunInsideDdlBatch_Accepted) {
    const std::string sql =
        "CREATE TABLE t (id INT);" + std::string(49000, '\n') + "CREATE INDEX ix ON t(id)";
    const auto* policy = engine().find_policy(OperationClass::kDataDefinition);
    ASSERT_NE(policy, nullptr);
    ASSERT_LE(sql.size(), policy->max_length);

    ValidationResult r{};
    EXPECT_NO_THROW(r = check(OperationClass::kDataDefinition, sql));
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
    EXPECT_EQ(*r.normalized_query, "CREATE TABLE t (id INT); CREATE INDEX ix ON t(id)");
}

TEST(PolicyEngineLength, LongTabRunInsideDiagnosticBatch_Accepted) {
    const std::string sql =
        "SET STATISTICS IO ON;" + std::string(49000, '\t') + "SELECT 1";
    const auto r = check(OperationClass::kDiagnosticBatch, sql);
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

// 체이닝 규칙이 공백 열 뒤의 동사를 놓치지 않는다
TEST(PolicyEngineLength, LongWhitespaceBeforeChainedVerb_StillRejected) {
    const std::string sql = "SELECT 1;" + std::string(9000, ' ') + "\v\fUPDATE t";
    const auto r = check(OperationClass::kReadOnlyQuery, sql);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "statement-chaining");
    EXPECT_EQ(*r.normalized_query, "SELECT 1; UPDATE t");
}

// 상한을 크게 넘는 입력은 정규식 실행 전에 길이로 거부된다
TEST(PolicyEngineLength, MillionSpacesAfterTerminator_RejectedAsTooLong) {
    const std::string sql = "SELECT 1;" + std::string(1000000, ' ') + "x";

    ValidationResult r{};
    EXPECT_NO_THROW(r = check(OperationClass::kReadOnlyQuery, sql));
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInputTooLong);
    EXPECT_EQ(*r.reason,
              "Query is too long: 1000010 characters exceeds the maximum of 10000");
}

TEST(PolicyEngineLength, OverLimitWithDeniedKeyword_ReportsLengthFirst) {
    const std::string sql = "SELECT 1; DROP TABLE t" + std::string(20000, ' ');
    const auto r = check(OperationClass::kReadOnlyQuery, sql);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInputTooLong);
}

// 문자 코드 인자 자릿수가 길어도 스캔이 끝난다 (DDL 정책에는 char-conversion-function 없음)
TEST(PolicyEngineLength, LongDigitRunInCharCall_ScanTerminates) {
    const std::string sql =
        "CREATE TABLE t (c INT DEFAULT CHAR(" + std::string(40000, '0') + "65))";
    ValidationResult r{};
    EXPECT_NO_THROW(r = check(OperationClass::kDataDefinition, sql));
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

// ---------------------------------------------------------------------------
// GuardedMutation
// ---------------------------------------------------------------------------

TEST(PolicyEngineMutation, UpdateWithoutWhere_Rejected) {
    const auto r = check(OperationClass::kGuardedMutation, "UPDATE users SET name='x'");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kMissingGuardClause);
    EXPECT_EQ(r.matched_rule, "WHERE");
    EXPECT_EQ(*r.reason, "UPDATE queries must include a WHERE clause");
}

TEST(PolicyEngineMutation, UpdateWithWhere_Accepted) {
    const auto r = check(OperationClass::kGuardedMutation, "UPDATE users SET name='x' WHERE id=1");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

TEST(PolicyEngineMutation, LowercaseWhereAcrossNewline_Accepted) {
    const auto r = check(OperationClass::kGuardedMutation, "update users set name='x'\nwhere id=1");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

// 텍스트 포함 검사이므로 리터럴 안의 WHERE 도 가드로 인정된다
TEST(PolicyEngineMutation, WhereInsideLiteral_StillAccepted) {
    const auto r = check(OperationClass::kGuardedMutation, "UPDATE notes SET body = 'see where it goes'");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

TEST(PolicyEngineMutation, DeleteWithoutOverride_Rejected) {
    const auto r = check(OperationClass::kGuardedMutation, "DELETE FROM users WHERE id = 1");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInvalidLeadingVerb);
}

TEST(PolicyEngineMutation, ChainedStatement_Rejected) {
    const auto r = check(OperationClass::kGuardedMutation,
                         "UPDATE users SET a = 1 WHERE id = 1; DROP TABLE users");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedKeyword);
    EXPECT_EQ(r.matched_rule, "DROP");
}

TEST(PolicyEngineMutation, DeleteVerbOverride_Accepted) {
    PolicyOverrides overrides{};
    overrides.required_leading_verbs = std::vector<std::string>{"DELETE"};

    const auto ok = engine().validate(OperationClass::kGuardedMutation,
                                      "DELETE FROM users WHERE id = 1", overrides);
    EXPECT_TRUE(ok.is_valid) << ok.reason.value_or("");

    const auto missing = engine().validate(OperationClass::kGuardedMutation,
                                           "DELETE FROM users", overrides);
    EXPECT_FALSE(missing.is_valid);
    EXPECT_EQ(missing.error_code, ValidationErrorCode::kMissingGuardClause);
    EXPECT_EQ(*missing.reason, "DELETE queries must include a WHERE clause");
}

// ---------------------------------------------------------------------------
// DataDefinition
// ---------------------------------------------------------------------------

TEST(PolicyEngineDdl, TwoAllowedStatements_Accepted) {
    const auto r = check(OperationClass::kDataDefinition,
                         "CREATE TABLE t (id INT); CREATE INDEX ix ON t(id)");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

TEST(PolicyEngineDdl, TrailingSelect_RejectedByLeadingVerb) {
    const auto r = check(OperationClass::kDataDefinition, "CREATE TABLE t (id INT); SELECT * FROM t");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInvalidLeadingVerb);
    EXPECT_EQ(*r.reason, "Statement 2 must start with one of: CREATE, ALTER, DROP, TRUNCATE");
}

TEST(PolicyEngineDdl, DisallowedObjectType_Rejected) {
    const auto r = check(OperationClass::kDataDefinition, "CREATE PROCEDURE p AS RETURN 1");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDisallowedObjectType);
    ASSERT_TRUE(r.reason.has_value());
    EXPECT_EQ(r.reason->rfind("Object type must be one of: TABLE", 0), 0u);
}

TEST(PolicyEngineDdl, DropAndTruncate_SkipObjectTypeCheck) {
    EXPECT_TRUE(check(OperationClass::kDataDefinition, "DROP TABLE staging").is_valid);
    EXPECT_TRUE(check(OperationClass::kDataDefinition, "TRUNCATE TABLE staging").is_valid);
}

TEST(PolicyEngineDdl, SystemDatabase_RejectedAsProtected) {
    const auto r = check(OperationClass::kDataDefinition, "DROP TABLE master.dbo.accounts");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kProtectedTarget);
    EXPECT_EQ(r.matched_rule, "system-database");
}

TEST(PolicyEngineDdl, SystemCatalog_RejectedAsProtected) {
    const auto r = check(OperationClass::kDataDefinition, "CREATE TABLE sys.shadow (id INT)");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kProtectedTarget);
    EXPECT_EQ(r.matched_rule, "system-catalog");
}

TEST(PolicyEngineDdl, ExecStatementInBatch_RejectedByLeadingVerb) {
    const auto r = check(OperationClass::kDataDefinition, "CREATE TABLE t (id INT); EXEC sp_who");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInvalidLeadingVerb);
}

TEST(PolicyEngineDdl, ConfigExtraObjectType_Accepted) {
    const std::string sql = "CREATE FUNCTION dbo.f (@x INT) RETURNS INT";
    EXPECT_FALSE(check(OperationClass::kDataDefinition, sql).is_valid);

    ValidatorConfig config{};
    config.policy_overrides[OperationClass::kDataDefinition].extra_allowed_object_types = {"FUNCTION"};
    const PolicyEngine configured{config};

    const auto r = configured.validate(OperationClass::kDataDefinition, sql);
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

// ---------------------------------------------------------------------------
// DiagnosticBatch
// ---------------------------------------------------------------------------

TEST(PolicyEngineDiagnostic, StatisticsToggleBatch_Accepted) {
    const auto r = check(OperationClass::kDiagnosticBatch,
                         "SET STATISTICS IO ON; SELECT * FROM orders; SET STATISTICS IO OFF");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

TEST(PolicyEngineDiagnostic, ShowplanToggle_Accepted) {
    const auto r = check(OperationClass::kDiagnosticBatch,
                         "SET SHOWPLAN_XML ON; SELECT id FROM orders; SET SHOWPLAN_XML OFF");
    EXPECT_TRUE(r.is_valid) << r.reason.value_or("");
}

TEST(PolicyEngineDiagnostic, OtherSetOption_Rejected) {
    const auto r = check(OperationClass::kDiagnosticBatch, "SET NOCOUNT ON; SELECT 1");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInvalidLeadingVerb);
    EXPECT_EQ(r.reason->rfind("Statement 1 must start with one of:", 0), 0u);
}

TEST(PolicyEngineDiagnostic, CredentialAccess_Rejected) {
    const auto r = check(OperationClass::kDiagnosticBatch, "SELECT password_hash FROM logins");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kDeniedPattern);
    EXPECT_EQ(r.matched_rule, "credential-access");
}

// ---------------------------------------------------------------------------
// 호출 단위 덮어쓰기
// ---------------------------------------------------------------------------

TEST(PolicyEngineOverrides, ExtraDeniedKeyword_AppliesOnlyToCall) {
    const std::string sql = "SELECT * FROM t WITH (NOLOCK)";
    PolicyOverrides overrides{};
    overrides.extra_denied_keywords = {"nolock"};

    const auto r = engine().validate(OperationClass::kReadOnlyQuery, sql, overrides);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.matched_rule, "NOLOCK");

    EXPECT_TRUE(engine().validate(OperationClass::kReadOnlyQuery, sql).is_valid);
}

TEST(PolicyEngineOverrides, EmptyOverrides_SameAsPlainValidate) {
    const auto r = engine().validate(OperationClass::kReadOnlyQuery, "SELECT 1", PolicyOverrides{});
    EXPECT_TRUE(r.is_valid);
}

TEST(PolicyEngineOverrides, InvalidPatternOverride_FailsClosed) {
    PolicyOverrides overrides{};
    overrides.extra_denied_patterns = {
        PatternRuleSpec{"broken", "(unclosed", "broken", PatternScope::kText}};

    const auto r = engine().validate(OperationClass::kReadOnlyQuery, "SELECT 1", overrides);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInternalError);
    EXPECT_EQ(r.matched_rule, "invalid-pattern-rules");
}

TEST(PolicyEngineOverrides, ApplyOverrides_AppendsWithoutDuplicates) {
    auto base = builtin_policy(OperationClass::kReadOnlyQuery);
    ASSERT_TRUE(base.has_value());
    const auto before = base->denied_keywords.size();

    PolicyOverrides overrides{};
    overrides.extra_denied_keywords = {"DROP", "NOLOCK"};
    const auto merged = apply_overrides(*base, overrides);
    EXPECT_EQ(merged.denied_keywords.size(), before + 1);
    EXPECT_EQ(merged.denied_keywords.back(), "NOLOCK");
}

// ---------------------------------------------------------------------------
// Fail-close
// ---------------------------------------------------------------------------

TEST(PolicyEngineFailClose, EmptyAndBlankInput_RejectedWithoutThrowing) {
    for (const std::string sql : {"", "   ", "\n\t", "-- only a comment", "/* block */", ";;;"}) {
        ValidationResult r{};
        EXPECT_NO_THROW(r = check(OperationClass::kReadOnlyQuery, sql)) << sql;
        EXPECT_FALSE(r.is_valid) << sql;
        EXPECT_EQ(r.error_code, ValidationErrorCode::kEmptyInput) << sql;
    }
}

TEST(PolicyEngineFailClose, UnregisteredClass_InternalError) {
    const PolicyEngine read_only{std::vector<ValidationPolicy>{
        *builtin_policy(OperationClass::kReadOnlyQuery)}};
    EXPECT_EQ(read_only.policy_count(), 1u);

    const auto r = read_only.validate(OperationClass::kGuardedMutation,
                                      "UPDATE t SET a = 1 WHERE id = 1");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInternalError);
    EXPECT_EQ(r.matched_rule, "no-policy");
}

TEST(PolicyEngineFailClose, InvalidBuiltinRule_RejectsEverything) {
    auto policy = *builtin_policy(OperationClass::kReadOnlyQuery);
    policy.denied_patterns.push_back(
        PatternRuleSpec{"broken", "[a-", "broken", PatternScope::kText});
    const PolicyEngine broken{std::vector<ValidationPolicy>{std::move(policy)}};

    const auto r = broken.validate(OperationClass::kReadOnlyQuery, "SELECT 1");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_code, ValidationErrorCode::kInternalError);
}

TEST(PolicyEngineFailClose, DuplicatePolicy_LaterWins) {
    auto first  = *builtin_policy(OperationClass::kReadOnlyQuery);
    auto second = first;
    second.max_length = 5;
    const PolicyEngine engine_dup{std::vector<ValidationPolicy>{first, second}};

    EXPECT_EQ(engine_dup.policy_count(), 1u);
    EXPECT_EQ(engine_dup.find_policy(OperationClass::kReadOnlyQuery)->max_length, 5u);
}

// ---------------------------------------------------------------------------
// ConcurrentValidate
//   하나의 엔진을 여러 스레드가 동기화 없이 공유해도 판정이 일관되어야 한다.
// ---------------------------------------------------------------------------
TEST(PolicyEngineConcurrency, ConcurrentValidate_ConsistentResults) {
    constexpr int kThreads    = 8;
    constexpr int kIterations = 500;

    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> mismatched{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kIterations; ++i) {
                if ((t + i) % 2 == 0) {
                    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT id FROM orders");
                    if (r.is_valid) {
                        accepted.fetch_add(1, std::memory_order_relaxed);
                    } else {
                        mismatched.fetch_add(1, std::memory_order_relaxed);
                    }
                } else {
                    const auto r = check(OperationClass::kReadOnlyQuery, "SELECT 1;UPDATE t");
                    if (!r.is_valid && r.matched_rule == "statement-chaining") {
                        rejected.fetch_add(1, std::memory_order_relaxed);
                    } else {
                        mismatched.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatched.load(), 0);
    EXPECT_EQ(accepted.load() + rejected.load(), kThreads * kIterations);
    EXPECT_EQ(accepted.load(), kThreads * kIterations / 2);
}
