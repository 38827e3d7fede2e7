#pragma once

// ---------------------------------------------------------------------------
// validation_policy.hpp
//
// 작업 분류별 검증 정책 데이터 구조체 정의 (헤더만, 구현 없음).
// 기본값은 builtin_policies.cpp 에 있고, config/policy.yaml 의 policies 섹션이
// PolicyOverrides 형태로 일부 필드를 덮어쓴다.
//
// [설계 원칙]
// - 정책은 코드가 아니라 데이터다. 분류를 추가할 때 스캐너/엔진을 수정하지 않는다.
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 이 구조체는 판정 로직을 포함하지 않는다. 판정은 PolicyEngine 소관.
//
// [순환 의존성]
// validation_policy.hpp → common/types.hpp, parser/injection_detector.hpp (단방향)
// ❌ parser/* → validation_policy.hpp 금지
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"              // OperationClass
#include "parser/injection_detector.hpp" // PatternRuleSpec

// ---------------------------------------------------------------------------
// ValidationPolicy
//   한 작업 분류에 적용되는 규칙 묶음.
//
//   required_leading_verbs : 문장이 시작해야 하는 동사/구문 (대소문자 무관).
//                            "SET STATISTICS" 처럼 여러 단어도 허용.
//   guard_token            : requires_guard_clause 일 때 대문자 정규화 텍스트에
//                            포함되어야 하는 문자열. 단순 포함 검사다.
//   denied_keywords        : 거부 키워드. 실제 스캔에서는 required_leading_verbs
//                            (및 각 구문의 첫 단어)가 제외된다.
//   denied_patterns        : 순서 있는 이름 붙은 정규식 규칙 (first-match-wins)
//   allowed_object_types   : 값이 있으면 object_type_verbs 로 시작하는 문장에
//                            목록 중 하나의 토큰이 있어야 한다.
//   protected_qualifiers   : 동사와 무관하게 거부하는 시스템 DB/카탈로그 참조
//
//   [max_length]
//   원문(정규화 전) 바이트 길이 기준. max_length 와 같으면 허용.
// ---------------------------------------------------------------------------
struct ValidationPolicy {
    OperationClass                          operation_class{OperationClass::kReadOnlyQuery};
    std::string                             name{};
    std::vector<std::string>                required_leading_verbs{};
    bool                                    requires_guard_clause{false};
    std::string                             guard_token{" WHERE "};
    std::vector<std::string>                denied_keywords{};
    std::vector<PatternRuleSpec>            denied_patterns{};
    std::optional<std::vector<std::string>> allowed_object_types{};
    std::vector<std::string>                object_type_verbs{"CREATE", "ALTER"};
    bool                                    allow_multiple_statements{false};
    std::size_t                             max_length{10000};
    std::vector<PatternRuleSpec>            protected_qualifiers{};
};

// ---------------------------------------------------------------------------
// PolicyOverrides
//   ValidationPolicy 의 부분 덮어쓰기. 값이 있는 필드만 교체한다.
//   extra_* 목록은 교체가 아니라 기존 목록 뒤에 추가된다.
//
//   [적용 순서]
//   교체 필드를 먼저 적용하고, 그 결과에 extra_* 를 추가한다.
//   allowed_object_types 가 nullopt 인 정책에 extra_allowed_object_types 를
//   주면 빈 목록에서 시작한다.
// ---------------------------------------------------------------------------
struct PolicyOverrides {
    std::optional<std::vector<std::string>>     required_leading_verbs{};
    std::optional<bool>                         requires_guard_clause{};
    std::optional<std::string>                  guard_token{};
    std::optional<std::vector<std::string>>     denied_keywords{};
    std::optional<std::vector<PatternRuleSpec>> denied_patterns{};
    std::optional<std::vector<std::string>>     allowed_object_types{};
    std::optional<bool>                         allow_multiple_statements{};
    std::optional<std::size_t>                  max_length{};
    std::optional<std::vector<PatternRuleSpec>> protected_qualifiers{};

    std::vector<std::string>     extra_denied_keywords{};
    std::vector<std::string>     extra_allowed_object_types{};
    std::vector<PatternRuleSpec> extra_denied_patterns{};

    // 아무 필드도 지정되지 않았으면 true
    [[nodiscard]] bool empty() const noexcept {
        return !required_leading_verbs && !requires_guard_clause && !guard_token &&
               !denied_keywords && !denied_patterns && !allowed_object_types &&
               !allow_multiple_statements && !max_length && !protected_qualifiers &&
               extra_denied_keywords.empty() && extra_allowed_object_types.empty() &&
               extra_denied_patterns.empty();
    }

    // 정규식 규칙 목록이 바뀌는지 여부 (탐지기 재컴파일 필요 판단용)
    [[nodiscard]] bool touches_patterns() const noexcept {
        return denied_patterns.has_value() || !extra_denied_patterns.empty();
    }
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   전역 설정값.
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   log_path : 감사 로그 파일 경로 (StructuredLogger)
//   sql_preview_length: 감사 로그에 남기는 SQL 앞부분 길이
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string   log_level{"info"};
    std::string   log_path{"/tmp/querygate.log"};
    std::uint32_t sql_preview_length{200};
};

// ---------------------------------------------------------------------------
// ValidatorConfig
//   PolicyLoader::load 가 반환하는 최종 결과물.
//   policy_overrides 에 없는 분류는 기본 정책을 그대로 사용한다.
// ---------------------------------------------------------------------------
struct ValidatorConfig {
    GlobalConfig                              global{};
    std::map<OperationClass, PolicyOverrides> policy_overrides{};
};
