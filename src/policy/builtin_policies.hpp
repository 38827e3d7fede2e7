#pragma once

// ---------------------------------------------------------------------------
// builtin_policies.hpp
//
// 네 가지 작업 분류의 기본 정책과 덮어쓰기 적용 함수.
// ---------------------------------------------------------------------------

#include <optional>
#include <vector>

#include "common/types.hpp"
#include "policy/validation_policy.hpp"

// 기본 정책 네 개를 OperationClass 순서대로 반환한다.
[[nodiscard]] std::vector<ValidationPolicy> builtin_policies();

// op 에 해당하는 기본 정책. 알 수 없는 값이면 std::nullopt.
[[nodiscard]] std::optional<ValidationPolicy> builtin_policy(OperationClass op);

// apply_overrides
//   base 에 overrides 를 적용한 사본을 반환한다 (validation_policy.hpp 참고).
//   denied_keywords 를 추가/교체한 뒤 required_leading_verbs 는 엔진이 스캔 시
//   다시 제외하므로 여기서 따로 정리하지 않는다.
[[nodiscard]] ValidationPolicy apply_overrides(ValidationPolicy base, const PolicyOverrides& overrides);
