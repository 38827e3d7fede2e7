#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// (작업 분류, SQL 원문) 쌍을 받아 실행 가능 여부를 판정하는 검증 엔진.
// 공개 진입점은 validate() 하나다.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 등록되지 않은 분류 → is_valid=false (kInternalError)
// 2. 내부 예외 → is_valid=false (kInternalError)
// 3. 규칙 컴파일 실패 → 해당 정책의 모든 입력 거부
// 4. is_valid=true 는 모든 단계를 통과했을 때만 반환
//
// ❌ 금지: 예외 처리 중 is_valid=true 반환
// ❌ 금지: 잘못된 규칙을 건너뛰고 계속 평가
//
// [평가 순서 (first-failure-wins)]
// 1. 정규화 → 비었으면 kEmptyInput
// 2. 원문 길이(kInputTooLong). 이후 단계의 정규식은 상한 이내 입력에만 실행된다.
// 3. 분할 → 선행 동사(kInvalidLeadingVerb), 객체 유형(kDisallowedObjectType)
//    다중 구문 허용 정책은 모든 후보 구문을, 아니면 첫 구문만 검사
// 4. 가드 절(kMissingGuardClause)
// 5. 키워드 스캔(kDeniedKeyword)
// 6. 패턴 스캔(kDeniedPattern). 정규화 텍스트 + 주석 내용 대상
// 7. 단일 구문 정책의 다중 구문(kMultipleStatementsNotAllowed)
// 8. 보호 대상 한정자(kProtectedTarget). 정규화 텍스트 대상
//
// [스레드 안전성]
// 생성 후 불변. validate() 는 동기화 없이 동시 호출 가능하다.
// 정책은 프로세스 시작 시 한 번 만들어지고 교체되지 않는다.
//
// [순환 의존성: 무순환 구조]
// policy_engine.hpp → validation_policy.hpp → common/types.hpp (단방향)
// ❌ parser/* → policy_engine.hpp 금지
// ---------------------------------------------------------------------------

#include <cstddef>
#include <map>
#include <memory>
#include <string_view>
#include <vector>

#include "common/types.hpp"              // OperationClass, ValidationResult
#include "policy/validation_policy.hpp"  // ValidationPolicy, PolicyOverrides, ValidatorConfig

class PolicyEngine {
public:
    // 기본 정책 네 개로 생성
    PolicyEngine();

    // 기본 정책에 config.policy_overrides 를 적용하여 생성
    explicit PolicyEngine(const ValidatorConfig& config);

    // 임의 정책 목록으로 생성. 같은 분류가 중복되면 뒤의 것이 이긴다.
    explicit PolicyEngine(std::vector<ValidationPolicy> policies);

    ~PolicyEngine() = default;

    // 복사 금지 (컴파일된 정책 공유 소유권 명확화), 이동 허용
    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&)                 = default;
    PolicyEngine& operator=(PolicyEngine&&)      = default;

    // validate
    //   op 에 등록된 정책으로 sql 을 검증한다.
    //   어떤 입력에 대해서도 예외를 던지지 않는다.
    [[nodiscard]] ValidationResult validate(OperationClass op, std::string_view sql) const noexcept;

    // validate (호출 단위 덮어쓰기)
    //   overrides 를 적용한 정책 사본으로 검증한다. 엔진의 정책은 바뀌지 않는다.
    //   패턴 목록을 건드리지 않으면 컴파일된 탐지기를 재사용한다.
    //   덮어쓴 정규식이 잘못되었으면 kInternalError 로 거부한다.
    [[nodiscard]] ValidationResult validate(OperationClass         op,
                                            std::string_view       sql,
                                            const PolicyOverrides& overrides) const noexcept;

    // 등록된 정책 조회. 없으면 nullptr.
    [[nodiscard]] const ValidationPolicy* find_policy(OperationClass op) const noexcept;

    [[nodiscard]] std::size_t policy_count() const noexcept { return policies_.size(); }

private:
    struct CompiledPolicy;

    // 정책 데이터를 미리 계산된 형태로 변환. reuse_* 가 있으면 재컴파일하지 않는다.
    [[nodiscard]] static std::shared_ptr<const CompiledPolicy>
    compile(ValidationPolicy                         policy,
            std::shared_ptr<const InjectionDetector> reuse_patterns,
            std::shared_ptr<const InjectionDetector> reuse_protected);

    [[nodiscard]] static ValidationResult run_pipeline(const CompiledPolicy& cp, std::string_view sql);

    std::map<OperationClass, std::shared_ptr<const CompiledPolicy>> policies_;
};
