#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// OperationClass
//   호출자가 의도한 SQL 작업 범주. 어떤 ValidationPolicy 를 적용할지 결정한다.
//   호출마다 호출자가 지정하며 엔진 내부에서 변경되지 않는다.
//
//   [확장]
//   다섯 번째 분류를 추가할 때는 이 enum 과 정책 데이터만 추가한다.
//   스캐너/엔진 코드는 분류별 분기를 갖지 않는다.
// ---------------------------------------------------------------------------
enum class OperationClass : std::uint8_t {
    kReadOnlyQuery   = 0,  // 순수 SELECT
    kGuardedMutation = 1,  // WHERE 가드가 필요한 UPDATE (또는 DELETE)
    kDataDefinition  = 2,  // CREATE/ALTER/DROP/TRUNCATE
    kDiagnosticBatch = 3,  // SET STATISTICS / SET SHOWPLAN_* 토글 + SELECT
};

// 통계 배열 크기 등 분류 개수가 필요한 곳에서 사용한다.
inline constexpr std::size_t kOperationClassCount = 4;

// ---------------------------------------------------------------------------
// ValidationErrorCode
//   거부 사유 분류. 모두 정상적인 음성 결과이며 예외로 던지지 않는다.
//   kInternalError 는 엔진 내부 오류를 fail-close 로 매핑한 결과다.
// ---------------------------------------------------------------------------
enum class ValidationErrorCode : std::uint8_t {
    kNone                         = 0,
    kEmptyInput                   = 1,
    kInvalidLeadingVerb           = 2,
    kMissingGuardClause           = 3,
    kDisallowedObjectType         = 4,
    kDeniedKeyword                = 5,
    kDeniedPattern                = 6,
    kMultipleStatementsNotAllowed = 7,
    kProtectedTarget              = 8,
    kInputTooLong                 = 9,
    kInternalError                = 10,
};

// ---------------------------------------------------------------------------
// ValidationResult
//   validate() 의 유일한 출력.
//
//   - is_valid == true 이면 reason 은 비어 있다.
//   - is_valid == false 이면 reason 은 위반된 규칙 하나만 설명한다
//     (first-match-wins, 위반 사항을 모두 모으지 않는다).
//   - matched_rule: 발동한 키워드/규칙 이름 (감사 로그용).
//   - normalized_query: 정규화 결과가 비어 있지 않으면 채워진다.
//
//   기본값은 거부 상태다 (fail-close).
// ---------------------------------------------------------------------------
struct ValidationResult {
    bool                       is_valid{false};
    ValidationErrorCode        error_code{ValidationErrorCode::kInternalError};
    std::optional<std::string> reason{};
    std::optional<std::string> normalized_query{};
    std::string                matched_rule{};
};

// 문자열 변환 헬퍼 (로그/설정 키 공용). 구현: common/types.cpp
[[nodiscard]] std::string_view operation_class_name(OperationClass op) noexcept;
[[nodiscard]] std::optional<OperationClass> parse_operation_class(std::string_view name) noexcept;
[[nodiscard]] std::string_view error_code_name(ValidationErrorCode code) noexcept;
