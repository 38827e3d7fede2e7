// ---------------------------------------------------------------------------
// types.cpp
//
// OperationClass / ValidationErrorCode 문자열 변환.
// 설정 파일 키와 로그 필드가 같은 이름을 쓰도록 snake_case 로 통일한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

std::string_view operation_class_name(OperationClass op) noexcept {
    switch (op) {
        case OperationClass::kReadOnlyQuery:   return "read_only_query";
        case OperationClass::kGuardedMutation: return "guarded_mutation";
        case OperationClass::kDataDefinition:  return "data_definition";
        case OperationClass::kDiagnosticBatch: return "diagnostic_batch";
        default:                               return "unknown";
    }
}

std::optional<OperationClass> parse_operation_class(std::string_view name) noexcept {
    if (name == "read_only_query")  { return OperationClass::kReadOnlyQuery; }
    if (name == "guarded_mutation") { return OperationClass::kGuardedMutation; }
    if (name == "data_definition")  { return OperationClass::kDataDefinition; }
    if (name == "diagnostic_batch") { return OperationClass::kDiagnosticBatch; }
    return std::nullopt;
}

std::string_view error_code_name(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::kNone:                         return "none";
        case ValidationErrorCode::kEmptyInput:                   return "empty_input";
        case ValidationErrorCode::kInvalidLeadingVerb:           return "invalid_leading_verb";
        case ValidationErrorCode::kMissingGuardClause:           return "missing_guard_clause";
        case ValidationErrorCode::kDisallowedObjectType:         return "disallowed_object_type";
        case ValidationErrorCode::kDeniedKeyword:                return "denied_keyword";
        case ValidationErrorCode::kDeniedPattern:                return "denied_pattern";
        case ValidationErrorCode::kMultipleStatementsNotAllowed: return "multiple_statements_not_allowed";
        case ValidationErrorCode::kProtectedTarget:              return "protected_target";
        case ValidationErrorCode::kInputTooLong:                 return "input_too_long";
        case ValidationErrorCode::kInternalError:                return "internal_error";
        default:                                                 return "internal_error";
    }
}
