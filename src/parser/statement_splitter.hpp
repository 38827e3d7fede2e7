#pragma once

// ---------------------------------------------------------------------------
// statement_splitter.hpp
//
// 정규화된 SQL 을 ';' 기준으로 최상위 후보 구문(candidate statement)으로 분할.
//
// [알려진 한계]
// - 문자열 리터럴 내부의 ';' 도 구분자로 취급한다 (정규화기와 같은 트레이드오프).
//   'a;b' 를 포함한 단일 SELECT 는 두 구문으로 분할되어 단일 구문 정책에서
//   거부된다 (false positive 방향).
//
// [수명]
// 반환되는 string_view 는 입력 문자열의 일부를 가리킨다. 입력 문자열보다
// 오래 보관하지 말 것 (검증 호출 한 번 안에서만 사용).
// ---------------------------------------------------------------------------

#include <string_view>
#include <vector>

class StatementSplitter {
public:
    StatementSplitter()  = default;
    ~StatementSplitter() = default;

    StatementSplitter(const StatementSplitter&)            = default;
    StatementSplitter& operator=(const StatementSplitter&) = default;
    StatementSplitter(StatementSplitter&&)                 = default;
    StatementSplitter& operator=(StatementSplitter&&)      = default;

    // split
    //   normalized_sql: SqlNormalizer 결과 텍스트
    //   반환: 앞뒤 공백을 제거한 비어 있지 않은 구문 목록 (입력 순서 유지)
    [[nodiscard]] std::vector<std::string_view> split(std::string_view normalized_sql) const;
};
