#pragma once

// ---------------------------------------------------------------------------
// sql_normalizer.hpp
//
// 키워드/패턴 매칭이 주석과 공백 변형에 속지 않도록 SQL 원문을 정규화한다.
//
// [처리 내용]
// 1. -- 줄 주석 (줄 끝까지), /* */ 블록 주석 (중첩 미지원) 제거
// 2. ASCII 공백(탭/개행/VT/FF/CR) → 공백, 연속 공백 → 공백 하나, 앞뒤 공백 제거
//
// [알려진 한계: 의도적으로 유지]
// - 문자열 리터럴 내부를 추적하지 않는다. 'a--b' 나 '/*' 를 포함한 리터럴도
//   주석으로 간주되어 변형된다. 휴리스틱 트레이드오프이며 수정 대상이 아니다.
// - 닫히지 않은 /* 는 입력 끝까지 주석으로 처리한다.
//
// [멱등성]
// 블록 주석 자리에 공백 하나를 삽입하므로 "-/**/-" 가 "--" 로 붙지 않는다.
// 따라서 normalize(normalize(x)) == normalize(x) 가 성립한다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// NormalizedSql
//   text           : 주석 제거 + 공백 정규화 결과 (빈 문자열 가능)
//   comment_bodies : 제거된 주석의 내용 (마커 제외). 주석 내 키워드
//                    은닉 탐지 규칙(PatternScope::kComments)이 사용한다.
// ---------------------------------------------------------------------------
struct NormalizedSql {
    std::string              text{};
    std::vector<std::string> comment_bodies{};
};

// ---------------------------------------------------------------------------
// SqlNormalizer
//   상태 없는 정규화기. 복사/이동 자유.
// ---------------------------------------------------------------------------
class SqlNormalizer {
public:
    SqlNormalizer()  = default;
    ~SqlNormalizer() = default;

    SqlNormalizer(const SqlNormalizer&)            = default;
    SqlNormalizer& operator=(const SqlNormalizer&) = default;
    SqlNormalizer(SqlNormalizer&&)                 = default;
    SqlNormalizer& operator=(SqlNormalizer&&)      = default;

    // normalize
    //   sql: 원문 SQL
    //   반환: 정규화된 텍스트와 제거된 주석 내용
    [[nodiscard]] NormalizedSql normalize(std::string_view sql) const;

    // normalize_text
    //   주석 내용이 필요 없는 호출자용 단축 함수.
    [[nodiscard]] std::string normalize_text(std::string_view sql) const;
};

// ASCII 대문자 변환. 키워드 스캐너와 정책 엔진이 공유한다.
[[nodiscard]] std::string to_upper_ascii(std::string_view s);

// 앞뒤 공백(스페이스, 탭, 개행 포함) 제거. 원본을 가리키는 view 를 반환한다.
[[nodiscard]] std::string_view trim_view(std::string_view s);
