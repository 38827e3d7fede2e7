#pragma once

// ---------------------------------------------------------------------------
// keyword_scanner.hpp
//
// 경계 인식(boundary-aware) 키워드 탐지기.
//
// [경계 규칙]
// 키워드 바로 앞뒤 문자가 영문자/숫자/밑줄이면 매칭으로 보지 않는다.
// 문자열 시작/끝, 공백, 구두점은 경계로 인정한다.
//   - DELETED_FLAG  → DELETE 아님
//   - DROP;TABLE    → DROP 탐지
//   - (DROP)        → DROP 탐지
//
// [입력 전제]
// scan() 은 대문자로 변환된 정규화 텍스트를 받는다. 키워드 목록은 생성자에서
// 대문자로 변환하여 보관하므로 대소문자 무관 탐지가 된다.
// 다중 단어 키워드("DBCC CHECKDB")는 정규화 텍스트의 단일 공백 기준으로 매칭.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class KeywordScanner {
public:
    // keywords: 거부 키워드 목록 (대소문자 무관). 빈 항목은 무시한다.
    explicit KeywordScanner(std::vector<std::string> keywords);

    ~KeywordScanner() = default;

    KeywordScanner(const KeywordScanner&)            = default;
    KeywordScanner& operator=(const KeywordScanner&) = default;
    KeywordScanner(KeywordScanner&&)                 = default;
    KeywordScanner& operator=(KeywordScanner&&)      = default;

    // scan
    //   upper_text: 대문자 정규화 텍스트
    //   반환: 목록 순서상 처음 발견된 키워드 (대문자), 없으면 std::nullopt
    [[nodiscard]] std::optional<std::string> scan(std::string_view upper_text) const;

    [[nodiscard]] const std::vector<std::string>& keywords() const noexcept { return keywords_; }

private:
    std::vector<std::string> keywords_;
};

// 식별자 문자 여부 (영문자, 숫자, 밑줄).
[[nodiscard]] bool is_identifier_char(char c) noexcept;

// find_token
//   haystack 에서 경계 규칙을 만족하는 token 의 첫 위치를 from 이후에서 찾는다.
//   대소문자를 구분하므로 호출자가 양쪽을 같은 대소문자로 맞춰야 한다.
[[nodiscard]] std::size_t find_token(std::string_view haystack,
                                     std::string_view token,
                                     std::size_t      from = 0) noexcept;

[[nodiscard]] bool contains_token(std::string_view haystack, std::string_view token) noexcept;

// starts_with_phrase
//   statement 가 phrase 로 시작하고, 그 직후가 경계인지 확인한다.
//   "SELECT*FROM t" 는 SELECT 로 시작, "SELECTED" 는 아님.
[[nodiscard]] bool starts_with_phrase(std::string_view statement, std::string_view phrase) noexcept;
