// ---------------------------------------------------------------------------
// keyword_scanner.cpp
//
// 정규식 대신 직접 스캔으로 경계를 검사한다. 키워드 수 K, 입력 길이 N 에 대해
// O(K * N) 이며 역추적(backtracking)이 없다.
// ---------------------------------------------------------------------------

#include "parser/keyword_scanner.hpp"

#include "parser/sql_normalizer.hpp"  // to_upper_ascii, trim_view

#include <cctype>

bool is_identifier_char(char c) noexcept {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

std::size_t find_token(std::string_view haystack,
                       std::string_view token,
                       std::size_t      from) noexcept {
    if (token.empty()) {
        return std::string_view::npos;
    }

    std::size_t pos = haystack.find(token, from);
    while (pos != std::string_view::npos) {
        const std::size_t after = pos + token.size();
        const bool valid_start = (pos == 0) || !is_identifier_char(haystack[pos - 1]);
        const bool valid_end   = (after >= haystack.size()) || !is_identifier_char(haystack[after]);
        if (valid_start && valid_end) {
            return pos;
        }
        pos = haystack.find(token, pos + 1);
    }
    return std::string_view::npos;
}

bool contains_token(std::string_view haystack, std::string_view token) noexcept {
    return find_token(haystack, token) != std::string_view::npos;
}

bool starts_with_phrase(std::string_view statement, std::string_view phrase) noexcept {
    if (phrase.empty() || statement.size() < phrase.size()) {
        return false;
    }
    if (statement.substr(0, phrase.size()) != phrase) {
        return false;
    }
    return statement.size() == phrase.size() || !is_identifier_char(statement[phrase.size()]);
}

KeywordScanner::KeywordScanner(std::vector<std::string> keywords) {
    keywords_.reserve(keywords.size());
    for (auto& kw : keywords) {
        const auto trimmed = trim_view(kw);
        if (trimmed.empty()) {
            continue;
        }
        keywords_.push_back(to_upper_ascii(trimmed));
    }
}

std::optional<std::string> KeywordScanner::scan(std::string_view upper_text) const {
    for (const auto& kw : keywords_) {
        if (contains_token(upper_text, kw)) {
            return kw;
        }
    }
    return std::nullopt;
}
