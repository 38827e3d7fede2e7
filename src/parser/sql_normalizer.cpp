// ---------------------------------------------------------------------------
// sql_normalizer.cpp
//
// 주석 제거 + 공백 정규화 구현.
//
// [처리 순서]
// 한 번의 선형 스캔에서 먼저 시작되는 주석을 처리한다.
//   - "/*" : "*/" 까지 제거, 자리에 공백 하나 삽입 (DROP/**/TABLE → DROP TABLE)
//   - "--" : 줄 끝('\n' 직전)까지 제거, 개행은 보존
// 이후 모든 ASCII 공백('\t' '\n' '\v' '\f' '\r')을 공백으로 바꾸고 연속 공백을 접는다.
// 결과 텍스트에는 두 글자 이상 이어진 공백이 없다. 패턴 스캐너의 \s* 가
// 입력 길이에 비례해 재귀하지 않도록 하는 전제 조건이다.
//
// [우회 주의]
// - SEL/**/ECT 처럼 키워드 중간을 자른 경우 "SEL ECT" 가 되어 선행 동사
//   검사에서 거부된다 (false positive 방향, 안전).
// - 문자열 리터럴 내부 주석 마커도 제거된다 (알려진 한계).
// ---------------------------------------------------------------------------

#include "parser/sql_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace {

// 주석을 제거하고, 제거한 주석 내용을 out_comments 에 모은다.
std::string strip_comments(std::string_view sql, std::vector<std::string>& out_comments) {
    std::string result;
    result.reserve(sql.size());

    std::size_t i = 0;
    const std::size_t len = sql.size();

    while (i < len) {
        // 블록 주석 /* ... */
        if (i + 1 < len && sql[i] == '/' && sql[i + 1] == '*') {
            i += 2;
            const std::size_t body_start = i;
            std::size_t body_end = len;
            while (i < len) {
                if (i + 1 < len && sql[i] == '*' && sql[i + 1] == '/') {
                    body_end = i;
                    i += 2;
                    break;
                }
                ++i;
            }
            out_comments.emplace_back(sql.substr(body_start, body_end - body_start));
            result.push_back(' ');
            continue;
        }

        // 줄 주석 -- (줄 끝까지)
        if (i + 1 < len && sql[i] == '-' && sql[i + 1] == '-') {
            i += 2;
            const std::size_t body_start = i;
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            out_comments.emplace_back(sql.substr(body_start, i - body_start));
            continue;
        }

        result.push_back(sql[i]);
        ++i;
    }

    return result;
}

// ASCII 공백을 공백으로 바꾸고 연속 공백을 하나로 접은 뒤 앞뒤를 자른다.
std::string collapse_whitespace(std::string_view s) {
    std::string result;
    result.reserve(s.size());

    bool pending_space = false;
    for (const char c : s) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            pending_space = true;
            continue;
        }
        if (pending_space && !result.empty()) {
            result.push_back(' ');
        }
        pending_space = false;
        result.push_back(c);
    }

    return result;
}

}  // namespace

std::string to_upper_ascii(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string_view trim_view(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

NormalizedSql SqlNormalizer::normalize(std::string_view sql) const {
    NormalizedSql out{};
    const std::string stripped = strip_comments(sql, out.comment_bodies);
    out.text = collapse_whitespace(stripped);
    return out;
}

std::string SqlNormalizer::normalize_text(std::string_view sql) const {
    return normalize(sql).text;
}
