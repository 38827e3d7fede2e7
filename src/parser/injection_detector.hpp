#pragma once

// ---------------------------------------------------------------------------
// injection_detector.hpp
//
// 이름 붙은 정규식 규칙 기반 구조적 SQL Injection 탐지기 (패턴 스캐너).
// 독립적 모듈: policy 레이어 헤더에 의존하지 않는다.
//
// [규칙 구성]
// 규칙 목록은 정책 데이터(builtin_policies.cpp / policy.yaml)에서 주입된다.
// 기본 정책이 사용하는 규칙 이름:
//   statement-chaining, union-injection, comment-smuggled-keyword,
//   dynamic-execution, bulk-external-data, system-probe, timing-attack,
//   obfuscation-via-char-codes, char-conversion-function, credential-access
//
// [평가 순서]
// 목록 순서대로 평가하고 첫 번째 매칭에서 즉시 반환한다 (first-match-wins).
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 인코딩 우회: hex 리터럴(0x44524f50='DROP'), 유니코드 이스케이프,
//    동형 문자(homoglyph)는 탐지하지 못한다.
// 2. 중첩/비정상 주석은 정규화기 한계를 그대로 따른다.
// 3. 정규식 기반이므로 의미 수준 안전성을 보장하지 않는다.
//
// [성능 고려사항]
// - 생성자에서 std::regex 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
// - 규칙 수 P, 입력 길이 N 에 대해 O(P * N). 기본 규칙은 .* 같은 무제한
//   반복을 피해 작성한다. 입력 길이 제한(max_length)은 정책이 함께 적용한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// PatternScope
//   kText     : 정규화된 SQL 텍스트 전체에 적용 (연속 공백 없음)
//   kComments : 정규화기가 제거한 주석 내용 각각에 적용
// ---------------------------------------------------------------------------
enum class PatternScope : std::uint8_t {
    kText     = 0,
    kComments = 1,
};

// ---------------------------------------------------------------------------
// PatternRuleSpec
//   컴파일 전 규칙 정의 (정책 데이터).
//   name   : 규칙 식별자 (결과 matched_rule / 감사 로그)
//   pattern: ECMAScript 정규식, 대소문자 무관으로 컴파일
//   reason : 사람이 읽을 수 있는 거부 사유 (결과에 그대로 노출)
// ---------------------------------------------------------------------------
struct PatternRuleSpec {
    std::string  name{};
    std::string  pattern{};
    std::string  reason{};
    PatternScope scope{PatternScope::kText};
};

// ---------------------------------------------------------------------------
// InjectionResult
//   detected == true 이면 rule_name/reason 이 채워진다.
// ---------------------------------------------------------------------------
struct InjectionResult {
    bool        detected{false};
    std::string rule_name{};
    std::string matched_pattern{};  // 매칭된 정규식 원문 (감사 로그용)
    std::string reason{};
};

// ---------------------------------------------------------------------------
// InjectionDetector
//   생성 시 규칙 목록을 컴파일하고 check() 에서 매칭.
//
//   [Fail-close]
//   하나라도 컴파일에 실패하면 fail_close_active() 가 true 가 되고,
//   check() 는 모든 입력에 대해 detected=true 를 반환한다.
//   잘못된 규칙을 건너뛰면 탐지 범위가 조용히 줄어들기 때문이다.
//   규칙 목록이 비어 있는 것은 정상 설정이다 (아무것도 탐지하지 않음).
//
//   [스레드 안전성]
//   생성 후 불변. check() 는 동시 호출 안전.
// ---------------------------------------------------------------------------
class InjectionDetector {
public:
    explicit InjectionDetector(std::vector<PatternRuleSpec> rules);

    ~InjectionDetector();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    InjectionDetector(const InjectionDetector&)            = delete;
    InjectionDetector& operator=(const InjectionDetector&) = delete;
    InjectionDetector(InjectionDetector&&) noexcept;
    InjectionDetector& operator=(InjectionDetector&&) noexcept;

    // check
    //   sql_text      : 정규화된 SQL 텍스트 (kText 규칙 대상)
    //   comment_bodies: 정규화기가 제거한 주석 내용 (kComments 규칙 대상)
    [[nodiscard]] InjectionResult check(std::string_view                sql_text,
                                        const std::vector<std::string>& comment_bodies) const;

    // 주석 없는 입력용 단축 함수
    [[nodiscard]] InjectionResult check(std::string_view sql_text) const;

    [[nodiscard]] bool        fail_close_active() const noexcept { return fail_close_active_; }
    [[nodiscard]] std::size_t rule_count() const noexcept;

private:
    // std::regex 는 구현 파일에서만 포함한다.
    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
    bool                         fail_close_active_{false};
    std::string                  invalid_rule_{};  // 컴파일 실패한 첫 규칙 이름
};
