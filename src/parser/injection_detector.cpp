// ---------------------------------------------------------------------------
// injection_detector.cpp
//
// 이름 붙은 정규식 규칙 기반 탐지기 구현.
//
// [CompiledPattern 구현 주의사항]
// 헤더에서 CompiledPattern 을 전방 선언만 하므로 vector<CompiledPattern> 의
// 소멸자/이동 연산은 완전한 정의가 보이는 이 파일에서 인스턴스화해야 한다.
// 그래서 소멸자와 이동 연산을 헤더에서 선언만 하고 여기서 default 로 정의한다.
// std::regex 는 shared_ptr 로 보관하여 정책 사본 간 공유가 가능하게 한다.
//
// [오탐/미탐 트레이드오프]
// - union-injection: 합법적인 UNION 사용도 거부한다 (읽기 정책의 위협 모델).
// - dynamic-execution 의 \bsp_ / \bxp_: sp_ 로 시작하는 컬럼명도 거부된다.
// - comment-smuggled-keyword: 주석 안에 동사가 보이면 설명용 주석이라도 거부.
// ---------------------------------------------------------------------------

#include "parser/injection_detector.hpp"

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

struct InjectionDetector::CompiledPattern {
    std::string                 name;
    std::string                 source_pattern;
    std::string                 reason;
    PatternScope                scope{PatternScope::kText};
    std::shared_ptr<std::regex> compiled;
};

InjectionDetector::~InjectionDetector() = default;
InjectionDetector::InjectionDetector(InjectionDetector&&) noexcept = default;
InjectionDetector& InjectionDetector::operator=(InjectionDetector&&) noexcept = default;

// ---------------------------------------------------------------------------
// InjectionDetector 생성자
// ---------------------------------------------------------------------------
InjectionDetector::InjectionDetector(std::vector<PatternRuleSpec> rules) {
    compiled_patterns_.reserve(rules.size());

    for (auto& rule : rules) {
        try {
            auto re = std::make_shared<std::regex>(
                rule.pattern,
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            compiled_patterns_.push_back(CompiledPattern{
                std::move(rule.name),
                std::move(rule.pattern),
                std::move(rule.reason),
                rule.scope,
                std::move(re),
            });
        } catch (const std::regex_error& e) {
            // 규칙 하나를 건너뛰면 해당 공격 유형이 조용히 통과하므로
            // 탐지기 전체를 fail-close 로 전환한다.
            spdlog::error(
                "injection_detector: invalid regex for rule '{}' ('{}'): {} "
                "(fail-close active, all SQL will be rejected)",
                rule.name, rule.pattern, e.what()
            );
            if (!fail_close_active_) {
                invalid_rule_ = rule.name;
            }
            fail_close_active_ = true;
        }
    }
}

// ---------------------------------------------------------------------------
// InjectionDetector::check
// ---------------------------------------------------------------------------
InjectionResult InjectionDetector::check(std::string_view                sql_text,
                                         const std::vector<std::string>& comment_bodies) const {
    if (fail_close_active_) {
        return InjectionResult{
            true,
            invalid_rule_,
            "",
            "pattern rule set is invalid"
        };
    }

    const std::string sql_str(sql_text);

    for (const auto& cp : compiled_patterns_) {
        if (!cp.compiled) {
            continue;
        }

        bool matched = false;
        if (cp.scope == PatternScope::kText) {
            matched = std::regex_search(sql_str, *cp.compiled);
        } else {
            for (const auto& body : comment_bodies) {
                if (std::regex_search(body, *cp.compiled)) {
                    matched = true;
                    break;
                }
            }
        }

        if (matched) {
            // 첫 번째 매칭 시 즉시 반환
            return InjectionResult{
                true,
                cp.name,
                cp.source_pattern,
                cp.reason
            };
        }
    }

    return InjectionResult{false, "", "", ""};
}

InjectionResult InjectionDetector::check(std::string_view sql_text) const {
    static const std::vector<std::string> kNoComments{};
    return check(sql_text, kNoComments);
}

std::size_t InjectionDetector::rule_count() const noexcept {
    return compiled_patterns_.size();
}
