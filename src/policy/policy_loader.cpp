// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 설정 파일을 ValidatorConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
// - global 필드 누락 시 구조체 기본값을 적용한다.
//
// [YAML 형식]
//   global:
//     log_level: info
//     log_path: /var/log/querygate/audit.log
//     sql_preview_length: 200
//   policies:
//     read_only_query:            # OperationClass 이름 (common/types.cpp)
//       max_length: 20000
//       extra_denied_keywords: [DBCC]
//     data_definition:
//       extra_allowed_object_types: [FUNCTION]
//       extra_denied_patterns:
//         - name: no-xml-index
//           pattern: '\bXML\s+INDEX\b'
//           reason: XML indexes are not allowed
//           scope: text           # text | comments (기본값 text)
//
// [fail-close 연계]
// 정규식은 로드 시점에 컴파일해 본다. 잘못된 패턴을 그대로 넘기면 엔진의
// 탐지기가 fail-close 상태가 되어 해당 분류의 모든 SQL 이 거부되므로,
// 기동 전에 명시적 오류로 알린다.
//
// [알려진 한계]
// - 알 수 없는 정책 필드 이름은 경고만 출력하고 무시한다 (오타 감지용).
//   알 수 없는 정책 키(분류 이름)는 오류다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::array<std::string_view, 6> kLogLevels{
    "trace", "debug", "info", "warn", "error", "critical",
};

constexpr std::array<std::string_view, 12> kOverrideFields{
    "required_leading_verbs", "requires_guard_clause", "guard_token",
    "denied_keywords", "denied_patterns", "allowed_object_types",
    "allow_multiple_statements", "max_length", "protected_qualifiers",
    "extra_denied_keywords", "extra_allowed_object_types", "extra_denied_patterns",
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 uint32_t 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 정책 필드용 문자열 목록. 값이 있는데 sequence 가 아니면 오류.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<std::string>, std::string>
read_required_list(const YAML::Node& node, std::string_view policy, std::string_view field) {
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format(
            "policy_loader: policies.{}.{} must be a list", policy, field));
    }
    return read_string_sequence(node);
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level          = read_string(global_node["log_level"], cfg.log_level);
    cfg.log_path           = read_string(global_node["log_path"],  cfg.log_path);
    cfg.sql_preview_length = read_uint32(global_node["sql_preview_length"], cfg.sql_preview_length);

    bool known_level = false;
    for (const auto level : kLogLevels) {
        if (cfg.log_level == level) {
            known_level = true;
            break;
        }
    }
    if (!known_level) {
        spdlog::warn("policy_loader: unknown log_level '{}', defaulting to 'info'", cfg.log_level);
        cfg.log_level = "info";
    }

    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 패턴 규칙 목록 파싱 + 정규식 사전 컴파일
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<PatternRuleSpec>, std::string>
parse_pattern_rules(const YAML::Node& node, std::string_view policy, std::string_view field) {
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format(
            "policy_loader: policies.{}.{} must be a list of rules", policy, field));
    }

    std::vector<PatternRuleSpec> rules;
    rules.reserve(node.size());
    for (const auto& rule_node : node) {
        if (!rule_node.IsMap()) {
            return std::unexpected(fmt::format(
                "policy_loader: policies.{}.{} entries must be maps", policy, field));
        }

        PatternRuleSpec rule{};
        rule.name    = read_string(rule_node["name"], "");
        rule.pattern = read_string(rule_node["pattern"], "");
        rule.reason  = read_string(rule_node["reason"], "");
        if (rule.name.empty() || rule.pattern.empty()) {
            return std::unexpected(fmt::format(
                "policy_loader: policies.{}.{} rule requires 'name' and 'pattern'", policy, field));
        }
        if (rule.reason.empty()) {
            rule.reason = rule.name;
        }

        const std::string scope = read_string(rule_node["scope"], "text");
        if (scope == "text") {
            rule.scope = PatternScope::kText;
        } else if (scope == "comments") {
            rule.scope = PatternScope::kComments;
        } else {
            return std::unexpected(fmt::format(
                "policy_loader: policies.{}.{} rule '{}' has unknown scope '{}' "
                "(expected 'text' or 'comments')",
                policy, field, rule.name, scope));
        }

        try {
            std::regex re(rule.pattern, std::regex_constants::icase | std::regex_constants::ECMAScript);
            (void)re;  // 컴파일만 확인
        } catch (const std::regex_error& e) {
            return std::unexpected(fmt::format(
                "policy_loader: policies.{}.{} rule '{}' has invalid regex: {}",
                policy, field, rule.name, e.what()));
        }

        rules.push_back(std::move(rule));
    }
    return rules;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 분류 하나의 PolicyOverrides 파싱
//   스칼라 변환 실패(YAML::BadConversion)는 호출자의 섹션 try-catch 가 처리한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PolicyOverrides, std::string>
parse_policy_overrides(const YAML::Node& node, std::string_view policy) {
    PolicyOverrides ov{};
    if (!node || node.IsNull()) {
        return ov;
    }
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("policy_loader: policies.{} must be a map", policy));
    }

    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        bool known = false;
        for (const auto field : kOverrideFields) {
            if (key == field) {
                known = true;
                break;
            }
        }
        if (!known) {
            spdlog::warn("policy_loader: ignoring unknown field policies.{}.{}", policy, key);
        }
    }

    // 목록 필드 (교체)
    const auto list_field = [&](const char* field,
                                std::optional<std::vector<std::string>>& target)
        -> std::expected<void, std::string> {
        if (const auto n = node[field]) {
            auto list = read_required_list(n, policy, field);
            if (!list) {
                return std::unexpected(list.error());
            }
            target = std::move(*list);
        }
        return {};
    };

    if (auto r = list_field("required_leading_verbs", ov.required_leading_verbs); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = list_field("denied_keywords", ov.denied_keywords); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = list_field("allowed_object_types", ov.allowed_object_types); !r) {
        return std::unexpected(r.error());
    }

    if (ov.required_leading_verbs && ov.required_leading_verbs->empty()) {
        return std::unexpected(fmt::format(
            "policy_loader: policies.{}.required_leading_verbs must not be empty", policy));
    }

    // 스칼라 필드
    if (const auto n = node["requires_guard_clause"]) {
        ov.requires_guard_clause = n.as<bool>();
    }
    if (const auto n = node["guard_token"]) {
        ov.guard_token = n.as<std::string>();
        if (ov.guard_token->empty()) {
            return std::unexpected(fmt::format(
                "policy_loader: policies.{}.guard_token must not be empty", policy));
        }
    }
    if (const auto n = node["allow_multiple_statements"]) {
        ov.allow_multiple_statements = n.as<bool>();
    }
    if (const auto n = node["max_length"]) {
        const auto max_length = n.as<std::uint32_t>();
        if (max_length == 0) {
            return std::unexpected(fmt::format(
                "policy_loader: policies.{}.max_length must be greater than 0", policy));
        }
        ov.max_length = max_length;
    }

    // 패턴 필드
    if (const auto n = node["denied_patterns"]) {
        auto rules = parse_pattern_rules(n, policy, "denied_patterns");
        if (!rules) {
            return std::unexpected(rules.error());
        }
        ov.denied_patterns = std::move(*rules);
    }
    if (const auto n = node["protected_qualifiers"]) {
        auto rules = parse_pattern_rules(n, policy, "protected_qualifiers");
        if (!rules) {
            return std::unexpected(rules.error());
        }
        ov.protected_qualifiers = std::move(*rules);
    }

    // 추가 필드
    if (const auto n = node["extra_denied_keywords"]) {
        auto list = read_required_list(n, policy, "extra_denied_keywords");
        if (!list) {
            return std::unexpected(list.error());
        }
        ov.extra_denied_keywords = std::move(*list);
    }
    if (const auto n = node["extra_allowed_object_types"]) {
        auto list = read_required_list(n, policy, "extra_allowed_object_types");
        if (!list) {
            return std::unexpected(list.error());
        }
        ov.extra_allowed_object_types = std::move(*list);
    }
    if (const auto n = node["extra_denied_patterns"]) {
        auto rules = parse_pattern_rules(n, policy, "extra_denied_patterns");
        if (!rules) {
            return std::unexpected(rules.error());
        }
        ov.extra_denied_patterns = std::move(*rules);
    }

    return ov;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 루트 노드 → ValidatorConfig
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ValidatorConfig, std::string> parse_root(const YAML::Node& root,
                                                                     std::string_view  source) {
    ValidatorConfig cfg{};

    // 빈 문서는 기본 설정
    if (!root || root.IsNull()) {
        spdlog::info("policy_loader: '{}' is empty, using built-in policies", source);
        return cfg;
    }

    if (!root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 각 섹션 파싱 (섹션별 try-catch, YAML 예외 안전)
    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: error parsing 'global' section: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        const YAML::Node policies_node = root["policies"];
        if (policies_node && !policies_node.IsNull()) {
            if (!policies_node.IsMap()) {
                const std::string err = "policy_loader: 'policies' section must be a map";
                spdlog::error("{}", err);
                return std::unexpected(err);
            }
            for (const auto& entry : policies_node) {
                const auto key = entry.first.as<std::string>();
                const auto op  = parse_operation_class(key);
                if (!op) {
                    const std::string err = fmt::format(
                        "policy_loader: unknown policy '{}' (expected read_only_query, "
                        "guarded_mutation, data_definition or diagnostic_batch)", key);
                    spdlog::error("{}", err);
                    return std::unexpected(err);
                }

                auto overrides = parse_policy_overrides(entry.second, key);
                if (!overrides) {
                    spdlog::error("{}", overrides.error());
                    return std::unexpected(overrides.error());
                }
                cfg.policy_overrides[*op] = std::move(*overrides);
            }
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: error parsing 'policies' section: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info(
        "policy_loader: configuration loaded successfully: log_level={}, policy_overrides={}",
        cfg.global.log_level,
        cfg.policy_overrides.size()
    );

    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<ValidatorConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화 (path traversal 방지 목적)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading configuration from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함한 상세 에러 메시지
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<ValidatorConfig, std::string>
PolicyLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("policy_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, "<string>");
}

std::expected<std::uint32_t, std::string>
PolicyLoader::parse_u32(std::string_view text) {
    const std::string value(text);
    constexpr auto kMax = std::numeric_limits<std::uint32_t>::max();

    long long parsed = 0;
    try {
        std::size_t consumed = 0;
        parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return std::unexpected(fmt::format("invalid value '{}'", value));
        }
    } catch (const std::out_of_range&) {
        return std::unexpected(fmt::format("value '{}' is out of range (0..{})", value, kMax));
    } catch (const std::invalid_argument&) {
        return std::unexpected(fmt::format("invalid value '{}'", value));
    }

    if (parsed < 0) {
        return std::unexpected(fmt::format("negative value {}", parsed));
    }
    if (parsed > static_cast<long long>(kMax)) {
        return std::unexpected(fmt::format("value {} is out of range (0..{})", parsed, kMax));
    }
    return static_cast<std::uint32_t>(parsed);
}
