#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 설정 파일(config/policy.yaml)을 읽어 ValidatorConfig 로 변환한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는 실패 시
//   기동을 중단해야 한다 (부분 설정으로 검증하지 않는다).
// - 설정은 기본 정책에 대한 덮어쓰기(PolicyOverrides)만 담는다.
//   빈 파일 또는 policies 섹션이 없는 파일은 "기본 정책 그대로" 를 뜻한다.
//
// [순환 의존성]
// policy_loader.hpp → validation_policy.hpp (단방향만)
//
// [보안 고려사항]
// - YAML 파일 경로는 설정/환경 변수에서만 지정하고 사용자 입력을 직접 사용 금지.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "policy/validation_policy.hpp"  // ValidatorConfig

class PolicyLoader {
public:
    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 ValidatorConfig 로 파싱한다.
    //
    //   [fail-close 요구사항]
    //   파일 없음, 파싱 오류, 스키마 불일치(알 수 없는 정책 키, max_length 0,
    //   잘못된 정규식, scope 값 오류) 모두 실패로 처리한다.
    //   부분적으로 파싱된 설정을 반환하지 않는다.
    [[nodiscard]] static std::expected<ValidatorConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   파일 대신 YAML 문자열을 파싱한다. 규칙은 load() 와 같다.
    [[nodiscard]] static std::expected<ValidatorConfig, std::string>
    load_from_string(std::string_view yaml_text);

    // parse_u32
    //   환경변수 덮어쓰기(SQL_PREVIEW_LENGTH 등)용 10진 정수 파싱.
    //   음수, UINT32_MAX 초과, 숫자 뒤 잔여 문자, 빈 문자열은 실패로 처리한다.
    //   std::uint32_t 로 잘라 넣지 않는다.
    [[nodiscard]] static std::expected<std::uint32_t, std::string>
    parse_u32(std::string_view text);
};
