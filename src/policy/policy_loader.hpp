#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 설정 파일(.claude/hooks.yaml)을 찾아 PolicyConfig 로 파싱하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(ConfigError) 반환. 부분 설정은 없다.
// - 스키마 검사(필드 타입, 액션 개수, mode 문자열)는 여기서,
//   regex / 조건식 / 이름 형식 / 중복 검사는 RuleSet::build 에서 수행한다.
//   둘 다 로드 시점에만 실패하며 이벤트 처리 중에는 실패하지 않는다.
//
// [설정 파일 탐색 순서]
// 1. HOOKGATE_CONFIG 가 가리키는 파일 (없으면 오류)
// 2. <project_root>/.claude/hooks.yaml
// 3. ~/.claude/hooks.yaml
// 4. 어느 것도 없으면 빈 규칙 집합
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"  // ConfigError
#include "policy/rule.hpp"   // PolicyConfig

class PolicyLoader {
public:
    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 PolicyConfig 로 파싱한다.
    //   파일 없음, 파싱 오류, 스키마 불일치 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<PolicyConfig, ConfigError>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   YAML 문자열을 파싱한다. origin 은 오류 메시지에 쓰이는 출처 이름.
    [[nodiscard]] static std::expected<PolicyConfig, ConfigError>
    load_from_string(std::string_view yaml, std::string_view origin = "<string>");

    // discover
    //   탐색 순서에 따라 설정 파일 경로를 찾는다. 없으면 std::nullopt.
    //   explicit_path 는 존재 여부와 상관없이 그대로 반환한다 (load 가 판단).
    [[nodiscard]] static std::optional<std::filesystem::path>
    discover(const std::optional<std::filesystem::path>& explicit_path,
             const std::filesystem::path&                project_root,
             const std::optional<std::filesystem::path>& home_dir);

    // load_for_project
    //   discover + load. 설정 파일이 없으면 빈 PolicyConfig.
    [[nodiscard]] static std::expected<PolicyConfig, ConfigError>
    load_for_project(const std::optional<std::filesystem::path>& explicit_path,
                     const std::filesystem::path&                project_root,
                     const std::optional<std::filesystem::path>& home_dir);
};
