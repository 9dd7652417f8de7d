#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 정책 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 .claude/hooks.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 표준 라이브러리 외 다른 헤더에 의존하지 않는다.
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 선택 필드는 std::optional 로 "설정 안 됨" 과 "기본값" 을 구분한다.
//   effective_mode() / effective_priority() 가 기본값을 적용한다.
// - 이 구조체 자체는 판정 로직을 포함하지 않는다.
//   regex / 조건식 컴파일은 RuleSet::build 의 책임이다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// PolicyMode
//   Enforce 는 Warn/Audit 보다 항상 우선한다 (priority 값과 무관).
// ---------------------------------------------------------------------------
enum class PolicyMode : std::uint8_t {
    kEnforce = 0,  // 액션을 그대로 실행 (차단 포함)
    kWarn    = 1,  // 차단 대신 경고 컨텍스트 주입
    kAudit   = 2,  // 아무것도 실행하지 않고 기록만
};

// 검증 스크립트 신뢰 수준. 기록만 하고 강제하지 않는다.
enum class TrustLevel : std::uint8_t {
    kLocal     = 0,
    kVerified  = 1,
    kUntrusted = 2,
};

enum class Confidence : std::uint8_t {
    kHigh   = 0,
    kMedium = 1,
    kLow    = 2,
};

[[nodiscard]] constexpr std::string_view to_string(PolicyMode mode) noexcept {
    switch (mode) {
        case PolicyMode::kEnforce: return "enforce";
        case PolicyMode::kWarn:    return "warn";
        case PolicyMode::kAudit:   return "audit";
    }
    return "enforce";
}

[[nodiscard]] constexpr std::string_view to_string(TrustLevel trust) noexcept {
    switch (trust) {
        case TrustLevel::kLocal:     return "local";
        case TrustLevel::kVerified:  return "verified";
        case TrustLevel::kUntrusted: return "untrusted";
    }
    return "local";
}

[[nodiscard]] constexpr std::string_view to_string(Confidence confidence) noexcept {
    switch (confidence) {
        case Confidence::kHigh:   return "high";
        case Confidence::kMedium: return "medium";
        case Confidence::kLow:    return "low";
    }
    return "medium";
}

// 소문자 이름만 허용 ("enforce", "warn", "audit")
[[nodiscard]] constexpr std::optional<PolicyMode> policy_mode_from_string(std::string_view s) noexcept {
    if (s == "enforce") { return PolicyMode::kEnforce; }
    if (s == "warn")    { return PolicyMode::kWarn; }
    if (s == "audit")   { return PolicyMode::kAudit; }
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<TrustLevel> trust_level_from_string(std::string_view s) noexcept {
    if (s == "local")     { return TrustLevel::kLocal; }
    if (s == "verified")  { return TrustLevel::kVerified; }
    if (s == "untrusted") { return TrustLevel::kUntrusted; }
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<Confidence> confidence_from_string(std::string_view s) noexcept {
    if (s == "high")   { return Confidence::kHigh; }
    if (s == "medium") { return Confidence::kMedium; }
    if (s == "low")    { return Confidence::kLow; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Matchers
//   모든 predicate 는 선택 사항이며 AND 로 결합된다.
//   설정되지 않은 predicate 는 항상 참으로 간주한다.
//
//   directories 는 접두사 매칭이다. 패턴 끝의 "/**", "/*", "/" 는 제거된다.
//   (glob 전체 문법은 지원하지 않는다.)
// ---------------------------------------------------------------------------
struct Matchers {
    std::optional<std::vector<std::string>> tools{};          // 도구 이름 (대소문자 구분)
    std::optional<std::vector<std::string>> extensions{};     // ".rs" 처럼 점 포함
    std::optional<std::vector<std::string>> directories{};    // 디렉토리 접두사
    std::optional<std::vector<std::string>> operations{};     // 명령 첫 토큰
    std::optional<std::string>              command_match{};  // 명령 regex (검색)
    std::optional<std::string>              prompt_match{};   // 프롬프트 regex (검색)
    std::optional<std::string>              enabled_when{};   // 조건식

    bool operator==(const Matchers&) const = default;

    [[nodiscard]] bool empty() const noexcept {
        return !tools && !extensions && !directories && !operations
            && !command_match && !prompt_match && !enabled_when;
    }
};

// ---------------------------------------------------------------------------
// Action (닫힌 합 타입)
//   규칙 하나는 정확히 하나의 액션을 가진다.
// ---------------------------------------------------------------------------
struct BlockAction {
    std::optional<std::string> reason{};  // 없으면 "Blocked by rule '<name>': <description>"

    bool operator==(const BlockAction&) const = default;
};

struct InjectFile {
    std::string path{};  // 상대 경로는 project root 기준

    bool operator==(const InjectFile&) const = default;
};

struct InjectInline {
    std::string text{};

    bool operator==(const InjectInline&) const = default;
};

struct InjectCommand {
    std::string command{};  // /bin/sh -c 로 실행, stdout 을 컨텍스트로 사용

    bool operator==(const InjectCommand&) const = default;
};

struct InjectAction {
    std::variant<InjectFile, InjectInline, InjectCommand> source{InjectInline{}};

    bool operator==(const InjectAction&) const = default;
};

struct RunAction {
    std::string               script{};
    std::optional<TrustLevel> trust{};

    bool operator==(const RunAction&) const = default;
};

struct BlockIfMatchAction {
    std::optional<std::string> field{};    // 없으면 content, new_string, newString, command 순
    std::string                pattern{};

    bool operator==(const BlockIfMatchAction&) const = default;
};

struct RequireFieldsAction {
    std::vector<std::string> fields{};  // 점 표기로 중첩 객체를 내려간다

    bool operator==(const RequireFieldsAction&) const = default;
};

using Action = std::variant<BlockAction, InjectAction, RunAction, BlockIfMatchAction,
                            RequireFieldsAction>;

// ---------------------------------------------------------------------------
// RuleMetadata
//   출처 정보만 담는다. 평가에는 절대 영향을 주지 않는다.
// ---------------------------------------------------------------------------
struct RuleMetadata {
    std::optional<std::string>              author{};
    std::optional<std::string>              created_by{};
    std::optional<std::string>              reason{};
    std::optional<Confidence>               confidence{};
    std::optional<std::string>              last_reviewed{};
    std::optional<std::string>              ticket{};
    std::optional<std::vector<std::string>> tags{};

    bool operator==(const RuleMetadata&) const = default;
};

// ---------------------------------------------------------------------------
// Rule
//   name 은 [A-Za-z0-9_-]+ 이며 설정 파일 안에서 유일하다.
//   events 가 비어 있으면 모든 이벤트 종류에 적용된다.
// ---------------------------------------------------------------------------
struct Rule {
    std::string                              name{};
    std::optional<std::string>               description{};
    std::vector<std::string>                 events{};      // 이벤트 종류 이름 제한
    Matchers                                 matchers{};
    Action                                   action{BlockAction{}};
    std::optional<PolicyMode>                mode{};        // 기본 Enforce
    std::optional<int>                       priority{};    // 기본 0, 클수록 먼저
    bool                                     enabled{true}; // false 면 로드 시 제거
    std::optional<std::chrono::milliseconds> timeout{};     // 외부 프로세스 제한 시간
    std::optional<RuleMetadata>              metadata{};

    bool operator==(const Rule&) const = default;

    [[nodiscard]] PolicyMode effective_mode() const noexcept {
        return mode.value_or(PolicyMode::kEnforce);
    }

    [[nodiscard]] int effective_priority() const noexcept {
        return priority.value_or(0);
    }
};

// ---------------------------------------------------------------------------
// Settings
//   settings: 블록. 모든 값은 기본값을 가진다.
// ---------------------------------------------------------------------------
struct Settings {
    std::string                          log_level{"warn"};                 // 진단 로그 레벨
    bool                                 fail_open{true};                   // 검증 실패 시 허용
    std::chrono::milliseconds            script_timeout{30'000};            // 기본 외부 프로세스 제한
    std::size_t                          max_context_size{1024 * 1024};     // 주입 컨텍스트 상한 (bytes)
    bool                                 debug_logs{false};
    std::optional<std::filesystem::path> log_path{};                        // 기본 ~/.claude/logs/hookgate.log

    bool operator==(const Settings&) const = default;
};

// ---------------------------------------------------------------------------
// PolicyConfig
//   최상위 설정 구조체. PolicyLoader::load 의 결과.
// ---------------------------------------------------------------------------
struct PolicyConfig {
    std::string       version{"1.0"};
    Settings          settings{};
    std::vector<Rule> rules{};
};
