#pragma once

// ---------------------------------------------------------------------------
// matcher.hpp
//
// 규칙 하나의 predicate 집합을 이벤트에 대해 평가한다.
//
// [설계 원칙]
// - 설정되지 않은 predicate 는 평가하지 않으며 결과도 std::nullopt 로 남는다.
// - trace=false 이면 첫 번째 거짓에서 단락 평가한다.
//   trace=true (디버그 로그) 이면 모든 predicate 를 평가해 결과를 기록한다.
// - regex 와 조건식은 compile() 시점에 한 번만 컴파일된다.
//   evaluate() 는 실패하지 않는다.
//
// [오탐/미탐 트레이드오프]
// - directories 는 접두사 매칭이다. "src/**" 는 "src" 와 "src/" 하위 전체를 잡는다.
//   "src" 는 "srcfoo/..." 를 잡지 않는다 (경로 구분자 경계 검사).
// - 상대 경로 이벤트는 그대로, 절대 경로 이벤트는 cwd 기준 상대 경로로도 비교한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "event/event.hpp"
#include "policy/expression.hpp"
#include "policy/pattern.hpp"
#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// MatcherResults
//   디버그 트레이스용 predicate 별 결과. 설정된 predicate 만 값을 가진다.
// ---------------------------------------------------------------------------
struct MatcherResults {
    std::optional<bool> tools_matched{};
    std::optional<bool> extensions_matched{};
    std::optional<bool> directories_matched{};
    std::optional<bool> operations_matched{};
    std::optional<bool> command_match_matched{};
    std::optional<bool> prompt_match_matched{};
    std::optional<bool> enabled_when_matched{};

    bool operator==(const MatcherResults&) const = default;
};

void to_json(nlohmann::json& j, const MatcherResults& results);
void from_json(const nlohmann::json& j, MatcherResults& results);

struct MatchResult {
    bool           matched{false};
    MatcherResults details{};
};

// ---------------------------------------------------------------------------
// CompiledMatchers
// ---------------------------------------------------------------------------
class CompiledMatchers {
public:
    CompiledMatchers() = default;

    // regex / 조건식 컴파일 실패 시 ConfigError (rule_name 은 호출자가 채운다)
    [[nodiscard]] static std::expected<CompiledMatchers, ConfigError>
    compile(const Matchers& matchers);

    [[nodiscard]] MatchResult evaluate(const Event&             event,
                                       const InvocationContext& ctx,
                                       bool                     trace) const;

    [[nodiscard]] const Matchers& source() const noexcept { return source_; }

private:
    Matchers                  source_{};
    std::optional<Pattern>    command_re_{};
    std::optional<Pattern>    prompt_re_{};
    std::optional<Expression> condition_{};
};

// ---------------------------------------------------------------------------
// 경로 / 명령 헬퍼 (테스트에서도 직접 사용)
// ---------------------------------------------------------------------------

// 마지막 경로 성분의 확장자 (점 포함). 없으면 빈 문자열.
// ".bashrc" 처럼 점으로 시작하는 파일 이름은 확장자가 없다.
[[nodiscard]] std::string path_extension(std::string_view path);

// 패턴 정규화: '\' → '/', 끝의 "/**", "/*", "/" 제거, 앞의 "./" 제거.
// "." 과 "./" 는 빈 접두사 (모든 경로).
[[nodiscard]] std::string normalize_directory_pattern(std::string_view pattern);

// path 가 prefix 와 같거나 prefix + "/" 로 시작하면 참.
// 절대 경로는 cwd 기준 상대 경로로도 비교한다.
[[nodiscard]] bool directory_matches(std::string_view                  pattern,
                                     std::string_view                  file_path,
                                     const std::optional<std::string>& cwd);

// 공백 기준 첫 토큰
[[nodiscard]] std::string_view first_token(std::string_view command) noexcept;
