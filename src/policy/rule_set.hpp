#pragma once

// ---------------------------------------------------------------------------
// rule_set.hpp
//
// 검증/컴파일/정렬이 끝난 불변 규칙 집합.
//
// [설계 원칙]
// - build() 는 all-or-nothing 이다. 규칙 하나라도 잘못되면 ConfigError 를
//   반환하고 부분 집합을 만들지 않는다.
// - enabled: false 규칙도 전부 검증/컴파일한 뒤 제거된다. 절대 매칭되지 않는다.
// - 정렬: priority 내림차순, 같으면 선언 순서 (stable_sort).
//   평가 순서는 실행마다 결정적이다.
// - 생성 후에는 읽기 전용이다. applicable() 이 돌려주는 포인터는 RuleSet 이
//   살아 있는 동안 유효하다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

#include "common/types.hpp"
#include "event/event.hpp"
#include "policy/matcher.hpp"
#include "policy/pattern.hpp"
#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// CompiledRule
//   Rule 원본 + 컴파일된 매처 + block_if_match 패턴.
// ---------------------------------------------------------------------------
struct CompiledRule {
    Rule                   rule{};
    CompiledMatchers       matchers{};
    std::optional<Pattern> action_pattern{};   // BlockIfMatch 전용
    std::size_t            declaration_index{0};

    [[nodiscard]] const std::string& name() const noexcept { return rule.name; }
    [[nodiscard]] PolicyMode mode() const noexcept { return rule.effective_mode(); }
    [[nodiscard]] int priority() const noexcept { return rule.effective_priority(); }

    // events 제한이 없거나 kind_name 이 목록에 있으면 참
    [[nodiscard]] bool applies_to(const Event& event) const noexcept;
};

class RuleSet {
public:
    RuleSet() = default;

    [[nodiscard]] static std::expected<RuleSet, ConfigError> build(std::vector<Rule> rules);

    // 이벤트 종류에 적용되는 규칙 (정렬 순서 유지)
    [[nodiscard]] std::vector<const CompiledRule*> applicable(const Event& event) const;

    [[nodiscard]] const std::vector<CompiledRule>& rules() const noexcept { return rules_; }
    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

private:
    explicit RuleSet(std::vector<CompiledRule> rules) : rules_(std::move(rules)) {}

    std::vector<CompiledRule> rules_{};
};

// 규칙 이름 형식 검사: [A-Za-z0-9_-]+
[[nodiscard]] bool is_valid_rule_name(std::string_view name) noexcept;
