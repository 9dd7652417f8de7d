// ---------------------------------------------------------------------------
// rule_set.cpp
//
// [검증 순서]
// 1. 이름 형식 → 2. 이름 중복 → 3. 액션 내용 (빈 스크립트, 빈 필드 목록)
// 4. 매처 regex / 조건식 컴파일 → 5. block_if_match 패턴 컴파일
// 비활성 규칙도 1-5 단계 검증을 모두 거친 뒤 제거된다.
// ---------------------------------------------------------------------------

#include "policy/rule_set.hpp"

#include <algorithm>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace {

// 내부 헬퍼: 액션 자체의 필수 값 검사
[[nodiscard]] std::optional<std::string> validate_action(const Action& action) {
    return std::visit(
        [](const auto& a) -> std::optional<std::string> {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, RunAction>) {
                if (a.script.empty()) {
                    return "run action requires a non-empty script";
                }
            } else if constexpr (std::is_same_v<T, InjectAction>) {
                if (const auto* f = std::get_if<InjectFile>(&a.source); f && f->path.empty()) {
                    return "inject action requires a non-empty path";
                }
                if (const auto* c = std::get_if<InjectCommand>(&a.source); c && c->command.empty()) {
                    return "inject_command action requires a non-empty command";
                }
            } else if constexpr (std::is_same_v<T, BlockIfMatchAction>) {
                if (a.pattern.empty()) {
                    return "block_if_match action requires a non-empty pattern";
                }
            } else if constexpr (std::is_same_v<T, RequireFieldsAction>) {
                if (a.fields.empty()) {
                    return "require_fields action requires at least one field";
                }
            }
            return std::nullopt;
        },
        action);
}

}  // namespace

bool is_valid_rule_name(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
            || c == '_' || c == '-';
    });
}

bool CompiledRule::applies_to(const Event& event) const noexcept {
    if (rule.events.empty()) {
        return true;
    }
    return std::find(rule.events.begin(), rule.events.end(), event.kind_name) != rule.events.end();
}

std::expected<RuleSet, ConfigError> RuleSet::build(std::vector<Rule> rules) {
    std::unordered_set<std::string> seen;
    std::vector<CompiledRule>       compiled;
    compiled.reserve(rules.size());

    for (std::size_t index = 0; index < rules.size(); ++index) {
        Rule& rule = rules[index];

        if (!is_valid_rule_name(rule.name)) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidRuleName,
                fmt::format("rule #{} has invalid name '{}' (allowed: A-Z a-z 0-9 _ -)",
                            index + 1, rule.name),
                rule.name,
            });
        }
        if (!seen.insert(rule.name).second) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kDuplicateRule,
                fmt::format("duplicate rule name '{}'", rule.name),
                rule.name,
            });
        }
        if (auto problem = validate_action(rule.action)) {
            return std::unexpected(ConfigError{ConfigErrorCode::kInvalidAction,
                                               fmt::format("rule '{}': {}", rule.name, *problem),
                                               rule.name});
        }

        auto matchers = CompiledMatchers::compile(rule.matchers);
        if (!matchers) {
            ConfigError err = std::move(matchers.error());
            err.message     = fmt::format("rule '{}': {}", rule.name, err.message);
            err.rule_name   = rule.name;
            return std::unexpected(std::move(err));
        }

        CompiledRule entry{};
        if (const auto* bim = std::get_if<BlockIfMatchAction>(&rule.action)) {
            auto re = Pattern::compile(bim->pattern);
            if (!re) {
                return std::unexpected(ConfigError{
                    ConfigErrorCode::kInvalidRegex,
                    fmt::format("rule '{}': block_if_match pattern '{}' is not a valid regex: {}",
                                rule.name, bim->pattern, re.error()),
                    rule.name,
                });
            }
            entry.action_pattern = std::move(*re);
        }

        // 비활성 규칙도 위 검증을 모두 통과해야 한다. 통과 후 제거한다.
        if (!rule.enabled) {
            spdlog::debug("rule_set: rule '{}' is disabled, skipping", rule.name);
            continue;
        }

        entry.matchers          = std::move(*matchers);
        entry.declaration_index = index;
        entry.rule              = std::move(rule);
        compiled.push_back(std::move(entry));
    }

    // priority 내림차순, 동률은 선언 순서
    std::stable_sort(compiled.begin(), compiled.end(),
                     [](const CompiledRule& a, const CompiledRule& b) {
                         return a.priority() > b.priority();
                     });

    spdlog::debug("rule_set: {} rule(s) compiled", compiled.size());
    return RuleSet{std::move(compiled)};
}

std::vector<const CompiledRule*> RuleSet::applicable(const Event& event) const {
    std::vector<const CompiledRule*> out;
    out.reserve(rules_.size());
    for (const auto& r : rules_) {
        if (r.applies_to(event)) {
            out.push_back(&r);
        }
    }
    return out;
}
