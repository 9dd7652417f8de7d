// ---------------------------------------------------------------------------
// hook_processor.cpp
// ---------------------------------------------------------------------------

#include "engine/hook_processor.hpp"

#include <chrono>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/time_format.hpp"

HookProcessor::HookProcessor(std::shared_ptr<const RuleSet> rules,
                             Settings                       settings,
                             ProcessRunner                  runner)
    : rules_(rules ? std::move(rules) : std::make_shared<const RuleSet>())
    , executor_(std::move(settings), std::move(runner)) {}

HookResult HookProcessor::process(const Event& event, const InvocationContext& ctx) const {
    const auto started = std::chrono::steady_clock::now();

    // 1. 이벤트 종류가 맞는 규칙 (priority 내림차순, 선언 순서)
    const std::vector<const CompiledRule*> candidates = rules_->applicable(event);

    // 2. 매처 평가. 디버그 모드에서는 모든 predicate 를 평가해 트레이스를 남긴다.
    std::vector<const CompiledRule*> matched;
    std::vector<RuleEvaluation>      evaluations;
    for (const CompiledRule* rule : candidates) {
        MatchResult result = rule->matchers.evaluate(event, ctx, ctx.debug);
        if (result.matched) {
            matched.push_back(rule);
        }
        if (ctx.debug) {
            evaluations.push_back(RuleEvaluation{rule->name(), result.matched, std::move(result.details)});
        }
    }

    // 3. 모드 충돌 해소
    const std::optional<Resolution> resolution = resolver_.resolve(matched);

    // 4. 액션 실행
    ActionOutcome outcome{};
    if (resolution) {
        spdlog::debug("hook_processor: {} rule(s) matched, governing rule '{}' ({})",
                      matched.size(), resolution->governing->name(), to_string(resolution->mode));
        outcome = executor_.execute(*resolution, event, ctx);
    }

    // Blocked 에는 항상 사유가 있다
    if (outcome.decision == Decision::kBlocked && !outcome.response.reason) {
        outcome.response.reason = ActionExecutor::default_block_reason(resolution->governing->rule);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    // 5. 감사 레코드
    AuditLogEntry entry{};
    entry.timestamp     = now_micros();
    entry.event_type    = event.kind_name;
    entry.session_id    = event.session_id;
    entry.tool_name     = event.tool_name;
    entry.cwd           = event.cwd;
    entry.event_details = event.details;
    entry.decision      = outcome.decision;
    entry.response      = ResponseSummary::from(outcome.response);
    entry.timing        = LogTiming{static_cast<std::uint64_t>(elapsed.count()), candidates.size()};
    entry.validator_failure = outcome.failure;
    entry.trust_level       = outcome.trust_level;

    entry.rules_matched.reserve(matched.size());
    for (const CompiledRule* rule : matched) {
        entry.rules_matched.push_back(rule->name());
    }
    if (resolution) {
        const Rule& rule     = resolution->governing->rule;
        entry.governing_rule = rule.name;
        entry.mode           = resolution->mode;
        entry.priority       = rule.effective_priority();
        entry.metadata       = rule.metadata;
    }
    if (ctx.debug) {
        entry.raw_event        = event.raw;
        entry.rule_evaluations = std::move(evaluations);
    }

    HookResult result{};
    result.decision  = outcome.decision;
    result.exit_code = exit_code_for(outcome.decision);
    result.response  = std::move(outcome.response);
    result.log_entry = std::move(entry);
    return result;
}
