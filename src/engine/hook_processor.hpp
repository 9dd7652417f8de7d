#pragma once

// ---------------------------------------------------------------------------
// hook_processor.hpp
//
// 이벤트 하나에 대한 판정 파이프라인.
//
//   Event → RuleSet::applicable → CompiledMatchers::evaluate (규칙마다)
//         → PolicyResolver::resolve → ActionExecutor::execute
//         → { Response, AuditLogEntry }
//
// [설계 원칙]
// - RuleSet 은 shared_ptr<const> 로 공유되는 읽기 전용 값이다.
//   process() 는 호출 사이에 상태를 남기지 않는다. 같은 이벤트를 두 번 처리하면
//   timestamp / timing 을 제외하고 같은 결과가 나온다.
// - 감사 로그 기록은 호출자 몫이다. process() 는 레코드만 만든다.
// ---------------------------------------------------------------------------

#include <memory>

#include "action/action_executor.hpp"
#include "common/types.hpp"
#include "event/event.hpp"
#include "logger/log_types.hpp"
#include "policy/decision.hpp"
#include "policy/policy_resolver.hpp"
#include "policy/rule.hpp"
#include "policy/rule_set.hpp"

struct HookResult {
    Response      response{};
    Decision      decision{Decision::kAllowed};
    AuditLogEntry log_entry{};
    int           exit_code{kExitAllow};
};

class HookProcessor {
public:
    HookProcessor(std::shared_ptr<const RuleSet> rules,
                  Settings                       settings,
                  ProcessRunner                  runner = ProcessRunner{});

    [[nodiscard]] HookResult process(const Event& event, const InvocationContext& ctx) const;

    [[nodiscard]] const RuleSet& rules() const noexcept { return *rules_; }

private:
    std::shared_ptr<const RuleSet> rules_;
    PolicyResolver                 resolver_{};
    ActionExecutor                 executor_;
};
