#pragma once

// ---------------------------------------------------------------------------
// action_executor.hpp
//
// governing rule 의 액션 하나를 그 규칙의 PolicyMode 아래에서 실행한다.
//
// [모드별 동작]
// - Enforce : 액션을 그대로 실행. 차단 결과는 Blocked.
// - Warn    : 액션을 실행하되 차단 결과는 경고 컨텍스트 주입(Warned)으로 바꾼다.
//             비차단 액션이 컨텍스트를 주입했으면 Warned, 아니면 Allowed.
// - Audit   : 아무것도 실행하지 않는다. Audited.
//
// [검증 실패 정책]
// 검증 스크립트 / inject_command 실패(타임아웃, spawn 실패, 비정상 종료,
// 출력 형식 오류)는 settings.fail_open 에 따른다.
//   fail_open=true  → Allowed, 실패 사유는 ActionOutcome::failure 에 기록
//   fail_open=false → Blocked, 실패 사유가 차단 사유
// inject 파일 읽기 실패는 항상 Allowed (컨텍스트 없이) + failure 기록.
//
// [보안 고려사항]
// - 검증 스크립트는 사용자 설정에서 온 셸 명령이다. trust 수준은 기록만 하고
//   강제하지 않는다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string>

#include "action/process_runner.hpp"
#include "common/types.hpp"
#include "event/event.hpp"
#include "policy/decision.hpp"
#include "policy/policy_resolver.hpp"
#include "policy/rule.hpp"
#include "policy/rule_set.hpp"

struct ActionOutcome {
    Decision                   decision{Decision::kAllowed};
    Response                   response{};
    std::optional<std::string> failure{};      // 검증/주입 실패 사유 (감사 로그 validator_failure)
    std::optional<TrustLevel>  trust_level{};  // Run 액션일 때만
};

class ActionExecutor {
public:
    explicit ActionExecutor(Settings settings, ProcessRunner runner = ProcessRunner{});

    ~ActionExecutor() = default;

    ActionExecutor(const ActionExecutor&)            = default;
    ActionExecutor& operator=(const ActionExecutor&) = default;
    ActionExecutor(ActionExecutor&&)                 = default;
    ActionExecutor& operator=(ActionExecutor&&)      = default;

    [[nodiscard]] ActionOutcome execute(const Resolution&        resolution,
                                        const Event&             event,
                                        const InvocationContext& ctx) const;

    // Warn 모드 경고 문구
    [[nodiscard]] static std::string warning_text(std::string_view rule_name,
                                                  std::string_view reason);

    // Block 액션 기본 사유
    [[nodiscard]] static std::string default_block_reason(const Rule& rule);

private:
    // 모드와 무관한 액션 결과 (Blocked 또는 Allowed)
    [[nodiscard]] ActionOutcome run_action(const CompiledRule&       rule,
                                           const Event&             event,
                                           const InvocationContext& ctx) const;

    [[nodiscard]] ActionOutcome run_inject(const CompiledRule&       rule,
                                           const InjectAction&      action,
                                           const Event&             event,
                                           const InvocationContext& ctx) const;

    [[nodiscard]] ActionOutcome run_validator(const CompiledRule&       rule,
                                              const RunAction&         action,
                                              const Event&             event,
                                              const InvocationContext& ctx) const;

    // 검증 실패 → fail_open 정책 적용
    [[nodiscard]] ActionOutcome on_failure(std::string failure) const;

    [[nodiscard]] std::chrono::milliseconds timeout_for(const Rule& rule) const noexcept;

    [[nodiscard]] ProcessRequest make_request(const CompiledRule&       rule,
                                              std::string              command,
                                              const Event&             event,
                                              const InvocationContext& ctx) const;

    Settings      settings_;
    ProcessRunner runner_;
};

// tool_input 에서 점 표기 필드를 찾는다. null 은 없음으로 본다.
[[nodiscard]] const nlohmann::json* find_input_field(const Event& event, std::string_view dotted);
