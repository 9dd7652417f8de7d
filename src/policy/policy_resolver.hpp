#pragma once

// ---------------------------------------------------------------------------
// policy_resolver.hpp
//
// 매칭된 규칙들 사이의 정책 모드 충돌을 하나의 governing rule 로 정리한다.
//
// [모드 우선순위: priority 값과 무관]
// 1. Enforce 매치가 하나라도 있으면 그 중 최우선 Enforce 규칙이 governing.
// 2. 없으면 최우선 Warn 규칙.
// 3. 없으면 최우선 Audit 규칙.
// 4. 매치가 없으면 std::nullopt (Allowed).
// 같은 모드 안에서는 priority 가 큰 쪽, 동률이면 선언 순서가 앞선 쪽.
//
// [순환 의존성]
// policy_resolver.hpp → rule_set.hpp (단방향)
// 부수 효과가 없는 순수 함수이므로 상태를 갖지 않는다.
// ---------------------------------------------------------------------------

#include <optional>
#include <span>

#include "policy/rule_set.hpp"

struct Resolution {
    const CompiledRule* governing{nullptr};
    PolicyMode          mode{PolicyMode::kEnforce};
};

class PolicyResolver {
public:
    PolicyResolver() = default;

    // matched 는 RuleSet 의 정렬 순서를 따르지 않아도 된다.
    [[nodiscard]] std::optional<Resolution>
    resolve(std::span<const CompiledRule* const> matched) const noexcept;
};
