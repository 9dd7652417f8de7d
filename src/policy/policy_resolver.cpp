// ---------------------------------------------------------------------------
// policy_resolver.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_resolver.hpp"

namespace {

// 모드 서열: 작을수록 강하다
[[nodiscard]] int mode_rank(PolicyMode mode) noexcept {
    switch (mode) {
        case PolicyMode::kEnforce: return 0;
        case PolicyMode::kWarn:    return 1;
        case PolicyMode::kAudit:   return 2;
    }
    return 2;
}

// a 가 b 보다 governing 자격이 앞서면 참
[[nodiscard]] bool outranks(const CompiledRule& a, const CompiledRule& b) noexcept {
    const int ra = mode_rank(a.mode());
    const int rb = mode_rank(b.mode());
    if (ra != rb) {
        return ra < rb;
    }
    if (a.priority() != b.priority()) {
        return a.priority() > b.priority();
    }
    return a.declaration_index < b.declaration_index;
}

}  // namespace

std::optional<Resolution>
PolicyResolver::resolve(std::span<const CompiledRule* const> matched) const noexcept {
    const CompiledRule* best = nullptr;
    for (const CompiledRule* candidate : matched) {
        if (candidate == nullptr) {
            continue;
        }
        if (best == nullptr || outranks(*candidate, *best)) {
            best = candidate;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return Resolution{best, best->mode()};
}
