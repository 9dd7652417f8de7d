#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그(JSON Lines) 레코드 구조체.
//
// [JSON 스키마]
// - 모든 필드는 snake_case JSON 키로 직렬화한다.
// - 값이 없는 optional 필드는 출력하지 않는다.
// - 스키마는 추가만 한다. 읽는 쪽은 모르는 필드를 무시하고 빠진 optional
//   필드를 허용한다 (from_json 이 그렇게 동작한다).
// - raw_event / rule_evaluations 는 디버그 모드에서만 채워진다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "event/event.hpp"
#include "policy/decision.hpp"
#include "policy/matcher.hpp"
#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// RuleEvaluation (디버그 전용)
//   이벤트 종류가 맞은 규칙 하나의 평가 트레이스.
// ---------------------------------------------------------------------------
struct RuleEvaluation {
    std::string                   rule_name{};
    bool                          matched{false};
    std::optional<MatcherResults> matcher_results{};

    bool operator==(const RuleEvaluation&) const = default;
};

// ---------------------------------------------------------------------------
// ResponseSummary
//   호스트에 보낸 응답 요약. 주입 컨텍스트 본문은 기록하지 않고 길이만 남긴다.
// ---------------------------------------------------------------------------
struct ResponseSummary {
    bool                       continue_{true};
    std::optional<std::string> reason{};
    std::optional<std::size_t> context_length{};

    bool operator==(const ResponseSummary&) const = default;

    [[nodiscard]] static ResponseSummary from(const Response& response) {
        ResponseSummary s{};
        s.continue_ = response.continue_;
        s.reason    = response.reason;
        if (response.context) {
            s.context_length = response.context->size();
        }
        return s;
    }
};

struct LogTiming {
    std::uint64_t processing_us{0};    // 이벤트 파싱 이후 판정까지 소요 시간
    std::size_t   rules_evaluated{0};  // 이벤트 종류가 맞아 평가된 규칙 수

    bool operator==(const LogTiming&) const = default;
};

// ---------------------------------------------------------------------------
// AuditLogEntry
//   처리된 이벤트 하나당 한 줄.
// ---------------------------------------------------------------------------
struct AuditLogEntry {
    std::chrono::system_clock::time_point timestamp{};
    std::string                           event_type{};
    std::string                           session_id{};
    std::optional<std::string>            tool_name{};
    std::optional<std::string>            cwd{};
    std::optional<EventDetails>           event_details{};
    std::vector<std::string>              rules_matched{};
    Decision                              decision{Decision::kAllowed};
    std::optional<std::string>            governing_rule{};
    std::optional<PolicyMode>             mode{};
    std::optional<int>                    priority{};
    ResponseSummary                       response{};
    LogTiming                             timing{};
    std::optional<std::string>            validator_failure{};
    std::optional<RuleMetadata>           metadata{};
    std::optional<TrustLevel>             trust_level{};
    std::optional<nlohmann::json>         raw_event{};         // 디버그 전용
    std::optional<std::vector<RuleEvaluation>> rule_evaluations{};  // 디버그 전용

    bool operator==(const AuditLogEntry&) const = default;
};

void to_json(nlohmann::json& j, const RuleEvaluation& eval);
void from_json(const nlohmann::json& j, RuleEvaluation& eval);

void to_json(nlohmann::json& j, const AuditLogEntry& entry);

// 필수 필드(timestamp, event_type, session_id, decision)가 없거나 잘못되면
// std::invalid_argument 를 던진다.
void from_json(const nlohmann::json& j, AuditLogEntry& entry);
