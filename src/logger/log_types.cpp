// ---------------------------------------------------------------------------
// log_types.cpp
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "common/time_format.hpp"
#include "policy/rule_json.hpp"

namespace {

using json = nlohmann::json;

// 내부 헬퍼: optional 문자열 읽기. 타입이 다르면 없음으로 본다.
[[nodiscard]] std::optional<std::string> opt_string(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// 내부 헬퍼: 필수 문자열. 없으면 std::invalid_argument
[[nodiscard]] std::string required_string(const json& j, const char* key) {
    auto value = opt_string(j, key);
    if (!value) {
        throw std::invalid_argument(fmt::format("audit log entry: missing string field '{}'", key));
    }
    return std::move(*value);
}

}  // namespace

// ---------------------------------------------------------------------------
// RuleEvaluation
// ---------------------------------------------------------------------------
void to_json(nlohmann::json& j, const RuleEvaluation& eval) {
    j              = json::object();
    j["rule_name"] = eval.rule_name;
    j["matched"]   = eval.matched;
    if (eval.matcher_results) {
        j["matcher_results"] = *eval.matcher_results;
    }
}

void from_json(const nlohmann::json& j, RuleEvaluation& eval) {
    eval           = RuleEvaluation{};
    eval.rule_name = opt_string(j, "rule_name").value_or("");
    if (const auto it = j.find("matched"); it != j.end() && it->is_boolean()) {
        eval.matched = it->get<bool>();
    }
    if (const auto it = j.find("matcher_results"); it != j.end() && it->is_object()) {
        eval.matcher_results = it->get<MatcherResults>();
    }
}

// ---------------------------------------------------------------------------
// AuditLogEntry
// ---------------------------------------------------------------------------
void to_json(nlohmann::json& j, const AuditLogEntry& entry) {
    j               = json::object();
    j["timestamp"]  = format_iso8601(entry.timestamp);
    j["event_type"] = entry.event_type;
    j["session_id"] = entry.session_id;
    if (entry.tool_name) {
        j["tool_name"] = *entry.tool_name;
    }
    if (entry.cwd) {
        j["cwd"] = *entry.cwd;
    }
    if (entry.event_details) {
        j["event_details"] = *entry.event_details;
    }
    j["rules_matched"] = entry.rules_matched;
    j["decision"]      = std::string{decision_to_string(entry.decision)};
    if (entry.governing_rule) {
        j["governing_rule"] = *entry.governing_rule;
    }
    if (entry.mode) {
        j["mode"] = std::string{to_string(*entry.mode)};
    }
    if (entry.priority) {
        j["priority"] = *entry.priority;
    }

    json response          = json::object();
    response["continue"]   = entry.response.continue_;
    if (entry.response.reason) {
        response["reason"] = *entry.response.reason;
    }
    if (entry.response.context_length) {
        response["context_length"] = *entry.response.context_length;
    }
    j["response"] = std::move(response);

    j["timing"] = json{
        {"processing_us",   entry.timing.processing_us},
        {"rules_evaluated", entry.timing.rules_evaluated},
    };

    if (entry.validator_failure) {
        j["validator_failure"] = *entry.validator_failure;
    }
    if (entry.metadata) {
        j["metadata"] = *entry.metadata;
    }
    if (entry.trust_level) {
        j["trust_level"] = std::string{to_string(*entry.trust_level)};
    }
    if (entry.raw_event) {
        j["raw_event"] = *entry.raw_event;
    }
    if (entry.rule_evaluations) {
        j["rule_evaluations"] = *entry.rule_evaluations;
    }
}

void from_json(const nlohmann::json& j, AuditLogEntry& entry) {
    if (!j.is_object()) {
        throw std::invalid_argument("audit log entry: not a JSON object");
    }
    entry = AuditLogEntry{};

    const std::string ts = required_string(j, "timestamp");
    const auto        tp = parse_iso8601(ts);
    if (!tp) {
        throw std::invalid_argument(fmt::format("audit log entry: invalid timestamp '{}'", ts));
    }
    entry.timestamp  = *tp;
    entry.event_type = required_string(j, "event_type");
    entry.session_id = required_string(j, "session_id");

    const std::string decision = required_string(j, "decision");
    const auto        parsed   = decision_from_string(decision);
    if (!parsed) {
        throw std::invalid_argument(
            fmt::format("audit log entry: unknown decision '{}'", decision));
    }
    entry.decision = *parsed;

    entry.tool_name = opt_string(j, "tool_name");
    entry.cwd       = opt_string(j, "cwd");
    if (const auto it = j.find("event_details"); it != j.end() && it->is_object()) {
        entry.event_details = it->get<EventDetails>();
    }
    if (const auto it = j.find("rules_matched"); it != j.end() && it->is_array()) {
        for (const auto& name : *it) {
            if (name.is_string()) {
                entry.rules_matched.push_back(name.get<std::string>());
            }
        }
    }
    entry.governing_rule = opt_string(j, "governing_rule");
    if (auto mode = opt_string(j, "mode")) {
        entry.mode = policy_mode_from_string(*mode);
    }
    if (const auto it = j.find("priority"); it != j.end() && it->is_number_integer()) {
        entry.priority = it->get<int>();
    }

    if (const auto it = j.find("response"); it != j.end() && it->is_object()) {
        const json& r = *it;
        if (const auto c = r.find("continue"); c != r.end() && c->is_boolean()) {
            entry.response.continue_ = c->get<bool>();
        }
        entry.response.reason = opt_string(r, "reason");
        if (const auto c = r.find("context_length"); c != r.end() && c->is_number_unsigned()) {
            entry.response.context_length = c->get<std::size_t>();
        }
    }

    if (const auto it = j.find("timing"); it != j.end() && it->is_object()) {
        const json& t = *it;
        if (const auto p = t.find("processing_us"); p != t.end() && p->is_number_unsigned()) {
            entry.timing.processing_us = p->get<std::uint64_t>();
        }
        if (const auto r = t.find("rules_evaluated"); r != t.end() && r->is_number_unsigned()) {
            entry.timing.rules_evaluated = r->get<std::size_t>();
        }
    }

    entry.validator_failure = opt_string(j, "validator_failure");
    if (const auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        entry.metadata = it->get<RuleMetadata>();
    }
    if (auto trust = opt_string(j, "trust_level")) {
        entry.trust_level = trust_level_from_string(*trust);
    }
    if (const auto it = j.find("raw_event"); it != j.end()) {
        entry.raw_event = *it;
    }
    if (const auto it = j.find("rule_evaluations"); it != j.end() && it->is_array()) {
        entry.rule_evaluations = it->get<std::vector<RuleEvaluation>>();
    }
}
