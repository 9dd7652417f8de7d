// ---------------------------------------------------------------------------
// rule_json.cpp
// ---------------------------------------------------------------------------

#include "policy/rule_json.hpp"

#include <string>

namespace {

using json = nlohmann::json;

// 내부 헬퍼: optional 문자열 입출력
void put(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

void put(json& j, const char* key, const std::optional<std::vector<std::string>>& value) {
    if (value) {
        j[key] = *value;
    }
}

[[nodiscard]] std::optional<std::string> get_string(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] std::optional<std::vector<std::string>> get_strings(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return std::vector<std::string>{it->get<std::string>()};
    }
    if (!it->is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> out;
    for (const auto& item : *it) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// RuleMetadata
// ---------------------------------------------------------------------------
void to_json(nlohmann::json& j, const RuleMetadata& metadata) {
    j = json::object();
    put(j, "author", metadata.author);
    put(j, "created_by", metadata.created_by);
    put(j, "reason", metadata.reason);
    if (metadata.confidence) {
        j["confidence"] = std::string{to_string(*metadata.confidence)};
    }
    put(j, "last_reviewed", metadata.last_reviewed);
    put(j, "ticket", metadata.ticket);
    put(j, "tags", metadata.tags);
}

void from_json(const nlohmann::json& j, RuleMetadata& metadata) {
    metadata.author        = get_string(j, "author");
    metadata.created_by    = get_string(j, "created_by");
    metadata.reason        = get_string(j, "reason");
    metadata.confidence    = std::nullopt;
    if (auto c = get_string(j, "confidence")) {
        metadata.confidence = confidence_from_string(*c);
    }
    metadata.last_reviewed = get_string(j, "last_reviewed");
    metadata.ticket        = get_string(j, "ticket");
    metadata.tags          = get_strings(j, "tags");
}

// ---------------------------------------------------------------------------
// Matchers
// ---------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Matchers& matchers) {
    j = json::object();
    put(j, "tools", matchers.tools);
    put(j, "extensions", matchers.extensions);
    put(j, "directories", matchers.directories);
    put(j, "operations", matchers.operations);
    put(j, "command_match", matchers.command_match);
    put(j, "prompt_match", matchers.prompt_match);
    put(j, "enabled_when", matchers.enabled_when);
}

void from_json(const nlohmann::json& j, Matchers& matchers) {
    matchers.tools         = get_strings(j, "tools");
    matchers.extensions    = get_strings(j, "extensions");
    matchers.directories   = get_strings(j, "directories");
    matchers.operations    = get_strings(j, "operations");
    matchers.command_match = get_string(j, "command_match");
    matchers.prompt_match  = get_string(j, "prompt_match");
    matchers.enabled_when  = get_string(j, "enabled_when");
}

// ---------------------------------------------------------------------------
// Action
// ---------------------------------------------------------------------------
nlohmann::json action_to_json(const Action& action) {
    json j = json::object();
    std::visit(
        [&j](const auto& a) {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, BlockAction>) {
                j["block"] = true;
                put(j, "block_reason", a.reason);
            } else if constexpr (std::is_same_v<T, InjectAction>) {
                if (const auto* f = std::get_if<InjectFile>(&a.source)) {
                    j["inject"] = f->path;
                } else if (const auto* t = std::get_if<InjectInline>(&a.source)) {
                    j["inject_inline"] = t->text;
                } else if (const auto* c = std::get_if<InjectCommand>(&a.source)) {
                    j["inject_command"] = c->command;
                }
            } else if constexpr (std::is_same_v<T, RunAction>) {
                if (a.trust) {
                    j["run"] = json{{"script", a.script},
                                    {"trust", std::string{to_string(*a.trust)}}};
                } else {
                    j["run"] = a.script;
                }
            } else if constexpr (std::is_same_v<T, BlockIfMatchAction>) {
                json spec = json{{"pattern", a.pattern}};
                put(spec, "field", a.field);
                j["block_if_match"] = std::move(spec);
            } else {
                j["require_fields"] = a.fields;
            }
        },
        action);
    return j;
}

Action action_from_json(const nlohmann::json& j) {
    if (auto path = get_string(j, "inject")) {
        return InjectAction{InjectFile{*path}};
    }
    if (auto text = get_string(j, "inject_inline")) {
        return InjectAction{InjectInline{*text}};
    }
    if (auto cmd = get_string(j, "inject_command")) {
        return InjectAction{InjectCommand{*cmd}};
    }
    if (const auto it = j.find("run"); it != j.end()) {
        if (it->is_string()) {
            return RunAction{it->get<std::string>(), std::nullopt};
        }
        if (it->is_object()) {
            RunAction run{get_string(*it, "script").value_or(""), std::nullopt};
            if (auto trust = get_string(*it, "trust")) {
                run.trust = trust_level_from_string(*trust);
            }
            return run;
        }
    }
    if (const auto it = j.find("block_if_match"); it != j.end()) {
        if (it->is_string()) {
            return BlockIfMatchAction{std::nullopt, it->get<std::string>()};
        }
        if (it->is_object()) {
            return BlockIfMatchAction{get_string(*it, "field"),
                                      get_string(*it, "pattern").value_or("")};
        }
    }
    if (auto fields = get_strings(j, "require_fields")) {
        return RequireFieldsAction{*fields};
    }
    return BlockAction{get_string(j, "block_reason")};
}

// ---------------------------------------------------------------------------
// Rule
// ---------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Rule& rule) {
    j         = json::object();
    j["name"] = rule.name;
    put(j, "description", rule.description);
    if (!rule.events.empty()) {
        j["events"] = rule.events;
    }
    j["matchers"] = rule.matchers;
    j["actions"]  = action_to_json(rule.action);
    if (rule.mode) {
        j["mode"] = std::string{to_string(*rule.mode)};
    }
    if (rule.priority) {
        j["priority"] = *rule.priority;
    }
    if (!rule.enabled) {
        j["enabled"] = false;
    }
    if (rule.timeout) {
        j["timeout_ms"] = rule.timeout->count();
    }
    if (rule.metadata) {
        j["metadata"] = *rule.metadata;
    }
}

void from_json(const nlohmann::json& j, Rule& rule) {
    rule             = Rule{};
    rule.name        = get_string(j, "name").value_or("");
    rule.description = get_string(j, "description");
    rule.events      = get_strings(j, "events").value_or(std::vector<std::string>{});

    if (const auto it = j.find("matchers"); it != j.end() && it->is_object()) {
        rule.matchers = it->get<Matchers>();
    }
    if (const auto it = j.find("actions"); it != j.end() && it->is_object()) {
        rule.action = action_from_json(*it);
    }
    if (auto mode = get_string(j, "mode")) {
        rule.mode = policy_mode_from_string(*mode);
    }
    if (const auto it = j.find("priority"); it != j.end() && it->is_number_integer()) {
        rule.priority = it->get<int>();
    }
    if (const auto it = j.find("enabled"); it != j.end() && it->is_boolean()) {
        rule.enabled = it->get<bool>();
    }
    if (const auto it = j.find("timeout_ms"); it != j.end() && it->is_number_integer()) {
        rule.timeout = std::chrono::milliseconds{it->get<std::int64_t>()};
    }
    if (const auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        rule.metadata = it->get<RuleMetadata>();
    }
}
